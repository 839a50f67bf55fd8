/**
 * @file ExceptionBridge.hpp
 * @brief 异常转换层：连接底层Result/Expected和调用方的Exception
 */

#pragma once

#include "Expected.hpp"
#include "ErrorCode.hpp"
#include "Exception.hpp"
#include <new>

namespace calcgrid {
namespace core {

/**
 * @brief 异常转换层
 *
 * 公式引擎与网格内部只返回Result；需要异常语义的调用方通过这里转换。
 */
class ExceptionBridge {
public:
    /**
     * @brief 将Result转换为异常抛出
     * @throws CalcGridException 如果result包含错误
     */
    template<typename T>
    static T unwrap(Result<T>&& result) {
        return std::move(result).valueOrThrow();
    }

    /**
     * @brief 捕获异常并转换为VoidResult
     * @param func 可能抛出异常的函数
     */
    template<typename F>
    static VoidResult wrapVoidCall(F&& func) {
        try {
            func();
            return VoidResult();
        } catch (const CalcGridException& e) {
            return makeError(e.getErrorCode(), e.what());
        } catch (const std::bad_alloc&) {
            return makeError(ErrorCode::OutOfMemory, "Memory allocation failed");
        } catch (const std::exception& e) {
            return makeError(ErrorCode::InternalError, e.what());
        }
    }
};

}} // namespace calcgrid::core

// 在调用方接口中使用，自动转换Result为异常
#define CALCGRID_UNWRAP(result) \
    calcgrid::core::ExceptionBridge::unwrap(result)
