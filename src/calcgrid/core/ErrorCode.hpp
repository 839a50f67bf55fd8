#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace calcgrid {
namespace core {

/**
 * @brief CalcGrid统一错误码
 *
 * 公式求值的每一个阶段都通过错误码返回失败，不使用异常做控制流：
 * - 引用错误：地址格式不正确或范围缺少端点
 * - 公式错误：语法错误、未知函数、除零
 * - 网格错误：循环引用（只有网格层能检测到）
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    OutOfMemory = 2,
    InternalError = 3,

    // 引用错误 (20-39)
    InvalidCellReference = 20,
    InvalidRange = 21,

    // 公式错误 (40-59)
    InvalidFormula = 40,
    InvalidFunction = 41,
    DivisionByZero = 42,

    // 网格错误 (60-79)
    CircularReference = 60
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 出错的公式片段或单元格地址

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    explicit operator bool() const noexcept { return isError(); }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

/**
 * @brief 按错误码抛出对应的异常类型（实现位于Exception.cpp）
 */
[[noreturn]] void throwError(const Error& error);

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

inline Error success() {
    return Error(ErrorCode::Ok);
}

}} // namespace calcgrid::core
