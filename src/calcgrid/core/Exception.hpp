/**
 * @file Exception.hpp
 * @brief CalcGrid异常类定义
 *
 * 公式引擎内部只返回Result；异常只出现在面向调用方的接口上，
 * 例如越界访问网格、以非法尺寸构造网格、对Result调用valueOrThrow()。
 */

#ifndef CALCGRID_EXCEPTION_HPP
#define CALCGRID_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace calcgrid {
namespace core {

/**
 * @brief CalcGrid基础异常类
 */
class CalcGridException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    CalcGridException(const std::string& message,
                      ErrorCode code = ErrorCode::InternalError,
                      const char* file = nullptr,
                      int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const;

    /**
     * @brief 获取详细错误信息（错误码、位置与上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public CalcGridException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 单元格相关异常
 */
class CellException : public CalcGridException {
public:
    CellException(const std::string& message,
                  int row = -1, int col = -1,
                  ErrorCode code = ErrorCode::InvalidCellReference,
                  const char* file = nullptr, int line = 0);

    int getRow() const { return row_; }
    int getCol() const { return col_; }
    std::string getCellReference() const;

private:
    int row_;
    int col_;
};

/**
 * @brief 公式相关异常
 */
class FormulaException : public CalcGridException {
public:
    FormulaException(const std::string& message,
                     ErrorCode code = ErrorCode::InvalidFormula,
                     const std::string& formula = "",
                     const char* file = nullptr, int line = 0);

    const std::string& getFormula() const { return formula_; }

private:
    std::string formula_;
};

} // namespace core
} // namespace calcgrid

#endif // CALCGRID_EXCEPTION_HPP
