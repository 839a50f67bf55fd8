#pragma once

#include "calcgrid/core/Constants.hpp"
#include "calcgrid/core/ErrorCode.hpp"
#include <string>
#include <utility>

namespace calcgrid {
namespace core {

/**
 * @brief 网格中的一个单元格
 *
 * input 是用户输入的原始文本，display_value 是最近一次重算的显示结果。
 * 不变式：hasError() 为 true 时 display_value 一定是错误标记文本。
 * 单元格只能由 Grid 修改。
 */
class Cell {
    friend class Grid;  // 让Grid能访问private方法
private:
    std::string input_;
    std::string display_value_;
    bool has_error_ = false;
    ErrorCode error_code_ = ErrorCode::Ok;

    void setInput(std::string input) { input_ = std::move(input); }

    void setDisplay(std::string value) {
        display_value_ = std::move(value);
        has_error_ = false;
        error_code_ = ErrorCode::Ok;
    }

    void setError(const std::string& sentinel, ErrorCode code) {
        display_value_ = sentinel;
        has_error_ = true;
        error_code_ = code;
    }

    void clear();

public:
    Cell() = default;

    const std::string& getInput() const { return input_; }
    const std::string& getDisplayValue() const { return display_value_; }
    bool hasError() const { return has_error_; }

    /**
     * @brief 最近一次失败的原因；循环中的单元格为 CircularReference
     */
    ErrorCode getErrorCode() const { return error_code_; }

    bool isEmpty() const { return input_.empty(); }

    /**
     * @brief 输入是否以公式标记开头
     */
    bool isFormula(char marker = Constants::kFormulaMarker) const {
        return !input_.empty() && input_.front() == marker;
    }

    /**
     * @brief 公式体（去掉前导标记）；非公式单元格返回空串
     */
    std::string getFormulaBody(char marker = Constants::kFormulaMarker) const;
};

}} // namespace calcgrid::core
