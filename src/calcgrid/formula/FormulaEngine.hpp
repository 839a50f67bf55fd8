#pragma once

#include "calcgrid/core/Expected.hpp"
#include "calcgrid/core/GridTypes.hpp"
#include "calcgrid/formula/CellValueSource.hpp"
#include "calcgrid/formula/FormulaAST.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace calcgrid {
namespace formula {

/**
 * @brief 公式求值入口：括号补全 -> 解析 -> 求值 -> 格式化
 *
 * 引擎本身无状态，可以在多个网格之间共享。
 *
 * @example
 * FormulaEngine engine;
 * auto result = engine.evaluate("SUM(A1:A3)*2", grid_source);
 * if (result) {
 *     std::cout << result.value();   // "120"
 * }
 */
class FormulaEngine {
public:
    explicit FormulaEngine(core::FormulaOptions options = core::FormulaOptions())
        : options_(options) {}

    /**
     * @brief 求值并格式化为显示文本
     * @param formula 公式体，不含前导 '='
     * @param source 单元格取值来源
     */
    core::Result<std::string> evaluate(std::string_view formula, const CellValueSource& source) const;

    core::Result<double> evaluateNumber(std::string_view formula, const CellValueSource& source) const;

    core::Result<std::unique_ptr<FormulaAST>> parse(std::string_view formula) const;

    /**
     * @brief 在末尾补上缺少的 ')'；右括号多余或顺序错误时原样返回，由解析器报错
     */
    static std::string balanceParentheses(std::string_view formula);

    const core::FormulaOptions& getOptions() const { return options_; }

private:
    core::FormulaOptions options_;
};

}} // namespace calcgrid::formula
