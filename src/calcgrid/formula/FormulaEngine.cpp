#include "calcgrid/formula/FormulaEngine.hpp"
#include "calcgrid/formula/FormulaParser.hpp"
#include "calcgrid/utils/ModuleLoggers.hpp"
#include "calcgrid/utils/NumberUtils.hpp"
#include <algorithm>

namespace calcgrid {
namespace formula {

core::Result<std::unique_ptr<FormulaAST>> FormulaEngine::parse(std::string_view formula) const {
    if (options_.auto_balance) {
        return FormulaParser(options_).parse(balanceParentheses(formula));
    }
    return FormulaParser(options_).parse(formula);
}

core::Result<double> FormulaEngine::evaluateNumber(std::string_view formula,
                                                   const CellValueSource& source) const {
    auto ast = parse(formula);
    if (!ast) {
        CALCGRID_LOG_EVAL_TRACE("parse '{}' failed: {}", formula, ast.error().message);
        return ast.error();
    }
    return ast.value()->execute(source);
}

core::Result<std::string> FormulaEngine::evaluate(std::string_view formula,
                                                  const CellValueSource& source) const {
    auto value = evaluateNumber(formula, source);
    if (!value) {
        return value.error();
    }
    return utils::NumberUtils::formatResult(value.value());
}

std::string FormulaEngine::balanceParentheses(std::string_view formula) {
    std::string balanced(formula);
    auto open = std::count(balanced.begin(), balanced.end(), '(');
    auto close = std::count(balanced.begin(), balanced.end(), ')');
    if (open > close) {
        balanced.append(static_cast<size_t>(open - close), ')');
    }
    return balanced;
}

}} // namespace calcgrid::formula
