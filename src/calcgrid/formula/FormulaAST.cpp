#include "calcgrid/formula/FormulaAST.hpp"
#include "calcgrid/utils/AddressParser.hpp"
#include "calcgrid/utils/ModuleLoggers.hpp"
#include "calcgrid/utils/NumberUtils.hpp"
#include <cmath>
#include <sstream>
#include <fmt/format.h>

namespace calcgrid {
namespace formula {

namespace {

std::string cellText(const CellValueSource& source, const core::CellPosition& pos) {
    auto text = source.get(pos.row, pos.col);
    return text ? *text : std::string();
}

void printChild(std::ostream& os, const FormulaNode& child, bool parenthesize) {
    if (parenthesize) os << '(';
    child.print(os);
    if (parenthesize) os << ')';
}

} // namespace

// ========== NumberNode ==========

core::Result<double> NumberNode::evaluate(const CellValueSource&) const {
    return value_;
}

void NumberNode::print(std::ostream& os) const {
    os << fmt::format("{}", value_);
}

// ========== ReferenceNode ==========

core::Result<double> ReferenceNode::evaluate(const CellValueSource& source) const {
    std::string text = cellText(source, pos_);
    if (text.empty()) {
        return 0.0;
    }

    auto value = utils::NumberUtils::parseNumber(text);
    if (!value) {
        return core::makeError(core::ErrorCode::InvalidFormula,
                               fmt::format("Cell {} is not numeric", pos_.toString()),
                               text);
    }
    CALCGRID_LOG_EVAL_TRACE("{} -> {}", pos_.toString(), *value);
    return *value;
}

void ReferenceNode::print(std::ostream& os) const {
    os << utils::AddressParser::encode(pos_);
}

void ReferenceNode::collectRanges(std::vector<core::CellRange>& out) const {
    out.emplace_back(pos_);
}

// ========== UnaryNode ==========

core::Result<double> UnaryNode::evaluate(const CellValueSource& source) const {
    auto operand = operand_->evaluate(source);
    if (!operand) {
        return operand.error();
    }
    return op_ == '-' ? -operand.value() : operand.value();
}

void UnaryNode::print(std::ostream& os) const {
    os << op_;
    printChild(os, *operand_, operand_->precedence() < precedence());
}

void UnaryNode::collectRanges(std::vector<core::CellRange>& out) const {
    operand_->collectRanges(out);
}

// ========== BinaryNode ==========

core::Result<double> BinaryNode::evaluate(const CellValueSource& source) const {
    auto lhs = lhs_->evaluate(source);
    if (!lhs) {
        return lhs.error();
    }
    auto rhs = rhs_->evaluate(source);
    if (!rhs) {
        return rhs.error();
    }

    switch (op_) {
        case '+': return lhs.value() + rhs.value();
        case '-': return lhs.value() - rhs.value();
        case '*': return lhs.value() * rhs.value();
        case '/':
            if (rhs.value() == 0.0) {
                return core::makeError(core::ErrorCode::DivisionByZero, "Division by zero");
            }
            return lhs.value() / rhs.value();
        default:
            break;
    }
    return core::makeError(core::ErrorCode::InternalError,
                           fmt::format("Unknown operator '{}'", op_));
}

void BinaryNode::print(std::ostream& os) const {
    printChild(os, *lhs_, lhs_->precedence() < precedence());
    os << op_;
    // 右操作数同级也要括号：a-(b-c) 与 a-b-c 不同
    printChild(os, *rhs_, rhs_->precedence() <= precedence());
}

void BinaryNode::collectRanges(std::vector<core::CellRange>& out) const {
    lhs_->collectRanges(out);
    rhs_->collectRanges(out);
}

// ========== FunctionArgument ==========

FunctionArgument FunctionArgument::makeNumber(double value) {
    FunctionArgument arg;
    arg.kind = Kind::Number;
    arg.number = value;
    return arg;
}

FunctionArgument FunctionArgument::makeReference(const core::CellPosition& pos) {
    FunctionArgument arg;
    arg.kind = Kind::Reference;
    arg.range = core::CellRange(pos);
    return arg;
}

FunctionArgument FunctionArgument::makeRange(const core::CellRange& range) {
    FunctionArgument arg;
    arg.kind = Kind::Range;
    arg.range = range;
    return arg;
}

FunctionArgument FunctionArgument::makeCall(std::unique_ptr<FunctionCallNode> call) {
    FunctionArgument arg;
    arg.kind = Kind::Call;
    arg.call = std::move(call);
    return arg;
}

// ========== FunctionCallNode ==========

core::VoidResult FunctionCallNode::expandArgument(const FunctionArgument& arg,
                                                  const CellValueSource& source,
                                                  std::vector<ArgumentValue>& out) const {
    switch (arg.kind) {
        case FunctionArgument::Kind::Number:
            out.emplace_back(arg.number);
            break;

        case FunctionArgument::Kind::Reference: {
            // 单个引用：空或非数值都按 0 计，但不算作数值
            auto value = utils::NumberUtils::parseNumber(cellText(source, arg.range.first()));
            out.emplace_back(value.value_or(0.0), value.has_value());
            break;
        }

        case FunctionArgument::Kind::Range: {
            // 来源有边界时先裁剪，边界外的单元格本来就读作空
            core::CellRange range = arg.range;
            if (auto extent = source.bounds()) {
                if (!arg.range.clipTo(extent->getRowCount(), extent->getColCount(), range)) {
                    break;
                }
            }
            // 范围：空单元格跳过，文本按 0 计但不算作数值
            range.forEach([&](const core::CellPosition& pos) {
                std::string text = cellText(source, pos);
                if (text.empty()) {
                    return;
                }
                auto value = utils::NumberUtils::parseNumber(text);
                out.emplace_back(value.value_or(0.0), value.has_value());
            });
            break;
        }

        case FunctionArgument::Kind::Call: {
            auto value = arg.call->evaluate(source);
            if (!value) {
                return value.error();
            }
            out.emplace_back(value.value());
            break;
        }
    }
    return {};
}

core::Result<double> FunctionCallNode::evaluate(const CellValueSource& source) const {
    std::vector<ArgumentValue> values;
    if (!segments_.empty()) {
        for (const auto& arg : segments_[0]) {
            auto expanded = expandArgument(arg, source, values);
            if (!expanded) {
                return expanded.error();
            }
        }
    }

    std::optional<double> secondary;
    if (segments_.size() > 1 && !segments_[1].empty()) {
        std::vector<ArgumentValue> secondary_values;
        auto expanded = expandArgument(segments_[1].front(), source, secondary_values);
        if (!expanded) {
            return expanded.error();
        }
        if (!secondary_values.empty()) {
            secondary = secondary_values.front().value;
        }
    }

    double result = FormulaFunctions::apply(id_, values, secondary);
    CALCGRID_LOG_EVAL_TRACE("{} over {} values -> {}", FormulaFunctions::name(id_), values.size(), result);
    return result;
}

void FunctionCallNode::print(std::ostream& os) const {
    os << FormulaFunctions::name(id_) << '(';
    for (size_t s = 0; s < segments_.size(); ++s) {
        if (s > 0) os << ';';
        const auto& segment = segments_[s];
        for (size_t i = 0; i < segment.size(); ++i) {
            if (i > 0) os << ',';
            const auto& arg = segment[i];
            switch (arg.kind) {
                case FunctionArgument::Kind::Number:
                    os << fmt::format("{}", arg.number);
                    break;
                case FunctionArgument::Kind::Reference:
                    os << utils::AddressParser::encode(arg.range.first());
                    break;
                case FunctionArgument::Kind::Range:
                    os << utils::AddressParser::encodeRange(arg.range);
                    break;
                case FunctionArgument::Kind::Call:
                    arg.call->print(os);
                    break;
            }
        }
    }
    os << ')';
}

void FunctionCallNode::collectRanges(std::vector<core::CellRange>& out) const {
    for (const auto& segment : segments_) {
        for (const auto& arg : segment) {
            switch (arg.kind) {
                case FunctionArgument::Kind::Reference:
                case FunctionArgument::Kind::Range:
                    out.push_back(arg.range);
                    break;
                case FunctionArgument::Kind::Call:
                    arg.call->collectRanges(out);
                    break;
                case FunctionArgument::Kind::Number:
                    break;
            }
        }
    }
}

// ========== FormulaAST ==========

core::Result<double> FormulaAST::execute(const CellValueSource& source) const {
    auto result = root_->evaluate(source);
    if (!result) {
        return result.error();
    }
    if (!std::isfinite(result.value())) {
        return core::makeError(core::ErrorCode::DivisionByZero,
                               "Result is not a finite number", text_);
    }
    return result;
}

std::string FormulaAST::toString() const {
    std::ostringstream oss;
    root_->print(oss);
    return oss.str();
}

std::vector<core::CellRange> FormulaAST::getReferencedRanges() const {
    std::vector<core::CellRange> ranges;
    root_->collectRanges(ranges);
    return ranges;
}

}} // namespace calcgrid::formula
