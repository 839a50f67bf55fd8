#include "calcgrid/formula/FormulaParser.hpp"
#include "calcgrid/utils/AddressParser.hpp"
#include "calcgrid/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace calcgrid {
namespace formula {

core::Result<std::unique_ptr<FormulaAST>> FormulaParser::parse(std::string_view formula) {
    formula_ = std::string(formula);
    pos_ = 0;
    depth_ = 0;

    auto tokens = FormulaTokenizer(formula_).tokenize();
    if (!tokens) {
        return tokens.error();
    }
    tokens_ = std::move(tokens.value());

    if (check(TokenType::End)) {
        return core::makeError(core::ErrorCode::InvalidFormula, "Empty formula", formula_);
    }

    auto root = parseExpression();
    if (!root) {
        return root.error();
    }
    if (!check(TokenType::End)) {
        return unexpected(core::ErrorCode::InvalidFormula, "an operator");
    }

    return std::make_unique<FormulaAST>(formula_, std::move(root.value()));
}

core::Result<FormulaNodePtr> FormulaParser::parseExpression() {
    auto lhs = parseTerm();
    if (!lhs) {
        return lhs.error();
    }
    FormulaNodePtr node = std::move(lhs.value());

    while (check(TokenType::Plus) || check(TokenType::Minus)) {
        char op = advance().text[0];
        auto rhs = parseTerm();
        if (!rhs) {
            return rhs.error();
        }
        node = std::make_unique<BinaryNode>(op, std::move(node), std::move(rhs.value()));
    }
    return node;
}

core::Result<FormulaNodePtr> FormulaParser::parseTerm() {
    auto lhs = parseUnary();
    if (!lhs) {
        return lhs.error();
    }
    FormulaNodePtr node = std::move(lhs.value());

    while (check(TokenType::Star) || check(TokenType::Slash)) {
        char op = advance().text[0];
        auto rhs = parseUnary();
        if (!rhs) {
            return rhs.error();
        }
        node = std::make_unique<BinaryNode>(op, std::move(node), std::move(rhs.value()));
    }
    return node;
}

core::Result<FormulaNodePtr> FormulaParser::parseUnary() {
    if (!check(TokenType::Plus) && !check(TokenType::Minus)) {
        return parsePrimary();
    }

    char op = advance().text[0];
    auto entered = enter();
    if (!entered) {
        return entered.error();
    }
    auto operand = parseUnary();
    if (!operand) {
        return operand.error();
    }
    leave();
    return FormulaNodePtr(std::make_unique<UnaryNode>(op, std::move(operand.value())));
}

core::Result<FormulaNodePtr> FormulaParser::parsePrimary() {
    const Token& token = peek();

    switch (token.type) {
        case TokenType::Number: {
            double value = advance().number;
            return FormulaNodePtr(std::make_unique<NumberNode>(value));
        }

        case TokenType::Reference: {
            auto pos = utils::AddressParser::decode(token.text);
            if (!pos) {
                return pos.error();
            }
            advance();
            if (check(TokenType::Colon)) {
                return core::makeError(core::ErrorCode::InvalidFormula,
                                       "Ranges are only allowed as function arguments", formula_);
            }
            return FormulaNodePtr(std::make_unique<ReferenceNode>(pos.value()));
        }

        case TokenType::Identifier: {
            if (pos_ + 1 < tokens_.size() && tokens_[pos_ + 1].type == TokenType::LParen) {
                auto call = parseCall();
                if (!call) {
                    return call.error();
                }
                return FormulaNodePtr(std::move(call.value()));
            }
            return core::makeError(core::ErrorCode::InvalidFormula,
                                   fmt::format("Unknown identifier '{}'", token.text), formula_);
        }

        case TokenType::LParen: {
            advance();
            auto entered = enter();
            if (!entered) {
                return entered.error();
            }
            auto inner = parseExpression();
            if (!inner) {
                return inner.error();
            }
            if (!check(TokenType::RParen)) {
                return unexpected(core::ErrorCode::InvalidFormula, "')'");
            }
            advance();
            leave();
            return inner;
        }

        default:
            break;
    }
    return unexpected(core::ErrorCode::InvalidFormula, "a value");
}

core::Result<std::unique_ptr<FunctionCallNode>> FormulaParser::parseCall() {
    const Token& name = advance();
    auto id = FormulaFunctions::lookup(name.text);
    if (!id) {
        return core::makeError(core::ErrorCode::InvalidFunction,
                               fmt::format("Unknown function '{}'", name.text), formula_);
    }
    advance(); // '('

    auto entered = enter();
    if (!entered) {
        return entered.error();
    }

    std::vector<FunctionCallNode::Segment> segments;
    auto primary = parseSegment();
    if (!primary) {
        return primary.error();
    }
    segments.push_back(std::move(primary.value()));

    while (check(TokenType::Semicolon)) {
        advance();
        if (segments.size() < 2) {
            auto secondary = parseSecondarySegment();
            if (!secondary) {
                return secondary.error();
            }
            segments.push_back(std::move(secondary.value()));
        } else {
            // 第三段及以后不参与计算
            auto skipped = skipSegment();
            if (!skipped) {
                return skipped.error();
            }
        }
    }

    if (!check(TokenType::RParen)) {
        return unexpected(core::ErrorCode::InvalidFormula, "')'");
    }
    advance();
    leave();

    return std::make_unique<FunctionCallNode>(*id, std::move(segments));
}

core::Result<FunctionCallNode::Segment> FormulaParser::parseSegment() {
    FunctionCallNode::Segment segment;
    if (check(TokenType::RParen) || check(TokenType::Semicolon)) {
        return segment;
    }

    while (true) {
        auto arg = parseArgument();
        if (!arg) {
            return arg.error();
        }
        segment.push_back(std::move(arg.value()));

        if (check(TokenType::Comma)) {
            advance();
            continue;
        }
        if (check(TokenType::RParen) || check(TokenType::Semicolon) || check(TokenType::End)) {
            break;
        }
        // "SUM(A1+1)" 这类参数不是合法的参数记号
        return unexpected(core::ErrorCode::InvalidCellReference, "',' or ')'");
    }
    return segment;
}

core::Result<FunctionCallNode::Segment> FormulaParser::parseSecondarySegment() {
    size_t start = pos_;
    size_t depth = depth_;
    auto segment = parseSegment();
    if (segment || segment.error().code == core::ErrorCode::InvalidFunction) {
        return segment;
    }

    // 解析不了的位数按缺省 0 处理
    FORMULA_DEBUG("忽略无法解析的第二参数段: {}", segment.error().message);
    pos_ = start;
    depth_ = depth;
    auto skipped = skipSegment();
    if (!skipped) {
        return skipped.error();
    }
    return FunctionCallNode::Segment();
}

core::Result<FunctionArgument> FormulaParser::parseArgument() {
    const Token& token = peek();

    switch (token.type) {
        case TokenType::Plus:
        case TokenType::Minus: {
            bool negative = token.type == TokenType::Minus;
            advance();
            if (!check(TokenType::Number)) {
                return unexpected(core::ErrorCode::InvalidCellReference, "a number after the sign");
            }
            double value = advance().number;
            return FunctionArgument::makeNumber(negative ? -value : value);
        }

        case TokenType::Number:
            return FunctionArgument::makeNumber(advance().number);

        case TokenType::Reference: {
            auto first = utils::AddressParser::decode(advance().text);
            if (!first) {
                return first.error();
            }
            if (!check(TokenType::Colon)) {
                return FunctionArgument::makeReference(first.value());
            }

            advance(); // ':'
            if (check(TokenType::Comma) || check(TokenType::RParen) ||
                check(TokenType::Semicolon) || check(TokenType::End)) {
                return core::makeError(core::ErrorCode::InvalidRange,
                                       "Range is missing its end cell", formula_);
            }
            if (!check(TokenType::Reference)) {
                return unexpected(core::ErrorCode::InvalidCellReference, "a cell reference");
            }
            auto last = utils::AddressParser::decode(advance().text);
            if (!last) {
                return last.error();
            }
            return FunctionArgument::makeRange(core::CellRange(first.value(), last.value()));
        }

        case TokenType::Colon:
            return core::makeError(core::ErrorCode::InvalidRange,
                                   "Range is missing its start cell", formula_);

        case TokenType::Identifier: {
            if (pos_ + 1 < tokens_.size() && tokens_[pos_ + 1].type == TokenType::LParen) {
                auto call = parseCall();
                if (!call) {
                    return call.error();
                }
                return FunctionArgument::makeCall(std::move(call.value()));
            }
            return unexpected(core::ErrorCode::InvalidCellReference, "a cell reference");
        }

        case TokenType::Comma:
        case TokenType::RParen:
        case TokenType::Semicolon:
        case TokenType::End:
            return unexpected(core::ErrorCode::InvalidFormula, "a function argument");

        default:
            break;
    }
    return unexpected(core::ErrorCode::InvalidCellReference, "a function argument");
}

core::VoidResult FormulaParser::skipSegment() {
    size_t nesting = 0;
    while (!check(TokenType::End)) {
        if (check(TokenType::LParen)) {
            ++nesting;
        } else if (check(TokenType::RParen)) {
            if (nesting == 0) {
                return {};
            }
            --nesting;
        } else if (check(TokenType::Semicolon) && nesting == 0) {
            return {};
        }
        advance();
    }
    return unexpected(core::ErrorCode::InvalidFormula, "')'");
}

core::VoidResult FormulaParser::enter() {
    if (++depth_ > options_.max_depth) {
        FORMULA_WARN("公式嵌套超过 {} 层，拒绝解析", options_.max_depth);
        return core::makeError(core::ErrorCode::InvalidFormula,
                               fmt::format("Formula nesting exceeds {} levels", options_.max_depth),
                               formula_);
    }
    return {};
}

core::Error FormulaParser::unexpected(core::ErrorCode code, const char* expected) const {
    const Token& token = peek();
    std::string found = token.type == TokenType::End ? toString(token.type)
                                                    : fmt::format("'{}'", token.text);
    return core::makeError(code,
                           fmt::format("Expected {} but found {} at position {}",
                                       expected, found, token.position),
                           formula_);
}

}} // namespace calcgrid::formula
