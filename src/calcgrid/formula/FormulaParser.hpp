#pragma once

#include "calcgrid/core/Expected.hpp"
#include "calcgrid/core/GridTypes.hpp"
#include "calcgrid/formula/FormulaAST.hpp"
#include "calcgrid/formula/FormulaTokenizer.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace calcgrid {
namespace formula {

/**
 * @brief 递归下降公式解析器
 *
 * 文法（'*' '/' 优先于 '+' '-'）：
 *   formula  := expr END
 *   expr     := term (('+' | '-') term)*
 *   term     := unary (('*' | '/') unary)*
 *   unary    := ('+' | '-') unary | primary
 *   primary  := NUMBER | REF | call | '(' expr ')'
 *   call     := IDENT '(' [args] (';' [args])* ')'
 *   args     := arg (',' arg)*
 *   arg      := ['+' | '-'] NUMBER | REF [':' REF] | call
 *
 * 范围只允许出现在函数参数中。参数位置上的其他内容返回 InvalidCellReference，
 * 未知函数名返回 InvalidFunction，其余语法错误返回 InvalidFormula。
 * 第二段（ROUND 的位数）无法按参数解析时视为空段，不报错。
 */
class FormulaParser {
public:
    explicit FormulaParser(core::FormulaOptions options = core::FormulaOptions())
        : options_(options) {}

    /**
     * @brief 解析公式体（不含 '=' 标记，也不做括号补全）
     */
    core::Result<std::unique_ptr<FormulaAST>> parse(std::string_view formula);

private:
    core::Result<FormulaNodePtr> parseExpression();
    core::Result<FormulaNodePtr> parseTerm();
    core::Result<FormulaNodePtr> parseUnary();
    core::Result<FormulaNodePtr> parsePrimary();
    core::Result<std::unique_ptr<FunctionCallNode>> parseCall();
    core::Result<FunctionCallNode::Segment> parseSegment();
    core::Result<FunctionCallNode::Segment> parseSecondarySegment();
    core::Result<FunctionArgument> parseArgument();
    core::VoidResult skipSegment();

    core::VoidResult enter();
    void leave() { --depth_; }

    const Token& peek() const { return tokens_[pos_]; }
    const Token& advance() { return tokens_[pos_ < tokens_.size() - 1 ? pos_++ : pos_]; }
    bool check(TokenType type) const { return peek().type == type; }

    core::Error unexpected(core::ErrorCode code, const char* expected) const;

    core::FormulaOptions options_;
    std::string formula_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    size_t depth_ = 0;
};

}} // namespace calcgrid::formula
