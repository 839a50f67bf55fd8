#pragma once

#include "calcgrid/core/Expected.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace calcgrid {
namespace formula {

enum class TokenType : uint8_t {
    Number,      // 12、3.5、.5、1e5
    Reference,   // 字母后紧跟数字：A1、aa12
    Identifier,  // 纯字母：SUM、hello
    Plus,
    Minus,
    Star,
    Slash,
    LParen,
    RParen,
    Comma,
    Semicolon,
    Colon,
    End
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    double number = 0.0;   // 仅 Number 有效
    size_t position = 0;   // 在公式中的起始偏移
};

const char* toString(TokenType type) noexcept;

/**
 * @brief 公式词法分析器
 *
 * 空白字符被跳过；任何不属于上述记号的字符（'^'、'%'、'"' 等）都返回 InvalidFormula。
 * 数字的指数部分只在 'e'/'E' 后面紧跟数字时才被吞入，所以 "1E5" 是数字而 "E5" 是引用。
 */
class FormulaTokenizer {
public:
    explicit FormulaTokenizer(std::string_view formula) : formula_(formula) {}

    core::Result<std::vector<Token>> tokenize();

private:
    core::Result<Token> readNumber();
    Token readWord();

    std::string_view formula_;
    size_t pos_ = 0;
};

}} // namespace calcgrid::formula
