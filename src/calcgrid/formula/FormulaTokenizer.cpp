#include "calcgrid/formula/FormulaTokenizer.hpp"
#include "calcgrid/utils/NumberUtils.hpp"
#include <cctype>
#include <fmt/format.h>

namespace calcgrid {
namespace formula {

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isLetter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

} // namespace

const char* toString(TokenType type) noexcept {
    switch (type) {
        case TokenType::Number:     return "number";
        case TokenType::Reference:  return "reference";
        case TokenType::Identifier: return "identifier";
        case TokenType::Plus:       return "'+'";
        case TokenType::Minus:      return "'-'";
        case TokenType::Star:       return "'*'";
        case TokenType::Slash:      return "'/'";
        case TokenType::LParen:     return "'('";
        case TokenType::RParen:     return "')'";
        case TokenType::Comma:      return "','";
        case TokenType::Semicolon:  return "';'";
        case TokenType::Colon:      return "':'";
        case TokenType::End:        return "end of formula";
    }
    return "unknown";
}

core::Result<std::vector<Token>> FormulaTokenizer::tokenize() {
    std::vector<Token> tokens;
    pos_ = 0;

    while (pos_ < formula_.size()) {
        char c = formula_[pos_];

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++pos_;
            continue;
        }

        if (isDigit(c) || (c == '.' && pos_ + 1 < formula_.size() && isDigit(formula_[pos_ + 1]))) {
            auto number = readNumber();
            if (!number) {
                return number.error();
            }
            tokens.push_back(std::move(number.value()));
            continue;
        }

        if (isLetter(c)) {
            tokens.push_back(readWord());
            continue;
        }

        Token token;
        token.position = pos_;
        token.text = std::string(1, c);
        switch (c) {
            case '+': token.type = TokenType::Plus; break;
            case '-': token.type = TokenType::Minus; break;
            case '*': token.type = TokenType::Star; break;
            case '/': token.type = TokenType::Slash; break;
            case '(': token.type = TokenType::LParen; break;
            case ')': token.type = TokenType::RParen; break;
            case ',': token.type = TokenType::Comma; break;
            case ';': token.type = TokenType::Semicolon; break;
            case ':': token.type = TokenType::Colon; break;
            default:
                return core::makeError(core::ErrorCode::InvalidFormula,
                                       fmt::format("Unexpected character '{}' at position {}", c, pos_),
                                       std::string(formula_));
        }
        tokens.push_back(std::move(token));
        ++pos_;
    }

    Token end;
    end.type = TokenType::End;
    end.position = formula_.size();
    tokens.push_back(std::move(end));
    return tokens;
}

core::Result<Token> FormulaTokenizer::readNumber() {
    size_t start = pos_;
    while (pos_ < formula_.size() && isDigit(formula_[pos_])) {
        ++pos_;
    }
    if (pos_ < formula_.size() && formula_[pos_] == '.') {
        ++pos_;
        while (pos_ < formula_.size() && isDigit(formula_[pos_])) {
            ++pos_;
        }
    }

    // 指数：e/E 后必须紧跟数字（可带符号），否则 'E' 留给下一个记号
    if (pos_ < formula_.size() && (formula_[pos_] == 'e' || formula_[pos_] == 'E')) {
        size_t exp = pos_ + 1;
        if (exp < formula_.size() && (formula_[exp] == '+' || formula_[exp] == '-')) {
            ++exp;
        }
        if (exp < formula_.size() && isDigit(formula_[exp])) {
            pos_ = exp;
            while (pos_ < formula_.size() && isDigit(formula_[pos_])) {
                ++pos_;
            }
        }
    }

    Token token;
    token.type = TokenType::Number;
    token.position = start;
    token.text = std::string(formula_.substr(start, pos_ - start));

    auto value = utils::NumberUtils::parseNumber(token.text);
    if (!value) {
        return core::makeError(core::ErrorCode::InvalidFormula,
                               fmt::format("Invalid number '{}' at position {}", token.text, start),
                               std::string(formula_));
    }
    token.number = *value;
    return token;
}

Token FormulaTokenizer::readWord() {
    Token token;
    token.position = pos_;
    size_t start = pos_;

    while (pos_ < formula_.size() && isLetter(formula_[pos_])) {
        ++pos_;
    }
    token.type = TokenType::Identifier;
    if (pos_ < formula_.size() && isDigit(formula_[pos_])) {
        while (pos_ < formula_.size() && isDigit(formula_[pos_])) {
            ++pos_;
        }
        token.type = TokenType::Reference;
    }

    token.text = std::string(formula_.substr(start, pos_ - start));
    return token;
}

}} // namespace calcgrid::formula
