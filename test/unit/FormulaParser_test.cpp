// CalcGrid 库 - 电子表格公式求值与重算引擎
// 组件：公式词法与语法分析测试

#include "calcgrid/formula/FormulaParser.hpp"
#include "calcgrid/formula/FormulaTokenizer.hpp"
#include <gtest/gtest.h>
#include <string>

namespace calcgrid {
namespace formula {

using core::ErrorCode;

namespace {

std::string canonical(const std::string& formula) {
    auto ast = FormulaParser().parse(formula);
    if (!ast) {
        return "<error: " + ast.error().fullMessage() + ">";
    }
    return ast.value()->toString();
}

ErrorCode parseError(const std::string& formula, core::FormulaOptions options = core::FormulaOptions()) {
    auto ast = FormulaParser(options).parse(formula);
    return ast ? ErrorCode::Ok : ast.error().code;
}

} // namespace

// ========== 词法分析 ==========

TEST(FormulaTokenizerTest, TokenKinds) {
    auto tokens = FormulaTokenizer("SUM(a1:B2; 1.5E2) - .5").tokenize();
    ASSERT_TRUE(tokens);

    const auto& t = tokens.value();
    ASSERT_EQ(t.size(), 11u);
    EXPECT_EQ(t[0].type, TokenType::Identifier);
    EXPECT_EQ(t[0].text, "SUM");
    EXPECT_EQ(t[1].type, TokenType::LParen);
    EXPECT_EQ(t[2].type, TokenType::Reference);
    EXPECT_EQ(t[2].text, "a1");
    EXPECT_EQ(t[3].type, TokenType::Colon);
    EXPECT_EQ(t[4].type, TokenType::Reference);
    EXPECT_EQ(t[5].type, TokenType::Semicolon);
    EXPECT_EQ(t[6].type, TokenType::Number);
    EXPECT_DOUBLE_EQ(t[6].number, 150.0);
    EXPECT_EQ(t[7].type, TokenType::RParen);
    EXPECT_EQ(t[8].type, TokenType::Minus);
    EXPECT_EQ(t[9].type, TokenType::Number);
    EXPECT_DOUBLE_EQ(t[9].number, 0.5);
    EXPECT_EQ(t[10].type, TokenType::End);
}

TEST(FormulaTokenizerTest, ExponentOnlyWhenDigitsFollow) {
    auto tokens = FormulaTokenizer("2E+E5").tokenize();
    ASSERT_TRUE(tokens);
    const auto& t = tokens.value();
    ASSERT_EQ(t.size(), 5u);
    EXPECT_EQ(t[0].type, TokenType::Number);
    EXPECT_EQ(t[0].text, "2");
    EXPECT_EQ(t[1].type, TokenType::Identifier);
    EXPECT_EQ(t[1].text, "E");
    EXPECT_EQ(t[2].type, TokenType::Plus);
    EXPECT_EQ(t[3].type, TokenType::Reference);
    EXPECT_EQ(t[3].text, "E5");
}

TEST(FormulaTokenizerTest, RejectsUnknownCharacters) {
    for (const char* formula : {"2^3", "10%", "\"text\"", "A1&B1", "1=1"}) {
        auto tokens = FormulaTokenizer(formula).tokenize();
        ASSERT_FALSE(tokens) << formula;
        EXPECT_EQ(tokens.error().code, ErrorCode::InvalidFormula) << formula;
    }
}

// ========== 语法分析 ==========

TEST(FormulaParserTest, PrecedenceAndParentheses) {
    EXPECT_EQ(canonical("1+2*3"), "1+2*3");
    EXPECT_EQ(canonical("(1+2)*3"), "(1+2)*3");
    EXPECT_EQ(canonical("((1))"), "1");
    EXPECT_EQ(canonical("1-(2-3)"), "1-(2-3)");
    EXPECT_EQ(canonical("(1-2)-3"), "1-2-3");
    EXPECT_EQ(canonical("8/(4/2)"), "8/(4/2)");
    EXPECT_EQ(canonical("-(1+2)"), "-(1+2)");
    EXPECT_EQ(canonical(" a1 + 1E5 "), "A1+100000");
}

TEST(FormulaParserTest, FunctionCalls) {
    EXPECT_EQ(canonical("sum(a3:a1,-2,B7)"), "SUM(A1:A3,-2,B7)");
    EXPECT_EQ(canonical("ROUND(A1;2)"), "ROUND(A1;2)");
    EXPECT_EQ(canonical("MIN(SUM(A1:A2);PRODUCT(B1:B2))"), "MIN(SUM(A1:A2);PRODUCT(B1:B2))");
    EXPECT_EQ(canonical("SUM()"), "SUM()");
    EXPECT_EQ(canonical("SUM(1)*-ABS(2)"), "SUM(1)*-ABS(2)");
}

TEST(FormulaParserTest, SegmentsAfterTheSecondAreIgnored) {
    EXPECT_EQ(canonical("MAX(1;2;anything(here);3)"), "MAX(1;2)");
}

TEST(FormulaParserTest, UnparsableSecondSegmentIsDropped) {
    EXPECT_EQ(canonical("ROUND(A1;abc)"), "ROUND(A1;)");
    EXPECT_EQ(canonical("ROUND(A1;1+1;7)"), "ROUND(A1;)");
}

TEST(FormulaParserTest, ReferencedRanges) {
    auto ast = FormulaParser().parse("A1+SUM(B1:B3,MAX(C2))");
    ASSERT_TRUE(ast);
    auto ranges = ast.value()->getReferencedRanges();
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges[0].toString(), "A1");
    EXPECT_EQ(ranges[1].toString(), "B1:B3");
    EXPECT_EQ(ranges[2].toString(), "C2");
}

TEST(FormulaParserTest, SyntaxErrors) {
    EXPECT_EQ(parseError(""), ErrorCode::InvalidFormula);
    EXPECT_EQ(parseError("1+"), ErrorCode::InvalidFormula);
    EXPECT_EQ(parseError("+++"), ErrorCode::InvalidFormula);
    EXPECT_EQ(parseError("1 2"), ErrorCode::InvalidFormula);
    EXPECT_EQ(parseError("(1+2"), ErrorCode::InvalidFormula);
    EXPECT_EQ(parseError("1+2)"), ErrorCode::InvalidFormula);
    EXPECT_EQ(parseError("hello"), ErrorCode::InvalidFormula);
    EXPECT_EQ(parseError("A1:A3"), ErrorCode::InvalidFormula);
    EXPECT_EQ(parseError("SUM(A1,)"), ErrorCode::InvalidFormula);
    EXPECT_EQ(parseError("1.2.3"), ErrorCode::InvalidFormula);
}

TEST(FormulaParserTest, ArgumentErrors) {
    EXPECT_EQ(parseError("FOO(1)"), ErrorCode::InvalidFunction);
    EXPECT_EQ(parseError("SUM(A1+1)"), ErrorCode::InvalidCellReference);
    EXPECT_EQ(parseError("SUM(hello)"), ErrorCode::InvalidCellReference);
    EXPECT_EQ(parseError("SUM((1))"), ErrorCode::InvalidCellReference);
    EXPECT_EQ(parseError("SUM(A1:B)"), ErrorCode::InvalidCellReference);
    EXPECT_EQ(parseError("SUM(A0)"), ErrorCode::InvalidCellReference);
    EXPECT_EQ(parseError("SUM(A1:)"), ErrorCode::InvalidRange);
    EXPECT_EQ(parseError("SUM(:A1)"), ErrorCode::InvalidRange);
}

TEST(FormulaParserTest, NestingLimit) {
    std::string deep = std::string(100, '(') + "1" + std::string(100, ')');
    EXPECT_EQ(parseError(deep), ErrorCode::InvalidFormula);

    core::FormulaOptions options;
    options.max_depth = 200;
    EXPECT_EQ(parseError(deep, options), ErrorCode::Ok);

    std::string signs = std::string(100, '-') + "1";
    EXPECT_EQ(parseError(signs), ErrorCode::InvalidFormula);
}

}} // namespace calcgrid::formula
