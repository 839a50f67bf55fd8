#pragma once

#include "calcgrid/core/CellAddress.hpp"
#include "calcgrid/core/Expected.hpp"
#include "calcgrid/formula/CellValueSource.hpp"
#include "calcgrid/formula/FormulaFunctions.hpp"
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace calcgrid {
namespace formula {

/**
 * @brief 公式语法树节点基类
 */
class FormulaNode {
public:
    virtual ~FormulaNode() = default;

    virtual core::Result<double> evaluate(const CellValueSource& source) const = 0;

    /**
     * @brief 输出规范化的公式文本（不含 '=' 标记，只保留必要的括号）
     */
    virtual void print(std::ostream& os) const = 0;

    /**
     * @brief 收集节点直接引用的单元格与范围（范围按原样收集，不展开）
     */
    virtual void collectRanges(std::vector<core::CellRange>& out) const = 0;

    /**
     * @brief 运算优先级，用于打印时决定是否需要括号
     */
    virtual int precedence() const { return 3; }
};

using FormulaNodePtr = std::unique_ptr<FormulaNode>;

class NumberNode : public FormulaNode {
public:
    explicit NumberNode(double value) : value_(value) {}

    core::Result<double> evaluate(const CellValueSource& source) const override;
    void print(std::ostream& os) const override;
    void collectRanges(std::vector<core::CellRange>&) const override {}

    double getValue() const { return value_; }

private:
    double value_;
};

/**
 * @brief 算术表达式中的单元格引用
 *
 * 空单元格取 0；非数值文本使整个公式失败。
 */
class ReferenceNode : public FormulaNode {
public:
    explicit ReferenceNode(const core::CellPosition& pos) : pos_(pos) {}

    core::Result<double> evaluate(const CellValueSource& source) const override;
    void print(std::ostream& os) const override;
    void collectRanges(std::vector<core::CellRange>& out) const override;

    const core::CellPosition& getPosition() const { return pos_; }

private:
    core::CellPosition pos_;
};

class UnaryNode : public FormulaNode {
public:
    UnaryNode(char op, FormulaNodePtr operand) : op_(op), operand_(std::move(operand)) {}

    core::Result<double> evaluate(const CellValueSource& source) const override;
    void print(std::ostream& os) const override;
    void collectRanges(std::vector<core::CellRange>& out) const override;
    int precedence() const override { return 2; }

private:
    char op_;  // '+' 或 '-'
    FormulaNodePtr operand_;
};

class BinaryNode : public FormulaNode {
public:
    BinaryNode(char op, FormulaNodePtr lhs, FormulaNodePtr rhs)
        : op_(op), lhs_(std::move(lhs)), rhs_(std::move(rhs)) {}

    core::Result<double> evaluate(const CellValueSource& source) const override;
    void print(std::ostream& os) const override;
    void collectRanges(std::vector<core::CellRange>& out) const override;
    int precedence() const override { return (op_ == '+' || op_ == '-') ? 0 : 1; }

    char getOperator() const { return op_; }

private:
    char op_;
    FormulaNodePtr lhs_;
    FormulaNodePtr rhs_;
};

class FunctionCallNode;

/**
 * @brief 函数参数：范围、带符号的数字、单个引用或嵌套函数调用
 */
struct FunctionArgument {
    enum class Kind : uint8_t {
        Number,
        Reference,
        Range,
        Call
    };

    Kind kind = Kind::Number;
    double number = 0.0;
    core::CellRange range;                    // Reference 时为单格范围
    std::unique_ptr<FunctionCallNode> call;

    static FunctionArgument makeNumber(double value);
    static FunctionArgument makeReference(const core::CellPosition& pos);
    static FunctionArgument makeRange(const core::CellRange& range);
    static FunctionArgument makeCall(std::unique_ptr<FunctionCallNode> call);
};

/**
 * @brief 函数调用
 *
 * 参数按 ';' 分段：第 0 段是主参数列表（按 ',' 分隔），第 1 段是 ROUND 的小数位数，
 * 其余各段只做语法检查，不参与计算。
 */
class FunctionCallNode : public FormulaNode {
public:
    using Segment = std::vector<FunctionArgument>;

    FunctionCallNode(FunctionId id, std::vector<Segment> segments)
        : id_(id), segments_(std::move(segments)) {}

    core::Result<double> evaluate(const CellValueSource& source) const override;
    void print(std::ostream& os) const override;
    void collectRanges(std::vector<core::CellRange>& out) const override;

    FunctionId getFunction() const { return id_; }
    const std::vector<Segment>& getSegments() const { return segments_; }

private:
    /**
     * @brief 把一个参数展开为若干取值并追加到 out
     */
    core::VoidResult expandArgument(const FunctionArgument& arg,
                                    const CellValueSource& source,
                                    std::vector<ArgumentValue>& out) const;

    FunctionId id_;
    std::vector<Segment> segments_;
};

/**
 * @brief 解析完成的公式
 */
class FormulaAST {
public:
    FormulaAST(std::string text, FormulaNodePtr root)
        : text_(std::move(text)), root_(std::move(root)) {}

    /**
     * @brief 求值；除零或结果不是有限数时返回 DivisionByZero
     */
    core::Result<double> execute(const CellValueSource& source) const;

    std::string toString() const;

    std::vector<core::CellRange> getReferencedRanges() const;

    const std::string& getText() const { return text_; }
    const FormulaNode& getRoot() const { return *root_; }

private:
    std::string text_;  // 括号补全后的公式体
    FormulaNodePtr root_;
};

}} // namespace calcgrid::formula
