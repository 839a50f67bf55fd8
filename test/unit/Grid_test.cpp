// CalcGrid 库 - 电子表格公式求值与重算引擎
// 组件：网格重算引擎测试
//
// 覆盖依赖排序、循环检测、编辑时的输入规范化与批量操作。

#include "calcgrid/core/Exception.hpp"
#include "calcgrid/core/Grid.hpp"
#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>

namespace calcgrid {
namespace core {

class GridTest : public ::testing::Test {
protected:
    // 以 "A1" 形式的地址编辑
    void edit(Grid& target, const std::string& label, const std::string& text) {
        target.applyEdit(label, text);
    }

    void edit(const std::string& label, const std::string& text) { edit(grid, label, text); }

    const Cell& at(const Grid& target, const std::string& label) {
        return target.cell(label);
    }

    const Cell& at(const std::string& label) { return at(grid, label); }

    std::string show(const std::string& label) { return at(label).getDisplayValue(); }

    Grid grid;
};

// ========== 构造与边界 ==========

TEST_F(GridTest, DefaultSize) {
    EXPECT_EQ(grid.getRows(), 50);
    EXPECT_EQ(grid.getCols(), 26);
    EXPECT_TRUE(grid.isInBounds(49, 25));
    EXPECT_FALSE(grid.isInBounds(50, 0));
    EXPECT_FALSE(grid.isInBounds(0, -1));
}

TEST_F(GridTest, ZeroSizedGridIsRejected) {
    EXPECT_THROW(Grid(0, 5), ParameterException);
    EXPECT_THROW(Grid(5, 0), ParameterException);
    EXPECT_THROW(Grid(-1, -1), ParameterException);
}

TEST_F(GridTest, OutOfBoundsAccessThrows) {
    EXPECT_THROW(grid.cell(50, 0), CellException);
    EXPECT_THROW(grid.displayValue(0, 26), CellException);
    EXPECT_THROW(grid.applyEdit(-1, 0, "1"), CellException);
    EXPECT_THROW(grid.setInput(0, 100, "1"), CellException);

    try {
        grid.cell(99, 0);
        FAIL() << "expected CellException";
    } catch (const CellException& e) {
        EXPECT_EQ(e.getCellReference(), "A100");
    }
}

TEST_F(GridTest, TryApplyEditReportsErrors) {
    auto outside = grid.tryApplyEdit(100, 0, "1");
    ASSERT_FALSE(outside);
    EXPECT_EQ(outside.error().code, ErrorCode::InvalidCellReference);

    auto inside = grid.tryApplyEdit(0, 0, "=2+2");
    ASSERT_TRUE(inside);
    EXPECT_EQ(show("A1"), "4");
}

TEST_F(GridTest, LabelAccess) {
    grid.applyEdit("B2", "=1+1");
    EXPECT_EQ(grid.cell("B2").getDisplayValue(), "2");
    EXPECT_EQ(grid.displayValue(1, 1), "2");

    EXPECT_THROW(grid.cell("B0"), CellException);
    EXPECT_THROW(grid.cell("not a label"), CellException);
    EXPECT_THROW(grid.applyEdit("AA1", "1"), CellException);
}

TEST_F(GridTest, EvaluateDoesNotWriteCells) {
    edit("A1", "10");
    edit("A2", "20");
    EXPECT_EQ(grid.evaluate("=SUM(A1:A2)"), "30");
    EXPECT_EQ(grid.evaluate("A1/4"), "2.5");
    EXPECT_FALSE(grid.usedBounds()->contains(CellPosition(2, 0)));

    try {
        grid.evaluate("A1/0");
        FAIL() << "expected FormulaException";
    } catch (const FormulaException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::DivisionByZero);
    }
    EXPECT_THROW(grid.evaluate("FOO(1)"), FormulaException);
    EXPECT_THROW(grid.evaluate("SUM(A1:)"), CellException);
}

// ========== 求值与依赖 ==========

TEST_F(GridTest, FormulaReadsOtherCells) {
    edit("A1", "10");
    edit("A2", "=A1*2");
    EXPECT_EQ(show("A2"), "20");

    edit("A1", "5");
    EXPECT_EQ(show("A2"), "10");
}

TEST_F(GridTest, ForwardReferencesAreOrdered) {
    edit("A1", "=B1+1");
    edit("B1", "=C1*2");
    edit("C1", "3");
    EXPECT_EQ(show("A1"), "7");
    EXPECT_EQ(show("B1"), "6");
}

TEST_F(GridTest, RangesOverFormulaCells) {
    edit("A1", "1");
    edit("A2", "=A1+1");
    edit("A3", "=A2+1");
    edit("A4", "=SUM(A1:A3)");
    EXPECT_EQ(show("A4"), "6");

    edit("A1", "10");
    EXPECT_EQ(show("A4"), "33");
}

TEST_F(GridTest, ReferenceOutsideTheGridReadsAsEmpty) {
    Grid small(3, 3);
    edit(small, "A1", "=Z99+1");
    EXPECT_EQ(at(small, "A1").getDisplayValue(), "1");
    EXPECT_TRUE(small.dependenciesOf(0, 0).empty());
}

// 远超网格的范围按网格边界裁剪
TEST_F(GridTest, HugeRangesAreClippedToTheGrid) {
    edit("A2", "5");
    edit("B3", "7");
    edit("C1", "=SUM(A2:ZZ3000000)");
    edit("D1", "=SUM(A1000:ZZ3000000)");
    edit("E1", "=COUNT(A2:FXSHRXW2147483647)");
    EXPECT_EQ(show("C1"), "12");
    EXPECT_EQ(show("D1"), "0");
    EXPECT_EQ(show("E1"), "2");
}

TEST_F(GridTest, DependenciesOf) {
    edit("C1", "=A1+SUM(B1:B3)");
    auto deps = grid.dependenciesOf(0, 2);
    EXPECT_EQ(deps, (std::set<CellPosition>{{0, 0}, {0, 1}, {2, 1}}));

    edit("D1", "plain");
    EXPECT_TRUE(grid.dependenciesOf(0, 3).empty());
}

// ========== 错误与循环 ==========

TEST_F(GridTest, FormulaErrorsAreLocal) {
    edit("A1", "=1/0");
    edit("B1", "=2+2");
    EXPECT_TRUE(at("A1").hasError());
    EXPECT_EQ(show("A1"), "#ERROR");
    EXPECT_EQ(at("A1").getErrorCode(), ErrorCode::DivisionByZero);
    EXPECT_FALSE(at("B1").hasError());
    EXPECT_EQ(show("B1"), "4");
}

TEST_F(GridTest, ReferencingAnErrorCell) {
    edit("A1", "=FOO(1)");
    edit("B1", "=A1+1");
    edit("C1", "=SUM(A1:A2)");

    EXPECT_EQ(at("A1").getErrorCode(), ErrorCode::InvalidFunction);
    // 裸引用读到错误标记文本时失败
    EXPECT_TRUE(at("B1").hasError());
    EXPECT_EQ(at("B1").getErrorCode(), ErrorCode::InvalidFormula);
    // 范围中的错误标记按文本处理，记为 0
    EXPECT_FALSE(at("C1").hasError());
    EXPECT_EQ(show("C1"), "0");
}

TEST_F(GridTest, SelfReferenceIsACycle) {
    edit("A1", "=A1+1");
    EXPECT_TRUE(at("A1").hasError());
    EXPECT_EQ(show("A1"), "#ERROR");
    EXPECT_EQ(at("A1").getErrorCode(), ErrorCode::CircularReference);
}

TEST_F(GridTest, CyclesAndTheirDependentsFail) {
    edit("A1", "=B1");
    edit("B1", "=A1");
    edit("C1", "=A1+1");
    edit("D1", "=1+1");
    edit("E1", "7");

    for (const char* label : {"A1", "B1", "C1"}) {
        EXPECT_TRUE(at(label).hasError()) << label;
        EXPECT_EQ(show(label), "#ERROR") << label;
        EXPECT_EQ(at(label).getErrorCode(), ErrorCode::CircularReference) << label;
    }
    EXPECT_EQ(show("D1"), "2");
    EXPECT_EQ(show("E1"), "7");
}

TEST_F(GridTest, IndirectCycle) {
    edit("A1", "=B1+1");
    edit("B1", "=C1+1");
    edit("C1", "=A1+1");
    auto stats = grid.recompute();
    EXPECT_EQ(stats.formula_cells, 3u);
    EXPECT_EQ(stats.cyclic, 3u);
    EXPECT_EQ(stats.evaluated, 0u);
}

TEST_F(GridTest, BreakingACycleRecovers) {
    edit("A1", "=B1");
    edit("B1", "=A1");
    edit("C1", "=A1+1");
    edit("B1", "5");

    EXPECT_FALSE(at("A1").hasError());
    EXPECT_EQ(show("A1"), "5");
    EXPECT_EQ(show("C1"), "6");
}

TEST_F(GridTest, RecomputeIsIdempotent) {
    edit("A1", "3");
    edit("A2", "=A1*A1");
    edit("B1", "=B2");
    edit("B2", "=B1");
    edit("C1", "=SUM(A1:A2)/0");

    auto snapshot = [this]() {
        std::vector<std::string> values;
        for (int row = 0; row < 3; ++row) {
            for (int col = 0; col < 3; ++col) {
                values.push_back(grid.displayValue(row, col));
            }
        }
        return values;
    };

    auto before = snapshot();
    auto first = grid.recompute();
    auto second = grid.recompute();
    EXPECT_EQ(snapshot(), before);
    EXPECT_EQ(first.cyclic, second.cyclic);
    EXPECT_EQ(first.failed, second.failed);
    EXPECT_EQ(first.failed, 1u);
}

TEST_F(GridTest, CustomErrorSentinel) {
    GridOptions options;
    options.error_sentinel = "ERR!";
    Grid custom(options);
    edit(custom, "A1", "=1/0");
    EXPECT_EQ(at(custom, "A1").getDisplayValue(), "ERR!");
}

// ========== 输入规范化 ==========

TEST_F(GridTest, NumericInputIsNormalized) {
    edit("A1", "007");
    edit("A2", "12.0");
    edit("A3", "3.50");
    edit("A4", "hello");
    EXPECT_EQ(at("A1").getInput(), "7");
    EXPECT_EQ(show("A1"), "7");
    EXPECT_EQ(at("A2").getInput(), "12");
    EXPECT_EQ(at("A3").getInput(), "3.5");
    EXPECT_EQ(at("A4").getInput(), "hello");
}

TEST_F(GridTest, NormalizationCanBeDisabled) {
    GridOptions options;
    options.normalize_literals = false;
    Grid raw(options);
    edit(raw, "A1", "007");
    edit(raw, "A2", "=A1+1");
    EXPECT_EQ(at(raw, "A1").getInput(), "007");
    EXPECT_EQ(at(raw, "A2").getDisplayValue(), "8");
}

TEST_F(GridTest, FormulaInputIsAutoClosed) {
    edit("A1", "10");
    edit("A2", "20");
    edit("A3", "=SUM(A1:A2");
    EXPECT_EQ(at("A3").getInput(), "=SUM(A1:A2)");
    EXPECT_EQ(show("A3"), "30");
}

// ========== 范围依赖 ==========

// 默认只记录范围端点；展开后范围内部的公式单元格也会先于引用者求值
TEST_F(GridTest, ExpandedRangeDependenciesOrderInteriorCells) {
    GridOptions options;
    options.expand_range_dependencies = true;
    Grid strict(options);

    edit(strict, "A1", "=SUM(B1:B3)");
    edit(strict, "B2", "=D9");
    edit(strict, "D9", "=4");
    edit(strict, "D9", "=9");

    EXPECT_EQ(at(strict, "B2").getDisplayValue(), "9");
    EXPECT_EQ(at(strict, "A1").getDisplayValue(), "9");
    EXPECT_EQ(strict.dependenciesOf(0, 0).size(), 3u);
}

TEST_F(GridTest, ExpandedRangeDependenciesDetectInteriorCycles) {
    GridOptions options;
    options.expand_range_dependencies = true;
    Grid strict(options);

    edit(strict, "A1", "=SUM(B1:B3)");
    edit(strict, "B2", "=A1");
    EXPECT_TRUE(at(strict, "A1").hasError());
    EXPECT_TRUE(at(strict, "B2").hasError());

    // 默认只看端点，B2 不在 A1 的依赖中
    edit("A1", "=SUM(B1:B3)");
    edit("B2", "=A1");
    EXPECT_FALSE(at("A1").hasError());
    EXPECT_FALSE(at("B2").hasError());
}

// ========== 批量操作与持久化 ==========

TEST_F(GridTest, ApplyEdits) {
    grid.applyEdits({{0, 0, "1"}, {1, 0, "2"}, {2, 0, "=A1+A2"}});
    EXPECT_EQ(show("A3"), "3");
}

TEST_F(GridTest, ApplyEditsIsAllOrNothing) {
    edit("A1", "1");
    EXPECT_THROW(grid.applyEdits({{0, 0, "99"}, {500, 0, "x"}}), CellException);
    EXPECT_EQ(show("A1"), "1");
}

TEST_F(GridTest, ClearCell) {
    edit("A1", "5");
    edit("A2", "=A1*2");
    grid.clearCell(0, 0);
    EXPECT_TRUE(at("A1").isEmpty());
    EXPECT_EQ(show("A2"), "0");
}

TEST_F(GridTest, InputsRoundTripThroughLoadInputs) {
    edit("A1", "2");
    edit("B3", "=A1*10");
    edit("C2", "note");

    auto saved = grid.inputs();
    ASSERT_EQ(saved.size(), 3u);
    EXPECT_EQ(saved.at(CellPosition(2, 1)), "=A1*10");

    Grid restored;
    restored.applyEdit(10, 10, "stale");
    restored.loadInputs(saved);
    EXPECT_EQ(restored.inputs(), saved);
    EXPECT_EQ(restored.displayValue(2, 1), "20");
    EXPECT_TRUE(restored.cell(10, 10).isEmpty());
}

TEST_F(GridTest, LoadInputsRejectsOutOfBoundsEntries) {
    edit("A1", "keep");
    std::map<CellPosition, std::string> bad = {{CellPosition(0, 0), "x"}, {CellPosition(0, 99), "y"}};
    EXPECT_THROW(grid.loadInputs(bad), CellException);
    EXPECT_EQ(show("A1"), "keep");
}

TEST_F(GridTest, UsedBounds) {
    EXPECT_FALSE(grid.usedBounds().has_value());

    edit("C1", "x");
    edit("A3", "y");
    auto bounds = grid.usedBounds();
    ASSERT_TRUE(bounds.has_value());
    EXPECT_EQ(bounds->first(), CellPosition(0, 0));
    EXPECT_EQ(bounds->last(), CellPosition(2, 2));
    EXPECT_EQ(bounds->toString(), "A1:C3");
}

}} // namespace calcgrid::core
