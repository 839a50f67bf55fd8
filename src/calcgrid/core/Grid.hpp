#pragma once

#include "calcgrid/core/Cell.hpp"
#include "calcgrid/core/CellAddress.hpp"
#include "calcgrid/core/DependencyGraph.hpp"
#include "calcgrid/core/Expected.hpp"
#include "calcgrid/core/GridTypes.hpp"
#include "calcgrid/formula/CellValueSource.hpp"
#include "calcgrid/formula/FormulaEngine.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace calcgrid {
namespace core {

/**
 * @brief 一次全量重算的统计
 */
struct RecomputeStats {
    size_t formula_cells = 0;  // 公式单元格数
    size_t edges = 0;          // 依赖图边数
    size_t evaluated = 0;      // 按拓扑序求值的单元格数
    size_t failed = 0;         // 求值失败的单元格数
    size_t cyclic = 0;         // 在环上或依赖环的单元格数
};

/**
 * @brief 固定尺寸的单元格网格与重算引擎
 *
 * 每次编辑后执行全量重算：
 * 1. 普通单元格直接显示输入文本；
 * 2. 在公式单元格之间建立依赖图（普通单元格视为常量，不进图）；
 * 3. Kahn 排序，排不进顺序的单元格（环及其下游）标记为错误，不求值；
 * 4. 其余公式按拓扑序求值，读取的是其他单元格当前的显示值。
 *
 * 坐标越界的访问与编辑抛出 CellException；公式本身的错误只体现在单元格的
 * 错误标记上，不会抛出。Grid 不是线程安全的。
 *
 * @example
 * Grid grid;
 * grid.applyEdit(0, 0, "10");       // A1
 * grid.applyEdit(1, 0, "=A1*2");    // A2
 * grid.displayValue(1, 0);          // "20"
 */
class Grid {
public:
    explicit Grid(GridOptions options = GridOptions());
    Grid(int rows, int cols);

    int getRows() const { return options_.rows; }
    int getCols() const { return options_.cols; }
    const GridOptions& getOptions() const { return options_; }

    bool isInBounds(int row, int col) const {
        return row >= 0 && row < options_.rows && col >= 0 && col < options_.cols;
    }

    // ========== 读取 ==========

    const Cell& cell(int row, int col) const;
    const Cell& cell(const CellPosition& pos) const { return cell(pos.row, pos.col); }

    /**
     * @brief 按 "B3" 形式的地址读取
     * @throws CellException 地址无法解析或越界
     */
    const Cell& cell(const std::string& label) const;

    const std::string& displayValue(int row, int col) const { return cell(row, col).getDisplayValue(); }

    // ========== 编辑 ==========

    /**
     * @brief 只写入输入文本（经过规范化），不重算
     *
     * 公式输入会被补全括号后存储（"=SUM(A1" 存为 "=SUM(A1)"），
     * 数值输入按 normalize_literals 规范化（"007" 存为 "7"）。
     */
    void setInput(int row, int col, const std::string& text);

    /**
     * @brief 写入输入，先对该单元格单独求值，再全量重算
     */
    void applyEdit(int row, int col, const std::string& text);
    void applyEdit(const std::string& label, const std::string& text);

    /**
     * @brief applyEdit 的非抛出版本，越界等调用错误以 Result 返回
     */
    VoidResult tryApplyEdit(int row, int col, const std::string& text);

    /**
     * @brief 批量写入后只重算一次；任一坐标越界时不做任何修改
     */
    void applyEdits(const std::vector<CellEdit>& edits);

    void clearCell(int row, int col) { applyEdit(row, col, std::string()); }

    /**
     * @brief 以当前显示值对一条公式求值，不写入任何单元格
     *
     * 开头的公式标记可有可无。
     * @throws FormulaException 公式无法求值
     * @throws CellException 公式中的地址或范围非法
     */
    std::string evaluate(const std::string& formula) const;

    /**
     * @brief 全量重算，重复调用结果相同
     */
    RecomputeStats recompute();

    // ========== 持久化与统计 ==========

    /**
     * @brief 导出所有非空输入（行优先）
     */
    std::map<CellPosition, std::string> inputs() const;

    /**
     * @brief 清空网格并载入输入，随后重算一次；任一坐标越界时不做任何修改
     */
    void loadInputs(const std::map<CellPosition, std::string>& inputs);

    /**
     * @brief 非空输入的外接矩形；网格为空时返回 std::nullopt
     */
    std::optional<CellRange> usedBounds() const;

    /**
     * @brief 单元格公式引用到的网格内单元格（非公式单元格为空集）
     */
    std::set<CellPosition> dependenciesOf(int row, int col) const;

private:
    /**
     * @brief 以当前显示值作为公式取值来源，越界返回 std::nullopt
     */
    class DisplaySource : public formula::CellValueSource {
    public:
        explicit DisplaySource(const Grid& grid) : grid_(grid) {}

        std::optional<std::string> get(int row, int col) const override;
        std::optional<CellRange> bounds() const override;

    private:
        const Grid& grid_;
    };

    void checkBounds(int row, int col) const;
    Cell& at(int row, int col) { return cells_[static_cast<size_t>(row) * options_.cols + col]; }
    const Cell& at(int row, int col) const { return cells_[static_cast<size_t>(row) * options_.cols + col]; }

    std::string prepareInput(const std::string& text) const;

    /**
     * @brief 对单个单元格求值并写入显示值
     * @return 公式求值失败时返回 false
     */
    bool evaluateCell(const CellPosition& pos);

    GridOptions options_;
    std::vector<Cell> cells_;
    formula::FormulaEngine engine_;
};

}} // namespace calcgrid::core
