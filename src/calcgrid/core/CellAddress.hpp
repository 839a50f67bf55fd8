#pragma once

#include <algorithm>
#include <string>

namespace calcgrid {
namespace core {

/**
 * @brief 单元格坐标（0基行列索引）
 *
 * 外部文本形式为列字母 + 1基行号（"AA12"），转换由 utils::AddressParser 完成。
 */
struct CellPosition {
    int row = 0;
    int col = 0;

    CellPosition() = default;
    CellPosition(int r, int c) : row(r), col(c) {}

    bool isValid() const {
        return row >= 0 && col >= 0;
    }

    /**
     * @brief 转换为"A1"形式的地址
     */
    std::string toString() const;

    bool operator==(const CellPosition& other) const {
        return row == other.row && col == other.col;
    }

    bool operator!=(const CellPosition& other) const {
        return !(*this == other);
    }

    // 行优先排序，std::set<CellPosition> 依赖它
    bool operator<(const CellPosition& other) const {
        if (row != other.row) return row < other.row;
        return col < other.col;
    }
};

/**
 * @brief 矩形单元格范围（闭区间，已规范化为左上到右下）
 *
 * 无论以哪个方向书写（A3:A1 或 A1:A3），构造后 first 总是左上角。
 */
class CellRange {
private:
    CellPosition first_;
    CellPosition last_;

public:
    CellRange() = default;

    CellRange(const CellPosition& a, const CellPosition& b)
        : first_(std::min(a.row, b.row), std::min(a.col, b.col)),
          last_(std::max(a.row, b.row), std::max(a.col, b.col)) {}

    explicit CellRange(const CellPosition& single) : first_(single), last_(single) {}

    const CellPosition& first() const { return first_; }
    const CellPosition& last() const { return last_; }

    int getRowCount() const { return last_.row - first_.row + 1; }
    int getColCount() const { return last_.col - first_.col + 1; }

    bool isSingleCell() const { return first_ == last_; }

    bool contains(const CellPosition& pos) const {
        return pos.row >= first_.row && pos.row <= last_.row &&
               pos.col >= first_.col && pos.col <= last_.col;
    }

    /**
     * @brief 按行优先顺序遍历范围内的每个单元格
     */
    template<typename F>
    void forEach(F&& func) const {
        for (int row = first_.row; row <= last_.row; ++row) {
            for (int col = first_.col; col <= last_.col; ++col) {
                func(CellPosition(row, col));
            }
        }
    }

    /**
     * @brief 与 [0, rows) x [0, cols) 的交集；不相交时返回 false
     */
    bool clipTo(int rows, int cols, CellRange& clipped) const {
        if (first_.row >= rows || first_.col >= cols) {
            return false;
        }
        clipped.first_ = first_;
        clipped.last_ = CellPosition(std::min(last_.row, rows - 1), std::min(last_.col, cols - 1));
        return true;
    }

    std::string toString() const;

    bool operator==(const CellRange& other) const {
        return first_ == other.first_ && last_ == other.last_;
    }
};

}} // namespace calcgrid::core
