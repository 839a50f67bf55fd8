#pragma once

#include "calcgrid/formula/CellValueSource.hpp"
#include "calcgrid/utils/AddressParser.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace calcgrid {
namespace test {

// 测试用的单元格来源：按 "A1" 形式的地址存放文本
class TestCellSource : public formula::CellValueSource {
public:
    TestCellSource& set(const std::string& label, const std::string& text) {
        auto pos = utils::AddressParser::decode(label).valueOrThrow();
        cells_[{pos.row, pos.col}] = text;
        return *this;
    }

    // 设置来源的边界，范围参数会按它裁剪
    TestCellSource& limit(int rows, int cols) {
        bounds_ = core::CellRange(core::CellPosition(0, 0), core::CellPosition(rows - 1, cols - 1));
        return *this;
    }

    std::optional<core::CellRange> bounds() const override {
        return bounds_;
    }

    std::optional<std::string> get(int row, int col) const override {
        auto it = cells_.find({row, col});
        if (it == cells_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    std::map<std::pair<int, int>, std::string> cells_;
    std::optional<core::CellRange> bounds_;
};

}} // namespace calcgrid::test
