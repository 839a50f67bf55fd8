#pragma once

#include "calcgrid/core/Constants.hpp"
#include <cstddef>
#include <string>
#include <utility>

namespace calcgrid {
namespace core {

/**
 * @file GridTypes.hpp
 * @brief 网格与公式引擎的配置类型
 */

/**
 * @brief 公式引擎选项
 */
struct FormulaOptions {
    size_t max_depth = Constants::kMaxFormulaDepth;  // 括号/函数嵌套上限，超出按 InvalidFormula 处理
    bool auto_balance = true;                        // 自动补全缺少的右括号
};

/**
 * @brief 网格选项配置结构体
 */
struct GridOptions {
    int rows = Constants::kDefaultRows;
    int cols = Constants::kDefaultCols;

    char formula_marker = Constants::kFormulaMarker;
    std::string error_sentinel = Constants::kErrorSentinel;

    // 编辑时把数值文本规范化（"007" -> "7"）
    bool normalize_literals = true;

    // 依赖提取时展开范围内部的单元格（默认只记录端点）
    bool expand_range_dependencies = false;

    FormulaOptions formula;
};

/**
 * @brief 单个单元格编辑，用于批量操作
 */
struct CellEdit {
    int row = 0;
    int col = 0;
    std::string text;

    CellEdit() = default;
    CellEdit(int r, int c, std::string t) : row(r), col(c), text(std::move(t)) {}
};

}} // namespace calcgrid::core
