#pragma once

#include "calcgrid/core/CellAddress.hpp"
#include <set>
#include <string>

namespace calcgrid {
namespace formula {

/**
 * @brief 从公式文本中提取被引用的单元格
 *
 * 只做文本扫描，不解析公式，所以语法错误的公式也能得到依赖集合。
 * 范围 "A1:A3" 只贡献两个端点 A1、A3；需要范围内部单元格时使用 extractExpanded。
 */
class DependencyExtractor {
public:
    /**
     * @brief 提取所有 [A-Z]+[0-9]+ 形式的引用（不区分大小写，去重）
     *
     * 紧跟在数字、字母或 '.' 后面的匹配不算引用（"1E5" 中的 "E5"），
     * 无法解码的匹配（如 "A0"）被跳过。
     */
    static std::set<core::CellPosition> extract(const std::string& formula);

    /**
     * @brief 在 extract 的基础上把每个 REF:REF 范围展开为其全部单元格，并裁剪到网格内
     */
    static std::set<core::CellPosition> extractExpanded(const std::string& formula, int rows, int cols);
};

}} // namespace calcgrid::formula
