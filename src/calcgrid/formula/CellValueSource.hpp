#pragma once

#include "calcgrid/core/CellAddress.hpp"
#include <optional>
#include <string>

namespace calcgrid {
namespace formula {

/**
 * @brief 公式求值时读取单元格文本的接口
 *
 * 网格、测试桩或缓存都可以实现它。返回 std::nullopt 与返回空串等价，
 * 都表示"空单元格"；越界坐标也应按空单元格处理，而不是报错。
 */
class CellValueSource {
public:
    virtual ~CellValueSource() = default;

    virtual std::optional<std::string> get(int row, int col) const = 0;

    /**
     * @brief 可能非空的区域（从 A1 起），范围参数展开前按它裁剪
     *
     * 默认 std::nullopt 表示没有边界，范围按原样逐格读取。
     */
    virtual std::optional<core::CellRange> bounds() const { return std::nullopt; }
};

}} // namespace calcgrid::formula
