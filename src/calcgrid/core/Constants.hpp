#pragma once

#include <cstddef>

namespace calcgrid {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // 公式输入的前导标记
    static constexpr char kFormulaMarker = '=';

    // 求值失败或处于循环中的单元格显示的文本
    static constexpr const char* kErrorSentinel = "#ERROR";

    // 默认网格尺寸（50 行 x A..Z 列）
    static constexpr int kDefaultRows = 50;
    static constexpr int kDefaultCols = 26;

    // 公式嵌套（括号与函数调用）的最大深度
    static constexpr size_t kMaxFormulaDepth = 64;
};

} // namespace core
} // namespace calcgrid
