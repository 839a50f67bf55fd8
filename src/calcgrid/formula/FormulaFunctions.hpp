#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace calcgrid {
namespace formula {

enum class FunctionId : uint8_t {
    Sum,
    Product,
    Average,
    Min,
    Max,
    Count,
    Abs,
    Round
};

/**
 * @brief 参数取值结果
 *
 * numeric 为 false 的值（非数值文本或空的单个引用）按 0 参与计算，但不计入 COUNT。
 */
struct ArgumentValue {
    double value = 0.0;
    bool numeric = true;

    ArgumentValue() = default;
    ArgumentValue(double v, bool is_numeric = true) : value(v), numeric(is_numeric) {}
};

class FormulaFunctions {
public:
    /**
     * @brief 按名称查找函数（不区分大小写）
     */
    static std::optional<FunctionId> lookup(std::string_view name);

    static const char* name(FunctionId id) noexcept;

    /**
     * @brief 对已展开的参数值求函数结果
     *
     * @param id 函数
     * @param values 主参数段中各参数的取值
     * @param secondary 第二参数段的值，只有 ROUND 使用它作为小数位数
     *
     * 没有任何参数值时所有函数都返回 0。
     */
    static double apply(FunctionId id,
                        const std::vector<ArgumentValue>& values,
                        std::optional<double> secondary = std::nullopt);

    /**
     * @brief 四舍五入到 digits 位小数，0.5 远离零方向进位；digits 可为负
     */
    static double roundHalfAwayFromZero(double value, int digits);
};

}} // namespace calcgrid::formula
