/**
 * @file NumberUtils.hpp
 * @brief 单元格文本与数值之间的转换
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace calcgrid {
namespace utils {

class NumberUtils {
public:
    /**
     * @brief 严格解析数值：整段文本（去除首尾空白后）必须是一个有限数
     *
     * 接受可选的前导 '+' 或 '-'、小数点与指数（"1e5"、".5"、"-3.25"）。
     * "12abc"、"inf"、"nan"、空串都返回 std::nullopt。
     */
    static std::optional<double> parseNumber(std::string_view text);

    static bool isWhole(double value);

    /**
     * @brief 公式结果格式化
     *
     * 整数不带小数位（8、-3、1000000），其余按 %g 输出六位有效数字（0.333333）。
     */
    static std::string formatResult(double value);

    /**
     * @brief 普通输入的数值规范化
     *
     * 整数值去掉小数点与前导零（"007" -> "7"，"12.0" -> "12"），
     * 非整数按最短往返表示（"3.50" -> "3.5"）。非数值文本与带首尾空白的
     * 输入原样返回。
     */
    static std::string normalizeLiteral(const std::string& input);
};

}} // namespace calcgrid::utils
