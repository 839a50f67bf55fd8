#pragma once

#include "calcgrid/core/CellAddress.hpp"
#include "calcgrid/core/Expected.hpp"
#include <string>
#include <string_view>

namespace calcgrid {
namespace utils {

/**
 * @brief 单元格地址编解码工具类
 *
 * 列字母采用电子表格的双射26进制（没有"零"字母）：
 * A->0, Z->25, AA->26, AZ->51, BA->52 ...
 * 行号对外为1基，对内为0基。
 *
 * @example
 * auto pos = AddressParser::decode("B2");      // (1, 1)
 * auto pos = AddressParser::decode("aa12");    // (11, 26)，字母大小写不敏感
 * std::string addr = AddressParser::encode(0, 27); // "AB1"
 */
class AddressParser {
public:
    /**
     * @brief 解析单个地址 "A1"
     * @return 0基坐标；格式不符 [A-Z]+[0-9]+、行号<=0或溢出时返回 InvalidCellReference
     */
    static core::Result<core::CellPosition> decode(std::string_view label);

    /**
     * @brief 将0基坐标编码为地址，行列为负时抛出 ParameterException
     */
    static std::string encode(int row, int col);

    static std::string encode(const core::CellPosition& pos) {
        return encode(pos.row, pos.col);
    }

    /**
     * @brief 解析范围 "A1:C3"，结果已规范化为左上到右下
     *
     * 缺少任一端点（"A1:"、":B2"）返回 InvalidRange；
     * 端点本身格式错误返回 InvalidCellReference。
     */
    static core::Result<core::CellRange> decodeRange(std::string_view range);

    static std::string encodeRange(const core::CellRange& range);

    /**
     * @brief 列字母 -> 0基列索引 ("A"->0, "AA"->26)
     */
    static core::Result<int> columnToIndex(std::string_view letters);

    /**
     * @brief 0基列索引 -> 列字母 (0->"A", 26->"AA")
     */
    static std::string indexToColumn(int index);

    static bool isValidAddress(std::string_view label) {
        return decode(label).hasValue();
    }
};

}} // namespace calcgrid::utils
