#include "calcgrid/utils/AddressParser.hpp"
#include "calcgrid/core/Exception.hpp"
#include <cctype>
#include <cstdint>
#include <limits>

namespace calcgrid {
namespace utils {

namespace {

// 最大0基索引留出一格余量，保证 CellRange 遍历时 ++row / ++col 不溢出
constexpr int64_t kMaxIndex = std::numeric_limits<int>::max() - 1;

std::string_view trimView(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

} // namespace

core::Result<int> AddressParser::columnToIndex(std::string_view letters) {
    if (letters.empty()) {
        return core::makeError(core::ErrorCode::InvalidCellReference,
                               "Column letters are empty");
    }

    int64_t result = 0;
    for (char c : letters) {
        if (!std::isalpha(static_cast<unsigned char>(c))) {
            return core::makeError(core::ErrorCode::InvalidCellReference,
                                   "Invalid column string", std::string(letters));
        }
        int digit = std::toupper(static_cast<unsigned char>(c)) - 'A' + 1;
        result = result * 26 + digit;
        if (result - 1 > kMaxIndex) {
            return core::makeError(core::ErrorCode::InvalidCellReference,
                                   "Column index out of range", std::string(letters));
        }
    }
    return static_cast<int>(result - 1);
}

std::string AddressParser::indexToColumn(int index) {
    if (index < 0) {
        throw core::ParameterException("Column index cannot be negative", "index");
    }

    std::string result;
    int64_t n = static_cast<int64_t>(index) + 1; // 转换为1基索引进行计算
    while (n > 0) {
        --n;
        result.insert(result.begin(), static_cast<char>('A' + (n % 26)));
        n /= 26;
    }
    return result;
}

core::Result<core::CellPosition> AddressParser::decode(std::string_view label) {
    size_t split = 0;
    while (split < label.size() && std::isalpha(static_cast<unsigned char>(label[split]))) {
        ++split;
    }

    std::string_view letters = label.substr(0, split);
    std::string_view digits = label.substr(split);
    if (letters.empty() || digits.empty()) {
        return core::makeError(core::ErrorCode::InvalidCellReference,
                               "Invalid address format", std::string(label));
    }

    int64_t row = 0;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return core::makeError(core::ErrorCode::InvalidCellReference,
                                   "Invalid address format", std::string(label));
        }
        row = row * 10 + (c - '0');
        if (row - 1 > kMaxIndex) {
            return core::makeError(core::ErrorCode::InvalidCellReference,
                                   "Row number out of range", std::string(label));
        }
    }
    if (row <= 0) {
        return core::makeError(core::ErrorCode::InvalidCellReference,
                               "Row number must be positive", std::string(label));
    }

    auto col = columnToIndex(letters);
    if (!col) {
        return col.error();
    }

    return core::CellPosition(static_cast<int>(row - 1), col.value());
}

std::string AddressParser::encode(int row, int col) {
    if (row < 0) {
        throw core::ParameterException("Row index cannot be negative", "row");
    }
    return indexToColumn(col) + std::to_string(static_cast<int64_t>(row) + 1);
}

core::Result<core::CellRange> AddressParser::decodeRange(std::string_view range) {
    auto colon_pos = range.find(':');
    if (colon_pos == std::string_view::npos) {
        auto single = decode(trimView(range));
        if (!single) {
            return single.error();
        }
        return core::CellRange(single.value());
    }

    std::string_view start_addr = trimView(range.substr(0, colon_pos));
    std::string_view end_addr = trimView(range.substr(colon_pos + 1));
    if (start_addr.empty() || end_addr.empty()) {
        return core::makeError(core::ErrorCode::InvalidRange,
                               "Range is missing an endpoint", std::string(range));
    }
    if (end_addr.find(':') != std::string_view::npos) {
        return core::makeError(core::ErrorCode::InvalidRange,
                               "Range has more than two endpoints", std::string(range));
    }

    auto start = decode(start_addr);
    if (!start) {
        return start.error();
    }
    auto end = decode(end_addr);
    if (!end) {
        return end.error();
    }

    return core::CellRange(start.value(), end.value());
}

std::string AddressParser::encodeRange(const core::CellRange& range) {
    if (range.isSingleCell()) {
        return encode(range.first());
    }
    return encode(range.first()) + ":" + encode(range.last());
}

}} // namespace calcgrid::utils
