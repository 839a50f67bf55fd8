#include "calcgrid/utils/NumberUtils.hpp"
#include <cctype>
#include <cmath>
#include <system_error>
#include <fast_float/fast_float.h>
#include <fmt/format.h>

namespace calcgrid {
namespace utils {

std::optional<double> NumberUtils::parseNumber(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }

    // fast_float 只接受 '-'，前导 '+' 自己处理
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
            return std::nullopt;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto result = fast_float::from_chars(first, last, value);
    if (result.ec != std::errc() || result.ptr != last) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool NumberUtils::isWhole(double value) {
    return std::isfinite(value) && std::trunc(value) == value;
}

std::string NumberUtils::formatResult(double value) {
    value += 0.0; // -0 -> 0
    if (isWhole(value)) {
        return fmt::format("{:.0f}", value);
    }
    return fmt::format("{:g}", value);
}

std::string NumberUtils::normalizeLiteral(const std::string& input) {
    // 带首尾空白的输入按原样保存
    if (input.empty() || std::isspace(static_cast<unsigned char>(input.front())) ||
        std::isspace(static_cast<unsigned char>(input.back()))) {
        return input;
    }

    auto number = parseNumber(input);
    if (!number) {
        return input;
    }

    double value = *number + 0.0;
    if (isWhole(value)) {
        return fmt::format("{:.0f}", value);
    }
    return fmt::format("{}", value);
}

}} // namespace calcgrid::utils
