#include "calcgrid/formula/FormulaFunctions.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <unordered_map>

namespace calcgrid {
namespace formula {

namespace {

const std::unordered_map<std::string, FunctionId>& functionTable() {
    static const std::unordered_map<std::string, FunctionId> table = {
        {"SUM", FunctionId::Sum},
        {"PRODUCT", FunctionId::Product},
        {"AVERAGE", FunctionId::Average},
        {"MIN", FunctionId::Min},
        {"MAX", FunctionId::Max},
        {"COUNT", FunctionId::Count},
        {"ABS", FunctionId::Abs},
        {"ROUND", FunctionId::Round}
    };
    return table;
}

} // namespace

std::optional<FunctionId> FormulaFunctions::lookup(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    const auto& table = functionTable();
    auto it = table.find(upper);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* FormulaFunctions::name(FunctionId id) noexcept {
    switch (id) {
        case FunctionId::Sum:     return "SUM";
        case FunctionId::Product: return "PRODUCT";
        case FunctionId::Average: return "AVERAGE";
        case FunctionId::Min:     return "MIN";
        case FunctionId::Max:     return "MAX";
        case FunctionId::Count:   return "COUNT";
        case FunctionId::Abs:     return "ABS";
        case FunctionId::Round:   return "ROUND";
    }
    return "UNKNOWN";
}

double FormulaFunctions::apply(FunctionId id,
                               const std::vector<ArgumentValue>& values,
                               std::optional<double> secondary) {
    if (values.empty()) {
        return 0.0;
    }

    switch (id) {
        case FunctionId::Sum: {
            double sum = 0.0;
            for (const auto& v : values) {
                sum += v.value;
            }
            return sum;
        }
        case FunctionId::Product: {
            double product = 1.0;
            for (const auto& v : values) {
                product *= v.value;
            }
            return product;
        }
        case FunctionId::Average: {
            double sum = 0.0;
            for (const auto& v : values) {
                sum += v.value;
            }
            return sum / static_cast<double>(values.size());
        }
        case FunctionId::Min: {
            auto it = std::min_element(values.begin(), values.end(),
                [](const ArgumentValue& a, const ArgumentValue& b) { return a.value < b.value; });
            return it->value;
        }
        case FunctionId::Max: {
            auto it = std::max_element(values.begin(), values.end(),
                [](const ArgumentValue& a, const ArgumentValue& b) { return a.value < b.value; });
            return it->value;
        }
        case FunctionId::Count: {
            auto count = std::count_if(values.begin(), values.end(),
                                       [](const ArgumentValue& v) { return v.numeric; });
            return static_cast<double>(count);
        }
        case FunctionId::Abs:
            return std::fabs(values.front().value);
        case FunctionId::Round: {
            int digits = 0;
            if (secondary && std::trunc(*secondary) == *secondary) {
                // 超出 double 精度的位数没有意义
                digits = static_cast<int>(std::clamp(*secondary, -15.0, 15.0));
            }
            return roundHalfAwayFromZero(values.front().value, digits);
        }
    }
    return 0.0;
}

double FormulaFunctions::roundHalfAwayFromZero(double value, int digits) {
    double factor = std::pow(10.0, digits);
    double scaled = value * factor;
    if (!std::isfinite(scaled)) {
        // 这么大的数在该精度下本来就是整数
        return value;
    }
    // std::round 本身就是远离零方向取整
    return std::round(scaled) / factor;
}

}} // namespace calcgrid::formula
