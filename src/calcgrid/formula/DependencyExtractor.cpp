#include "calcgrid/formula/DependencyExtractor.hpp"
#include "calcgrid/utils/AddressParser.hpp"
#include "calcgrid/utils/ModuleLoggers.hpp"
#include <cctype>
#include <regex>

namespace calcgrid {
namespace formula {

namespace {

const std::regex& referencePattern() {
    static const std::regex pattern(R"([A-Za-z]+[0-9]+)");
    return pattern;
}

const std::regex& rangePattern() {
    static const std::regex pattern(R"(([A-Za-z]+[0-9]+)\s*:\s*([A-Za-z]+[0-9]+))");
    return pattern;
}

// 匹配前一个字符是数字、字母或小数点时，它属于数字或标识符的一部分
bool isGluedToPrevious(const std::string& formula, std::ptrdiff_t position) {
    if (position <= 0) {
        return false;
    }
    auto prev = static_cast<unsigned char>(formula[static_cast<size_t>(position - 1)]);
    return std::isalnum(prev) || prev == '.';
}

} // namespace

std::set<core::CellPosition> DependencyExtractor::extract(const std::string& formula) {
    std::set<core::CellPosition> dependencies;

    std::sregex_iterator iter(formula.begin(), formula.end(), referencePattern());
    std::sregex_iterator end;

    for (auto it = iter; it != end; ++it) {
        const std::smatch& match = *it;
        if (isGluedToPrevious(formula, match.position())) {
            continue;
        }

        auto pos = utils::AddressParser::decode(match.str());
        if (!pos) {
            UTILS_DEBUG("跳过无法解码的引用 {}: {}", match.str(), pos.error().message);
            continue;
        }
        dependencies.insert(pos.value());
    }
    return dependencies;
}

std::set<core::CellPosition> DependencyExtractor::extractExpanded(const std::string& formula,
                                                                  int rows, int cols) {
    std::set<core::CellPosition> dependencies = extract(formula);

    std::sregex_iterator iter(formula.begin(), formula.end(), rangePattern());
    std::sregex_iterator end;

    for (auto it = iter; it != end; ++it) {
        const std::smatch& match = *it;
        if (isGluedToPrevious(formula, match.position())) {
            continue;
        }

        auto first = utils::AddressParser::decode(match.str(1));
        auto last = utils::AddressParser::decode(match.str(2));
        if (!first || !last) {
            continue;
        }

        core::CellRange clipped;
        if (!core::CellRange(first.value(), last.value()).clipTo(rows, cols, clipped)) {
            continue;
        }
        clipped.forEach([&](const core::CellPosition& pos) {
            dependencies.insert(pos);
        });
    }
    return dependencies;
}

}} // namespace calcgrid::formula
