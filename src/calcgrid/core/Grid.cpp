#include "calcgrid/core/Grid.hpp"
#include "calcgrid/core/Exception.hpp"
#include "calcgrid/core/ExceptionBridge.hpp"
#include "calcgrid/formula/DependencyExtractor.hpp"
#include "calcgrid/utils/AddressParser.hpp"
#include "calcgrid/utils/ModuleLoggers.hpp"
#include "calcgrid/utils/NumberUtils.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace calcgrid {
namespace core {

namespace {

GridOptions withSize(int rows, int cols) {
    GridOptions options;
    options.rows = rows;
    options.cols = cols;
    return options;
}

} // namespace

Grid::Grid(GridOptions options)
    : options_(std::move(options)), engine_(options_.formula) {
    if (options_.rows <= 0 || options_.cols <= 0) {
        throw ParameterException(
            fmt::format("Grid size must be positive, got {}x{}", options_.rows, options_.cols),
            options_.rows <= 0 ? "rows" : "cols", __FILE__, __LINE__);
    }
    cells_.resize(static_cast<size_t>(options_.rows) * static_cast<size_t>(options_.cols));
    GRID_DEBUG("创建网格 {}x{}", options_.rows, options_.cols);
}

Grid::Grid(int rows, int cols) : Grid(withSize(rows, cols)) {}

std::optional<std::string> Grid::DisplaySource::get(int row, int col) const {
    if (!grid_.isInBounds(row, col)) {
        return std::nullopt;
    }
    return grid_.at(row, col).getDisplayValue();
}

std::optional<CellRange> Grid::DisplaySource::bounds() const {
    return CellRange(CellPosition(0, 0), CellPosition(grid_.getRows() - 1, grid_.getCols() - 1));
}

void Grid::checkBounds(int row, int col) const {
    if (!isInBounds(row, col)) {
        throw CellException(
            fmt::format("Cell ({}, {}) is outside the {}x{} grid", row, col, options_.rows, options_.cols),
            row, col, ErrorCode::InvalidCellReference, __FILE__, __LINE__);
    }
}

const Cell& Grid::cell(int row, int col) const {
    checkBounds(row, col);
    return at(row, col);
}

const Cell& Grid::cell(const std::string& label) const {
    return cell(CALCGRID_UNWRAP(utils::AddressParser::decode(label)));
}

std::string Grid::prepareInput(const std::string& text) const {
    if (!text.empty() && text.front() == options_.formula_marker) {
        if (!options_.formula.auto_balance) {
            return text;
        }
        return options_.formula_marker + formula::FormulaEngine::balanceParentheses(text.substr(1));
    }
    if (options_.normalize_literals) {
        return utils::NumberUtils::normalizeLiteral(text);
    }
    return text;
}

void Grid::setInput(int row, int col, const std::string& text) {
    checkBounds(row, col);
    at(row, col).setInput(prepareInput(text));
}

void Grid::applyEdit(int row, int col, const std::string& text) {
    setInput(row, col, text);

    // 快速路径：先用当前显示值算出该单元格，随后被全量重算覆盖
    evaluateCell(CellPosition(row, col));
    recompute();
}

void Grid::applyEdit(const std::string& label, const std::string& text) {
    CellPosition pos = CALCGRID_UNWRAP(utils::AddressParser::decode(label));
    applyEdit(pos.row, pos.col, text);
}

VoidResult Grid::tryApplyEdit(int row, int col, const std::string& text) {
    return ExceptionBridge::wrapVoidCall([&]() { applyEdit(row, col, text); });
}

void Grid::applyEdits(const std::vector<CellEdit>& edits) {
    for (const auto& edit : edits) {
        checkBounds(edit.row, edit.col);
    }
    for (const auto& edit : edits) {
        at(edit.row, edit.col).setInput(prepareInput(edit.text));
    }
    GRID_DEBUG("批量编辑 {} 个单元格", edits.size());
    recompute();
}

bool Grid::evaluateCell(const CellPosition& pos) {
    Cell& target = at(pos.row, pos.col);
    if (!target.isFormula(options_.formula_marker)) {
        target.setDisplay(target.getInput());
        return true;
    }

    auto result = engine_.evaluate(target.getFormulaBody(options_.formula_marker), DisplaySource(*this));
    if (!result) {
        GRID_DEBUG("{} 求值失败: [{}] {}", pos.toString(), toString(result.error().code),
                   result.error().fullMessage());
        target.setError(options_.error_sentinel, result.error().code);
        return false;
    }
    target.setDisplay(std::move(result.value()));
    return true;
}

std::string Grid::evaluate(const std::string& formula) const {
    std::string body = formula;
    if (!body.empty() && body.front() == options_.formula_marker) {
        body.erase(0, 1);
    }
    return CALCGRID_UNWRAP(engine_.evaluate(body, DisplaySource(*this)));
}

std::set<CellPosition> Grid::dependenciesOf(int row, int col) const {
    const Cell& source = cell(row, col);
    std::set<CellPosition> dependencies;
    if (!source.isFormula(options_.formula_marker)) {
        return dependencies;
    }

    std::string body = source.getFormulaBody(options_.formula_marker);
    std::set<CellPosition> extracted = options_.expand_range_dependencies
        ? formula::DependencyExtractor::extractExpanded(body, options_.rows, options_.cols)
        : formula::DependencyExtractor::extract(body);

    for (const auto& pos : extracted) {
        if (isInBounds(pos.row, pos.col)) {
            dependencies.insert(pos);
        }
    }
    return dependencies;
}

RecomputeStats Grid::recompute() {
    RecomputeStats stats;
    DependencyGraph graph;

    // 普通单元格直接显示输入；公式单元格进入依赖图
    for (int row = 0; row < options_.rows; ++row) {
        for (int col = 0; col < options_.cols; ++col) {
            Cell& current = at(row, col);
            if (!current.isFormula(options_.formula_marker)) {
                current.setDisplay(current.getInput());
                continue;
            }

            CellPosition pos(row, col);
            graph.addNode(pos);
            for (const auto& dependency : dependenciesOf(row, col)) {
                if (at(dependency.row, dependency.col).isFormula(options_.formula_marker)) {
                    graph.addEdge(dependency, pos);
                }
            }
        }
    }
    stats.formula_cells = graph.nodeCount();
    stats.edges = graph.edgeCount();

    DependencyGraph::Ordering ordering = graph.topologicalOrder();

    for (const auto& pos : ordering.cyclic) {
        at(pos.row, pos.col).setError(options_.error_sentinel, ErrorCode::CircularReference);
    }
    stats.cyclic = ordering.cyclic.size();
    if (ordering.hasCycle()) {
        GRID_WARN("检测到循环引用，{} 个单元格无法求值，首个为 {}",
                  ordering.cyclic.size(), ordering.cyclic.front().toString());
    }

    for (const auto& pos : ordering.order) {
        if (!evaluateCell(pos)) {
            ++stats.failed;
        }
        ++stats.evaluated;
    }

    GRID_DEBUG("重算完成: 公式 {} 个, 依赖边 {} 条, 求值 {} 个, 失败 {} 个, 循环 {} 个",
               stats.formula_cells, stats.edges, stats.evaluated, stats.failed, stats.cyclic);
    return stats;
}

std::map<CellPosition, std::string> Grid::inputs() const {
    std::map<CellPosition, std::string> result;
    for (int row = 0; row < options_.rows; ++row) {
        for (int col = 0; col < options_.cols; ++col) {
            const Cell& current = at(row, col);
            if (!current.isEmpty()) {
                result.emplace(CellPosition(row, col), current.getInput());
            }
        }
    }
    return result;
}

void Grid::loadInputs(const std::map<CellPosition, std::string>& inputs) {
    for (const auto& entry : inputs) {
        checkBounds(entry.first.row, entry.first.col);
    }

    for (auto& current : cells_) {
        current.clear();
    }
    for (const auto& [pos, text] : inputs) {
        at(pos.row, pos.col).setInput(prepareInput(text));
    }
    GRID_INFO("载入 {} 个单元格输入", inputs.size());
    recompute();
}

std::optional<CellRange> Grid::usedBounds() const {
    std::optional<CellPosition> first;
    CellPosition last;
    for (int row = 0; row < options_.rows; ++row) {
        for (int col = 0; col < options_.cols; ++col) {
            if (at(row, col).isEmpty()) {
                continue;
            }
            if (!first) {
                first = CellPosition(row, col);
                last = *first;
                continue;
            }
            first->col = std::min(first->col, col);
            last.row = std::max(last.row, row);
            last.col = std::max(last.col, col);
        }
    }
    if (!first) {
        return std::nullopt;
    }
    return CellRange(*first, last);
}

}} // namespace calcgrid::core
