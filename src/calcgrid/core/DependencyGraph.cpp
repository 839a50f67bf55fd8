#include "calcgrid/core/DependencyGraph.hpp"
#include "calcgrid/utils/ModuleLoggers.hpp"
#include <deque>

namespace calcgrid {
namespace core {

namespace {
const std::set<CellPosition> kNoCells;
}

void DependencyGraph::addNode(const CellPosition& pos) {
    nodes_[pos];
}

void DependencyGraph::addEdge(const CellPosition& dependency, const CellPosition& dependent) {
    auto inserted = nodes_[dependent].dependencies.insert(dependency);
    if (!inserted.second) {
        return;
    }
    nodes_[dependency].dependents.insert(dependent);
    ++edge_count_;
    CALCGRID_LOG_GRAPH_TRACE("edge {} -> {}", dependency.toString(), dependent.toString());
}

const std::set<CellPosition>& DependencyGraph::getDependencies(const CellPosition& pos) const {
    auto it = nodes_.find(pos);
    return it == nodes_.end() ? kNoCells : it->second.dependencies;
}

const std::set<CellPosition>& DependencyGraph::getDependents(const CellPosition& pos) const {
    auto it = nodes_.find(pos);
    return it == nodes_.end() ? kNoCells : it->second.dependents;
}

void DependencyGraph::clear() {
    nodes_.clear();
    edge_count_ = 0;
}

DependencyGraph::Ordering DependencyGraph::topologicalOrder() const {
    Ordering result;
    result.order.reserve(nodes_.size());

    std::map<CellPosition, size_t> in_degree;
    std::deque<CellPosition> ready;
    for (const auto& [pos, node] : nodes_) {
        in_degree[pos] = node.dependencies.size();
        if (node.dependencies.empty()) {
            ready.push_back(pos);
        }
    }

    while (!ready.empty()) {
        CellPosition current = ready.front();
        ready.pop_front();
        result.order.push_back(current);

        for (const auto& dependent : nodes_.at(current).dependents) {
            if (--in_degree[dependent] == 0) {
                ready.push_back(dependent);
            }
        }
    }

    // 入度始终不为 0 的节点在环上或在环的下游
    if (result.order.size() != nodes_.size()) {
        for (const auto& [pos, degree] : in_degree) {
            if (degree > 0) {
                result.cyclic.push_back(pos);
            }
        }
    }
    return result;
}

}} // namespace calcgrid::core
