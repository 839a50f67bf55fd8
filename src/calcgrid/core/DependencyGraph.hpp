#pragma once

#include "calcgrid/core/CellAddress.hpp"
#include <map>
#include <set>
#include <vector>

namespace calcgrid {
namespace core {

/**
 * @brief 公式单元格之间的依赖图
 *
 * 边 dependency -> dependent 表示 dependent 的公式引用了 dependency。
 * 节点与边都按行优先顺序存储，所以拓扑序在相同输入下总是确定的。
 */
class DependencyGraph {
public:
    /**
     * @brief Kahn 排序结果
     *
     * order 中的单元格可以按顺序安全求值；
     * cyclic 是位于环上或依赖环的单元格（行优先顺序）。
     */
    struct Ordering {
        std::vector<CellPosition> order;
        std::vector<CellPosition> cyclic;

        bool hasCycle() const { return !cyclic.empty(); }
    };

    void addNode(const CellPosition& pos);

    /**
     * @brief 添加边；两端不存在时自动加入节点，重复边被忽略
     */
    void addEdge(const CellPosition& dependency, const CellPosition& dependent);

    bool contains(const CellPosition& pos) const { return nodes_.count(pos) > 0; }

    const std::set<CellPosition>& getDependencies(const CellPosition& pos) const;
    const std::set<CellPosition>& getDependents(const CellPosition& pos) const;

    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edge_count_; }

    void clear();

    Ordering topologicalOrder() const;

private:
    struct Node {
        std::set<CellPosition> dependencies;  // 入边
        std::set<CellPosition> dependents;    // 出边
    };

    std::map<CellPosition, Node> nodes_;
    size_t edge_count_ = 0;
};

}} // namespace calcgrid::core
