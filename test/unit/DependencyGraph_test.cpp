// CalcGrid 库 - 电子表格公式求值与重算引擎
// 组件：依赖图与拓扑排序测试

#include "calcgrid/core/DependencyGraph.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace calcgrid {
namespace core {

class DependencyGraphTest : public ::testing::Test {
protected:
    const CellPosition a1{0, 0};
    const CellPosition b1{0, 1};
    const CellPosition c1{0, 2};
    const CellPosition a2{1, 0};
    const CellPosition b2{1, 1};

    DependencyGraph graph;
};

TEST_F(DependencyGraphTest, EmptyGraph) {
    auto ordering = graph.topologicalOrder();
    EXPECT_TRUE(ordering.order.empty());
    EXPECT_FALSE(ordering.hasCycle());
}

// 没有边时按行优先顺序输出
TEST_F(DependencyGraphTest, IndependentNodesAreRowMajor) {
    graph.addNode(a2);
    graph.addNode(b1);
    graph.addNode(a1);

    auto ordering = graph.topologicalOrder();
    EXPECT_EQ(ordering.order, (std::vector<CellPosition>{a1, b1, a2}));
}

TEST_F(DependencyGraphTest, ChainIsOrderedByDependency) {
    // a1 依赖 b1，b1 依赖 c1
    graph.addEdge(c1, b1);
    graph.addEdge(b1, a1);

    auto ordering = graph.topologicalOrder();
    EXPECT_FALSE(ordering.hasCycle());
    EXPECT_EQ(ordering.order, (std::vector<CellPosition>{c1, b1, a1}));
}

TEST_F(DependencyGraphTest, DuplicateEdgesAreIgnored) {
    graph.addEdge(a1, b1);
    graph.addEdge(a1, b1);
    EXPECT_EQ(graph.edgeCount(), 1u);
    EXPECT_EQ(graph.nodeCount(), 2u);
    EXPECT_EQ(graph.getDependencies(b1).size(), 1u);
    EXPECT_EQ(graph.getDependents(a1).count(b1), 1u);
    EXPECT_TRUE(graph.getDependents(c1).empty());
}

TEST_F(DependencyGraphTest, SelfReferenceIsACycle) {
    graph.addEdge(a1, a1);
    graph.addNode(b1);

    auto ordering = graph.topologicalOrder();
    EXPECT_EQ(ordering.order, (std::vector<CellPosition>{b1}));
    EXPECT_EQ(ordering.cyclic, (std::vector<CellPosition>{a1}));
}

TEST_F(DependencyGraphTest, DependentsOfACycleAreCyclic) {
    graph.addEdge(a1, b1);
    graph.addEdge(b1, a1);
    graph.addEdge(a1, c1);   // c1 依赖环上的 a1
    graph.addEdge(a2, b2);   // 与环无关

    auto ordering = graph.topologicalOrder();
    EXPECT_EQ(ordering.order, (std::vector<CellPosition>{a2, b2}));
    EXPECT_EQ(ordering.cyclic, (std::vector<CellPosition>{a1, b1, c1}));
}

TEST_F(DependencyGraphTest, Clear) {
    graph.addEdge(a1, b1);
    graph.clear();
    EXPECT_EQ(graph.nodeCount(), 0u);
    EXPECT_EQ(graph.edgeCount(), 0u);
    EXPECT_FALSE(graph.contains(a1));
}

}} // namespace calcgrid::core
