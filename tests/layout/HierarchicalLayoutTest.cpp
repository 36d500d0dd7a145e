#include <gtest/gtest.h>
#include <codemap/layout/HierarchicalLayout.h>
#include <codemap/layout/ILayerAssignment.h>

using namespace codemap;

// ============================================================================
// HierarchicalLayoutTest - 계층형 레이아웃 파이프라인 테스트
// ============================================================================

TEST(HierarchicalLayoutTest, EmptyGraph_ReturnsEmptyResult) {
    Graph graph;
    HierarchicalLayout layout;

    HierarchyResult result = layout.layout(graph);

    EXPECT_TRUE(result.placements.empty());
    EXPECT_EQ(result.stats.layerCount, 0);
}

TEST(HierarchicalLayoutTest, ChainGraph_AssignsSequentialLayers) {
    Graph graph;
    NodeId n1 = graph.addNode("n1");
    NodeId n2 = graph.addNode("n2");
    NodeId n3 = graph.addNode("n3");
    graph.addEdge(n1, n2);
    graph.addEdge(n2, n3);

    HierarchicalLayout layout;
    HierarchyResult result = layout.layout(graph);

    EXPECT_EQ(result.stats.layerCount, 3);
    EXPECT_EQ(result.placements.at(n1).rank, 0);
    EXPECT_EQ(result.placements.at(n2).rank, 1);
    EXPECT_EQ(result.placements.at(n3).rank, 2);
    EXPECT_LT(result.placements.at(n1).center.y, result.placements.at(n2).center.y);
}

TEST(HierarchicalLayoutTest, Cycle_ReversedAndLaidOut) {
    Graph graph;
    NodeId a = graph.addNode("a");
    NodeId b = graph.addNode("b");
    NodeId c = graph.addNode("c");
    graph.addEdge(a, b);
    graph.addEdge(b, c);
    graph.addEdge(c, a);

    HierarchicalLayout layout;
    HierarchyResult result = layout.layout(graph);

    EXPECT_EQ(result.stats.reversedEdges, 1);
    EXPECT_EQ(result.placements.size(), 3u);
    EXPECT_EQ(result.stats.layerCount, 3);
}

TEST(HierarchicalLayoutTest, SelfLoop_Ignored) {
    Graph graph;
    NodeId a = graph.addNode("a");
    NodeId b = graph.addNode("b");
    graph.addEdge(a, a);
    graph.addEdge(a, b);

    HierarchicalLayout layout;
    HierarchyResult result = layout.layout(graph);

    EXPECT_EQ(result.stats.ignoredSelfLoops, 1);
    EXPECT_EQ(result.stats.reversedEdges, 0);
    EXPECT_EQ(result.placements.at(b).rank, 1);
}

TEST(HierarchicalLayoutTest, Extent_CoversAllNodes) {
    Graph graph;
    NodeId root = graph.addNode("root");
    for (int i = 0; i < 5; ++i) {
        graph.addEdge(root, graph.addNode("leaf" + std::to_string(i)));
    }

    HierarchicalLayout layout;
    HierarchyResult result = layout.layout(graph);

    for (const auto& [id, placement] : result.placements) {
        const Size& size = graph.getNode(id).size;
        EXPECT_GE(placement.center.x - size.width / 2, 0.0f);
        EXPECT_GE(placement.center.y - size.height / 2, 0.0f);
        EXPECT_LE(placement.center.x + size.width / 2, result.extent.width + 0.01f);
        EXPECT_LE(placement.center.y + size.height / 2, result.extent.height + 0.01f);
    }
    EXPECT_EQ(result.stats.maxLayerWidth, 5);
}

TEST(HierarchicalLayoutTest, LeftToRight_RanksAlongX) {
    Graph graph;
    NodeId a = graph.addNode("a");
    NodeId b = graph.addNode("b");
    graph.addEdge(a, b);

    HierarchicalLayout layout(LayoutOptions{}.setDirection(Direction::LeftToRight));
    HierarchyResult result = layout.layout(graph);

    EXPECT_LT(result.placements.at(a).center.x, result.placements.at(b).center.x);
    EXPECT_FLOAT_EQ(result.placements.at(a).center.y, result.placements.at(b).center.y);
}

namespace {

/// Puts every node on its own layer in id order
class IdOrderLayerAssignment : public algorithms::ILayerAssignment {
public:
    algorithms::LayerAssignmentResult assignLayers(const Graph& dag) const override {
        algorithms::LayerAssignmentResult result;
        for (NodeId id : dag.nodes()) {
            result.nodeLayer[id] = static_cast<int>(id);
            result.layers.push_back({id});
        }
        result.layerCount = static_cast<int>(result.layers.size());
        return result;
    }
    const char* algorithmName() const override { return "IdOrder"; }
};

}  // namespace

TEST(HierarchicalLayoutTest, InjectedPhase_IsUsed) {
    Graph graph;
    graph.addNode("a");
    graph.addNode("b");
    graph.addNode("c");

    HierarchicalLayout layout;
    layout.setLayerAssignment(std::make_shared<IdOrderLayerAssignment>());
    HierarchyResult result = layout.layout(graph);

    EXPECT_EQ(result.stats.layerCount, 3);
}
