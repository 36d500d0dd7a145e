#include <gtest/gtest.h>
#include <codemap/core/Graph.h>

#include <algorithm>

using namespace codemap;

TEST(GraphTest, AddNode_AssignsSequentialIds) {
    Graph graph;
    NodeId a = graph.addNode("a");
    NodeId b = graph.addNode("b");

    EXPECT_EQ(a, 0u);
    EXPECT_EQ(b, 1u);
    EXPECT_TRUE(graph.hasNode(a));
    EXPECT_EQ(graph.nodeCount(), 2u);
    EXPECT_EQ(graph.getNode(b).label, "b");
}

TEST(GraphTest, AddNode_DefaultsToCodeNodeCellSize) {
    Graph graph;
    NodeId id = graph.addNode("fn");

    EXPECT_FLOAT_EQ(graph.getNode(id).size.width, 172.0f);
    EXPECT_FLOAT_EQ(graph.getNode(id).size.height, 36.0f);
}

TEST(GraphTest, AddNodeWithSize) {
    Graph graph;
    NodeId id = graph.addNode(Size{150.0f, 75.0f}, "big");

    EXPECT_FLOAT_EQ(graph.getNode(id).size.width, 150.0f);
    EXPECT_FLOAT_EQ(graph.getNode(id).size.height, 75.0f);
}

TEST(GraphTest, AddEdge_UpdatesAdjacency) {
    Graph graph;
    NodeId n1 = graph.addNode("n1");
    NodeId n2 = graph.addNode("n2");
    EdgeId e = graph.addEdge(n1, n2);

    EXPECT_TRUE(graph.hasEdge(e));
    EXPECT_EQ(graph.getEdge(e).from, n1);
    EXPECT_EQ(graph.getEdge(e).to, n2);
    EXPECT_EQ(graph.outDegree(n1), 1u);
    EXPECT_EQ(graph.inDegree(n2), 1u);
    EXPECT_EQ(graph.successors(n1), std::vector<NodeId>{n2});
    EXPECT_EQ(graph.predecessors(n2), std::vector<NodeId>{n1});
}

TEST(GraphTest, AddEdge_UnknownEndpointThrows) {
    Graph graph;
    NodeId n1 = graph.addNode("n1");

    EXPECT_THROW(graph.addEdge(n1, 42), std::invalid_argument);
    EXPECT_THROW(graph.addEdge(42, n1), std::invalid_argument);
}

TEST(GraphTest, SelfLoop_IsRecognised) {
    Graph graph;
    NodeId n = graph.addNode("recursive");
    EdgeId e = graph.addEdge(n, n);

    EXPECT_TRUE(graph.getEdge(e).isSelfLoop());
}

TEST(GraphTest, GetNode_InvalidIdThrows) {
    Graph graph;
    EXPECT_THROW(graph.getNode(0), std::out_of_range);
    EXPECT_THROW(graph.getEdge(0), std::out_of_range);
    EXPECT_THROW(graph.outEdges(3), std::out_of_range);
    EXPECT_FALSE(graph.hasNode(0));
}

TEST(GraphTest, FindEdge) {
    Graph graph;
    NodeId n1 = graph.addNode("n1");
    NodeId n2 = graph.addNode("n2");
    EdgeId e = graph.addEdge(n1, n2);

    ASSERT_TRUE(graph.findEdge(n1, n2).has_value());
    EXPECT_EQ(*graph.findEdge(n1, n2), e);
    EXPECT_FALSE(graph.findEdge(n2, n1).has_value());
}

TEST(GraphTest, NodesAndEdges_InInsertionOrder) {
    Graph graph;
    NodeId a = graph.addNode("a");
    NodeId b = graph.addNode("b");
    NodeId c = graph.addNode("c");
    graph.addEdge(c, a);
    graph.addEdge(a, b);

    EXPECT_EQ(graph.nodes(), (std::vector<NodeId>{a, b, c}));
    EXPECT_EQ(graph.edges(), (std::vector<EdgeId>{0, 1}));
}

TEST(GraphTest, Clear) {
    Graph graph;
    graph.addEdge(graph.addNode("a"), graph.addNode("b"));

    graph.clear();

    EXPECT_EQ(graph.nodeCount(), 0u);
    EXPECT_EQ(graph.edgeCount(), 0u);
    EXPECT_EQ(graph.addNode("again"), 0u);
}
