#include <gtest/gtest.h>
#include <codemap/core/CodeGraph.h>
#include <codemap/core/Types.h>

using namespace codemap;

TEST(CodeGraphTest, ParseNodeKind_RecognisesProducerStrings) {
    EXPECT_EQ(parseNodeKind("CLASS"), NodeKind::Class);
    EXPECT_EQ(parseNodeKind("METHOD"), NodeKind::Method);
    EXPECT_EQ(parseNodeKind("FUNCTION"), NodeKind::Function);
    EXPECT_EQ(parseNodeKind("PROPERTY"), NodeKind::Property);
    EXPECT_EQ(parseNodeKind("IMPORT"), NodeKind::Import);
}

TEST(CodeGraphTest, ParseNodeKind_UnknownStringsMapToUnknown) {
    EXPECT_EQ(parseNodeKind("VARIABLE"), NodeKind::Unknown);
    EXPECT_EQ(parseNodeKind("class"), NodeKind::Unknown);
    EXPECT_EQ(parseNodeKind(""), NodeKind::Unknown);
}

TEST(CodeGraphTest, NodeKindToString_RoundTripsKnownKinds) {
    for (NodeKind kind : {NodeKind::Class, NodeKind::Method, NodeKind::Function,
                          NodeKind::Property, NodeKind::Import}) {
        EXPECT_EQ(parseNodeKind(nodeKindToString(kind)), kind);
    }
    EXPECT_STREQ(nodeKindToString(NodeKind::Unknown), "UNKNOWN");
}

TEST(CodeGraphTest, GraphNode_ConstructorFillsKindName) {
    GraphNode node("main.py:run", "run", NodeKind::Function, "main.py", 12);

    EXPECT_EQ(node.kindName, "FUNCTION");
    EXPECT_EQ(node.line, 12);
}

TEST(CodeGraphTest, Counts) {
    CodeGraph graph;
    EXPECT_TRUE(graph.empty());

    graph.nodes.emplace_back("a", "a", NodeKind::Function, "x.py");
    graph.nodes.emplace_back("b", "b", NodeKind::Function, "x.py");
    graph.edges.emplace_back("a", "b");

    EXPECT_FALSE(graph.empty());
    EXPECT_EQ(graph.nodeCount(), 2u);
    EXPECT_EQ(graph.edgeCount(), 1u);
}

TEST(TypesTest, RectContainsAndUnion) {
    Rect outer{0, 0, 100, 100};
    Rect inner{10, 10, 20, 20};

    EXPECT_TRUE(outer.contains(inner));
    EXPECT_FALSE(inner.contains(outer));
    EXPECT_TRUE(outer.intersects(inner));

    Rect merged = inner.united(Rect{50, 60, 10, 10});
    EXPECT_EQ(merged, (Rect{10, 10, 50, 60}));
    EXPECT_EQ(Rect{}.united(inner), inner);
}
