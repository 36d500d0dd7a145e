#include <gtest/gtest.h>
#include <codemap/io/LayoutSerializer.h>
#include <codemap/layout/CodeGraphLayout.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>

using namespace codemap;
using json = nlohmann::json;

// ============================================================================
// LayoutSerializerTest - 레이아웃 결과 및 옵션 직렬화 테스트
// ============================================================================

namespace {

LayoutResult sampleLayout() {
    CodeGraph graph;
    graph.nodes = {
        GraphNode("a", "Job", NodeKind::Class, "x.py", 1),
        GraphNode("b", "run", NodeKind::Method, "x.py", 4),
        GraphNode("c", "VERSION", NodeKind::Property, "y.py", 2),
    };
    graph.edges = {{"a", "b"}, {"b", "ghost"}, {"b", "c"}};

    CodeGraphLayout engine;
    return engine.layout(graph, Direction::LeftToRight);
}

}  // namespace

TEST(LayoutSerializerTest, ToJson_ContainsRequiredFields) {
    json j = json::parse(LayoutSerializer::toJson(sampleLayout()));

    EXPECT_EQ(j["direction"], "LR");
    EXPECT_EQ(j["placement"], "row");
    EXPECT_EQ(j["containers"].size(), 2u);
    EXPECT_EQ(j["nodes"].size(), 3u);
    EXPECT_EQ(j["edges"].size(), 2u);
    EXPECT_TRUE(j.contains("diagnostics"));
}

TEST(LayoutSerializerTest, ToJson_NodeRecord) {
    json j = json::parse(LayoutSerializer::toJson(sampleLayout()));
    const json& node = j["nodes"][0];

    EXPECT_EQ(node["id"], "a");
    EXPECT_EQ(node["kind"], "CLASS");
    EXPECT_EQ(node["containerId"], "group-x.py");
    EXPECT_EQ(node["targetPosition"], "left");
    EXPECT_EQ(node["sourcePosition"], "right");
    EXPECT_EQ(node["shape"], "rectangle");
    EXPECT_EQ(node["style"]["fontWeight"], "bold");
    EXPECT_FALSE(node["style"].contains("clipPath"));
    EXPECT_TRUE(node["position"].contains("x"));
}

TEST(LayoutSerializerTest, ToJson_EdgeRecord) {
    json j = json::parse(LayoutSerializer::toJson(sampleLayout()));
    const json& edge = j["edges"][1];

    EXPECT_EQ(edge["id"], "edge-2");
    EXPECT_EQ(edge["source"], "b");
    EXPECT_EQ(edge["target"], "c");
    EXPECT_EQ(edge["type"], "smoothstep");
    EXPECT_EQ(edge["markerEnd"]["type"], "arrowclosed");
    EXPECT_EQ(edge["style"]["stroke"], "#2563eb");
}

TEST(LayoutSerializerTest, ToJson_Diagnostics) {
    json j = json::parse(LayoutSerializer::toJson(sampleLayout()));
    const json& diagnostics = j["diagnostics"];

    EXPECT_EQ(diagnostics["droppedEdgeCount"], 1);
    ASSERT_EQ(diagnostics["danglingEdges"].size(), 1u);
    EXPECT_EQ(diagnostics["danglingEdges"][0]["missing"], "ghost");
    EXPECT_EQ(diagnostics["danglingEdges"][0]["index"], 1);
}

TEST(LayoutSerializerTest, EmptyResult_SerializesEmptyArrays) {
    json j = json::parse(LayoutSerializer::toJson(LayoutResult{}));

    EXPECT_TRUE(j["nodes"].empty());
    EXPECT_TRUE(j["edges"].empty());
    EXPECT_TRUE(j["containers"].empty());
}

TEST(LayoutSerializerTest, SaveToFile) {
    std::filesystem::path path = std::filesystem::temp_directory_path() / "codemap_layout_test.json";

    ASSERT_TRUE(LayoutSerializer::saveToFile(sampleLayout(), path.string()));

    std::ifstream in(path);
    json j = json::parse(in);
    EXPECT_EQ(j["nodes"].size(), 3u);
    std::filesystem::remove(path);
}

TEST(LayoutSerializerTest, Options_MissingKeysKeepDefaults) {
    LayoutOptions options = LayoutSerializer::optionsFromJson(R"({
        "direction": "LR",
        "placement": {"containerGap": 120},
        "hierarchy": {"minNodes": 3, "crossingMinimization": "none"},
        "unknown": 1
    })");

    EXPECT_EQ(options.direction, Direction::LeftToRight);
    EXPECT_FLOAT_EQ(options.placement.containerGap, 120.0f);
    EXPECT_FLOAT_EQ(options.placement.columnSlotWidth, 1200.0f);
    EXPECT_EQ(options.hierarchy.hierarchicalMinNodes, 3);
    EXPECT_EQ(options.hierarchy.hierarchicalMinEdges, 1);
    EXPECT_EQ(options.hierarchy.crossingMinimization, CrossingMinimization::None);
    EXPECT_FLOAT_EQ(options.container.nodeWidth, 172.0f);
}

TEST(LayoutSerializerTest, Options_ToJsonAndBack) {
    LayoutOptions original;
    original.setNodeSize(200.0f, 40.0f).setRowGap(90.0f).setDirection(Direction::LeftToRight);

    LayoutOptions restored = LayoutSerializer::optionsFromJson(LayoutSerializer::optionsToJson(original));

    EXPECT_FLOAT_EQ(restored.container.nodeWidth, 200.0f);
    EXPECT_FLOAT_EQ(restored.container.nodeHeight, 40.0f);
    EXPECT_FLOAT_EQ(restored.placement.rowGap, 90.0f);
    EXPECT_EQ(restored.direction, Direction::LeftToRight);
}

TEST(LayoutSerializerTest, Options_InvalidInputThrows) {
    EXPECT_THROW(LayoutSerializer::optionsFromJson("not json"), std::runtime_error);
    EXPECT_THROW(LayoutSerializer::optionsFromJson("[]"), std::runtime_error);
    EXPECT_THROW(LayoutSerializer::optionsFromJson(R"({"direction": "BT"})"), std::runtime_error);
}

TEST(LayoutSerializerTest, LoadOptionsFromFile_MissingFileFails) {
    LayoutOptions options;
    EXPECT_FALSE(LayoutSerializer::loadOptionsFromFile("/nonexistent/codemap.json", options));
}
