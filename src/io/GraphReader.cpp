#include "codemap/io/GraphReader.h"
#include "codemap/common/Logger.h"
#include "codemap/core/Errors.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace codemap {

namespace {

constexpr std::array<GraphVariant, 3> kVariants = {
    GraphVariant::Combined, GraphVariant::Call, GraphVariant::Declaration};

const json& requireField(const json& record, const std::string& recordName,
                         const char* field) {
    auto it = record.find(field);
    if (it == record.end() || it->is_null()) {
        throw MalformedInputError(recordName, field, "is missing");
    }
    return *it;
}

std::string requireString(const json& record, const std::string& recordName, const char* field) {
    const json& value = requireField(record, recordName, field);
    if (!value.is_string()) {
        throw MalformedInputError(recordName, field, "must be a string");
    }
    return value.get<std::string>();
}

int requireInt(const json& record, const std::string& recordName, const char* field) {
    const json& value = requireField(record, recordName, field);
    if (!value.is_number_integer()) {
        throw MalformedInputError(recordName, field, "must be an integer");
    }
    // Unsigned storage is only used for values beyond int64 range
    if (value.is_number_unsigned() && value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        throw MalformedInputError(recordName, field, "is out of range");
    }
    const int64_t wide = value.get<int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        throw MalformedInputError(recordName, field, "is out of range");
    }
    return static_cast<int>(wide);
}

const json& requireArray(const json& document, const char* key) {
    auto it = document.find(key);
    if (it == document.end() || !it->is_array()) {
        throw GraphFormatError(std::string("Graph document has no \"") + key + "\" array");
    }
    return *it;
}

GraphNode parseNode(const json& record, size_t index) {
    std::string recordName = "node #" + std::to_string(index);
    if (!record.is_object()) {
        throw MalformedInputError(recordName, "*", "record is not an object");
    }

    GraphNode node;
    node.id = requireString(record, recordName, "id");
    recordName += " (" + node.id + ")";
    node.name = requireString(record, recordName, "name");
    node.kindName = requireString(record, recordName, "kind");
    node.kind = parseNodeKind(node.kindName);
    node.file = requireString(record, recordName, "file");
    node.line = requireInt(record, recordName, "line");
    return node;
}

GraphEdge parseEdge(const json& record, size_t index) {
    const std::string recordName = "edge #" + std::to_string(index);
    if (!record.is_object()) {
        throw MalformedInputError(recordName, "*", "record is not an object");
    }
    return {requireString(record, recordName, "from"), requireString(record, recordName, "to")};
}

}  // namespace

const char* variantName(GraphVariant variant) {
    switch (variant) {
        case GraphVariant::Combined: return "combined";
        case GraphVariant::Call: return "call";
        case GraphVariant::Declaration: return "declaration";
    }
    return "combined";
}

const char* variantFileName(GraphVariant variant) {
    switch (variant) {
        case GraphVariant::Combined: return "combined_graph.json";
        case GraphVariant::Call: return "call_graph.json";
        case GraphVariant::Declaration: return "declaration_graph.json";
    }
    return "combined_graph.json";
}

GraphVariant parseVariant(std::string_view text) {
    for (GraphVariant variant : kVariants) {
        if (text == variantName(variant)) return variant;
    }
    throw std::invalid_argument("Unknown graph variant: " + std::string(text));
}

CodeGraph GraphReader::fromJson(const std::string& text) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        throw GraphFormatError(std::string("Graph document is not valid JSON: ") + e.what());
    }

    if (!document.is_object()) {
        throw GraphFormatError("Graph document is not a JSON object");
    }

    const json& nodes = requireArray(document, "nodes");
    const json& edges = requireArray(document, "edges");

    CodeGraph graph;
    graph.nodes.reserve(nodes.size());
    for (size_t i = 0; i < nodes.size(); ++i) {
        graph.nodes.push_back(parseNode(nodes[i], i));
    }
    graph.edges.reserve(edges.size());
    for (size_t i = 0; i < edges.size(); ++i) {
        graph.edges.push_back(parseEdge(edges[i], i));
    }

    LOG_DEBUG("Read graph: {} nodes, {} edges", graph.nodeCount(), graph.edgeCount());
    return graph;
}

CodeGraph GraphReader::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw GraphFormatError("Cannot open graph file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return fromJson(buffer.str());
    } catch (const GraphFormatError& e) {
        throw GraphFormatError(path + ": " + e.what());
    }
}

GraphDataset GraphDataset::loadFromDirectory(const std::string& dir) {
    GraphDataset dataset;
    for (GraphVariant variant : kVariants) {
        std::filesystem::path path = std::filesystem::path(dir) / variantFileName(variant);
        dataset.setGraph(variant, GraphReader::loadFromFile(path.string()));
    }
    LOG_INFO("Loaded dataset from {}", dir);
    return dataset;
}

void GraphDataset::setGraph(GraphVariant variant, CodeGraph graph) {
    graphs_[static_cast<size_t>(variant)] = std::move(graph);
}

}  // namespace codemap
