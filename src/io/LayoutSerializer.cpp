#include "codemap/io/LayoutSerializer.h"
#include "codemap/common/Logger.h"
#include "codemap/layout/config/LayoutResult.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace codemap {

namespace {

void putOptional(json& j, const char* key, const std::optional<std::string>& value) {
    if (value) j[key] = *value;
}

json nodeStyleToJson(const NodeStyle& style) {
    json j = {
        {"background", style.background},
        {"border", style.border},
        {"borderRadius", style.borderRadius},
        {"fontSize", style.fontSize},
        {"padding", style.padding},
        {"textAlign", style.textAlign},
        {"minWidth", style.minWidth}
    };
    putOptional(j, "fontWeight", style.fontWeight);
    putOptional(j, "width", style.width);
    putOptional(j, "height", style.height);
    putOptional(j, "display", style.display);
    putOptional(j, "alignItems", style.alignItems);
    putOptional(j, "justifyContent", style.justifyContent);
    putOptional(j, "clipPath", style.clipPath);
    return j;
}

json containerStyleToJson(const ContainerStyle& style) {
    return {
        {"backgroundColor", style.backgroundColor},
        {"border", style.border},
        {"borderRadius", style.borderRadius},
        {"padding", style.padding},
        {"opacity", style.opacity}
    };
}

json edgeStyleToJson(const EdgeStyle& style) {
    return {
        {"type", style.type},
        {"style", {
            {"strokeWidth", style.strokeWidth},
            {"stroke", style.stroke},
            {"opacity", style.opacity}
        }},
        {"zIndex", style.zIndex},
        {"markerEnd", {
            {"type", style.markerEnd.type},
            {"width", style.markerEnd.width},
            {"height", style.markerEnd.height},
            {"color", style.markerEnd.color}
        }}
    };
}

json diagnosticsToJson(const IngestDiagnostics& diagnostics) {
    json dangling = json::array();
    for (const auto& edge : diagnostics.danglingEdges) {
        dangling.push_back({
            {"index", edge.inputIndex},
            {"from", edge.from},
            {"to", edge.to},
            {"missing", edge.missingId}
        });
    }
    return {
        {"duplicateNodeIds", diagnostics.duplicateNodeIds},
        {"danglingEdges", dangling},
        {"unknownKindNodeIds", diagnostics.unknownKindNodeIds},
        {"droppedEdgeCount", diagnostics.droppedEdgeCount()}
    };
}

CrossingMinimization parseCrossingMinimization(const std::string& text) {
    if (text == "none") return CrossingMinimization::None;
    if (text == "barycenter") return CrossingMinimization::BarycenterHeuristic;
    throw std::runtime_error("Unknown crossing minimization: " + text);
}

const char* crossingMinimizationToString(CrossingMinimization c) {
    return c == CrossingMinimization::None ? "none" : "barycenter";
}

}  // namespace

std::string LayoutSerializer::toJson(const LayoutResult& result) {
    json j;
    j["direction"] = directionToString(result.direction());
    j["placement"] = placementRegimeToString(result.placementRegime());

    json containers = json::array();
    for (const auto& container : result.containers()) {
        containers.push_back({
            {"id", container.id},
            {"file", container.file},
            {"label", container.label},
            {"memberIds", container.memberIds},
            {"position", {{"x", container.position.x}, {"y", container.position.y}}},
            {"size", {{"width", container.size.width}, {"height", container.size.height}}},
            {"strategy", layoutStrategyToString(container.strategy)},
            {"rankCount", container.rankCount},
            {"internalEdgeCount", container.internalEdgeCount},
            {"style", containerStyleToJson(container.style)}
        });
    }
    j["containers"] = containers;

    json nodes = json::array();
    for (const auto& node : result.nodes()) {
        nodes.push_back({
            {"id", node.id},
            {"name", node.name},
            {"kind", node.kindName},
            {"file", node.file},
            {"line", node.line},
            {"shape", nodeShapeToString(node.style.shape)},
            {"position", {{"x", node.position.x}, {"y", node.position.y}}},
            {"size", {{"width", node.size.width}, {"height", node.size.height}}},
            {"containerId", node.containerId},
            {"rank", node.rank},
            {"order", node.order},
            {"targetPosition", nodeEdgeToString(node.targetAnchor)},
            {"sourcePosition", nodeEdgeToString(node.sourceAnchor)},
            {"style", nodeStyleToJson(node.style)}
        });
    }
    j["nodes"] = nodes;

    json edges = json::array();
    for (const auto& edge : result.edges()) {
        json edgeJson = edgeStyleToJson(edge.style);
        edgeJson["id"] = edge.id;
        edgeJson["source"] = edge.sourceId;
        edgeJson["target"] = edge.targetId;
        edges.push_back(edgeJson);
    }
    j["edges"] = edges;

    j["diagnostics"] = diagnosticsToJson(result.diagnostics());

    return j.dump(2);
}

bool LayoutSerializer::saveToFile(const LayoutResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot write layout to {}", path);
        return false;
    }
    file << toJson(result);
    return true;
}

std::string LayoutSerializer::optionsToJson(const LayoutOptions& options) {
    const ContainerMetrics& c = options.container;
    const PlacementMetrics& p = options.placement;
    const HierarchyMetrics& h = options.hierarchy;

    json j;
    j["direction"] = directionToString(options.direction);
    j["container"] = {
        {"nodeWidth", c.nodeWidth},
        {"nodeHeight", c.nodeHeight},
        {"nodeGapX", c.nodeGapX},
        {"nodeGapY", c.nodeGapY},
        {"horizontalPad", c.horizontalPad},
        {"verticalPad", c.verticalPad},
        {"titleBand", c.titleBand},
        {"minWidth", c.minWidth},
        {"minHeight", c.minHeight}
    };
    j["placement"] = {
        {"canvasMargin", p.canvasMargin},
        {"containerGap", p.containerGap},
        {"columnSlotWidth", p.columnSlotWidth},
        {"rowGap", p.rowGap},
        {"maxRowContainers", p.maxRowContainers}
    };
    j["hierarchy"] = {
        {"nodeSeparation", h.nodeSeparation},
        {"rankSeparation", h.rankSeparation},
        {"minNodes", h.hierarchicalMinNodes},
        {"minEdges", h.hierarchicalMinEdges},
        {"crossingMinimization", crossingMinimizationToString(h.crossingMinimization)},
        {"crossingMinimizationPasses", h.crossingMinimizationPasses}
    };
    return j.dump(2);
}

LayoutOptions LayoutSerializer::optionsFromJson(const std::string& jsonStr) {
    LayoutOptions options;

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw std::runtime_error("Layout options must be a JSON object");
        }

        if (j.contains("direction")) {
            options.direction = parseDirection(j["direction"].get<std::string>());
        }

        if (j.contains("container")) {
            const json& c = j["container"];
            ContainerMetrics& m = options.container;
            m.nodeWidth = c.value("nodeWidth", m.nodeWidth);
            m.nodeHeight = c.value("nodeHeight", m.nodeHeight);
            m.nodeGapX = c.value("nodeGapX", m.nodeGapX);
            m.nodeGapY = c.value("nodeGapY", m.nodeGapY);
            m.horizontalPad = c.value("horizontalPad", m.horizontalPad);
            m.verticalPad = c.value("verticalPad", m.verticalPad);
            m.titleBand = c.value("titleBand", m.titleBand);
            m.minWidth = c.value("minWidth", m.minWidth);
            m.minHeight = c.value("minHeight", m.minHeight);
        }

        if (j.contains("placement")) {
            const json& p = j["placement"];
            PlacementMetrics& m = options.placement;
            m.canvasMargin = p.value("canvasMargin", m.canvasMargin);
            m.containerGap = p.value("containerGap", m.containerGap);
            m.columnSlotWidth = p.value("columnSlotWidth", m.columnSlotWidth);
            m.rowGap = p.value("rowGap", m.rowGap);
            m.maxRowContainers = p.value("maxRowContainers", m.maxRowContainers);
        }

        if (j.contains("hierarchy")) {
            const json& h = j["hierarchy"];
            HierarchyMetrics& m = options.hierarchy;
            m.nodeSeparation = h.value("nodeSeparation", m.nodeSeparation);
            m.rankSeparation = h.value("rankSeparation", m.rankSeparation);
            m.hierarchicalMinNodes = h.value("minNodes", m.hierarchicalMinNodes);
            m.hierarchicalMinEdges = h.value("minEdges", m.hierarchicalMinEdges);
            if (h.contains("crossingMinimization")) {
                m.crossingMinimization =
                    parseCrossingMinimization(h["crossingMinimization"].get<std::string>());
            }
            m.crossingMinimizationPasses =
                h.value("crossingMinimizationPasses", m.crossingMinimizationPasses);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse layout options JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Failed to parse layout options JSON: ") + e.what());
    }

    return options;
}

bool LayoutSerializer::loadOptionsFromFile(const std::string& path, LayoutOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) return false;
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        options = optionsFromJson(buffer.str());
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Invalid layout options in {}: {}", path, e.what());
        return false;
    }
    return true;
}

}  // namespace codemap
