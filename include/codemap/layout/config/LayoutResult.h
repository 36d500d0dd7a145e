#pragma once

#include "../../core/CodeGraph.h"
#include "../../core/Types.h"
#include "../../ingest/GraphIngest.h"
#include "LayoutStyle.h"
#include "LayoutTypes.h"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codemap {

/// Positioned code node
struct LayoutNode {
    std::string id;
    std::string name;
    NodeKind kind = NodeKind::Unknown;
    std::string kindName;
    std::string file;
    int line = 0;

    Point position;           // Top-left corner, canvas coordinates
    // Layout cell reserved by the engine (node width x height from
    // ContainerMetrics), not the drawn size. Circle and diamond kinds draw
    // smaller, per style.width / style.height.
    Size size;
    NodeStyle style;
    std::string containerId;

    int rank = 0;             // Layer (hierarchical) or grid row
    int order = 0;            // Position within layer (hierarchical) or grid column

    NodeEdge targetAnchor = NodeEdge::Top;     // Side incoming edges attach to
    NodeEdge sourceAnchor = NodeEdge::Bottom;  // Side outgoing edges leave from

    Rect bounds() const { return {position, size}; }
};

/// Styled edge between two laid-out nodes
struct LayoutEdge {
    std::string id;           // "edge-" + input index
    std::string sourceId;
    std::string targetId;
    size_t inputIndex = 0;
    EdgeStyle style;
};

/// Positioned file container
struct ContainerLayout {
    std::string id;
    std::string file;
    std::string label;
    std::vector<std::string> memberIds;
    Point position;           // Top-left corner, canvas coordinates
    Size size;
    LayoutStrategy strategy = LayoutStrategy::Grid;
    int rankCount = 0;        // Layers (hierarchical) or grid rows
    int internalEdgeCount = 0;
    ContainerStyle style;

    Rect bounds() const { return {position, size}; }
};

/// Complete output of one layout pass. Replaced wholesale by the next pass.
class LayoutResult {
public:
    LayoutResult() = default;

    // Containers
    void addContainer(const ContainerLayout& container);
    const ContainerLayout* getContainer(const std::string& id) const;
    const std::vector<ContainerLayout>& containers() const { return containers_; }

    // Nodes
    void addNode(const LayoutNode& node);
    const LayoutNode* getNode(const std::string& id) const;
    bool hasNode(const std::string& id) const { return nodeIndex_.count(id) > 0; }
    const std::vector<LayoutNode>& nodes() const { return nodes_; }
    std::vector<const LayoutNode*> nodesInContainer(const std::string& containerId) const;

    // Edges
    void addEdge(const LayoutEdge& edge);
    const LayoutEdge* getEdge(const std::string& id) const;
    const std::vector<LayoutEdge>& edges() const { return edges_; }

    // Pass metadata
    void setDirection(Direction direction) { direction_ = direction; }
    Direction direction() const { return direction_; }
    void setPlacementRegime(PlacementRegime regime) { placementRegime_ = regime; }
    PlacementRegime placementRegime() const { return placementRegime_; }
    void setDiagnostics(IngestDiagnostics diagnostics) { diagnostics_ = std::move(diagnostics); }
    const IngestDiagnostics& diagnostics() const { return diagnostics_; }

    // Bounds
    Rect computeBounds() const;
    Rect computeBounds(float padding) const;

    // Statistics
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }
    size_t containerCount() const { return containers_.size(); }
    /// True when there is nothing to draw ("no data")
    bool empty() const { return nodes_.empty(); }

    void clear();

private:
    Direction direction_ = Direction::TopToBottom;
    PlacementRegime placementRegime_ = PlacementRegime::None;

    std::vector<ContainerLayout> containers_;
    std::vector<LayoutNode> nodes_;
    std::vector<LayoutEdge> edges_;
    IngestDiagnostics diagnostics_;

    std::unordered_map<std::string, size_t> containerIndex_;
    std::unordered_map<std::string, size_t> nodeIndex_;
    std::unordered_map<std::string, size_t> edgeIndex_;
};

}  // namespace codemap
