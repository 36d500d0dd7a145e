#pragma once

#include "../core/CodeGraph.h"
#include "config/LayoutOptions.h"
#include "config/LayoutTypes.h"
#include "Container.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace codemap {

/// Sides edges attach to, fixed per container by the layout direction
struct AnchorSides {
    NodeEdge target = NodeEdge::Top;
    NodeEdge source = NodeEdge::Bottom;
};

/// Strategy decision for one container, made before any position is computed
struct ContainerPlan {
    LayoutStrategy strategy = LayoutStrategy::Grid;
    size_t memberCount = 0;
    size_t internalEdgeCount = 0;   ///< Induced edges excluding self-loops
    size_t selfLoopCount = 0;
};

/// Container-local placement of one member (top-left corner)
struct LocalPlacement {
    Point position;
    int rank = 0;
    int order = 0;
};

struct IntraLayoutResult {
    ContainerPlan plan;
    std::unordered_map<std::string, LocalPlacement> placements;  ///< By member id
    Size contentExtent;      ///< Largest right/bottom of any member, local coordinates
    int rankCount = 0;       ///< Layers (hierarchical) or rows (grid)
    AnchorSides anchors;
};

/// Lays out the members of one container in container-local coordinates.
///
/// Hierarchical strategy: layered layout of the induced subgraph; node
/// centres are shifted by half a node and by the content origin (horizontal
/// padding, title band). Grid strategy: raster order on the same
/// cols/rows split the ContainerSizer uses.
class IntraContainerLayout {
public:
    explicit IntraContainerLayout(const LayoutOptions& options) : options_(options) {}

    /// Hierarchical iff internalEdgeCount >= minEdges and memberCount >= minNodes.
    /// A minEdges below 1 counts as 1: layering needs at least one edge to order by.
    static LayoutStrategy selectStrategy(size_t memberCount, size_t internalEdgeCount,
                                         const HierarchyMetrics& metrics);

    static AnchorSides anchorsFor(Direction direction);

    /// Edges of `edges` with both endpoints in the container, in input order
    static std::vector<GraphEdge> inducedEdges(const Container& container,
                                               const std::vector<GraphEdge>& edges);

    ContainerPlan plan(const Container& container,
                       const std::vector<GraphEdge>& induced) const;

    /// @param induced Edges between members of the container (see inducedEdges)
    IntraLayoutResult layout(const Container& container,
                             const std::vector<GraphEdge>& induced) const;

private:
    void layoutGrid(const Container& container, IntraLayoutResult& result) const;
    void layoutHierarchical(const Container& container,
                            const std::vector<GraphEdge>& induced,
                            IntraLayoutResult& result) const;

    LayoutOptions options_;
};

}  // namespace codemap
