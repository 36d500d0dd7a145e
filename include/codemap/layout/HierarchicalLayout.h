#pragma once

#include "../core/Graph.h"
#include "config/LayoutOptions.h"

#include <memory>
#include <unordered_map>
#include <vector>

namespace codemap {

namespace algorithms {
class ICycleRemoval;
class ILayerAssignment;
class ICrossingMinimization;
class ICoordinateAssignment;
}  // namespace algorithms

/// Placement of one workspace node produced by the layered layout
struct HierarchyNodePlacement {
    Point center;   ///< Centre, drawing's top-left corner at the origin
    int rank = 0;   ///< Layer index (0 = sources)
    int order = 0;  ///< Position within the layer
};

/// Output of a hierarchical layout run
struct HierarchyResult {
    std::unordered_map<NodeId, HierarchyNodePlacement> placements;
    std::vector<std::vector<NodeId>> layers;  ///< Final order within each layer
    Size extent;                              ///< Bounding size of all nodes

    struct Stats {
        int layerCount = 0;
        int maxLayerWidth = 0;
        int edgeCrossings = 0;
        int reversedEdges = 0;
        int ignoredSelfLoops = 0;
    } stats;
};

/// Sugiyama-style layered layout of a single container's subgraph
///
/// 1. Cycle Removal - find edges to reverse so the graph becomes acyclic
/// 2. Layer Assignment - longest path from the sources
/// 3. Crossing Minimization - barycenter sweeps within layers
/// 4. Coordinate Assignment - centre coordinates per layer
///
/// Self-loops are kept in the input graph but ignored by every phase.
/// Each run builds its own workspace; no state survives between runs.
class HierarchicalLayout {
public:
    HierarchicalLayout();
    explicit HierarchicalLayout(const LayoutOptions& options);
    ~HierarchicalLayout();

    // Non-copyable, movable
    HierarchicalLayout(const HierarchicalLayout&) = delete;
    HierarchicalLayout& operator=(const HierarchicalLayout&) = delete;
    HierarchicalLayout(HierarchicalLayout&&) noexcept;
    HierarchicalLayout& operator=(HierarchicalLayout&&) noexcept;

    void setOptions(const LayoutOptions& options) { options_ = options; }
    const LayoutOptions& options() const { return options_; }

    HierarchyResult layout(const Graph& graph) const;

    /// Algorithm injection (for swapping implementations); nullptr keeps the current one
    void setCycleRemoval(std::shared_ptr<algorithms::ICycleRemoval> impl);
    void setLayerAssignment(std::shared_ptr<algorithms::ILayerAssignment> impl);
    void setCrossingMinimization(std::shared_ptr<algorithms::ICrossingMinimization> impl);
    void setCoordinateAssignment(std::shared_ptr<algorithms::ICoordinateAssignment> impl);

private:
    LayoutOptions options_;

    std::shared_ptr<algorithms::ICycleRemoval> cycleRemoval_;
    std::shared_ptr<algorithms::ILayerAssignment> layerAssignment_;
    std::shared_ptr<algorithms::ICrossingMinimization> crossingMinimization_;
    std::shared_ptr<algorithms::ICoordinateAssignment> coordinateAssignment_;

    /// Copy of the graph with reversed edges flipped and self-loops removed
    static Graph buildAcyclicGraph(const Graph& graph, const std::vector<EdgeId>& reversedEdges);
};

}  // namespace codemap
