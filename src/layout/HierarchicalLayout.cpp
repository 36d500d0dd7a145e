#include "codemap/layout/HierarchicalLayout.h"
#include "codemap/common/Logger.h"
#include "codemap/layout/ICoordinateAssignment.h"
#include "codemap/layout/ICrossingMinimization.h"
#include "codemap/layout/ICycleRemoval.h"
#include "codemap/layout/ILayerAssignment.h"
#include "sugiyama/CoordinateAssignment.h"
#include "sugiyama/CrossingMinimization.h"
#include "sugiyama/CycleRemoval.h"
#include "sugiyama/LayerAssignment.h"

#include <algorithm>
#include <unordered_set>

namespace codemap {

HierarchicalLayout::HierarchicalLayout()
    : HierarchicalLayout(LayoutOptions{}) {}

HierarchicalLayout::HierarchicalLayout(const LayoutOptions& options)
    : options_(options)
    , cycleRemoval_(std::make_shared<algorithms::CycleRemoval>())
    , layerAssignment_(std::make_shared<algorithms::LongestPathLayerAssignment>())
    , crossingMinimization_(std::make_shared<algorithms::BarycenterCrossingMinimization>())
    , coordinateAssignment_(std::make_shared<algorithms::SimpleCoordinateAssignment>()) {}

HierarchicalLayout::~HierarchicalLayout() = default;

HierarchicalLayout::HierarchicalLayout(HierarchicalLayout&&) noexcept = default;
HierarchicalLayout& HierarchicalLayout::operator=(HierarchicalLayout&&) noexcept = default;

void HierarchicalLayout::setCycleRemoval(std::shared_ptr<algorithms::ICycleRemoval> impl) {
    if (impl) cycleRemoval_ = std::move(impl);
}

void HierarchicalLayout::setLayerAssignment(std::shared_ptr<algorithms::ILayerAssignment> impl) {
    if (impl) layerAssignment_ = std::move(impl);
}

void HierarchicalLayout::setCrossingMinimization(std::shared_ptr<algorithms::ICrossingMinimization> impl) {
    if (impl) crossingMinimization_ = std::move(impl);
}

void HierarchicalLayout::setCoordinateAssignment(std::shared_ptr<algorithms::ICoordinateAssignment> impl) {
    if (impl) coordinateAssignment_ = std::move(impl);
}

Graph HierarchicalLayout::buildAcyclicGraph(const Graph& graph,
                                            const std::vector<EdgeId>& reversedEdges) {
    std::unordered_set<EdgeId> reversed(reversedEdges.begin(), reversedEdges.end());

    Graph dag;
    for (NodeId id : graph.nodes()) {
        dag.addNode(graph.getNode(id));
    }
    for (EdgeId id : graph.edges()) {
        const EdgeData& edge = graph.getEdge(id);
        if (edge.isSelfLoop()) {
            continue;
        }
        if (reversed.count(id) > 0) {
            dag.addEdge(edge.to, edge.from);
        } else {
            dag.addEdge(edge.from, edge.to);
        }
    }
    return dag;
}

HierarchyResult HierarchicalLayout::layout(const Graph& graph) const {
    HierarchyResult result;

    if (graph.nodeCount() == 0) {
        return result;
    }

    const HierarchyMetrics& metrics = options_.hierarchy;

    // Phase 1: Cycle Removal
    algorithms::CycleRemovalResult cycles = cycleRemoval_->findEdgesToReverse(graph);
    result.stats.reversedEdges = static_cast<int>(cycles.reversedEdges.size());
    for (EdgeId id : graph.edges()) {
        if (graph.getEdge(id).isSelfLoop()) {
            ++result.stats.ignoredSelfLoops;
        }
    }

    Graph dag = buildAcyclicGraph(graph, cycles.reversedEdges);

    // Phase 2: Layer Assignment
    algorithms::LayerAssignmentResult layering = layerAssignment_->assignLayers(dag);

    // Phase 3: Crossing Minimization
    algorithms::CrossingMinimizationResult ordering = crossingMinimization_->minimize(
        dag, std::move(layering.layers), metrics.crossingMinimization,
        metrics.crossingMinimizationPasses);

    // Phase 4: Coordinate Assignment
    algorithms::CoordinateAssignmentResult coords = coordinateAssignment_->assign(
        dag, ordering.layers, options_.direction, metrics);

    for (size_t rank = 0; rank < ordering.layers.size(); ++rank) {
        const auto& layer = ordering.layers[rank];
        for (size_t order = 0; order < layer.size(); ++order) {
            NodeId node = layer[order];
            result.placements[node] = {coords.centers.at(node),
                                       static_cast<int>(rank),
                                       static_cast<int>(order)};
        }
        result.stats.maxLayerWidth = std::max(result.stats.maxLayerWidth,
                                              static_cast<int>(layer.size()));
    }

    result.layers = std::move(ordering.layers);
    result.extent = coords.extent;
    result.stats.layerCount = static_cast<int>(result.layers.size());
    result.stats.edgeCrossings = ordering.crossingCount;

    LOG_TRACE("{} nodes in {} layers ({} crossings, {} reversed edges) via {}/{}/{}/{}",
              graph.nodeCount(), result.stats.layerCount, result.stats.edgeCrossings,
              result.stats.reversedEdges, cycleRemoval_->algorithmName(),
              layerAssignment_->algorithmName(), crossingMinimization_->algorithmName(),
              coordinateAssignment_->algorithmName());

    return result;
}

}  // namespace codemap
