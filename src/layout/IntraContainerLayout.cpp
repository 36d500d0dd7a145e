#include "codemap/layout/IntraContainerLayout.h"
#include "codemap/common/Logger.h"
#include "codemap/core/Graph.h"
#include "codemap/layout/ContainerSizer.h"
#include "codemap/layout/HierarchicalLayout.h"

#include <algorithm>
#include <unordered_set>

namespace codemap {

LayoutStrategy IntraContainerLayout::selectStrategy(size_t memberCount, size_t internalEdgeCount,
                                                    const HierarchyMetrics& metrics) {
    size_t minNodes = static_cast<size_t>(std::max(0, metrics.hierarchicalMinNodes));
    size_t minEdges = static_cast<size_t>(std::max(1, metrics.hierarchicalMinEdges));

    if (memberCount >= minNodes && internalEdgeCount >= minEdges) {
        return LayoutStrategy::Hierarchical;
    }
    return LayoutStrategy::Grid;
}

AnchorSides IntraContainerLayout::anchorsFor(Direction direction) {
    if (direction == Direction::LeftToRight) {
        return {NodeEdge::Left, NodeEdge::Right};
    }
    return {NodeEdge::Top, NodeEdge::Bottom};
}

std::vector<GraphEdge> IntraContainerLayout::inducedEdges(const Container& container,
                                                          const std::vector<GraphEdge>& edges) {
    std::unordered_set<std::string> members(container.memberIds.begin(), container.memberIds.end());

    std::vector<GraphEdge> result;
    for (const auto& edge : edges) {
        if (members.count(edge.from) > 0 && members.count(edge.to) > 0) {
            result.push_back(edge);
        }
    }
    return result;
}

ContainerPlan IntraContainerLayout::plan(const Container& container,
                                         const std::vector<GraphEdge>& induced) const {
    ContainerPlan plan;
    plan.memberCount = container.memberCount();
    for (const auto& edge : induced) {
        if (edge.from == edge.to) {
            ++plan.selfLoopCount;
        } else {
            ++plan.internalEdgeCount;
        }
    }
    plan.strategy = selectStrategy(plan.memberCount, plan.internalEdgeCount, options_.hierarchy);
    return plan;
}

IntraLayoutResult IntraContainerLayout::layout(const Container& container,
                                               const std::vector<GraphEdge>& induced) const {
    IntraLayoutResult result;
    result.plan = plan(container, induced);
    result.anchors = anchorsFor(options_.direction);

    switch (result.plan.strategy) {
        case LayoutStrategy::Hierarchical:
            layoutHierarchical(container, induced, result);
            break;
        case LayoutStrategy::Grid:
            layoutGrid(container, result);
            break;
    }

    LOG_DEBUG("Container {}: {} members, {} internal edges -> {} layout, {} ranks",
              container.id, result.plan.memberCount, result.plan.internalEdgeCount,
              layoutStrategyToString(result.plan.strategy), result.rankCount);
    return result;
}

void IntraContainerLayout::layoutGrid(const Container& container, IntraLayoutResult& result) const {
    const ContainerMetrics& m = options_.container;
    const GridShape shape = ContainerSizer::gridShape(container.memberCount());
    const Point origin = m.contentOrigin();

    if (shape.cols == 0) {
        return;
    }

    for (size_t i = 0; i < container.memberIds.size(); ++i) {
        int col = static_cast<int>(i) % shape.cols;
        int row = static_cast<int>(i) / shape.cols;

        LocalPlacement placement;
        placement.position = {origin.x + col * (m.nodeWidth + m.nodeGapX),
                              origin.y + row * (m.nodeHeight + m.nodeGapY)};
        placement.rank = row;
        placement.order = col;
        result.placements[container.memberIds[i]] = placement;

        result.contentExtent.width = std::max(result.contentExtent.width,
                                              placement.position.x + m.nodeWidth);
        result.contentExtent.height = std::max(result.contentExtent.height,
                                               placement.position.y + m.nodeHeight);
    }

    result.rankCount = shape.rows;
}

void IntraContainerLayout::layoutHierarchical(const Container& container,
                                              const std::vector<GraphEdge>& induced,
                                              IntraLayoutResult& result) const {
    const ContainerMetrics& m = options_.container;
    const Size cell = m.nodeSize();
    const Point origin = m.contentOrigin();

    // Layering workspace scoped to this container and this call
    Graph workspace;
    std::unordered_map<std::string, NodeId> vertexOf;
    for (const auto& memberId : container.memberIds) {
        vertexOf[memberId] = workspace.addNode(cell, memberId);
    }
    for (const auto& edge : induced) {
        workspace.addEdge(vertexOf.at(edge.from), vertexOf.at(edge.to));
    }

    HierarchicalLayout layered(options_);
    HierarchyResult hierarchy = layered.layout(workspace);

    for (const auto& memberId : container.memberIds) {
        const HierarchyNodePlacement& placed = hierarchy.placements.at(vertexOf.at(memberId));

        LocalPlacement placement;
        placement.position = {placed.center.x - cell.width / 2.0f + origin.x,
                              placed.center.y - cell.height / 2.0f + origin.y};
        placement.rank = placed.rank;
        placement.order = placed.order;
        result.placements[memberId] = placement;
    }

    result.contentExtent = {origin.x + hierarchy.extent.width,
                            origin.y + hierarchy.extent.height};
    result.rankCount = hierarchy.stats.layerCount;
}

}  // namespace codemap
