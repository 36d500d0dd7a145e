#include "codemap/layout/CodeGraphLayout.h"
#include "codemap/common/Logger.h"
#include "codemap/ingest/GraphIngest.h"
#include "codemap/layout/ContainerPlacer.h"
#include "codemap/layout/ContainerSizer.h"
#include "codemap/layout/IntraContainerLayout.h"
#include "codemap/layout/Partitioner.h"

#include <unordered_map>

namespace codemap {

LayoutResult CodeGraphLayout::layout(const CodeGraph& graph) const {
    return layout(graph, options_.direction);
}

LayoutResult CodeGraphLayout::layout(const CodeGraph& graph, const std::string& direction) const {
    return layout(graph, parseDirection(direction));
}

LayoutResult CodeGraphLayout::layout(const CodeGraph& graph, Direction direction) const {
    LayoutOptions options = options_;
    options.direction = direction;

    LayoutResult result;
    result.setDirection(direction);

    IngestResult ingested = GraphIngest::normalize(graph);
    const NormalizedGraph& normalized = ingested.graph;
    result.setDiagnostics(std::move(ingested.diagnostics));

    if (normalized.empty()) {
        LOG_INFO("Empty graph, nothing to lay out");
        return result;
    }

    std::vector<Container> containers = Partitioner::partition(normalized.nodes());

    ContainerSizer sizer(options.container);
    sizer.sizeAll(containers);

    // Bucket edges by container; edges crossing files only get a LayoutEdge
    std::unordered_map<std::string, size_t> containerOfNode;
    for (size_t i = 0; i < containers.size(); ++i) {
        for (const auto& memberId : containers[i].memberIds) {
            containerOfNode[memberId] = i;
        }
    }
    std::vector<std::vector<GraphEdge>> induced(containers.size());
    for (const auto& edge : normalized.edges()) {
        size_t from = containerOfNode.at(edge.from);
        if (from == containerOfNode.at(edge.to)) {
            induced[from].push_back(edge);
        }
    }

    IntraContainerLayout intra(options);
    std::vector<IntraLayoutResult> local;
    local.reserve(containers.size());
    for (size_t i = 0; i < containers.size(); ++i) {
        local.push_back(intra.layout(containers[i], induced[i]));
        sizer.fitToContent(containers[i], local.back().contentExtent);
    }

    ContainerPlacer placer(options.placement);
    result.setPlacementRegime(placer.place(containers));

    const Size cell = options.container.nodeSize();
    for (size_t i = 0; i < containers.size(); ++i) {
        const Container& container = containers[i];
        result.addContainer(styles_.resolveContainer(container, local[i]));

        for (const auto& memberId : container.memberIds) {
            const GraphNode* node = normalized.findNode(memberId);
            result.addNode(styles_.resolveNode(*node, container, local[i].placements.at(memberId),
                                               local[i].anchors, cell));
        }
    }

    const EdgeStyle edgeStyle = styles_.edgeStyle();
    for (size_t i = 0; i < normalized.edgeCount(); ++i) {
        const GraphEdge& edge = normalized.edges()[i];

        LayoutEdge out;
        out.inputIndex = normalized.edgeInputIndex(i);
        out.id = "edge-" + std::to_string(out.inputIndex);
        out.sourceId = edge.from;
        out.targetId = edge.to;
        out.style = edgeStyle;
        result.addEdge(out);
    }

    LOG_INFO("Laid out {} nodes in {} containers ({} placement), {} edges, direction {}",
             result.nodeCount(), result.containerCount(),
             placementRegimeToString(result.placementRegime()), result.edgeCount(),
             directionToString(direction));
    return result;
}

}  // namespace codemap
