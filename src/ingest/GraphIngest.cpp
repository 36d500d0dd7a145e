#include "codemap/ingest/GraphIngest.h"
#include "codemap/common/Logger.h"

namespace codemap {

const GraphNode* NormalizedGraph::findNode(const std::string& id) const {
    auto it = nodeIndex_.find(id);
    if (it == nodeIndex_.end()) {
        return nullptr;
    }
    return &nodes_[it->second];
}

IngestResult GraphIngest::normalize(const CodeGraph& graph) {
    IngestResult result;
    NormalizedGraph& out = result.graph;
    IngestDiagnostics& diagnostics = result.diagnostics;

    out.nodes_.reserve(graph.nodes.size());
    for (const auto& node : graph.nodes) {
        if (out.nodeIndex_.count(node.id) > 0) {
            LOG_WARN("Duplicate node id '{}' (file {}, line {}) dropped; first occurrence kept",
                     node.id, node.file, node.line);
            diagnostics.duplicateNodeIds.push_back(node.id);
            continue;
        }

        if (node.kind == NodeKind::Unknown) {
            LOG_WARN("Node '{}' has unrecognised kind '{}'; default style applies",
                     node.id, node.kindName);
            diagnostics.unknownKindNodeIds.push_back(node.id);
        }

        out.nodeIndex_[node.id] = out.nodes_.size();
        out.nodes_.push_back(node);
    }

    out.edges_.reserve(graph.edges.size());
    for (size_t i = 0; i < graph.edges.size(); ++i) {
        const GraphEdge& edge = graph.edges[i];

        const std::string* missing = nullptr;
        if (!out.hasNode(edge.from)) {
            missing = &edge.from;
        } else if (!out.hasNode(edge.to)) {
            missing = &edge.to;
        }

        if (missing) {
            LOG_WARN("Dropping dangling edge #{} {} -> {}: unknown node '{}'",
                     i, edge.from, edge.to, *missing);
            diagnostics.danglingEdges.push_back({i, edge.from, edge.to, *missing});
            continue;
        }

        out.edges_.push_back(edge);
        out.edgeInputIndex_.push_back(i);
    }

    LOG_DEBUG("Ingested {} nodes, {} edges ({} duplicates, {} dangling edges)",
              out.nodeCount(), out.edgeCount(),
              diagnostics.duplicateNodeIds.size(), diagnostics.danglingEdges.size());

    return result;
}

}  // namespace codemap
