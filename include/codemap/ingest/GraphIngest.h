#pragma once

#include "../core/CodeGraph.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace codemap {

/// An input edge dropped because one of its endpoints is not a known node
struct DanglingEdge {
    size_t inputIndex = 0;   ///< Position of the edge in the input edge list
    std::string from;
    std::string to;
    std::string missingId;   ///< First endpoint that failed to resolve
};

/// Recoverable problems found while normalising an input graph
struct IngestDiagnostics {
    std::vector<std::string> duplicateNodeIds;   ///< Ids seen more than once (later copies dropped)
    std::vector<DanglingEdge> danglingEdges;
    std::vector<std::string> unknownKindNodeIds; ///< Nodes laid out with the default style

    bool clean() const {
        return duplicateNodeIds.empty() && danglingEdges.empty() && unknownKindNodeIds.empty();
    }
    size_t droppedEdgeCount() const { return danglingEdges.size(); }
};

/// Validated graph: unique node ids, every edge resolvable.
/// Nodes and edges keep their input order.
class NormalizedGraph {
public:
    const std::vector<GraphNode>& nodes() const { return nodes_; }
    const std::vector<GraphEdge>& edges() const { return edges_; }

    /// Index of edge i in the original input edge list
    size_t edgeInputIndex(size_t i) const { return edgeInputIndex_.at(i); }

    bool hasNode(const std::string& id) const { return nodeIndex_.count(id) > 0; }

    /// Returns nullptr if id is unknown
    const GraphNode* findNode(const std::string& id) const;

    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }
    bool empty() const { return nodes_.empty(); }

private:
    friend class GraphIngest;

    std::vector<GraphNode> nodes_;
    std::vector<GraphEdge> edges_;
    std::vector<size_t> edgeInputIndex_;
    std::unordered_map<std::string, size_t> nodeIndex_;
};

struct IngestResult {
    NormalizedGraph graph;
    IngestDiagnostics diagnostics;
};

/// First stage of a layout pass: deduplicates node ids and drops edges whose
/// endpoints do not resolve. Never fails; every problem is reported in the
/// diagnostics and logged.
class GraphIngest {
public:
    static IngestResult normalize(const CodeGraph& graph);
};

}  // namespace codemap
