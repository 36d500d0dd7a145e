#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codemap {

/// Kind of declaration a node stands for.
///
/// The set is closed. Unknown only records that the producer sent a kind
/// string outside the set; such nodes are laid out with the default style.
enum class NodeKind {
    Class,
    Method,
    Function,
    Property,
    Import,
    Unknown
};

/// "CLASS", "METHOD", ... ("UNKNOWN" for NodeKind::Unknown)
const char* nodeKindToString(NodeKind kind);

/// Case-sensitive parse of the producer's kind string; NodeKind::Unknown if not recognised
NodeKind parseNodeKind(std::string_view text);

/// A declaration found by the parser
struct GraphNode {
    std::string id;
    std::string name;
    NodeKind kind = NodeKind::Unknown;
    std::string kindName;   ///< Kind string as received (kept for diagnostics)
    std::string file;
    int line = 0;

    GraphNode() = default;
    GraphNode(std::string id_, std::string name_, NodeKind kind_, std::string file_, int line_ = 0)
        : id(std::move(id_)), name(std::move(name_)), kind(kind_),
          kindName(nodeKindToString(kind_)), file(std::move(file_)), line(line_) {}
};

/// A call or containment relationship between two declarations
struct GraphEdge {
    std::string from;
    std::string to;

    GraphEdge() = default;
    GraphEdge(std::string f, std::string t) : from(std::move(f)), to(std::move(t)) {}
};

/// Raw node/edge graph as produced by the parser
struct CodeGraph {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;

    bool empty() const { return nodes.empty(); }
    size_t nodeCount() const { return nodes.size(); }
    size_t edgeCount() const { return edges.size(); }
};

}  // namespace codemap
