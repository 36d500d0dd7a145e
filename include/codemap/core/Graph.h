#pragma once

#include "Types.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace codemap {

struct NodeData {
    NodeId id = INVALID_NODE;
    Size size = {172.0f, 36.0f};
    std::string label;   ///< Id of the code node this vertex stands for

    NodeData() = default;
    explicit NodeData(std::string lbl) : label(std::move(lbl)) {}
    NodeData(Size s, std::string lbl) : size(s), label(std::move(lbl)) {}
};

struct EdgeData {
    EdgeId id = INVALID_EDGE;
    NodeId from = INVALID_NODE;
    NodeId to = INVALID_NODE;

    EdgeData() = default;
    EdgeData(NodeId f, NodeId t) : from(f), to(t) {}

    bool isSelfLoop() const { return from == to; }
};

/// Directed multigraph with dense integer ids, used as the layering
/// workspace of a single container. Ids follow insertion order, so
/// nodes() and edges() are insertion-ordered too.
class Graph {
public:
    Graph() = default;

    NodeId addNode(const std::string& label);
    NodeId addNode(Size size, const std::string& label);
    NodeId addNode(const NodeData& data);

    bool hasNode(NodeId id) const { return id < vertices_.size(); }

    /// Throws std::out_of_range if the id is unknown.
    const NodeData& getNode(NodeId id) const;

    /// Throws std::invalid_argument if either endpoint is unknown.
    EdgeId addEdge(NodeId from, NodeId to);

    bool hasEdge(EdgeId id) const { return id < edges_.size(); }

    /// Throws std::out_of_range if the id is unknown.
    const EdgeData& getEdge(EdgeId id) const;

    size_t nodeCount() const { return vertices_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    std::vector<NodeId> nodes() const;
    std::vector<EdgeId> edges() const;

    std::vector<NodeId> successors(NodeId id) const;
    std::vector<NodeId> predecessors(NodeId id) const;
    const std::vector<EdgeId>& outEdges(NodeId id) const;
    const std::vector<EdgeId>& inEdges(NodeId id) const;

    size_t inDegree(NodeId id) const { return inEdges(id).size(); }
    size_t outDegree(NodeId id) const { return outEdges(id).size(); }

    /// First edge from -> to in insertion order
    std::optional<EdgeId> findEdge(NodeId from, NodeId to) const;

    void clear();

private:
    struct Vertex {
        NodeData data;
        std::vector<EdgeId> out;
        std::vector<EdgeId> in;
    };

    const Vertex& vertex(NodeId id) const;

    std::vector<Vertex> vertices_;
    std::vector<EdgeData> edges_;
};

}  // namespace codemap
