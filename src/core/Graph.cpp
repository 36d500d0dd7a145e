#include "codemap/core/Graph.h"

#include <numeric>

namespace codemap {

NodeId Graph::addNode(const std::string& label) {
    return addNode(NodeData{label});
}

NodeId Graph::addNode(Size size, const std::string& label) {
    return addNode(NodeData{size, label});
}

NodeId Graph::addNode(const NodeData& data) {
    const auto id = static_cast<NodeId>(vertices_.size());
    Vertex& v = vertices_.emplace_back();
    v.data = data;
    v.data.id = id;
    return id;
}

const Graph::Vertex& Graph::vertex(NodeId id) const {
    if (!hasNode(id)) {
        throw std::out_of_range("Graph: no node with id " + std::to_string(id));
    }
    return vertices_[id];
}

const NodeData& Graph::getNode(NodeId id) const {
    return vertex(id).data;
}

EdgeId Graph::addEdge(NodeId from, NodeId to) {
    if (!hasNode(from) || !hasNode(to)) {
        throw std::invalid_argument("Graph: edge " + std::to_string(from) + " -> " +
                                    std::to_string(to) + " references an unknown node");
    }

    const auto id = static_cast<EdgeId>(edges_.size());
    EdgeData& edge = edges_.emplace_back(from, to);
    edge.id = id;

    vertices_[from].out.push_back(id);
    vertices_[to].in.push_back(id);
    return id;
}

const EdgeData& Graph::getEdge(EdgeId id) const {
    if (!hasEdge(id)) {
        throw std::out_of_range("Graph: no edge with id " + std::to_string(id));
    }
    return edges_[id];
}

std::vector<NodeId> Graph::nodes() const {
    std::vector<NodeId> ids(vertices_.size());
    std::iota(ids.begin(), ids.end(), NodeId{0});
    return ids;
}

std::vector<EdgeId> Graph::edges() const {
    std::vector<EdgeId> ids(edges_.size());
    std::iota(ids.begin(), ids.end(), EdgeId{0});
    return ids;
}

std::vector<NodeId> Graph::successors(NodeId id) const {
    std::vector<NodeId> result;
    if (!hasNode(id)) return result;
    for (EdgeId e : vertices_[id].out) {
        result.push_back(edges_[e].to);
    }
    return result;
}

std::vector<NodeId> Graph::predecessors(NodeId id) const {
    std::vector<NodeId> result;
    if (!hasNode(id)) return result;
    for (EdgeId e : vertices_[id].in) {
        result.push_back(edges_[e].from);
    }
    return result;
}

const std::vector<EdgeId>& Graph::outEdges(NodeId id) const {
    return vertex(id).out;
}

const std::vector<EdgeId>& Graph::inEdges(NodeId id) const {
    return vertex(id).in;
}

std::optional<EdgeId> Graph::findEdge(NodeId from, NodeId to) const {
    if (!hasNode(from) || !hasNode(to)) return std::nullopt;
    for (EdgeId e : vertices_[from].out) {
        if (edges_[e].to == to) return e;
    }
    return std::nullopt;
}

void Graph::clear() {
    vertices_.clear();
    edges_.clear();
}

}  // namespace codemap
