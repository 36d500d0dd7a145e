#include "codemap/layout/config/LayoutResult.h"

namespace codemap {

void LayoutResult::addContainer(const ContainerLayout& container) {
    containerIndex_[container.id] = containers_.size();
    containers_.push_back(container);
}

const ContainerLayout* LayoutResult::getContainer(const std::string& id) const {
    auto it = containerIndex_.find(id);
    return it != containerIndex_.end() ? &containers_[it->second] : nullptr;
}

void LayoutResult::addNode(const LayoutNode& node) {
    nodeIndex_[node.id] = nodes_.size();
    nodes_.push_back(node);
}

const LayoutNode* LayoutResult::getNode(const std::string& id) const {
    auto it = nodeIndex_.find(id);
    return it != nodeIndex_.end() ? &nodes_[it->second] : nullptr;
}

std::vector<const LayoutNode*> LayoutResult::nodesInContainer(const std::string& containerId) const {
    std::vector<const LayoutNode*> result;
    for (const auto& node : nodes_) {
        if (node.containerId == containerId) {
            result.push_back(&node);
        }
    }
    return result;
}

void LayoutResult::addEdge(const LayoutEdge& edge) {
    edgeIndex_[edge.id] = edges_.size();
    edges_.push_back(edge);
}

const LayoutEdge* LayoutResult::getEdge(const std::string& id) const {
    auto it = edgeIndex_.find(id);
    return it != edgeIndex_.end() ? &edges_[it->second] : nullptr;
}

Rect LayoutResult::computeBounds() const {
    Rect bounds;
    for (const auto& container : containers_) {
        bounds = bounds.united(container.bounds());
    }
    for (const auto& node : nodes_) {
        bounds = bounds.united(node.bounds());
    }
    return bounds;
}

Rect LayoutResult::computeBounds(float padding) const {
    return computeBounds().expanded(padding);
}

void LayoutResult::clear() {
    direction_ = Direction::TopToBottom;
    placementRegime_ = PlacementRegime::None;
    containers_.clear();
    nodes_.clear();
    edges_.clear();
    diagnostics_ = {};
    containerIndex_.clear();
    nodeIndex_.clear();
    edgeIndex_.clear();
}

}  // namespace codemap
