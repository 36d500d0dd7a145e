#include "CrossingMinimization.h"

#include <algorithm>
#include <numeric>
#include <tuple>

namespace codemap {
namespace algorithms {

namespace {

std::unordered_map<NodeId, int> positionsOf(const std::vector<NodeId>& layer) {
    std::unordered_map<NodeId, int> pos;
    for (size_t i = 0; i < layer.size(); ++i) {
        pos[layer[i]] = static_cast<int>(i);
    }
    return pos;
}

}  // namespace

CrossingMinimizationResult BarycenterCrossingMinimization::minimize(
    const Graph& dag,
    std::vector<std::vector<NodeId>> layers,
    CrossingMinimization strategy,
    int passes) const {

    CrossingMinimizationResult result;
    result.layers = std::move(layers);

    if (result.layers.size() < 2) {
        result.crossingCount = 0;
        return result;
    }

    result.crossingCount = countTotalCrossings(dag, result.layers);

    if (strategy == CrossingMinimization::None) {
        return result;
    }

    std::vector<std::vector<NodeId>> working = result.layers;

    for (int pass = 0; pass < passes && result.crossingCount > 0; ++pass) {
        // Downward sweep (fix upper layer, reorder lower)
        barycenterSweep(dag, working, true);
        int crossings = countTotalCrossings(dag, working);
        if (crossings < result.crossingCount) {
            result.layers = working;
            result.crossingCount = crossings;
        }

        // Upward sweep (fix lower layer, reorder upper)
        barycenterSweep(dag, working, false);
        crossings = countTotalCrossings(dag, working);
        if (crossings < result.crossingCount) {
            result.layers = working;
            result.crossingCount = crossings;
        }
    }

    return result;
}

int BarycenterCrossingMinimization::countCrossings(
    const Graph& dag,
    const std::vector<NodeId>& upperLayer,
    const std::vector<NodeId>& lowerLayer) const {

    std::unordered_map<NodeId, int> lowerPos = positionsOf(lowerLayer);

    // Edges between these layers as (upper position, lower position)
    std::vector<std::pair<int, int>> edges;
    for (size_t i = 0; i < upperLayer.size(); ++i) {
        for (EdgeId edgeId : dag.outEdges(upperLayer[i])) {
            auto it = lowerPos.find(dag.getEdge(edgeId).to);
            if (it != lowerPos.end()) {
                edges.emplace_back(static_cast<int>(i), it->second);
            }
        }
    }

    // Two edges cross if their endpoint orders disagree
    int crossings = 0;
    for (size_t i = 0; i < edges.size(); ++i) {
        for (size_t j = i + 1; j < edges.size(); ++j) {
            if ((edges[i].first < edges[j].first && edges[i].second > edges[j].second) ||
                (edges[i].first > edges[j].first && edges[i].second < edges[j].second)) {
                ++crossings;
            }
        }
    }

    return crossings;
}

int BarycenterCrossingMinimization::countTotalCrossings(
    const Graph& dag,
    const std::vector<std::vector<NodeId>>& layers) const {

    int total = 0;
    for (size_t i = 0; i + 1 < layers.size(); ++i) {
        total += countCrossings(dag, layers[i], layers[i + 1]);
    }
    return total;
}

void BarycenterCrossingMinimization::barycenterSweep(
    const Graph& dag,
    std::vector<std::vector<NodeId>>& layers,
    bool downward) const {

    auto reorder = [&](size_t layerIdx, size_t adjacentIdx, bool useSuccessors) {
        std::unordered_map<NodeId, int> adjacentPos = positionsOf(layers[adjacentIdx]);

        // (barycenter, current index, node): ties keep the current order
        std::vector<std::tuple<float, size_t, NodeId>> weights;
        weights.reserve(layers[layerIdx].size());
        for (size_t i = 0; i < layers[layerIdx].size(); ++i) {
            NodeId node = layers[layerIdx][i];
            float bc = computeBarycenter(node, static_cast<float>(i), dag,
                                         adjacentPos, useSuccessors);
            weights.emplace_back(bc, i, node);
        }

        std::sort(weights.begin(), weights.end());

        layers[layerIdx].clear();
        for (const auto& [weight, index, node] : weights) {
            layers[layerIdx].push_back(node);
        }
    };

    if (downward) {
        for (size_t i = 1; i < layers.size(); ++i) {
            reorder(i, i - 1, false);
        }
    } else {
        for (size_t i = layers.size() - 1; i-- > 0;) {
            reorder(i, i + 1, true);
        }
    }
}

float BarycenterCrossingMinimization::computeBarycenter(
    NodeId node,
    float currentIndex,
    const Graph& dag,
    const std::unordered_map<NodeId, int>& adjacentPos,
    bool useSuccessors) const {

    std::vector<int> neighborPositions;

    const auto& incident = useSuccessors ? dag.outEdges(node) : dag.inEdges(node);
    for (EdgeId edgeId : incident) {
        const EdgeData& edge = dag.getEdge(edgeId);
        NodeId neighbor = useSuccessors ? edge.to : edge.from;
        auto it = adjacentPos.find(neighbor);
        if (it != adjacentPos.end()) {
            neighborPositions.push_back(it->second);
        }
    }

    if (neighborPositions.empty()) {
        return currentIndex;
    }

    float sum = std::accumulate(neighborPositions.begin(), neighborPositions.end(), 0.0f);
    return sum / static_cast<float>(neighborPositions.size());
}

}  // namespace algorithms
}  // namespace codemap
