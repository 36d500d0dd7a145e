#include "LayerAssignment.h"

#include <algorithm>
#include <queue>
#include <stdexcept>

namespace codemap {
namespace algorithms {

LayerAssignmentResult LongestPathLayerAssignment::assignLayers(const Graph& dag) const {
    LayerAssignmentResult result;

    const size_t count = dag.nodeCount();
    if (count == 0) {
        return result;
    }

    // Kahn's algorithm: a node's layer is final once all predecessors are processed
    std::vector<size_t> remainingIn(count, 0);
    std::vector<int> layer(count, 0);
    std::queue<NodeId> ready;

    for (NodeId node : dag.nodes()) {
        remainingIn[node] = dag.inDegree(node);
        if (remainingIn[node] == 0) {
            ready.push(node);
        }
    }

    size_t processed = 0;
    while (!ready.empty()) {
        NodeId current = ready.front();
        ready.pop();
        ++processed;

        for (EdgeId edgeId : dag.outEdges(current)) {
            NodeId successor = dag.getEdge(edgeId).to;
            layer[successor] = std::max(layer[successor], layer[current] + 1);
            if (--remainingIn[successor] == 0) {
                ready.push(successor);
            }
        }
    }

    if (processed != count) {
        throw std::invalid_argument("Layer assignment requires an acyclic graph");
    }

    int maxLayer = *std::max_element(layer.begin(), layer.end());
    result.layerCount = maxLayer + 1;
    result.layers.resize(result.layerCount);

    for (NodeId node : dag.nodes()) {
        result.nodeLayer[node] = layer[node];
        result.layers[layer[node]].push_back(node);
    }

    return result;
}

}  // namespace algorithms
}  // namespace codemap
