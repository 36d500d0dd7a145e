#include "CycleRemoval.h"

#include <algorithm>

namespace codemap {
namespace algorithms {

CycleRemovalResult CycleRemoval::findEdgesToReverse(const Graph& graph) const {
    CycleRemovalResult result;
    result.isAcyclic = true;

    if (graph.nodeCount() == 0) {
        return result;
    }

    std::vector<NodeState> state(graph.nodeCount(), NodeState::White);
    std::unordered_set<EdgeId> backEdges;

    for (NodeId node : graph.nodes()) {
        if (state[node] == NodeState::White) {
            dfs(node, graph, state, backEdges);
        }
    }

    result.reversedEdges.assign(backEdges.begin(), backEdges.end());
    std::sort(result.reversedEdges.begin(), result.reversedEdges.end());
    result.isAcyclic = backEdges.empty();

    return result;
}

bool CycleRemoval::hasCycles(const Graph& graph) const {
    return !findEdgesToReverse(graph).isAcyclic;
}

void CycleRemoval::dfs(NodeId node, const Graph& graph,
                       std::vector<NodeState>& state,
                       std::unordered_set<EdgeId>& backEdges) const {
    state[node] = NodeState::Gray;

    for (EdgeId edgeId : graph.outEdges(node)) {
        const EdgeData& edge = graph.getEdge(edgeId);
        if (edge.isSelfLoop()) {
            continue;
        }

        if (state[edge.to] == NodeState::Gray) {
            // Back edge closes a cycle
            backEdges.insert(edgeId);
        } else if (state[edge.to] == NodeState::White) {
            dfs(edge.to, graph, state, backEdges);
        }
    }

    state[node] = NodeState::Black;
}

}  // namespace algorithms
}  // namespace codemap
