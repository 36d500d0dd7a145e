#pragma once

#include "codemap/layout/ICycleRemoval.h"

#include <unordered_set>
#include <vector>

namespace codemap {
namespace algorithms {

/// DFS-based cycle removal algorithm
///
/// Back edges found by a depth-first search started from every unvisited
/// node in id order are reported for reversal. Id order makes the choice
/// deterministic for a given member order.
class CycleRemoval : public ICycleRemoval {
public:
    CycleRemoval() = default;

    const char* algorithmName() const override { return "DFS"; }

    CycleRemovalResult findEdgesToReverse(const Graph& graph) const override;

    bool hasCycles(const Graph& graph) const override;

private:
    enum class NodeState { White, Gray, Black };

    void dfs(NodeId node, const Graph& graph,
             std::vector<NodeState>& state,
             std::unordered_set<EdgeId>& backEdges) const;
};

}  // namespace algorithms
}  // namespace codemap
