#pragma once

#include "../core/Types.h"
#include "../core/Graph.h"

#include <vector>

namespace codemap {
namespace algorithms {

/// Result of cycle removal operation
struct CycleRemovalResult {
    std::vector<EdgeId> reversedEdges;  ///< Edges to reverse, in ascending id order
    bool isAcyclic = false;             ///< Whether the graph had no cycles to begin with
};

/// Abstract interface for cycle removal algorithms
///
/// Self-loops never take part in layering and are not reported.
class ICycleRemoval {
public:
    virtual ~ICycleRemoval() = default;

    /// Detect edges whose reversal makes the graph acyclic.
    /// Does not modify the graph.
    virtual CycleRemovalResult findEdgesToReverse(const Graph& graph) const = 0;

    virtual bool hasCycles(const Graph& graph) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace algorithms
}  // namespace codemap
