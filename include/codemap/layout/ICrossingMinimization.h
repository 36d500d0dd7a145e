#pragma once

#include "../core/Types.h"
#include "../core/Graph.h"
#include "config/LayoutOptions.h"

#include <vector>

namespace codemap {
namespace algorithms {

/// Result of crossing minimization operation
struct CrossingMinimizationResult {
    std::vector<std::vector<NodeId>> layers;  ///< Reordered layers
    int crossingCount = 0;                     ///< Crossings between adjacent layers after minimization
};

/// Abstract interface for crossing minimization algorithms
class ICrossingMinimization {
public:
    virtual ~ICrossingMinimization() = default;

    /// Reorder nodes within each layer
    /// @param dag Acyclic graph the layers were computed from
    /// @param layers Initial ordering
    /// @param strategy Strategy hint (implementation may ignore if not supported)
    /// @param passes Number of down/up sweep pairs
    virtual CrossingMinimizationResult minimize(
        const Graph& dag,
        std::vector<std::vector<NodeId>> layers,
        CrossingMinimization strategy,
        int passes) const = 0;

    /// Count edge crossings between two adjacent layers
    virtual int countCrossings(
        const Graph& dag,
        const std::vector<NodeId>& upperLayer,
        const std::vector<NodeId>& lowerLayer) const = 0;

    /// Count crossings between every pair of adjacent layers
    virtual int countTotalCrossings(
        const Graph& dag,
        const std::vector<std::vector<NodeId>>& layers) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace algorithms
}  // namespace codemap
