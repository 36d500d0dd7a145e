#pragma once

#include "codemap/layout/ICrossingMinimization.h"

#include <unordered_map>
#include <vector>

namespace codemap {
namespace algorithms {

/// Barycenter-based crossing minimization algorithm
///
/// Alternates downward and upward sweeps. Each sweep sorts a layer by the
/// mean position of its neighbours in the fixed adjacent layer; nodes with
/// no such neighbour keep their current position. The ordering with the
/// fewest crossings seen across all sweeps is returned.
class BarycenterCrossingMinimization : public ICrossingMinimization {
public:
    BarycenterCrossingMinimization() = default;

    const char* algorithmName() const override { return "Barycenter"; }

    CrossingMinimizationResult minimize(
        const Graph& dag,
        std::vector<std::vector<NodeId>> layers,
        CrossingMinimization strategy,
        int passes = 4) const override;

    int countCrossings(
        const Graph& dag,
        const std::vector<NodeId>& upperLayer,
        const std::vector<NodeId>& lowerLayer) const override;

    int countTotalCrossings(
        const Graph& dag,
        const std::vector<std::vector<NodeId>>& layers) const override;

private:
    void barycenterSweep(const Graph& dag,
                         std::vector<std::vector<NodeId>>& layers,
                         bool downward) const;

    float computeBarycenter(NodeId node,
                            float currentIndex,
                            const Graph& dag,
                            const std::unordered_map<NodeId, int>& adjacentPos,
                            bool useSuccessors) const;
};

}  // namespace algorithms
}  // namespace codemap
