#pragma once

#include "codemap/layout/ICoordinateAssignment.h"

namespace codemap {
namespace algorithms {

/// Rank-centred coordinate assignment
///
/// Ranks are stacked along the layout direction, rankSeparation apart;
/// nodes within a rank are placed nodeSeparation apart and every rank is
/// centred on the widest one.
class SimpleCoordinateAssignment : public ICoordinateAssignment {
public:
    SimpleCoordinateAssignment() = default;

    const char* algorithmName() const override { return "Simple"; }

    CoordinateAssignmentResult assign(
        const Graph& dag,
        const std::vector<std::vector<NodeId>>& layers,
        Direction direction,
        const HierarchyMetrics& metrics) const override;
};

}  // namespace algorithms
}  // namespace codemap
