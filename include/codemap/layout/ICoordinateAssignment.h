#pragma once

#include "../core/Types.h"
#include "../core/Graph.h"
#include "config/LayoutOptions.h"

#include <unordered_map>
#include <vector>

namespace codemap {
namespace algorithms {

/// Result of coordinate assignment operation
struct CoordinateAssignmentResult {
    std::unordered_map<NodeId, Point> centers;  ///< Centre of each node
    Size extent;                                ///< Bounding size of all nodes, origin at (0, 0)
};

/// Abstract interface for coordinate assignment algorithms
///
/// Coordinates are node centres with the drawing's top-left corner at the
/// origin, so no node extends to negative coordinates.
class ICoordinateAssignment {
public:
    virtual ~ICoordinateAssignment() = default;

    virtual CoordinateAssignmentResult assign(
        const Graph& dag,
        const std::vector<std::vector<NodeId>>& layers,
        Direction direction,
        const HierarchyMetrics& metrics) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace algorithms
}  // namespace codemap
