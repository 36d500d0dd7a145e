#pragma once

#include "codemap/layout/ILayerAssignment.h"

namespace codemap {
namespace algorithms {

/// Longest-path layer assignment from the sources
///
/// Sources sit on layer 0; every other node sits one layer below its
/// deepest predecessor, so every edge points to a strictly later layer.
class LongestPathLayerAssignment : public ILayerAssignment {
public:
    LongestPathLayerAssignment() = default;

    const char* algorithmName() const override { return "LongestPath"; }

    /// Throws std::invalid_argument if the graph has a cycle or a self-loop
    LayerAssignmentResult assignLayers(const Graph& dag) const override;
};

}  // namespace algorithms
}  // namespace codemap
