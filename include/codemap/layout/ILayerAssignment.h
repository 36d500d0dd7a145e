#pragma once

#include "../core/Types.h"
#include "../core/Graph.h"

#include <unordered_map>
#include <vector>

namespace codemap {
namespace algorithms {

/// Result of layer assignment operation
struct LayerAssignmentResult {
    std::unordered_map<NodeId, int> nodeLayer;  ///< Node -> layer index
    int layerCount = 0;                          ///< Total number of layers
    std::vector<std::vector<NodeId>> layers;     ///< Layer -> nodes, in node id order
};

/// Abstract interface for layer assignment algorithms
///
/// Implementations receive an acyclic graph.
class ILayerAssignment {
public:
    virtual ~ILayerAssignment() = default;

    virtual LayerAssignmentResult assignLayers(const Graph& dag) const = 0;

    /// Get algorithm name for debugging/logging
    virtual const char* algorithmName() const = 0;
};

}  // namespace algorithms
}  // namespace codemap
