#pragma once

#include "../core/CodeGraph.h"
#include "Container.h"

#include <vector>

namespace codemap {

/// Groups nodes by their source file.
///
/// Containers appear in first-appearance order of each file in the node
/// list and keep their members in node order, so the same input always
/// yields the same containers.
class Partitioner {
public:
    static std::vector<Container> partition(const std::vector<GraphNode>& nodes);
};

}  // namespace codemap
