#include "CoordinateAssignment.h"

#include <algorithm>

namespace codemap {
namespace algorithms {

CoordinateAssignmentResult SimpleCoordinateAssignment::assign(
    const Graph& dag,
    const std::vector<std::vector<NodeId>>& layers,
    Direction direction,
    const HierarchyMetrics& metrics) const {

    CoordinateAssignmentResult result;
    if (layers.empty()) {
        return result;
    }

    const bool horizontal = (direction == Direction::LeftToRight);

    // Extent of a node along the rank axis (thickness) and across it (breadth)
    auto thicknessOf = [&](NodeId node) {
        const Size& s = dag.getNode(node).size;
        return horizontal ? s.width : s.height;
    };
    auto breadthOf = [&](NodeId node) {
        const Size& s = dag.getNode(node).size;
        return horizontal ? s.height : s.width;
    };

    std::vector<float> layerThickness(layers.size(), 0.0f);
    std::vector<float> layerBreadth(layers.size(), 0.0f);
    float maxBreadth = 0.0f;

    for (size_t i = 0; i < layers.size(); ++i) {
        for (NodeId node : layers[i]) {
            layerThickness[i] = std::max(layerThickness[i], thicknessOf(node));
            layerBreadth[i] += breadthOf(node);
        }
        if (!layers[i].empty()) {
            layerBreadth[i] += metrics.nodeSeparation * (layers[i].size() - 1);
        }
        maxBreadth = std::max(maxBreadth, layerBreadth[i]);
    }

    float rankPos = 0.0f;
    for (size_t i = 0; i < layers.size(); ++i) {
        float rankCenter = rankPos + layerThickness[i] / 2.0f;
        float cursor = (maxBreadth - layerBreadth[i]) / 2.0f;

        for (NodeId node : layers[i]) {
            float breadth = breadthOf(node);
            float across = cursor + breadth / 2.0f;
            cursor += breadth + metrics.nodeSeparation;

            result.centers[node] = horizontal ? Point{rankCenter, across}
                                              : Point{across, rankCenter};
        }

        rankPos += layerThickness[i];
        if (i + 1 < layers.size()) {
            rankPos += metrics.rankSeparation;
        }
    }

    result.extent = horizontal ? Size{rankPos, maxBreadth} : Size{maxBreadth, rankPos};
    return result;
}

}  // namespace algorithms
}  // namespace codemap
