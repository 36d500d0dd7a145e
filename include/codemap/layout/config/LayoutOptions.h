#pragma once

#include "../../core/Types.h"
#include "LayoutTypes.h"

namespace codemap {

/// Crossing minimization strategy used inside hierarchical containers
enum class CrossingMinimization {
    None,               // Keep member order within each rank
    BarycenterHeuristic // Alternating barycenter sweeps
};

/// Sizing of one node cell and of the container frame around the member grid
struct ContainerMetrics {
    float nodeWidth = 172.0f;      // Drawn width of one node
    float nodeHeight = 36.0f;      // Drawn height of one node
    float nodeGapX = 80.0f;        // Horizontal gap between grid cells
    float nodeGapY = 50.0f;        // Vertical gap between grid rows
    float horizontalPad = 150.0f;  // Padding left and right of the content
    float verticalPad = 100.0f;    // Padding below the content
    float titleBand = 100.0f;      // Band reserved at the top for the container label
    float minWidth = 800.0f;       // Floor for small containers
    float minHeight = 500.0f;

    Size nodeSize() const { return {nodeWidth, nodeHeight}; }
    /// Offset of the content area from the container's top-left corner.
    /// Shared by grid and layered members.
    Point contentOrigin() const { return {horizontalPad, titleBand}; }
};

/// Arrangement of containers on the canvas
struct PlacementMetrics {
    float canvasMargin = 50.0f;     // Offset of the first container from the canvas origin
    float containerGap = 300.0f;    // Gap between containers in the single-row regime
    // Column pitch in the grid regime. Unlike a strictly fixed 1200 slot, the
    // placer widens it to widest container + containerGap when a container
    // exceeds columnSlotWidth - containerGap, so columns never overlap.
    float columnSlotWidth = 1200.0f;
    float rowGap = 200.0f;          // Gap below the tallest container of a grid row
    int maxRowContainers = 3;       // Largest container count still placed in one row
};

/// Layered placement inside a container
struct HierarchyMetrics {
    float nodeSeparation = 30.0f;   // Gap between neighbours within a rank
    float rankSeparation = 50.0f;   // Gap between consecutive ranks
    int hierarchicalMinNodes = 2;   // Fewer members -> grid
    int hierarchicalMinEdges = 1;   // Fewer internal edges (self-loops excluded) -> grid
    CrossingMinimization crossingMinimization = CrossingMinimization::BarycenterHeuristic;
    int crossingMinimizationPasses = 4;
};

/// Options for a layout pass. Defaults reproduce the viewer's visual contract.
struct LayoutOptions {
    Direction direction = Direction::TopToBottom;

    ContainerMetrics container;
    PlacementMetrics placement;
    HierarchyMetrics hierarchy;

    // Builder pattern for convenient configuration
    LayoutOptions& setDirection(Direction d) { direction = d; return *this; }
    LayoutOptions& setNodeSize(float width, float height) {
        container.nodeWidth = width;
        container.nodeHeight = height;
        return *this;
    }
    LayoutOptions& setNodeGaps(float x, float y) {
        container.nodeGapX = x;
        container.nodeGapY = y;
        return *this;
    }
    LayoutOptions& setContainerPadding(float horizontal, float vertical, float title) {
        container.horizontalPad = horizontal;
        container.verticalPad = vertical;
        container.titleBand = title;
        return *this;
    }
    LayoutOptions& setMinContainerSize(float width, float height) {
        container.minWidth = width;
        container.minHeight = height;
        return *this;
    }
    LayoutOptions& setCanvasMargin(float margin) { placement.canvasMargin = margin; return *this; }
    LayoutOptions& setContainerGap(float gap) { placement.containerGap = gap; return *this; }
    LayoutOptions& setColumnSlotWidth(float width) { placement.columnSlotWidth = width; return *this; }
    LayoutOptions& setRowGap(float gap) { placement.rowGap = gap; return *this; }
    LayoutOptions& setRankSpacing(float nodeSep, float rankSep) {
        hierarchy.nodeSeparation = nodeSep;
        hierarchy.rankSeparation = rankSep;
        return *this;
    }
    LayoutOptions& setHierarchicalThresholds(int minNodes, int minEdges) {
        hierarchy.hierarchicalMinNodes = minNodes;
        hierarchy.hierarchicalMinEdges = minEdges;
        return *this;
    }
    LayoutOptions& setCrossingMinimization(CrossingMinimization c) {
        hierarchy.crossingMinimization = c;
        return *this;
    }
    LayoutOptions& setCrossingMinimizationPasses(int passes) {
        hierarchy.crossingMinimizationPasses = passes;
        return *this;
    }
};

}  // namespace codemap
