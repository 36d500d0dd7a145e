#include "codemap/layout/ContainerPlacer.h"
#include "codemap/common/Logger.h"
#include "codemap/layout/ContainerSizer.h"

#include <algorithm>

namespace codemap {

PlacementRegime ContainerPlacer::regimeFor(size_t containerCount) const {
    if (containerCount == 0) return PlacementRegime::None;
    if (containerCount == 1) return PlacementRegime::Single;
    if (containerCount <= static_cast<size_t>(std::max(1, metrics_.maxRowContainers))) {
        return PlacementRegime::Row;
    }
    return PlacementRegime::Grid;
}

int ContainerPlacer::gridColumnsFor(size_t containerCount) {
    return ContainerSizer::gridShape(containerCount).cols;
}

PlacementRegime ContainerPlacer::place(std::vector<Container>& containers) const {
    PlacementRegime regime = regimeFor(containers.size());

    switch (regime) {
        case PlacementRegime::None:
            break;
        case PlacementRegime::Single:
            containers.front().position = {metrics_.canvasMargin, metrics_.canvasMargin};
            break;
        case PlacementRegime::Row:
            placeRow(containers);
            break;
        case PlacementRegime::Grid:
            placeGrid(containers);
            break;
    }

    LOG_DEBUG("Placed {} containers using the {} regime",
              containers.size(), placementRegimeToString(regime));
    return regime;
}

void ContainerPlacer::placeRow(std::vector<Container>& containers) const {
    float xOffset = metrics_.canvasMargin;
    for (auto& container : containers) {
        container.position = {xOffset, metrics_.canvasMargin};
        xOffset += container.width + metrics_.containerGap;
    }
}

void ContainerPlacer::placeGrid(std::vector<Container>& containers) const {
    const int cols = gridColumnsFor(containers.size());

    float widest = 0.0f;
    for (const auto& container : containers) {
        widest = std::max(widest, container.width);
    }
    float slotWidth = metrics_.columnSlotWidth;
    if (widest + metrics_.containerGap > slotWidth) {
        slotWidth = widest + metrics_.containerGap;
        LOG_DEBUG("Column slot widened to {} for a {} wide container", slotWidth, widest);
    }

    float rowY = metrics_.canvasMargin;
    float rowHeight = 0.0f;
    int currentRow = 0;

    for (size_t i = 0; i < containers.size(); ++i) {
        int col = static_cast<int>(i) % cols;
        int row = static_cast<int>(i) / cols;

        if (row != currentRow) {
            rowY += rowHeight + metrics_.rowGap;
            rowHeight = 0.0f;
            currentRow = row;
        }

        containers[i].position = {metrics_.canvasMargin + col * slotWidth, rowY};
        rowHeight = std::max(rowHeight, containers[i].height);
    }
}

}  // namespace codemap
