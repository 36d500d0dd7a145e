#include "codemap/layout/ContainerSizer.h"
#include "codemap/common/Logger.h"

#include <algorithm>
#include <cmath>

namespace codemap {

GridShape ContainerSizer::gridShape(size_t memberCount) {
    if (memberCount == 0) {
        return {};
    }

    int cols = static_cast<int>(std::ceil(std::sqrt(static_cast<double>(memberCount))));
    // sqrt of a perfect square may land just above the integer
    while (cols > 1 && static_cast<size_t>(cols - 1) * static_cast<size_t>(cols - 1) >= memberCount) {
        --cols;
    }
    int rows = static_cast<int>((memberCount + cols - 1) / cols);
    return {cols, rows};
}

Size ContainerSizer::contentSize(size_t memberCount) const {
    GridShape shape = gridShape(memberCount);
    if (shape.cols == 0) {
        return {};
    }

    float width = shape.cols * metrics_.nodeWidth + (shape.cols - 1) * metrics_.nodeGapX;
    float height = shape.rows * metrics_.nodeHeight + (shape.rows - 1) * metrics_.nodeGapY;
    return {width, height};
}

Size ContainerSizer::footprint(size_t memberCount) const {
    Size content = contentSize(memberCount);

    float width = content.width + metrics_.horizontalPad * 2.0f;
    float height = content.height + metrics_.titleBand + metrics_.verticalPad;

    return {std::max(metrics_.minWidth, width), std::max(metrics_.minHeight, height)};
}

void ContainerSizer::size(Container& container) const {
    Size fp = footprint(container.memberCount());
    container.width = fp.width;
    container.height = fp.height;
}

void ContainerSizer::sizeAll(std::vector<Container>& containers) const {
    for (auto& container : containers) {
        size(container);
    }
}

void ContainerSizer::fitToContent(Container& container, const Size& extent) const {
    float requiredWidth = extent.width + metrics_.horizontalPad;
    float requiredHeight = extent.height + metrics_.verticalPad;

    if (requiredWidth > container.width || requiredHeight > container.height) {
        LOG_DEBUG("Container {} grows from {}x{} to fit content {}x{}",
                  container.id, container.width, container.height, extent.width, extent.height);
    }

    container.width = std::max(container.width, requiredWidth);
    container.height = std::max(container.height, requiredHeight);
}

}  // namespace codemap
