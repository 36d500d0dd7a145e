#pragma once

#include "../core/Types.h"
#include "config/LayoutOptions.h"
#include "Container.h"

#include <vector>

namespace codemap {

/// Rows and columns of the square-ish member grid
struct GridShape {
    int cols = 0;
    int rows = 0;
};

/// Computes container footprints from their member count.
class ContainerSizer {
public:
    explicit ContainerSizer(const ContainerMetrics& metrics) : metrics_(metrics) {}

    /// cols = ceil(sqrt(n)), rows = ceil(n / cols); {0, 0} for n == 0
    static GridShape gridShape(size_t memberCount);

    /// Width and height of the member grid without padding
    Size contentSize(size_t memberCount) const;

    /// Padded footprint, floored at the minimum container size.
    /// Depends only on the member count and never decreases as it grows.
    Size footprint(size_t memberCount) const;

    void size(Container& container) const;
    void sizeAll(std::vector<Container>& containers) const;

    /// Grows the container so that content occupying [0, extent] in
    /// container-local coordinates keeps the right and bottom padding.
    /// Never shrinks the container.
    void fitToContent(Container& container, const Size& extent) const;

private:
    ContainerMetrics metrics_;
};

}  // namespace codemap
