#pragma once

#include "config/LayoutOptions.h"
#include "config/LayoutTypes.h"
#include "Container.h"

#include <vector>

namespace codemap {

/// Arranges sized containers on the canvas.
///
/// - one container: at the canvas margin
/// - two or three: one row, left to right, separated by containerGap
/// - more: grid with ceil(sqrt(m)) columns on fixed-width column slots; each
///   row starts below the tallest container of the previous row plus rowGap
///
/// A column slot widens to the widest container plus containerGap when a
/// container would not fit the fixed slot width.
class ContainerPlacer {
public:
    explicit ContainerPlacer(const PlacementMetrics& metrics) : metrics_(metrics) {}

    PlacementRegime regimeFor(size_t containerCount) const;

    /// Columns used by the grid regime
    static int gridColumnsFor(size_t containerCount);

    /// Sets every container's position; returns the regime used
    PlacementRegime place(std::vector<Container>& containers) const;

private:
    void placeRow(std::vector<Container>& containers) const;
    void placeGrid(std::vector<Container>& containers) const;

    PlacementMetrics metrics_;
};

}  // namespace codemap
