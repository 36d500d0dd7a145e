#pragma once

#include "../core/CodeGraph.h"
#include "config/LayoutOptions.h"
#include "config/LayoutResult.h"
#include "StyleResolver.h"

#include <string>

namespace codemap {

/// File-grouped layout of a code graph
///
/// One pass runs, in order:
/// 1. Ingest - deduplicate node ids, drop dangling edges
/// 2. Partition - one container per source file
/// 3. Size - grid footprint from member count
/// 4. Intra-container layout - hierarchical or grid, container-local
/// 5. Fit - grow containers whose layered content exceeds the grid estimate
/// 6. Place - single / row / grid arrangement on the canvas
/// 7. Style - canvas-absolute nodes, styled containers and edges
///
/// Every call builds its result from scratch; nothing is cached between calls.
class CodeGraphLayout {
public:
    CodeGraphLayout() = default;
    explicit CodeGraphLayout(const LayoutOptions& options) : options_(options) {}

    void setOptions(const LayoutOptions& options) { options_ = options; }
    const LayoutOptions& options() const { return options_; }

    StyleResolver& styleResolver() { return styles_; }
    const StyleResolver& styleResolver() const { return styles_; }

    /// Layout with the configured direction
    LayoutResult layout(const CodeGraph& graph) const;

    /// Layout with an explicit direction (overrides the configured one)
    LayoutResult layout(const CodeGraph& graph, Direction direction) const;

    /// "TB" or "LR"; throws std::invalid_argument for anything else
    LayoutResult layout(const CodeGraph& graph, const std::string& direction) const;

private:
    LayoutOptions options_;
    StyleResolver styles_;
};

}  // namespace codemap
