#pragma once

#include "../core/CodeGraph.h"
#include "config/LayoutResult.h"
#include "config/LayoutStyle.h"
#include "Container.h"
#include "IntraContainerLayout.h"

#include <string>
#include <unordered_map>

namespace codemap {

/// Maps node kinds and files to visual styles, and local member placements
/// to canvas-absolute layout records.
///
/// Styles come from a fixed table keyed by NodeKind. A small set of known
/// file names gets its own colours; other files use per-kind defaults.
/// NodeKind::Unknown gets the base style.
class StyleResolver {
public:
    StyleResolver();

    static NodeShape shapeFor(NodeKind kind);

    NodeStyle nodeStyle(NodeKind kind, const std::string& file) const;
    ContainerStyle containerStyle(const std::string& file) const;
    EdgeStyle edgeStyle() const { return EdgeStyle{}; }

    /// "📁 <file> (<n> nodes)"
    static std::string containerLabel(const std::string& file, size_t memberCount);

    /// Override or add a file colour
    void setNodeFileColor(const std::string& file, const std::string& color);
    void setContainerFileColor(const std::string& file, const std::string& color);

    /// Canvas-absolute layout record of a placed member
    LayoutNode resolveNode(const GraphNode& node,
                           const Container& container,
                           const LocalPlacement& placement,
                           const AnchorSides& anchors,
                           const Size& cellSize) const;

    ContainerLayout resolveContainer(const Container& container,
                                     const IntraLayoutResult& intra) const;

private:
    std::unordered_map<std::string, std::string> nodeFileColors_;
    std::unordered_map<std::string, std::string> containerFileColors_;
};

}  // namespace codemap
