#include "codemap/layout/StyleResolver.h"

#include <array>

namespace codemap {

namespace {

/// One row of the kind style table; nullptr means "not set"
struct KindStyle {
    NodeShape shape;
    bool usesFileColor;
    const char* background;    // Fallback when the file has no colour
    const char* border;
    const char* borderRadius;
    const char* fontWeight;
    const char* size;          // Fixed width and height
    bool flexCentered;
    const char* clipPath;
};

constexpr std::array<KindStyle, 6> kKindStyles = {{
    // Class
    {NodeShape::Rectangle, true, "#lightcyan", "2px solid #0066cc", nullptr, "bold",
     nullptr, false, nullptr},
    // Method
    {NodeShape::RoundedRectangle, true, "#lightsteelblue", "1px solid #4682b4", nullptr, nullptr,
     nullptr, false, nullptr},
    // Function
    {NodeShape::RoundedRectangle, true, "#ffcccb", "1px solid #666", nullptr, nullptr,
     nullptr, false, nullptr},
    // Property
    {NodeShape::Circle, false, "#lightpink", "1px solid #ff69b4", "50%", nullptr,
     "120px", true, nullptr},
    // Import
    {NodeShape::Diamond, false, "#lightgoldenrodyellow", "1px solid #daa520", "8px", nullptr,
     "100px", true, "polygon(50% 0%, 100% 50%, 50% 100%, 0% 50%)"},
    // Unknown: base style
    {NodeShape::Rectangle, false, "#fff", "1px solid #ddd", nullptr, nullptr,
     nullptr, false, nullptr},
}};

const KindStyle& kindStyle(NodeKind kind) {
    return kKindStyles[static_cast<size_t>(kind)];
}

}  // namespace

StyleResolver::StyleResolver()
    : nodeFileColors_{
          {"main.py", "#ffcccb"},
          {"operations.py", "#add8e6"},
          {"utils.py", "#ffffe0"},
      }
    , containerFileColors_{
          {"main.py", "#ffeeee"},
          {"operations.py", "#eef5ff"},
          {"utils.py", "#fffff0"},
      } {}

NodeShape StyleResolver::shapeFor(NodeKind kind) {
    return kindStyle(kind).shape;
}

NodeStyle StyleResolver::nodeStyle(NodeKind kind, const std::string& file) const {
    const KindStyle& entry = kindStyle(kind);

    NodeStyle style;
    style.shape = entry.shape;
    style.background = entry.background;
    style.border = entry.border;

    if (entry.usesFileColor) {
        auto it = nodeFileColors_.find(file);
        if (it != nodeFileColors_.end()) {
            style.background = it->second;
        }
    }
    if (entry.borderRadius) style.borderRadius = entry.borderRadius;
    if (entry.fontWeight) style.fontWeight = entry.fontWeight;
    if (entry.size) {
        style.width = entry.size;
        style.height = entry.size;
    }
    if (entry.flexCentered) {
        style.display = "flex";
        style.alignItems = "center";
        style.justifyContent = "center";
    }
    if (entry.clipPath) style.clipPath = entry.clipPath;

    return style;
}

ContainerStyle StyleResolver::containerStyle(const std::string& file) const {
    ContainerStyle style;
    auto it = containerFileColors_.find(file);
    if (it != containerFileColors_.end()) {
        style.backgroundColor = it->second;
    }
    return style;
}

std::string StyleResolver::containerLabel(const std::string& file, size_t memberCount) {
    return "\xF0\x9F\x93\x81 " + file + " (" + std::to_string(memberCount) + " nodes)";
}

void StyleResolver::setNodeFileColor(const std::string& file, const std::string& color) {
    nodeFileColors_[file] = color;
}

void StyleResolver::setContainerFileColor(const std::string& file, const std::string& color) {
    containerFileColors_[file] = color;
}

LayoutNode StyleResolver::resolveNode(const GraphNode& node,
                                      const Container& container,
                                      const LocalPlacement& placement,
                                      const AnchorSides& anchors,
                                      const Size& cellSize) const {
    LayoutNode out;
    out.id = node.id;
    out.name = node.name;
    out.kind = node.kind;
    out.kindName = node.kindName;
    out.file = node.file;
    out.line = node.line;

    out.position = container.position + placement.position;
    out.size = cellSize;
    out.style = nodeStyle(node.kind, node.file);
    out.containerId = container.id;

    out.rank = placement.rank;
    out.order = placement.order;
    out.targetAnchor = anchors.target;
    out.sourceAnchor = anchors.source;
    return out;
}

ContainerLayout StyleResolver::resolveContainer(const Container& container,
                                                const IntraLayoutResult& intra) const {
    ContainerLayout out;
    out.id = container.id;
    out.file = container.file;
    out.label = containerLabel(container.file, container.memberCount());
    out.memberIds = container.memberIds;
    out.position = container.position;
    out.size = container.size();
    out.strategy = intra.plan.strategy;
    out.rankCount = intra.rankCount;
    out.internalEdgeCount = static_cast<int>(intra.plan.internalEdgeCount);
    out.style = containerStyle(container.file);
    return out;
}

}  // namespace codemap
