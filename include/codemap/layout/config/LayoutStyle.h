#pragma once

#include "LayoutTypes.h"

#include <optional>
#include <string>

namespace codemap {

/// Visual style of a code node. String values are CSS values handed to the
/// rendering surface unchanged.
struct NodeStyle {
    NodeShape shape = NodeShape::Rectangle;
    std::string background = "#fff";
    std::string border = "1px solid #ddd";
    std::string borderRadius = "3px";
    std::string fontSize = "12px";
    std::string padding = "10px";
    std::string textAlign = "center";
    std::string minWidth = "150px";

    std::optional<std::string> fontWeight;
    std::optional<std::string> width;
    std::optional<std::string> height;
    std::optional<std::string> display;
    std::optional<std::string> alignItems;
    std::optional<std::string> justifyContent;
    std::optional<std::string> clipPath;

    bool operator==(const NodeStyle&) const = default;
};

/// Visual style of a file container
struct ContainerStyle {
    std::string backgroundColor = "#f9f9f9";
    std::string border = "2px solid #999";
    std::string borderRadius = "12px";
    std::string padding = "0";
    float opacity = 0.7f;

    bool operator==(const ContainerStyle&) const = default;
};

/// Arrow marker drawn at the target end of an edge
struct EdgeMarker {
    std::string type = "arrowclosed";
    float width = 24.0f;
    float height = 24.0f;
    std::string color = "#2563eb";

    bool operator==(const EdgeMarker&) const = default;
};

/// Visual style of a relationship edge
struct EdgeStyle {
    std::string type = "smoothstep";
    float strokeWidth = 3.0f;
    std::string stroke = "#2563eb";
    float opacity = 0.9f;
    int zIndex = 10;
    EdgeMarker markerEnd;

    bool operator==(const EdgeStyle&) const = default;
};

}  // namespace codemap
