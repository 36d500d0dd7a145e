#pragma once

#include <string>
#include <string_view>

namespace codemap {

/// Overall layout direction selected by the viewer
enum class Direction {
    TopToBottom,   // "TB": ranks stacked vertically
    LeftToRight    // "LR": ranks side by side
};

/// "TB" / "LR"
const char* directionToString(Direction direction);

/// Parse "TB" or "LR"; throws std::invalid_argument otherwise
Direction parseDirection(std::string_view text);

/// Side of a node that edges attach to
enum class NodeEdge {
    Top,
    Bottom,
    Left,
    Right
};

const char* nodeEdgeToString(NodeEdge edge);

/// How members of one container are positioned
enum class LayoutStrategy {
    Hierarchical,  ///< Layered placement driven by internal edges
    Grid           ///< Raster order on the sizing grid
};

const char* layoutStrategyToString(LayoutStrategy strategy);

/// How containers are arranged on the canvas, chosen by container count
enum class PlacementRegime {
    None,     ///< No containers
    Single,   ///< One container at the canvas origin
    Row,      ///< Two or three containers left to right
    Grid      ///< More than three containers on a square-ish grid
};

const char* placementRegimeToString(PlacementRegime regime);

/// Drawn shape of a node
enum class NodeShape {
    Rectangle,         ///< Declarations (classes)
    RoundedRectangle,  ///< Behaviours (methods, functions)
    Circle,            ///< Attributes (properties)
    Diamond            ///< Dependencies (imports)
};

const char* nodeShapeToString(NodeShape shape);

}  // namespace codemap
