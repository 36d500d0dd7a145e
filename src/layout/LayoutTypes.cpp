#include "codemap/layout/config/LayoutTypes.h"

#include <stdexcept>

namespace codemap {

const char* directionToString(Direction direction) {
    switch (direction) {
        case Direction::TopToBottom: return "TB";
        case Direction::LeftToRight: return "LR";
    }
    return "TB";
}

Direction parseDirection(std::string_view text) {
    if (text == "TB") return Direction::TopToBottom;
    if (text == "LR") return Direction::LeftToRight;
    throw std::invalid_argument("Unknown layout direction '" + std::string(text) +
                                "' (expected TB or LR)");
}

const char* nodeEdgeToString(NodeEdge edge) {
    switch (edge) {
        case NodeEdge::Top: return "top";
        case NodeEdge::Bottom: return "bottom";
        case NodeEdge::Left: return "left";
        case NodeEdge::Right: return "right";
    }
    return "bottom";
}

const char* layoutStrategyToString(LayoutStrategy strategy) {
    switch (strategy) {
        case LayoutStrategy::Hierarchical: return "hierarchical";
        case LayoutStrategy::Grid: return "grid";
    }
    return "grid";
}

const char* placementRegimeToString(PlacementRegime regime) {
    switch (regime) {
        case PlacementRegime::None: return "none";
        case PlacementRegime::Single: return "single";
        case PlacementRegime::Row: return "row";
        case PlacementRegime::Grid: return "grid";
    }
    return "none";
}

const char* nodeShapeToString(NodeShape shape) {
    switch (shape) {
        case NodeShape::Rectangle: return "rectangle";
        case NodeShape::RoundedRectangle: return "rounded-rectangle";
        case NodeShape::Circle: return "circle";
        case NodeShape::Diamond: return "diamond";
    }
    return "rectangle";
}

}  // namespace codemap
