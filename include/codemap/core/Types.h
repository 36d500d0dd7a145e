#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace codemap {

/// Dense index of a vertex inside a Graph
using NodeId = uint32_t;
/// Dense index of an arc inside a Graph
using EdgeId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr EdgeId INVALID_EDGE = UINT32_MAX;

/// Canvas coordinate in pixels. Y grows downwards.
struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float px, float py) : x(px), y(py) {}

    constexpr Point operator+(const Point& rhs) const { return Point(x + rhs.x, y + rhs.y); }
    constexpr Point operator-(const Point& rhs) const { return Point(x - rhs.x, y - rhs.y); }

    bool isFinite() const { return std::isfinite(x) && std::isfinite(y); }

    constexpr bool operator==(const Point&) const = default;
};

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    constexpr bool empty() const { return width <= 0.0f || height <= 0.0f; }

    constexpr bool operator==(const Size&) const = default;
};

/// Axis-aligned box anchored at its top-left corner
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float left, float top, float w, float h)
        : x(left), y(top), width(w), height(h) {}
    constexpr Rect(const Point& origin, const Size& extent)
        : x(origin.x), y(origin.y), width(extent.width), height(extent.height) {}

    constexpr float left() const { return x; }
    constexpr float top() const { return y; }
    constexpr float right() const { return x + width; }
    constexpr float bottom() const { return y + height; }
    constexpr Point center() const { return Point(x + width * 0.5f, y + height * 0.5f); }
    constexpr bool empty() const { return width <= 0.0f || height <= 0.0f; }

    /// Inclusive on every side, so a box touching the border still counts.
    constexpr bool contains(const Rect& inner) const {
        return inner.left() >= left() && inner.top() >= top() &&
               inner.right() <= right() && inner.bottom() <= bottom();
    }

    /// Open intervals: boxes sharing only an edge do not intersect.
    constexpr bool intersects(const Rect& other) const {
        return left() < other.right() && other.left() < right() &&
               top() < other.bottom() && other.top() < bottom();
    }

    /// Smallest box covering both. Empty boxes are ignored.
    Rect united(const Rect& other) const {
        if (empty()) return other;
        if (other.empty()) return *this;
        const float l = std::min(left(), other.left());
        const float t = std::min(top(), other.top());
        return Rect(l, t,
                    std::max(right(), other.right()) - l,
                    std::max(bottom(), other.bottom()) - t);
    }

    Rect expanded(float margin) const {
        return Rect(x - margin, y - margin, width + margin * 2.0f, height + margin * 2.0f);
    }

    constexpr bool operator==(const Rect&) const = default;
};

}  // namespace codemap
