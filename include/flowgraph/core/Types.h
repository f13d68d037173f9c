#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace flowgraph {

using NodeId = uint32_t;
using ConnectionId = uint32_t;

constexpr NodeId INVALID_NODE = UINT32_MAX;
constexpr ConnectionId INVALID_CONNECTION = UINT32_MAX;

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    constexpr bool operator==(const Size& o) const {
        return width == o.width && height == o.height;
    }
    constexpr bool operator!=(const Size& o) const { return !(*this == o); }
};

/// Axis-aligned box stored as its two extreme corners
struct Bounds {
    float minX = 0.0f;
    float minY = 0.0f;
    float maxX = 0.0f;
    float maxY = 0.0f;

    constexpr Bounds() = default;
    constexpr Bounds(float minX_, float minY_, float maxX_, float maxY_)
        : minX(minX_), minY(minY_), maxX(maxX_), maxY(maxY_) {}

    constexpr bool operator==(const Bounds& o) const {
        return minX == o.minX && minY == o.minY && maxX == o.maxX && maxY == o.maxY;
    }
};

/// Rendered footprint of every node on the canvas (model units)
constexpr float NODE_WIDTH = 220.0f;
constexpr float NODE_HEIGHT = 68.0f;

/// Pan/zoom transform from canvas (model) space to screen space:
/// screen = model * zoom + (x, y)
struct Viewport {
    float x = 0.0f;
    float y = 0.0f;
    float zoom = 1.0f;

    constexpr Point toScreen(const Point& model) const {
        return {model.x * zoom + x, model.y * zoom + y};
    }
    constexpr Point toModel(const Point& screen) const {
        return {(screen.x - x) / zoom, (screen.y - y) / zoom};
    }

    constexpr bool operator==(const Viewport& o) const {
        return x == o.x && y == o.y && zoom == o.zoom;
    }
    constexpr bool operator!=(const Viewport& o) const { return !(*this == o); }
};

/// Named connection endpoint on a node.
/// Wrapped so a port can never be compared against arbitrary display text.
class PortName {
public:
    PortName() = default;
    explicit PortName(std::string name) : name_(std::move(name)) {}

    const std::string& str() const { return name_; }
    bool empty() const { return name_.empty(); }

    bool operator==(const PortName& o) const { return name_ == o.name_; }
    bool operator!=(const PortName& o) const { return name_ != o.name_; }

    static PortName defaultOutput() { return PortName("out"); }
    static PortName defaultInput() { return PortName("in"); }

private:
    std::string name_;
};

}  // namespace flowgraph
