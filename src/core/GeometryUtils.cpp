#include "flowgraph/core/GeometryUtils.h"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <limits>

namespace flowgraph {
namespace geometry {

namespace {
    bool allFinite(std::initializer_list<float> values) {
        return std::all_of(values.begin(), values.end(),
                           [](float v) { return std::isfinite(v); });
    }

    float clampCoordinate(float value) {
        return std::clamp(value, -ViewportLimits::COORDINATE_LIMIT,
                          ViewportLimits::COORDINATE_LIMIT);
    }
}

float calculateZoomDelta(float delta, float currentZoom) {
    if (!std::isfinite(currentZoom) || currentZoom <= 0.0f) {
        return 1.0f;
    }
    if (!std::isfinite(delta)) {
        return std::clamp(currentZoom, ViewportLimits::MIN_ZOOM, ViewportLimits::MAX_ZOOM);
    }

    float newZoom = currentZoom * (1.0f + delta);
    return std::clamp(newZoom, ViewportLimits::MIN_ZOOM, ViewportLimits::MAX_ZOOM);
}

Point calculatePanOffset(
    float viewportX, float viewportY,
    float centerX, float centerY,
    float oldZoom, float newZoom) {

    const Point unchanged{viewportX, viewportY};

    if (!allFinite({viewportX, viewportY, centerX, centerY, oldZoom, newZoom}) ||
        oldZoom <= 0.0f) {
        return unchanged;
    }

    float factor = newZoom / oldZoom;
    if (!std::isfinite(factor)) {
        return unchanged;
    }

    float newX = centerX - (centerX - viewportX) * factor;
    float newY = centerY - (centerY - viewportY) * factor;

    if (!std::isfinite(newX) || !std::isfinite(newY)) {
        return unchanged;
    }
    return {newX, newY};
}

std::optional<Bounds> nodeBounds(const std::vector<Point>& nodePositions) {
    if (nodePositions.empty()) {
        return std::nullopt;
    }

    Bounds box{
        std::numeric_limits<float>::infinity(),
        std::numeric_limits<float>::infinity(),
        -std::numeric_limits<float>::infinity(),
        -std::numeric_limits<float>::infinity()};

    for (const Point& p : nodePositions) {
        box.minX = std::min(box.minX, p.x);
        box.minY = std::min(box.minY, p.y);
        box.maxX = std::max(box.maxX, p.x + NODE_WIDTH);
        box.maxY = std::max(box.maxY, p.y + NODE_HEIGHT);
    }
    return box;
}

std::optional<Viewport> calculateFitView(
    const std::vector<Point>& nodePositions,
    float viewportWidth,
    float viewportHeight,
    float padding) {

    if (nodePositions.empty()) {
        return std::nullopt;
    }

    if (!allFinite({viewportWidth, viewportHeight, padding}) ||
        viewportWidth <= 0.0f || viewportHeight <= 0.0f || padding < 0.0f) {
        return std::nullopt;
    }

    bool positionsFinite = std::all_of(nodePositions.begin(), nodePositions.end(),
        [](const Point& p) { return std::isfinite(p.x) && std::isfinite(p.y); });
    if (!positionsFinite) {
        return std::nullopt;
    }

    auto box = nodeBounds(nodePositions);
    if (!box) {
        return std::nullopt;
    }

    Size extent = rectSize(*box);
    float scaleX = (viewportWidth - padding) / std::max(extent.width, 1.0f);
    float scaleY = (viewportHeight - padding) / std::max(extent.height, 1.0f);
    float zoom = std::clamp(std::min(scaleX, scaleY),
                            ViewportLimits::MIN_FIT_ZOOM, ViewportLimits::MAX_FIT_ZOOM);

    Point center = rectCenter(*box);

    Viewport result;
    result.zoom = zoom;
    result.x = viewportWidth / 2.0f - center.x * zoom;
    result.y = viewportHeight / 2.0f - center.y * zoom;
    return result;
}

Point findSafePosition(
    const std::vector<Point>& existingPositions,
    float desiredX,
    float desiredY,
    float step) {

    // A zero or non-finite step could never leave an occupied spot
    if (!std::isfinite(step) || step <= 0.0f) {
        return {desiredX, desiredY};
    }

    Point candidate{desiredX, desiredY};
    auto occupied = [&existingPositions](const Point& c) {
        return std::any_of(existingPositions.begin(), existingPositions.end(),
            [&c](const Point& e) {
                return std::abs(e.x - c.x) < ViewportLimits::OVERLAP_TOLERANCE &&
                       std::abs(e.y - c.y) < ViewportLimits::OVERLAP_TOLERANCE;
            });
    };

    while (occupied(candidate)) {
        Point next{candidate.x + step, candidate.y + step};
        // A step below float precision at this coordinate cannot move it
        if (next.x == candidate.x || next.y == candidate.y) {
            break;
        }
        candidate = next;
    }
    return candidate;
}

Point updateNodePosition(float x, float y, float dx, float dy) {
    if (!allFinite({x, y, dx, dy})) {
        return {x, y};
    }

    const float grid = ViewportLimits::SNAP_GRID;
    float newX = std::round(x + dx / grid) * grid;
    float newY = std::round(y + dy / grid) * grid;

    return {clampCoordinate(newX), clampCoordinate(newY)};
}

Point snapDragPosition(float x, float y, float dx, float dy) {
    if (!allFinite({x, y, dx, dy})) {
        return {x, y};
    }

    const float grid = ViewportLimits::SNAP_GRID;
    float newX = std::round((x + dx) / grid) * grid;
    float newY = std::round((y + dy) / grid) * grid;

    return {clampCoordinate(newX), clampCoordinate(newY)};
}

Point rectCenter(const Bounds& rect) {
    return {(rect.minX + rect.maxX) / 2.0f, (rect.minY + rect.maxY) / 2.0f};
}

Size rectSize(const Bounds& rect) {
    return {rect.maxX - rect.minX, rect.maxY - rect.minY};
}

}  // namespace geometry
}  // namespace flowgraph
