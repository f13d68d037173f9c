#pragma once

#include "Types.h"

#include <optional>
#include <vector>

namespace flowgraph {

/// Numeric limits shared by every viewport and drag computation
struct ViewportLimits {
    static constexpr float MIN_ZOOM = 0.1f;
    static constexpr float MAX_ZOOM = 5.0f;
    static constexpr float MIN_FIT_ZOOM = 0.15f;
    static constexpr float MAX_FIT_ZOOM = 1.5f;
    static constexpr float SNAP_GRID = 10.0f;
    static constexpr float COORDINATE_LIMIT = 100000.0f;
    static constexpr float OVERLAP_TOLERANCE = 10.0f;
};

/// Pure viewport and drag math. No function here touches a Workflow; callers
/// feed in plain coordinates and apply the result themselves.
namespace geometry {

/// Multiply the current zoom by (1 + delta) and clamp to [MIN_ZOOM, MAX_ZOOM].
/// A non-finite delta keeps the (clamped) current zoom; a non-finite or
/// non-positive current zoom resets to 1.
float calculateZoomDelta(float delta, float currentZoom);

/// Compute the pan offset that keeps the screen point (centerX, centerY) over the
/// same model point while the zoom changes from oldZoom to newZoom.
/// Returns the original offset when any input is non-finite or oldZoom <= 0.
Point calculatePanOffset(
    float viewportX, float viewportY,
    float centerX, float centerY,
    float oldZoom, float newZoom);

/// Viewport that shows every node (each expanded by the node footprint) centred
/// in a viewportWidth x viewportHeight screen area.
/// @return std::nullopt for no nodes or unusable arguments
std::optional<Viewport> calculateFitView(
    const std::vector<Point>& nodePositions,
    float viewportWidth,
    float viewportHeight,
    float padding);

/// Offset (desiredX, desiredY) by +step on both axes until no existing position
/// lies within OVERLAP_TOLERANCE of the candidate on both axes. Stops early
/// when adding step no longer changes a float coordinate.
Point findSafePosition(
    const std::vector<Point>& existingPositions,
    float desiredX,
    float desiredY,
    float step);

/// Reference drag formula: round(v + d / 10) * 10 per axis, clamped to
/// [-COORDINATE_LIMIT, COORDINATE_LIMIT]. Any non-finite input returns (x, y).
Point updateNodePosition(float x, float y, float dx, float dy);

/// Editor drag rule: add the delta, then snap to the nearest multiple of
/// SNAP_GRID. Same finite guard and clamp as updateNodePosition().
Point snapDragPosition(float x, float y, float dx, float dy);

Point rectCenter(const Bounds& rect);
Size rectSize(const Bounds& rect);

/// Bounding box of node positions, each expanded by NODE_WIDTH x NODE_HEIGHT
std::optional<Bounds> nodeBounds(const std::vector<Point>& nodePositions);

}  // namespace geometry

}  // namespace flowgraph
