#include "CoordinateAssignment.h"

#include <algorithm>
#include <limits>

namespace flowgraph {
namespace algorithms {

CoordinateAssignmentResult ParentAlignedCoordinateAssignment::assign(
    const LayerGraph& graph,
    const std::vector<std::vector<size_t>>& layers,
    const LayoutOptions& options) const {

    CoordinateAssignmentResult result;
    result.positions.assign(graph.size(), Point{0.0f, 0.0f});

    std::vector<bool> placed(graph.size(), false);
    const float layerStep = NODE_HEIGHT + options.layerSpacing;

    for (size_t layerIdx = 0; layerIdx < layers.size(); ++layerIdx) {
        const auto& layer = layers[layerIdx];
        float y = static_cast<float>(layerIdx) * layerStep;
        bool first = true;
        float prevX = 0.0f;

        for (size_t v : layer) {
            float sum = 0.0f;
            int count = 0;
            for (size_t parent : graph.incoming[v]) {
                if (placed[parent]) {
                    sum += result.positions[parent].x;
                    ++count;
                }
            }
            float preferredX = count > 0 ? sum / static_cast<float>(count) : 0.0f;

            float x = first ? preferredX
                            : std::max(preferredX, prevX + NODE_WIDTH + options.nodeSpacing);
            result.positions[v] = {x, y};
            placed[v] = true;
            prevX = x;
            first = false;
        }

        result.maxLayerWidth = std::max(result.maxLayerWidth,
                                        layerWidth(layer, result.positions));
    }

    // Center every layer on the widest one
    for (const auto& layer : layers) {
        float offset = (result.maxLayerWidth - layerWidth(layer, result.positions)) / 2.0f;
        for (size_t v : layer) {
            result.positions[v].x += offset;
        }
    }

    if (result.positions.empty()) {
        return result;
    }

    // Normalize to the padding origin
    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    for (const Point& p : result.positions) {
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
    }
    for (Point& p : result.positions) {
        p.x = p.x - minX + options.leftPadding;
        p.y = p.y - minY + options.topPadding;
    }

    return result;
}

float ParentAlignedCoordinateAssignment::layerWidth(
    const std::vector<size_t>& layer,
    const std::vector<Point>& positions) const {
    if (layer.empty()) {
        return 0.0f;
    }
    return std::max(0.0f, positions[layer.back()].x - positions[layer.front()].x + NODE_WIDTH);
}

}  // namespace algorithms
}  // namespace flowgraph
