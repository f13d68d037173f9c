#pragma once

#include "LayerGraph.h"
#include "flowgraph/layout/LayoutOptions.h"

#include <vector>

namespace flowgraph {
namespace algorithms {

/// Result of coordinate assignment, indexed by vertex
struct CoordinateAssignmentResult {
    std::vector<Point> positions;
    float maxLayerWidth = 0.0f;
};

/// Parent-aligned coordinate assignment.
///
/// Each vertex prefers the mean x of its already placed parents and is pushed
/// right only as far as needed to keep NODE_WIDTH + nodeSpacing from its left
/// neighbour. Layers are then centered on the widest one and the whole drawing
/// is shifted so its top-left corner sits at (leftPadding, topPadding).
class ParentAlignedCoordinateAssignment {
public:
    CoordinateAssignmentResult assign(const LayerGraph& graph,
                                      const std::vector<std::vector<size_t>>& layers,
                                      const LayoutOptions& options) const;

private:
    float layerWidth(const std::vector<size_t>& layer,
                     const std::vector<Point>& positions) const;
};

}  // namespace algorithms
}  // namespace flowgraph
