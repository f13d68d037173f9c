#pragma once

#include "LayerGraph.h"

#include <vector>

namespace flowgraph {
namespace algorithms {

/// Result of layer assignment
struct LayerAssignmentResult {
    std::vector<int> vertexLayer;              ///< Vertex index -> layer
    std::vector<std::vector<size_t>> layers;   ///< Layer -> vertices, in topological order
    int layerCount() const { return static_cast<int>(layers.size()); }
};

/// Longest-path layering: sources sit on layer 0 and every other vertex one
/// layer below its deepest parent, so each edge points strictly downward.
class LongestPathLayerAssignment {
public:
    /// @param order a topological order of graph
    LayerAssignmentResult assignLayers(const LayerGraph& graph,
                                       const std::vector<size_t>& order) const;
};

}  // namespace algorithms
}  // namespace flowgraph
