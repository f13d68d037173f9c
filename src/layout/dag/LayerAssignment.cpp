#include "LayerAssignment.h"

#include <algorithm>

namespace flowgraph {
namespace algorithms {

LayerAssignmentResult LongestPathLayerAssignment::assignLayers(
    const LayerGraph& graph,
    const std::vector<size_t>& order) const {

    LayerAssignmentResult result;
    result.vertexLayer.assign(graph.size(), 0);

    // Parents precede children in a topological order
    for (size_t v : order) {
        int layer = 0;
        for (size_t parent : graph.incoming[v]) {
            layer = std::max(layer, result.vertexLayer[parent] + 1);
        }
        result.vertexLayer[v] = layer;
    }

    for (size_t v : order) {
        size_t layer = static_cast<size_t>(result.vertexLayer[v]);
        if (result.layers.size() <= layer) {
            result.layers.resize(layer + 1);
        }
        result.layers[layer].push_back(v);
    }

    return result;
}

}  // namespace algorithms
}  // namespace flowgraph
