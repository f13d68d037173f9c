#pragma once

#include "LayerGraph.h"

#include <vector>

namespace flowgraph {
namespace algorithms {

/// Barycenter-based crossing minimization.
///
/// Each pass sweeps downward over layers 1..N (layer 0 keeps its order) and
/// re-sorts a layer by the mean index of each vertex's parents in the layer
/// above, ties broken by insertion order. A heuristic: the same input always
/// gives the same ordering, not necessarily the minimum crossing count.
class BarycenterCrossingMinimization {
public:
    void minimize(const LayerGraph& graph,
                  std::vector<std::vector<size_t>>& layers,
                  int passes) const;

    /// Count edge crossings between two adjacent layers
    int countCrossings(const LayerGraph& graph,
                       const std::vector<size_t>& upperLayer,
                       const std::vector<size_t>& lowerLayer) const;

    int countTotalCrossings(const LayerGraph& graph,
                            const std::vector<std::vector<size_t>>& layers) const;

private:
    float computeBarycenter(const LayerGraph& graph,
                            size_t vertex,
                            const std::vector<int>& upperPosition) const;
};

}  // namespace algorithms
}  // namespace flowgraph
