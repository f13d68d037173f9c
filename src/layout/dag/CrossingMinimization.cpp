#include "CrossingMinimization.h"

#include <algorithm>
#include <utility>

namespace flowgraph {
namespace algorithms {

void BarycenterCrossingMinimization::minimize(
    const LayerGraph& graph,
    std::vector<std::vector<size_t>>& layers,
    int passes) const {

    if (layers.size() < 2) {
        return;
    }

    // Position of each vertex inside its layer; -1 = not in the layer being read
    std::vector<int> position(graph.size(), -1);

    for (int pass = 0; pass < passes; ++pass) {
        for (size_t layerIdx = 1; layerIdx < layers.size(); ++layerIdx) {
            const auto& upper = layers[layerIdx - 1];
            std::fill(position.begin(), position.end(), -1);
            for (size_t i = 0; i < upper.size(); ++i) {
                position[upper[i]] = static_cast<int>(i);
            }

            std::vector<std::pair<float, size_t>> weighted;
            weighted.reserve(layers[layerIdx].size());
            for (size_t v : layers[layerIdx]) {
                weighted.emplace_back(computeBarycenter(graph, v, position), v);
            }

            // (barycenter, insertion index) is a total order
            std::sort(weighted.begin(), weighted.end());

            auto& layer = layers[layerIdx];
            layer.clear();
            for (const auto& [weight, v] : weighted) {
                layer.push_back(v);
            }
        }
    }
}

float BarycenterCrossingMinimization::computeBarycenter(
    const LayerGraph& graph,
    size_t vertex,
    const std::vector<int>& upperPosition) const {

    float sum = 0.0f;
    int count = 0;
    for (size_t parent : graph.incoming[vertex]) {
        int pos = upperPosition[parent];
        if (pos >= 0) {
            sum += static_cast<float>(pos);
            ++count;
        }
    }
    return count > 0 ? sum / static_cast<float>(count) : 0.0f;
}

int BarycenterCrossingMinimization::countCrossings(
    const LayerGraph& graph,
    const std::vector<size_t>& upperLayer,
    const std::vector<size_t>& lowerLayer) const {

    std::vector<int> lowerPos(graph.size(), -1);
    for (size_t i = 0; i < lowerLayer.size(); ++i) {
        lowerPos[lowerLayer[i]] = static_cast<int>(i);
    }

    std::vector<std::pair<int, int>> edges;
    for (size_t i = 0; i < upperLayer.size(); ++i) {
        for (size_t child : graph.outgoing[upperLayer[i]]) {
            if (lowerPos[child] >= 0) {
                edges.emplace_back(static_cast<int>(i), lowerPos[child]);
            }
        }
    }

    // Two edges cross when their endpoint orders disagree
    int crossings = 0;
    for (size_t i = 0; i < edges.size(); ++i) {
        for (size_t j = i + 1; j < edges.size(); ++j) {
            bool upperBefore = edges[i].first < edges[j].first;
            bool upperAfter = edges[i].first > edges[j].first;
            bool lowerBefore = edges[i].second < edges[j].second;
            bool lowerAfter = edges[i].second > edges[j].second;
            if ((upperBefore && lowerAfter) || (upperAfter && lowerBefore)) {
                ++crossings;
            }
        }
    }
    return crossings;
}

int BarycenterCrossingMinimization::countTotalCrossings(
    const LayerGraph& graph,
    const std::vector<std::vector<size_t>>& layers) const {

    int total = 0;
    for (size_t i = 0; i + 1 < layers.size(); ++i) {
        total += countCrossings(graph, layers[i], layers[i + 1]);
    }
    return total;
}

}  // namespace algorithms
}  // namespace flowgraph
