#pragma once

namespace flowgraph {

/// Outcome of an auto-layout request
enum class LayoutStatus {
    Applied,     ///< Every node received a new position
    EmptyGraph,  ///< Nothing to lay out
    CyclicGraph  ///< Connection graph has a cycle; positions left untouched
};

const char* layoutStatusToString(LayoutStatus status);

/// Tunables of the layered DAG layout. Node footprint is fixed (NODE_WIDTH x NODE_HEIGHT).
struct LayoutOptions {
    float nodeSpacing = 60.0f;    ///< Horizontal gap between siblings in a layer
    float layerSpacing = 140.0f;  ///< Vertical gap between consecutive layers
    int crossingPasses = 4;       ///< Barycenter sweeps over layers 1..N
    float leftPadding = 120.0f;   ///< Minimum x after normalization
    float topPadding = 80.0f;     ///< Minimum y after normalization
};

}  // namespace flowgraph
