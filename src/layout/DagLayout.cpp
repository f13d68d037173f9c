#include "flowgraph/layout/DagLayout.h"
#include "flowgraph/core/Workflow.h"
#include "flowgraph/common/Logger.h"
#include "dag/LayerGraph.h"
#include "dag/LayerAssignment.h"
#include "dag/CrossingMinimization.h"
#include "dag/CoordinateAssignment.h"

#include <algorithm>

namespace flowgraph {

const char* layoutStatusToString(LayoutStatus status) {
    switch (status) {
        case LayoutStatus::Applied: return "applied";
        case LayoutStatus::EmptyGraph: return "empty graph";
        case LayoutStatus::CyclicGraph: return "cyclic graph";
    }
    return "unknown";
}

LayoutStatus DagLayout::apply(Workflow& workflow) {
    stats_ = LayoutStats{};

    if (workflow.nodeCount() == 0) {
        return LayoutStatus::EmptyGraph;
    }

    // Phase 1: Graph construction
    auto graph = algorithms::LayerGraph::fromWorkflow(workflow);

    // Phase 2: Topological sort
    auto order = algorithms::topologicalOrder(graph);
    if (!order) {
        LOG_WARN("Workflow contains a cycle; layout skipped ({} nodes, {} connections)",
                 workflow.nodeCount(), workflow.connectionCount());
        return LayoutStatus::CyclicGraph;
    }

    // Phase 3: Layer assignment
    algorithms::LongestPathLayerAssignment layerAssignment;
    auto layering = layerAssignment.assignLayers(graph, *order);

    // Phase 4: Crossing minimization
    algorithms::BarycenterCrossingMinimization crossingMinimization;
    crossingMinimization.minimize(graph, layering.layers, std::max(0, options_.crossingPasses));

    // Phase 5: Coordinate assignment
    algorithms::ParentAlignedCoordinateAssignment coordinateAssignment;
    auto coords = coordinateAssignment.assign(graph, layering.layers, options_);

    for (size_t v = 0; v < graph.size(); ++v) {
        workflow.setNodePosition(graph.vertices[v], coords.positions[v]);
    }

    stats_.layerCount = layering.layerCount();
    for (const auto& layer : layering.layers) {
        stats_.maxLayerWidth = std::max(stats_.maxLayerWidth, static_cast<int>(layer.size()));
    }
    stats_.edgeCrossings = crossingMinimization.countTotalCrossings(graph, layering.layers);

    LOG_DEBUG("Layout applied: {} layers, widest {}, {} crossings",
              stats_.layerCount, stats_.maxLayerWidth, stats_.edgeCrossings);
    return LayoutStatus::Applied;
}

}  // namespace flowgraph
