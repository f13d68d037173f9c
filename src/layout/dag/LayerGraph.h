#pragma once

#include "flowgraph/core/Workflow.h"

#include <optional>
#include <unordered_map>
#include <vector>

namespace flowgraph {
namespace algorithms {

/// Transient adjacency view of a Workflow built for one layout run.
///
/// Vertices are addressed by their index in workflow insertion order; that
/// index doubles as the deterministic tie-break key of every phase.
struct LayerGraph {
    std::vector<NodeId> vertices;
    std::unordered_map<NodeId, size_t> indexOf;
    std::vector<std::vector<size_t>> incoming;
    std::vector<std::vector<size_t>> outgoing;

    size_t size() const { return vertices.size(); }

    /// Ports are ignored; connections to unknown nodes are skipped
    static LayerGraph fromWorkflow(const Workflow& workflow);
};

/// Kahn's algorithm, always releasing the ready vertex with the lowest index.
/// @return std::nullopt when the graph contains a cycle
std::optional<std::vector<size_t>> topologicalOrder(const LayerGraph& graph);

}  // namespace algorithms
}  // namespace flowgraph
