#include "LayerGraph.h"

#include <functional>
#include <queue>

namespace flowgraph {
namespace algorithms {

LayerGraph LayerGraph::fromWorkflow(const Workflow& workflow) {
    LayerGraph graph;

    const auto& nodes = workflow.nodes();
    graph.vertices.reserve(nodes.size());
    graph.indexOf.reserve(nodes.size());
    for (const Node& node : nodes) {
        graph.indexOf[node.id] = graph.vertices.size();
        graph.vertices.push_back(node.id);
    }

    graph.incoming.resize(graph.vertices.size());
    graph.outgoing.resize(graph.vertices.size());

    for (const Connection& conn : workflow.connections()) {
        auto src = graph.indexOf.find(conn.source);
        auto tgt = graph.indexOf.find(conn.target);
        if (src == graph.indexOf.end() || tgt == graph.indexOf.end()) {
            continue;
        }
        graph.outgoing[src->second].push_back(tgt->second);
        graph.incoming[tgt->second].push_back(src->second);
    }

    return graph;
}

std::optional<std::vector<size_t>> topologicalOrder(const LayerGraph& graph) {
    std::vector<size_t> inDegree(graph.size(), 0);
    for (size_t v = 0; v < graph.size(); ++v) {
        inDegree[v] = graph.incoming[v].size();
    }

    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> ready;
    for (size_t v = 0; v < graph.size(); ++v) {
        if (inDegree[v] == 0) {
            ready.push(v);
        }
    }

    std::vector<size_t> order;
    order.reserve(graph.size());

    while (!ready.empty()) {
        size_t v = ready.top();
        ready.pop();
        order.push_back(v);

        for (size_t next : graph.outgoing[v]) {
            if (--inDegree[next] == 0) {
                ready.push(next);
            }
        }
    }

    // Vertices left with incoming edges sit on a cycle
    if (order.size() != graph.size()) {
        return std::nullopt;
    }
    return order;
}

}  // namespace algorithms
}  // namespace flowgraph
