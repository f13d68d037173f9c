#pragma once

#include "Types.h"
#include "NodeCatalog.h"
#include "WorkflowHistory.h"
#include "flowgraph/layout/LayoutOptions.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace flowgraph {

struct Node {
    NodeId id = INVALID_NODE;
    std::string name;
    std::string description;
    std::string nodeType;  ///< Key into NodeCatalog
    NodeCategory category = NodeCategory::Durable;
    std::string icon;
    float x = 0.0f;
    float y = 0.0f;
    nlohmann::json config = nlohmann::json::object();
    std::optional<nlohmann::json> lastOutput;

    // Transient UI / execution flags
    bool selected = false;
    bool executing = false;
    bool skipped = false;
    std::optional<std::string> error;

    Point position() const { return {x, y}; }

    bool operator==(const Node& o) const = default;
};

struct Connection {
    ConnectionId id = INVALID_CONNECTION;
    NodeId source = INVALID_NODE;
    NodeId target = INVALID_NODE;
    PortName sourcePort;
    PortName targetPort;

    /// Same endpoints and ports, ignoring the id
    bool sameLink(const Connection& o) const {
        return source == o.source && target == o.target &&
               sourcePort == o.sourcePort && targetPort == o.targetPort;
    }

    bool operator==(const Connection& o) const = default;
};

/// Execution-related fields of a node, written by the runner
struct NodeRunState {
    bool executing = false;
    bool skipped = false;
    std::optional<std::string> error;
    std::optional<nlohmann::json> lastOutput;
};

/// Everything an undo snapshot restores
struct WorkflowState {
    std::vector<Node> nodes;              ///< Insertion order is the layout tie-break key
    std::vector<Connection> connections;
    Viewport viewport;
    std::vector<NodeId> executionQueue;   ///< Consumed by the execution subsystem
    size_t currentStep = 0;

    bool operator==(const WorkflowState& o) const = default;
};

/// Aggregate root of the editor: nodes, connections, viewport and undo history.
///
/// Connections are only created through ConnectivityValidator, which is the
/// sole gate for the acyclic / no-duplicate / no-self-loop invariants.
/// Unknown ids passed to mutators degrade to no-ops.
///
/// Undo is caller-driven: call saveUndoPoint() before a mutation that should be
/// undoable.
class Workflow {
public:
    Workflow();
    explicit Workflow(size_t historyCapacity);

    // Node operations
    NodeId addNode(const std::string& nodeType, float x, float y);
    NodeId addNodeAtViewportCenter(const std::string& nodeType);

    /// Remove the node and every connection touching it
    void removeNode(NodeId id);

    /// Add the delta and snap to the 10-unit grid; non-finite input is ignored
    void updateNodePosition(NodeId id, float dx, float dy);

    /// Set an absolute position. Rejected (returns false) for unknown ids or
    /// non-finite coordinates.
    bool setNodePosition(NodeId id, Point position);

    void deselectAll();
    void selectNode(NodeId id, bool additive = false);

    bool setNodeConfig(NodeId id, nlohmann::json config);
    bool setNodeRunState(NodeId id, const NodeRunState& state);

    // Node access API:
    // - getNode(): throws std::out_of_range for unknown ids.
    //   WARNING: Returned reference is invalidated by addNode()/removeNode().
    // - findNode(): nullptr for unknown ids.
    const Node& getNode(NodeId id) const;
    const Node* findNode(NodeId id) const;
    bool hasNode(NodeId id) const;

    // Connection operations (creation lives in ConnectivityValidator)
    bool removeConnection(ConnectionId id);
    const Connection* findConnection(ConnectionId id) const;

    // Queries
    size_t nodeCount() const { return state_.nodes.size(); }
    size_t connectionCount() const { return state_.connections.size(); }
    const std::vector<Node>& nodes() const { return state_.nodes; }
    const std::vector<Connection>& connections() const { return state_.connections; }

    std::vector<NodeId> successors(NodeId id) const;
    std::vector<NodeId> predecessors(NodeId id) const;

    /// Connections where id is source or target
    std::vector<ConnectionId> connectionsOf(NodeId id) const;

    // Viewport
    const Viewport& viewport() const { return state_.viewport; }
    void setViewport(const Viewport& viewport);

    /// Zoom by delta keeping the screen point (centerX, centerY) fixed
    void zoom(float delta, float centerX, float centerY);
    void pan(float dx, float dy);

    /// Fit all nodes into a viewportWidth x viewportHeight screen.
    /// No-op for an empty workflow or unusable arguments.
    void fitView(float viewportWidth, float viewportHeight, float padding);

    /// Run the default DAG layout over the current graph
    LayoutStatus applyLayout(const LayoutOptions& options = LayoutOptions{});

    // Execution cursor (carried, not interpreted)
    const std::vector<NodeId>& executionQueue() const { return state_.executionQueue; }
    size_t currentStep() const { return state_.currentStep; }
    void setExecutionQueue(std::vector<NodeId> queue, size_t currentStep = 0);

    // Undo / redo
    void saveUndoPoint();
    bool undo();
    bool redo();
    bool canUndo() const { return history_.canUndo(); }
    bool canRedo() const { return history_.canRedo(); }
    const WorkflowHistory<WorkflowState>& history() const { return history_; }

    /// Plain graph state, e.g. for cloning into a read-only snapshot
    const WorkflowState& state() const { return state_; }

private:
    friend class ConnectivityValidator;
    friend class WorkflowSerializer;

    Node* findMutableNode(NodeId id);

    ConnectionId appendConnection(NodeId source, NodeId target,
                                  const PortName& sourcePort, const PortName& targetPort);

    /// Insert already-identified elements (deserialization) and reseed the id counters
    void restore(WorkflowState state);
    void reseedIds();

    WorkflowState state_;
    WorkflowHistory<WorkflowState> history_;

    // Outside the snapshot so ids are never reused after undo
    NodeId nextNodeId_ = 0;
    ConnectionId nextConnectionId_ = 0;
};

}  // namespace flowgraph
