#include "flowgraph/core/Workflow.h"
#include "flowgraph/core/GeometryUtils.h"
#include "flowgraph/layout/DagLayout.h"
#include "flowgraph/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace flowgraph {

namespace {
    constexpr float PLACEMENT_STEP = 30.0f;

    // Screen point used by addNodeAtViewportCenter
    constexpr float VIEWPORT_CENTER_X = 400.0f;
    constexpr float VIEWPORT_CENTER_Y = 300.0f;
}

Workflow::Workflow()
    : history_(WorkflowHistory<WorkflowState>::DEFAULT_CAPACITY) {}

Workflow::Workflow(size_t historyCapacity)
    : history_(historyCapacity) {}

NodeId Workflow::addNode(const std::string& nodeType, float x, float y) {
    if (!std::isfinite(x)) x = 0.0f;
    if (!std::isfinite(y)) y = 0.0f;
    x = std::clamp(x, -ViewportLimits::COORDINATE_LIMIT, ViewportLimits::COORDINATE_LIMIT);
    y = std::clamp(y, -ViewportLimits::COORDINATE_LIMIT, ViewportLimits::COORDINATE_LIMIT);

    std::vector<Point> existing;
    existing.reserve(state_.nodes.size());
    for (const Node& node : state_.nodes) {
        existing.push_back(node.position());
    }
    Point placed = geometry::findSafePosition(existing, x, y, PLACEMENT_STEP);

    const NodeTypeInfo& info = NodeCatalog::lookup(nodeType);

    Node node;
    node.id = nextNodeId_++;
    node.name = nodeType + " " + std::to_string(state_.nodes.size() + 1);
    node.description = std::string(info.label);
    node.nodeType = nodeType;
    node.category = info.category;
    node.icon = std::string(info.icon);
    node.x = placed.x;
    node.y = placed.y;

    if (!NodeCatalog::isKnown(nodeType)) {
        LOG_DEBUG("Unknown node type '{}', using fallback metadata", nodeType);
    }

    state_.nodes.push_back(std::move(node));
    return state_.nodes.back().id;
}

NodeId Workflow::addNodeAtViewportCenter(const std::string& nodeType) {
    Point model = state_.viewport.toModel({VIEWPORT_CENTER_X, VIEWPORT_CENTER_Y});
    return addNode(nodeType, model.x, model.y);
}

void Workflow::removeNode(NodeId id) {
    auto& nodes = state_.nodes;
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [id](const Node& n) { return n.id == id; });
    if (it == nodes.end()) return;
    nodes.erase(it);

    auto& conns = state_.connections;
    conns.erase(std::remove_if(conns.begin(), conns.end(),
                               [id](const Connection& c) {
                                   return c.source == id || c.target == id;
                               }),
                conns.end());
}

void Workflow::updateNodePosition(NodeId id, float dx, float dy) {
    Node* node = findMutableNode(id);
    if (!node) return;

    Point snapped = geometry::snapDragPosition(node->x, node->y, dx, dy);
    node->x = snapped.x;
    node->y = snapped.y;
}

bool Workflow::setNodePosition(NodeId id, Point position) {
    if (!std::isfinite(position.x) || !std::isfinite(position.y)) {
        return false;
    }
    Node* node = findMutableNode(id);
    if (!node) return false;

    node->x = position.x;
    node->y = position.y;
    return true;
}

void Workflow::deselectAll() {
    for (Node& node : state_.nodes) {
        node.selected = false;
    }
}

void Workflow::selectNode(NodeId id, bool additive) {
    if (!hasNode(id)) return;
    if (!additive) {
        deselectAll();
    }
    findMutableNode(id)->selected = true;
}

bool Workflow::setNodeConfig(NodeId id, nlohmann::json config) {
    Node* node = findMutableNode(id);
    if (!node) return false;
    node->config = std::move(config);
    return true;
}

bool Workflow::setNodeRunState(NodeId id, const NodeRunState& state) {
    Node* node = findMutableNode(id);
    if (!node) return false;
    node->executing = state.executing;
    node->skipped = state.skipped;
    node->error = state.error;
    node->lastOutput = state.lastOutput;
    return true;
}

const Node& Workflow::getNode(NodeId id) const {
    const Node* node = findNode(id);
    if (!node) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    return *node;
}

const Node* Workflow::findNode(NodeId id) const {
    auto it = std::find_if(state_.nodes.begin(), state_.nodes.end(),
                           [id](const Node& n) { return n.id == id; });
    return it != state_.nodes.end() ? &*it : nullptr;
}

Node* Workflow::findMutableNode(NodeId id) {
    return const_cast<Node*>(std::as_const(*this).findNode(id));
}

bool Workflow::hasNode(NodeId id) const {
    return findNode(id) != nullptr;
}

bool Workflow::removeConnection(ConnectionId id) {
    auto& conns = state_.connections;
    auto it = std::find_if(conns.begin(), conns.end(),
                           [id](const Connection& c) { return c.id == id; });
    if (it == conns.end()) return false;
    conns.erase(it);
    return true;
}

const Connection* Workflow::findConnection(ConnectionId id) const {
    auto it = std::find_if(state_.connections.begin(), state_.connections.end(),
                           [id](const Connection& c) { return c.id == id; });
    return it != state_.connections.end() ? &*it : nullptr;
}

std::vector<NodeId> Workflow::successors(NodeId id) const {
    std::vector<NodeId> result;
    for (const Connection& c : state_.connections) {
        if (c.source == id) {
            result.push_back(c.target);
        }
    }
    return result;
}

std::vector<NodeId> Workflow::predecessors(NodeId id) const {
    std::vector<NodeId> result;
    for (const Connection& c : state_.connections) {
        if (c.target == id) {
            result.push_back(c.source);
        }
    }
    return result;
}

std::vector<ConnectionId> Workflow::connectionsOf(NodeId id) const {
    std::vector<ConnectionId> result;
    for (const Connection& c : state_.connections) {
        if (c.source == id || c.target == id) {
            result.push_back(c.id);
        }
    }
    return result;
}

void Workflow::setViewport(const Viewport& viewport) {
    if (!std::isfinite(viewport.x) || !std::isfinite(viewport.y) ||
        !std::isfinite(viewport.zoom) || viewport.zoom <= 0.0f) {
        return;
    }
    state_.viewport = viewport;
}

void Workflow::zoom(float delta, float centerX, float centerY) {
    Viewport& vp = state_.viewport;
    float newZoom = geometry::calculateZoomDelta(delta, vp.zoom);
    Point offset = geometry::calculatePanOffset(vp.x, vp.y, centerX, centerY, vp.zoom, newZoom);

    vp.x = offset.x;
    vp.y = offset.y;
    vp.zoom = newZoom;
}

void Workflow::pan(float dx, float dy) {
    if (!std::isfinite(dx) || !std::isfinite(dy)) return;
    state_.viewport.x += dx;
    state_.viewport.y += dy;
}

void Workflow::fitView(float viewportWidth, float viewportHeight, float padding) {
    std::vector<Point> positions;
    positions.reserve(state_.nodes.size());
    for (const Node& node : state_.nodes) {
        positions.push_back(node.position());
    }

    auto fitted = geometry::calculateFitView(positions, viewportWidth, viewportHeight, padding);
    if (fitted) {
        state_.viewport = *fitted;
    }
}

LayoutStatus Workflow::applyLayout(const LayoutOptions& options) {
    DagLayout layout(options);
    return layout.apply(*this);
}

void Workflow::setExecutionQueue(std::vector<NodeId> queue, size_t currentStep) {
    state_.executionQueue = std::move(queue);
    state_.currentStep = currentStep;
}

void Workflow::saveUndoPoint() {
    history_.record(state_);
}

bool Workflow::undo() {
    auto previous = history_.undo(state_);
    if (!previous) return false;
    state_ = std::move(*previous);
    return true;
}

bool Workflow::redo() {
    auto next = history_.redo(state_);
    if (!next) return false;
    state_ = std::move(*next);
    return true;
}

ConnectionId Workflow::appendConnection(NodeId source, NodeId target,
                                        const PortName& sourcePort,
                                        const PortName& targetPort) {
    Connection conn;
    conn.id = nextConnectionId_++;
    conn.source = source;
    conn.target = target;
    conn.sourcePort = sourcePort;
    conn.targetPort = targetPort;
    state_.connections.push_back(std::move(conn));
    return state_.connections.back().id;
}

void Workflow::restore(WorkflowState state) {
    state_ = std::move(state);
    history_.clear();
    reseedIds();
}

void Workflow::reseedIds() {
    nextNodeId_ = 0;
    for (const Node& node : state_.nodes) {
        if (node.id != INVALID_NODE) {
            nextNodeId_ = std::max(nextNodeId_, node.id + 1);
        }
    }
    nextConnectionId_ = 0;
    for (const Connection& conn : state_.connections) {
        if (conn.id != INVALID_CONNECTION) {
            nextConnectionId_ = std::max(nextConnectionId_, conn.id + 1);
        }
    }
}

}  // namespace flowgraph
