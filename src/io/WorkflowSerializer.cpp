#include "flowgraph/io/WorkflowSerializer.h"
#include "flowgraph/connectivity/ConnectivityValidator.h"
#include "flowgraph/common/Logger.h"

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <vector>

using json = nlohmann::json;

namespace flowgraph {

namespace {

template <typename T>
json optionalToJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

/// Reject documents that could not have been built through the editor API
void checkGraphInvariants(const WorkflowState& state) {
    std::unordered_set<NodeId> nodeIds;
    for (const Node& node : state.nodes) {
        if (node.id == INVALID_NODE) {
            throw std::runtime_error("Node has an invalid id");
        }
        if (!nodeIds.insert(node.id).second) {
            throw std::runtime_error(std::format("Duplicate node id {}", node.id));
        }
    }

    std::unordered_set<ConnectionId> connectionIds;
    std::vector<const Connection*> seen;
    for (const Connection& c : state.connections) {
        if (c.id == INVALID_CONNECTION) {
            throw std::runtime_error("Connection has an invalid id");
        }
        if (!connectionIds.insert(c.id).second) {
            throw std::runtime_error(std::format("Duplicate connection id {}", c.id));
        }
        if (c.source == c.target) {
            throw std::runtime_error(std::format(
                "Connection {} connects node {} to itself", c.id, c.source));
        }
        if (nodeIds.count(c.source) == 0 || nodeIds.count(c.target) == 0) {
            throw std::runtime_error(std::format(
                "Connection {} references a missing node", c.id));
        }
        for (const Connection* other : seen) {
            if (other->sameLink(c)) {
                throw std::runtime_error(std::format(
                    "Connection {} duplicates connection {}", c.id, other->id));
            }
        }
        seen.push_back(&c);
    }
}

/// True if any connection lies on a cycle
bool hasCycle(const Workflow& workflow) {
    for (const Connection& c : workflow.connections()) {
        if (ConnectivityValidator::pathExists(workflow, c.target, c.source)) {
            return true;
        }
    }
    return false;
}

}  // namespace

json WorkflowSerializer::toJson(const Node& node) {
    json j;
    j["id"] = node.id;
    j["name"] = node.name;
    j["description"] = node.description;
    j["node_type"] = node.nodeType;
    j["category"] = nodeCategoryToString(node.category);
    j["icon"] = node.icon;
    j["x"] = node.x;
    j["y"] = node.y;
    j["config"] = node.config;
    j["last_output"] = optionalToJson(node.lastOutput);
    j["selected"] = node.selected;
    j["executing"] = node.executing;
    j["skipped"] = node.skipped;
    j["error"] = optionalToJson(node.error);
    return j;
}

json WorkflowSerializer::toJson(const Connection& connection) {
    return {
        {"id", connection.id},
        {"source", connection.source},
        {"target", connection.target},
        {"source_port", connection.sourcePort.str()},
        {"target_port", connection.targetPort.str()}
    };
}

json WorkflowSerializer::toJson(const Viewport& viewport) {
    return {{"x", viewport.x}, {"y", viewport.y}, {"zoom", viewport.zoom}};
}

Node WorkflowSerializer::nodeFromJson(const json& j) {
    Node node;
    node.id = j.at("id").get<NodeId>();
    node.nodeType = j.at("node_type").get<std::string>();

    const NodeTypeInfo& info = NodeCatalog::lookup(node.nodeType);
    node.name = j.value("name", node.nodeType);
    node.description = j.value("description", std::string(info.label));
    node.icon = j.value("icon", std::string(info.icon));

    // Unrecognized category text falls back to the catalog entry
    node.category = info.category;
    if (j.contains("category") && j["category"].is_string()) {
        if (auto category = nodeCategoryFromString(j["category"].get<std::string>())) {
            node.category = *category;
        }
    }

    node.x = j.at("x").get<float>();
    node.y = j.at("y").get<float>();

    if (j.contains("config") && !j["config"].is_null()) {
        node.config = j["config"];
    }
    if (j.contains("last_output") && !j["last_output"].is_null()) {
        node.lastOutput = j["last_output"];
    }
    node.selected = j.value("selected", false);
    node.executing = j.value("executing", false);
    node.skipped = j.value("skipped", false);
    if (j.contains("error") && !j["error"].is_null()) {
        node.error = j["error"].get<std::string>();
    }
    return node;
}

Connection WorkflowSerializer::connectionFromJson(const json& j) {
    Connection connection;
    connection.id = j.at("id").get<ConnectionId>();
    connection.source = j.at("source").get<NodeId>();
    connection.target = j.at("target").get<NodeId>();
    connection.sourcePort = PortName(j.value("source_port", PortName::defaultOutput().str()));
    connection.targetPort = PortName(j.value("target_port", PortName::defaultInput().str()));
    return connection;
}

Viewport WorkflowSerializer::viewportFromJson(const json& j) {
    Viewport viewport;
    viewport.x = j.value("x", 0.0f);
    viewport.y = j.value("y", 0.0f);
    viewport.zoom = j.value("zoom", 1.0f);
    return viewport;
}

json WorkflowSerializer::toJson(const Workflow& workflow) {
    json nodes = json::array();
    for (const Node& node : workflow.nodes()) {
        nodes.push_back(toJson(node));
    }

    json connections = json::array();
    for (const Connection& connection : workflow.connections()) {
        connections.push_back(toJson(connection));
    }

    json j;
    j["nodes"] = nodes;
    j["connections"] = connections;
    j["viewport"] = toJson(workflow.viewport());
    j["execution_queue"] = workflow.executionQueue();
    j["current_step"] = workflow.currentStep();
    return j;
}

std::string WorkflowSerializer::toString(const Workflow& workflow) {
    return toJson(workflow).dump(2);
}

Workflow WorkflowSerializer::workflowFromJson(const json& j) {
    WorkflowState state;

    try {
        if (!j.is_object()) {
            throw std::runtime_error("Workflow JSON must be an object");
        }

        if (j.contains("nodes")) {
            for (const auto& nodeJson : j.at("nodes")) {
                state.nodes.push_back(nodeFromJson(nodeJson));
            }
        }

        if (j.contains("connections")) {
            for (const auto& connectionJson : j.at("connections")) {
                state.connections.push_back(connectionFromJson(connectionJson));
            }
        }

        if (j.contains("viewport")) {
            state.viewport = viewportFromJson(j.at("viewport"));
        }

        if (j.contains("execution_queue")) {
            state.executionQueue = j.at("execution_queue").get<std::vector<NodeId>>();
        }
        state.currentStep = j.value("current_step", static_cast<size_t>(0));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Failed to parse workflow JSON: ") + e.what());
    }

    checkGraphInvariants(state);

    Workflow workflow;
    workflow.restore(std::move(state));

    // Loaded as-is; DagLayout reports CyclicGraph for these
    if (hasCycle(workflow)) {
        LOG_WARN("Loaded workflow contains a connection cycle");
    }
    return workflow;
}

Workflow WorkflowSerializer::workflowFromString(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Failed to parse workflow JSON: ") + e.what());
    }
    return workflowFromJson(j);
}

bool WorkflowSerializer::saveToFile(const Workflow& workflow, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open '{}' for writing", path);
        return false;
    }
    file << toString(workflow);
    return file.good();
}

std::optional<Workflow> WorkflowSerializer::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open '{}' for reading", path);
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return workflowFromString(buffer.str());
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Cannot load workflow from '{}': {}", path, e.what());
        return std::nullopt;
    }
}

json WorkflowSerializer::layoutOptionsToJson(const LayoutOptions& options) {
    return {
        {"node_spacing", options.nodeSpacing},
        {"layer_spacing", options.layerSpacing},
        {"crossing_passes", options.crossingPasses},
        {"left_padding", options.leftPadding},
        {"top_padding", options.topPadding}
    };
}

LayoutOptions WorkflowSerializer::layoutOptionsFromJson(const json& j) {
    LayoutOptions options;
    try {
        options.nodeSpacing = j.value("node_spacing", options.nodeSpacing);
        options.layerSpacing = j.value("layer_spacing", options.layerSpacing);
        options.crossingPasses = j.value("crossing_passes", options.crossingPasses);
        options.leftPadding = j.value("left_padding", options.leftPadding);
        options.topPadding = j.value("top_padding", options.topPadding);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid layout options: ") + e.what());
    }
    return options;
}

}  // namespace flowgraph
