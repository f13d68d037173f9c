#include "flowgraph/connectivity/ConnectivityValidator.h"
#include "flowgraph/common/Logger.h"

#include <algorithm>
#include <format>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace flowgraph {

const char* connectionErrorToString(ConnectionError error) {
    switch (error) {
        case ConnectionError::SelfConnection: return "Cannot connect node to itself";
        case ConnectionError::UnknownNode: return "Connection endpoint does not exist";
        case ConnectionError::WouldCreateCycle: return "Connection would create a cycle";
        case ConnectionError::Duplicate: return "Connection already exists";
        case ConnectionError::TypeMismatch: return "Port types are incompatible";
    }
    return "Invalid connection";
}

std::string ConnectionOutcome::message() const {
    if (ok()) {
        const ConnectionResult& result = value();
        return result.warning ? *result.warning : std::string("Connection created");
    }
    if (error() == ConnectionError::TypeMismatch && mismatch_) {
        return std::format("{}: {} -> {}", connectionErrorToString(error()),
                           portTypeToString(mismatch_->sourceType),
                           portTypeToString(mismatch_->targetType));
    }
    return connectionErrorToString(error());
}

ConnectivityValidator::ConnectivityValidator()
    : resolver_([](std::string_view nodeType) { return NodeCatalog::portTypes(nodeType); }) {}

ConnectivityValidator::ConnectivityValidator(PortTypeResolver resolver)
    : resolver_(std::move(resolver)) {}

ConnectionOutcome ConnectivityValidator::addConnectionChecked(
    Workflow& workflow, NodeId source, NodeId target,
    const PortName& sourcePort, const PortName& targetPort) const {
    return connect(workflow, source, target, sourcePort, targetPort, TypePolicy::Warn);
}

ConnectionOutcome ConnectivityValidator::addConnectionStrict(
    Workflow& workflow, NodeId source, NodeId target,
    const PortName& sourcePort, const PortName& targetPort) const {
    return connect(workflow, source, target, sourcePort, targetPort, TypePolicy::Reject);
}

bool ConnectivityValidator::addConnection(
    Workflow& workflow, NodeId source, NodeId target,
    const PortName& sourcePort, const PortName& targetPort) const {
    return addConnectionChecked(workflow, source, target, sourcePort, targetPort).ok();
}

std::optional<ConnectionError> ConnectivityValidator::canConnect(
    const Workflow& workflow, NodeId source, NodeId target,
    const PortName& sourcePort, const PortName& targetPort) const {
    return structuralCheck(workflow, source, target, sourcePort, targetPort);
}

ConnectionOutcome ConnectivityValidator::connect(
    Workflow& workflow, NodeId source, NodeId target,
    const PortName& sourcePort, const PortName& targetPort,
    TypePolicy policy) const {

    if (auto error = structuralCheck(workflow, source, target, sourcePort, targetPort)) {
        LOG_DEBUG("Rejected connection {} -> {}: {}", source, target,
                  connectionErrorToString(*error));
        return ConnectionOutcome::failure(*error);
    }

    ConnectionResult result;
    auto mismatch = checkPortTypes(workflow, source, target);
    if (mismatch) {
        if (policy == TypePolicy::Reject) {
            LOG_DEBUG("Rejected connection {} -> {}: port types {} -> {}", source, target,
                      portTypeToString(mismatch->sourceType),
                      portTypeToString(mismatch->targetType));
            return ConnectionOutcome::failure(ConnectionError::TypeMismatch, mismatch);
        }
        result.status = ConnectionStatus::CreatedWithTypeWarning;
        result.warning = describeMismatch(workflow, source, target, *mismatch);
    }

    result.connectionId = workflow.appendConnection(source, target, sourcePort, targetPort);
    return ConnectionOutcome::success(std::move(result));
}

std::optional<ConnectionError> ConnectivityValidator::structuralCheck(
    const Workflow& workflow, NodeId source, NodeId target,
    const PortName& sourcePort, const PortName& targetPort) const {

    if (source == target) {
        return ConnectionError::SelfConnection;
    }

    if (!workflow.hasNode(source) || !workflow.hasNode(target)) {
        return ConnectionError::UnknownNode;
    }

    if (wouldCreateCycle(workflow, source, target)) {
        return ConnectionError::WouldCreateCycle;
    }

    Connection candidate;
    candidate.source = source;
    candidate.target = target;
    candidate.sourcePort = sourcePort;
    candidate.targetPort = targetPort;

    const auto& conns = workflow.connections();
    bool duplicate = std::any_of(conns.begin(), conns.end(),
                                 [&candidate](const Connection& c) { return c.sameLink(candidate); });
    if (duplicate) {
        return ConnectionError::Duplicate;
    }

    return std::nullopt;
}

std::optional<TypeMismatch> ConnectivityValidator::checkPortTypes(
    const Workflow& workflow, NodeId source, NodeId target) const {

    if (!resolver_) {
        return std::nullopt;
    }

    const Node* sourceNode = workflow.findNode(source);
    const Node* targetNode = workflow.findNode(target);
    if (!sourceNode || !targetNode) {
        return std::nullopt;
    }

    auto sourcePorts = resolver_(sourceNode->nodeType);
    auto targetPorts = resolver_(targetNode->nodeType);
    if (!sourcePorts || !targetPorts) {
        return std::nullopt;
    }

    if (NodeCatalog::arePortTypesCompatible(sourcePorts->output, targetPorts->input)) {
        return std::nullopt;
    }
    return TypeMismatch{sourcePorts->output, targetPorts->input};
}

bool ConnectivityValidator::pathExists(const Workflow& workflow, NodeId from, NodeId to) {
    std::unordered_map<NodeId, std::vector<NodeId>> adjacency;
    for (const Connection& c : workflow.connections()) {
        adjacency[c.source].push_back(c.target);
    }

    // Iterative DFS; the visited set keeps shared ancestors from being re-expanded
    std::unordered_set<NodeId> visited;
    std::vector<NodeId> stack{from};

    while (!stack.empty()) {
        NodeId current = stack.back();
        stack.pop_back();

        if (current == to) {
            return true;
        }
        if (!visited.insert(current).second) {
            continue;
        }

        auto it = adjacency.find(current);
        if (it != adjacency.end()) {
            for (NodeId next : it->second) {
                if (visited.count(next) == 0) {
                    stack.push_back(next);
                }
            }
        }
    }
    return false;
}

bool ConnectivityValidator::wouldCreateCycle(const Workflow& workflow, NodeId source, NodeId target) {
    return pathExists(workflow, target, source);
}

std::string ConnectivityValidator::describeMismatch(
    const Workflow& workflow, NodeId source, NodeId target, const TypeMismatch& mismatch) {
    const Node& sourceNode = workflow.getNode(source);
    const Node& targetNode = workflow.getNode(target);
    return std::format("Type mismatch: '{}' outputs {} but '{}' expects {}",
                       sourceNode.name, portTypeToString(mismatch.sourceType),
                       targetNode.name, portTypeToString(mismatch.targetType));
}

}  // namespace flowgraph
