#include "flowgraph/validation/WorkflowValidator.h"
#include "flowgraph/connectivity/ConnectivityValidator.h"
#include "flowgraph/common/Logger.h"

#include <algorithm>
#include <format>
#include <string_view>
#include <unordered_set>

namespace flowgraph {

namespace {

enum class RequiredKind {
    Text,     ///< Non-empty string
    Positive  ///< Number greater than zero
};

struct RequiredField {
    std::string_view nodeType;
    std::string_view key;
    RequiredKind kind;
    ValidationSeverity severity;
    std::string_view message;
};

// Node types absent here (run, compensate) need no configuration
constexpr RequiredField REQUIRED_FIELDS[] = {
    {"http-handler", "path", RequiredKind::Text, ValidationSeverity::Error, "HTTP Handler requires a path"},
    {"kafka-handler", "topic", RequiredKind::Text, ValidationSeverity::Error, "Kafka Handler requires a topic"},
    {"cron-trigger", "schedule", RequiredKind::Text, ValidationSeverity::Error, "Cron Trigger requires a schedule"},
    {"workflow-submit", "workflow_name", RequiredKind::Text, ValidationSeverity::Error, "Workflow Submit requires a workflow name"},
    {"service-call", "service", RequiredKind::Text, ValidationSeverity::Error, "Service Call requires a service name"},
    {"object-call", "object_name", RequiredKind::Text, ValidationSeverity::Error, "Object Call requires an object name"},
    {"workflow-call", "workflow_name", RequiredKind::Text, ValidationSeverity::Error, "Workflow Call requires a workflow name"},
    {"send-message", "target", RequiredKind::Text, ValidationSeverity::Error, "Send Message requires a target"},
    {"delayed-send", "target", RequiredKind::Text, ValidationSeverity::Error, "Delayed Send requires a target"},
    {"delayed-send", "delay_ms", RequiredKind::Positive, ValidationSeverity::Warning, "Delayed Send should have a non-zero delay"},
    {"get-state", "key", RequiredKind::Text, ValidationSeverity::Error, "Get State requires a key"},
    {"set-state", "key", RequiredKind::Text, ValidationSeverity::Error, "Set State requires a key"},
    {"clear-state", "key", RequiredKind::Text, ValidationSeverity::Error, "Clear State requires a key"},
    {"condition", "expression", RequiredKind::Text, ValidationSeverity::Error, "Condition requires an expression"},
    {"switch", "expression", RequiredKind::Text, ValidationSeverity::Error, "Switch requires an expression"},
    {"loop", "iterator", RequiredKind::Text, ValidationSeverity::Warning, "Loop should have an iterator expression"},
    {"parallel", "branches", RequiredKind::Positive, ValidationSeverity::Warning, "Parallel should have at least one branch"},
    {"sleep", "duration_ms", RequiredKind::Positive, ValidationSeverity::Warning, "Sleep should have a non-zero duration"},
    {"timeout", "timeout_ms", RequiredKind::Positive, ValidationSeverity::Warning, "Timeout should have a non-zero duration"},
    {"durable-promise", "promise_name", RequiredKind::Text, ValidationSeverity::Error, "Durable Promise requires a promise name"},
    {"awakeable", "awakeable_id", RequiredKind::Text, ValidationSeverity::Error, "Awakeable requires an awakeable ID"},
    {"resolve-promise", "promise_name", RequiredKind::Text, ValidationSeverity::Error, "Resolve Promise requires a promise name"},
    {"signal-handler", "signal_name", RequiredKind::Text, ValidationSeverity::Error, "Signal Handler requires a signal name"},
};

bool isSatisfied(const nlohmann::json& config, const RequiredField& field) {
    if (!config.is_object()) {
        return false;
    }
    auto it = config.find(std::string(field.key));
    if (it == config.end()) {
        return false;
    }
    switch (field.kind) {
        case RequiredKind::Text:
            return it->is_string() && !it->get<std::string>().empty();
        case RequiredKind::Positive:
            return it->is_number() && it->get<double>() > 0.0;
    }
    return false;
}

bool isEntry(const Node& node) {
    return node.category == NodeCategory::Entry;
}

}  // namespace

const char* validationSeverityToString(ValidationSeverity severity) {
    switch (severity) {
        case ValidationSeverity::Error: return "error";
        case ValidationSeverity::Warning: return "warning";
    }
    return "unknown";
}

size_t ValidationResult::errorCount() const {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
        [](const ValidationIssue& i) { return i.severity == ValidationSeverity::Error; }));
}

size_t ValidationResult::warningCount() const {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
        [](const ValidationIssue& i) { return i.severity == ValidationSeverity::Warning; }));
}

std::vector<ValidationIssue> ValidationResult::issuesFor(NodeId id) const {
    std::vector<ValidationIssue> result;
    for (const auto& issue : issues) {
        if (issue.nodeId && *issue.nodeId == id) {
            result.push_back(issue);
        }
    }
    return result;
}

ValidationResult WorkflowValidator::validate(const Workflow& workflow) const {
    ValidationResult result;

    if (workflow.nodeCount() == 0) {
        result.issues.push_back(ValidationIssue::error("Workflow has no nodes"));
        return result;
    }

    checkEntryPoints(workflow, result);
    checkReachability(workflow, result);
    checkOrphans(workflow, result);
    checkNodeTypes(workflow, result);
    checkCycles(workflow, result);

    LOG_DEBUG("Validated workflow: {} errors, {} warnings",
              result.errorCount(), result.warningCount());
    return result;
}

void WorkflowValidator::checkEntryPoints(const Workflow& workflow, ValidationResult& result) const {
    const auto& nodes = workflow.nodes();
    if (std::none_of(nodes.begin(), nodes.end(), isEntry)) {
        result.issues.push_back(ValidationIssue::error(
            "Workflow has no entry point (e.g., HTTP Handler, Kafka Handler)"));
    }
}

void WorkflowValidator::checkReachability(const Workflow& workflow, ValidationResult& result) const {
    if (workflow.connectionCount() == 0) {
        return;
    }

    std::vector<NodeId> stack;
    for (const Node& node : workflow.nodes()) {
        if (isEntry(node)) {
            stack.push_back(node.id);
        }
    }
    if (stack.empty()) {
        return;
    }

    std::unordered_set<NodeId> reachable;
    while (!stack.empty()) {
        NodeId current = stack.back();
        stack.pop_back();
        if (!reachable.insert(current).second) {
            continue;
        }
        for (NodeId next : workflow.successors(current)) {
            if (reachable.count(next) == 0) {
                stack.push_back(next);
            }
        }
    }

    for (const Node& node : workflow.nodes()) {
        if (isEntry(node) || reachable.count(node.id) > 0) {
            continue;
        }
        // Nodes fed by other unreachable nodes are reported at the head of their chain
        if (workflow.predecessors(node.id).empty()) {
            result.issues.push_back(ValidationIssue::warning(
                std::format("Node '{}' is not reachable from any entry point", node.name),
                node.id));
        }
    }
}

void WorkflowValidator::checkOrphans(const Workflow& workflow, ValidationResult& result) const {
    if (workflow.nodeCount() < 2) {
        return;
    }

    for (const Node& node : workflow.nodes()) {
        if (isEntry(node)) {
            continue;
        }
        bool hasIncoming = !workflow.predecessors(node.id).empty();
        bool hasOutgoing = !workflow.successors(node.id).empty();

        if (!hasIncoming && !hasOutgoing) {
            result.issues.push_back(ValidationIssue::warning(
                std::format("Node '{}' is not connected to anything", node.name), node.id));
        } else if (!hasIncoming) {
            result.issues.push_back(ValidationIssue::warning(
                std::format("Node '{}' has no incoming connections", node.name), node.id));
        }
    }
}

void WorkflowValidator::checkNodeTypes(const Workflow& workflow, ValidationResult& result) const {
    for (const Node& node : workflow.nodes()) {
        if (!NodeCatalog::isKnown(node.nodeType)) {
            result.issues.push_back(ValidationIssue::error(
                std::format("Unknown node type: {}", node.nodeType), node.id));
            continue;
        }
        checkRequiredConfig(node, result);
    }
}

void WorkflowValidator::checkRequiredConfig(const Node& node, ValidationResult& result) const {
    for (const RequiredField& field : REQUIRED_FIELDS) {
        if (field.nodeType != node.nodeType || isSatisfied(node.config, field)) {
            continue;
        }
        result.issues.push_back({field.severity, std::string(field.message), node.id});
    }
}

void WorkflowValidator::checkCycles(const Workflow& workflow, ValidationResult& result) const {
    for (const Connection& conn : workflow.connections()) {
        if (ConnectivityValidator::pathExists(workflow, conn.target, conn.source)) {
            result.issues.push_back(ValidationIssue::error(
                std::format("Connection from '{}' to '{}' is part of a cycle",
                            workflow.getNode(conn.source).name,
                            workflow.getNode(conn.target).name),
                conn.source));
        }
    }
}

}  // namespace flowgraph
