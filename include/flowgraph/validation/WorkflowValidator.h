#pragma once

#include "flowgraph/core/Workflow.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace flowgraph {

enum class ValidationSeverity {
    Error,
    Warning
};

const char* validationSeverityToString(ValidationSeverity severity);

struct ValidationIssue {
    ValidationSeverity severity = ValidationSeverity::Error;
    std::string message;
    std::optional<NodeId> nodeId;  ///< Offending node, if the issue is node-specific

    static ValidationIssue error(std::string message, std::optional<NodeId> nodeId = std::nullopt) {
        return {ValidationSeverity::Error, std::move(message), nodeId};
    }
    static ValidationIssue warning(std::string message, std::optional<NodeId> nodeId = std::nullopt) {
        return {ValidationSeverity::Warning, std::move(message), nodeId};
    }
};

struct ValidationResult {
    std::vector<ValidationIssue> issues;

    bool hasErrors() const { return errorCount() > 0; }
    bool hasWarnings() const { return warningCount() > 0; }
    size_t errorCount() const;
    size_t warningCount() const;

    /// True when no issue has Error severity; warnings are allowed
    bool isValid() const { return !hasErrors(); }

    /// Issues attached to one node
    std::vector<ValidationIssue> issuesFor(NodeId id) const;
};

/**
 * @brief Pre-deployment checks over a whole workflow.
 *
 * Unlike ConnectivityValidator, which guards single edits, this inspects a
 * finished graph: entry points, reachability, orphans, node types, required
 * node configuration and cycles. Cycles can only arrive through a loaded
 * document; every connection on one is reported.
 */
class WorkflowValidator {
public:
    ValidationResult validate(const Workflow& workflow) const;

private:
    void checkEntryPoints(const Workflow& workflow, ValidationResult& result) const;
    void checkReachability(const Workflow& workflow, ValidationResult& result) const;
    void checkOrphans(const Workflow& workflow, ValidationResult& result) const;
    void checkNodeTypes(const Workflow& workflow, ValidationResult& result) const;
    void checkRequiredConfig(const Node& node, ValidationResult& result) const;
    void checkCycles(const Workflow& workflow, ValidationResult& result) const;
};

}  // namespace flowgraph
