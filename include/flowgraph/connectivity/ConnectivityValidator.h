#pragma once

#include "ConnectionResult.h"
#include "flowgraph/core/Workflow.h"

#include <functional>
#include <optional>
#include <string_view>

namespace flowgraph {

/// Resolves the declared port types of a node type; std::nullopt when unknown
using PortTypeResolver = std::function<std::optional<NodePortTypes>(std::string_view nodeType)>;

/// The only way to create connections in a Workflow.
///
/// Checks run in order and the first failure wins:
/// 1. self connection
/// 2. unknown endpoint
/// 3. cycle (iterative DFS from target looking for source)
/// 4. duplicate (source, target, sourcePort, targetPort)
/// 5. port types (advisory on the checked path, fatal on the strict path)
class ConnectivityValidator {
public:
    /// Uses NodeCatalog::portTypes for port type resolution
    ConnectivityValidator();
    explicit ConnectivityValidator(PortTypeResolver resolver);

    /// Lenient path: incompatible port types still create the connection and
    /// report ConnectionStatus::CreatedWithTypeWarning.
    ConnectionOutcome addConnectionChecked(Workflow& workflow,
                                           NodeId source, NodeId target,
                                           const PortName& sourcePort,
                                           const PortName& targetPort) const;

    /// Strict path: incompatible port types fail with ConnectionError::TypeMismatch.
    ConnectionOutcome addConnectionStrict(Workflow& workflow,
                                          NodeId source, NodeId target,
                                          const PortName& sourcePort,
                                          const PortName& targetPort) const;

    /// Success signal only; both success variants map to true
    bool addConnection(Workflow& workflow,
                       NodeId source, NodeId target,
                       const PortName& sourcePort,
                       const PortName& targetPort) const;

    /// Run every check without inserting anything (e.g. hover feedback while dragging a wire)
    std::optional<ConnectionError> canConnect(const Workflow& workflow,
                                              NodeId source, NodeId target,
                                              const PortName& sourcePort,
                                              const PortName& targetPort) const;

    /// Port type conflict between source output and target input, if both resolve
    std::optional<TypeMismatch> checkPortTypes(const Workflow& workflow,
                                               NodeId source, NodeId target) const;

    /// True when a directed path from -> to exists along current connections
    static bool pathExists(const Workflow& workflow, NodeId from, NodeId to);

    /// True when adding source -> target would close a cycle
    static bool wouldCreateCycle(const Workflow& workflow, NodeId source, NodeId target);

private:
    enum class TypePolicy { Warn, Reject };

    ConnectionOutcome connect(Workflow& workflow,
                              NodeId source, NodeId target,
                              const PortName& sourcePort,
                              const PortName& targetPort,
                              TypePolicy policy) const;

    std::optional<ConnectionError> structuralCheck(const Workflow& workflow,
                                                   NodeId source, NodeId target,
                                                   const PortName& sourcePort,
                                                   const PortName& targetPort) const;

    static std::string describeMismatch(const Workflow& workflow,
                                        NodeId source, NodeId target,
                                        const TypeMismatch& mismatch);

    PortTypeResolver resolver_;
};

}  // namespace flowgraph
