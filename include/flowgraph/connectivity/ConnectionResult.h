#pragma once

#include "flowgraph/core/NodeCatalog.h"
#include "flowgraph/core/Types.h"

#include <optional>
#include <string>
#include <variant>

namespace flowgraph {

/// Reasons a connection request is refused
enum class ConnectionError {
    SelfConnection,    ///< source == target
    UnknownNode,       ///< An endpoint is not in the workflow
    WouldCreateCycle,  ///< target already reaches source
    Duplicate,         ///< Identical (source, target, ports) connection exists
    TypeMismatch       ///< Declared port types are incompatible (strict path only)
};

const char* connectionErrorToString(ConnectionError error);

enum class ConnectionStatus {
    Created,
    CreatedWithTypeWarning
};

/// Declared port types of the two endpoints when they do not match
struct TypeMismatch {
    PortType sourceType = PortType::Any;
    PortType targetType = PortType::Any;
};

/// Successful connection creation
struct ConnectionResult {
    ConnectionStatus status = ConnectionStatus::Created;
    ConnectionId connectionId = INVALID_CONNECTION;
    std::optional<std::string> warning;  ///< Set for CreatedWithTypeWarning
};

/// Either a ConnectionResult or a ConnectionError.
///
/// Usage pattern:
/// ```cpp
/// auto outcome = validator.addConnectionChecked(workflow, a, b, out, in);
/// if (!outcome) {
///     showToast(outcome.message());
/// } else if (outcome.value().warning) {
///     showWarning(*outcome.value().warning);
/// }
/// ```
class ConnectionOutcome {
public:
    static ConnectionOutcome success(ConnectionResult result) {
        return ConnectionOutcome(std::move(result));
    }

    static ConnectionOutcome failure(ConnectionError error,
                                     std::optional<TypeMismatch> mismatch = std::nullopt) {
        ConnectionOutcome outcome(error);
        outcome.mismatch_ = mismatch;
        return outcome;
    }

    bool ok() const { return std::holds_alternative<ConnectionResult>(data_); }
    explicit operator bool() const { return ok(); }

    /// @throws std::bad_variant_access when called on a failure
    const ConnectionResult& value() const { return std::get<ConnectionResult>(data_); }

    /// @throws std::bad_variant_access when called on a success
    ConnectionError error() const { return std::get<ConnectionError>(data_); }

    bool isError(ConnectionError e) const { return !ok() && error() == e; }

    /// Only set for ConnectionError::TypeMismatch
    const std::optional<TypeMismatch>& mismatch() const { return mismatch_; }

    /// Human readable summary for either variant
    std::string message() const;

private:
    explicit ConnectionOutcome(ConnectionResult result) : data_(std::move(result)) {}
    explicit ConnectionOutcome(ConnectionError error) : data_(error) {}

    std::variant<ConnectionResult, ConnectionError> data_;
    std::optional<TypeMismatch> mismatch_;
};

}  // namespace flowgraph
