#pragma once

#include "flowgraph/core/Workflow.h"
#include "flowgraph/layout/LayoutOptions.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace flowgraph {

/// JSON serialization and file I/O for workflows and layout options.
///
/// Field names are snake_case (node_type, last_output, source_port, ...).
/// Absent optionals are written as null.
class WorkflowSerializer {
public:
    // === Element serialization ===

    static nlohmann::json toJson(const Node& node);
    static nlohmann::json toJson(const Connection& connection);
    static nlohmann::json toJson(const Viewport& viewport);

    /// @throws nlohmann::json::exception on missing or mistyped fields
    static Node nodeFromJson(const nlohmann::json& j);
    static Connection connectionFromJson(const nlohmann::json& j);
    static Viewport viewportFromJson(const nlohmann::json& j);

    // === Workflow serialization ===

    /// Graph state only; undo history is not serialized
    static nlohmann::json toJson(const Workflow& workflow);

    /// Serialize to an indented JSON string
    static std::string toString(const Workflow& workflow);

    /// Build a workflow from parsed JSON. Id counters continue past the
    /// largest loaded ids and the undo history starts empty.
    /// A connection cycle is accepted with a logged warning.
    /// @throws std::runtime_error if the document is not a valid workflow:
    /// malformed fields, invalid or duplicate ids, self connections,
    /// duplicate connections or connections to missing nodes
    static Workflow workflowFromJson(const nlohmann::json& j);

    /// @throws std::runtime_error if parsing fails
    static Workflow workflowFromString(const std::string& text);

    /// Save workflow to file
    /// @return true if save succeeded
    static bool saveToFile(const Workflow& workflow, const std::string& path);

    /// Load workflow from file
    /// @return std::nullopt if the file cannot be read or parsed
    static std::optional<Workflow> loadFromFile(const std::string& path);

    // === Layout options ===

    static nlohmann::json layoutOptionsToJson(const LayoutOptions& options);

    /// Missing fields keep their defaults
    /// @throws std::runtime_error on mistyped fields
    static LayoutOptions layoutOptionsFromJson(const nlohmann::json& j);
};

}  // namespace flowgraph
