#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flowgraph {

/// Palette grouping of a node type
enum class NodeCategory {
    Entry,
    Durable,
    State,
    Flow,
    Timing,
    Signal
};

/// Payload kind flowing through a node's input or output port.
/// Used only for advisory connection warnings.
enum class PortType {
    Any,      ///< Accepts / produces anything
    None,     ///< Port does not exist (e.g. the input of an entry trigger)
    Request,  ///< Invocation request from an HTTP or workflow submission
    Event,    ///< Message from a broker or scheduler
    Value,    ///< Result of a durable step or call
    State,    ///< Value read from persisted state
    Signal    ///< Promise or awakeable completion
};

struct NodePortTypes {
    PortType input = PortType::Any;
    PortType output = PortType::Any;
};

/// Static description of one node type in the palette
struct NodeTypeInfo {
    std::string_view type;
    NodeCategory category = NodeCategory::Durable;
    std::string_view icon;
    std::string_view label;
    NodePortTypes ports;
};

/// Closed table of every node type the editor knows about.
/// Lookups never fail: unknown types resolve to unknownNodeType().
class NodeCatalog {
public:
    /// All known node types in palette order
    static const std::vector<NodeTypeInfo>& all();

    /// Metadata for a node type; unknownNodeType() when not in the table
    static const NodeTypeInfo& lookup(std::string_view type);

    /// The explicit fallback entry: Durable, "help-circle", "Unknown Node"
    static const NodeTypeInfo& unknownNodeType();

    static bool isKnown(std::string_view type);

    /// Declared port types of a node type, std::nullopt for unknown types
    static std::optional<NodePortTypes> portTypes(std::string_view type);

    /// An output may feed an input when the types are equal or either side is Any.
    /// A missing port (None) is never compatible.
    static bool arePortTypesCompatible(PortType output, PortType input);
};

const char* nodeCategoryToString(NodeCategory category);
std::optional<NodeCategory> nodeCategoryFromString(std::string_view text);

const char* portTypeToString(PortType type);

}  // namespace flowgraph
