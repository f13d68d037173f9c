#include "flowgraph/core/NodeCatalog.h"

#include <algorithm>

namespace flowgraph {

namespace {

using C = NodeCategory;
using P = PortType;

const std::vector<NodeTypeInfo>& catalogTable() {
    static const std::vector<NodeTypeInfo> table = {
        // Entry points
        {"http-handler",    C::Entry,   "globe",        "HTTP Handler",     {P::None, P::Request}},
        {"kafka-handler",   C::Entry,   "kafka",        "Kafka Consumer",   {P::None, P::Event}},
        {"cron-trigger",    C::Entry,   "clock",        "Cron Trigger",     {P::None, P::Event}},
        {"workflow-submit", C::Entry,   "play-circle",  "Workflow Submit",  {P::None, P::Request}},
        // Durable steps and calls
        {"run",             C::Durable, "shield",       "Durable Step",     {P::Any, P::Value}},
        {"service-call",    C::Durable, "arrow-right",  "Service Call",     {P::Any, P::Value}},
        {"object-call",     C::Durable, "box",          "Object Call",      {P::Any, P::Value}},
        {"workflow-call",   C::Durable, "workflow",     "Workflow Call",    {P::Any, P::Value}},
        {"send-message",    C::Durable, "send",         "Send Message",     {P::Any, P::Any}},
        {"delayed-send",    C::Durable, "clock-send",   "Delayed Message",  {P::Any, P::Any}},
        // State
        {"get-state",       C::State,   "download",     "Get State",        {P::Any, P::State}},
        {"set-state",       C::State,   "upload",       "Set State",        {P::Any, P::Any}},
        {"clear-state",     C::State,   "eraser",       "Clear State",      {P::Any, P::Any}},
        // Control flow
        {"condition",       C::Flow,    "git-branch",   "If / Else",        {P::Any, P::Any}},
        {"switch",          C::Flow,    "git-fork",     "Switch",           {P::Any, P::Any}},
        {"loop",            C::Flow,    "repeat",       "Loop / Iterate",   {P::Any, P::Any}},
        {"parallel",        C::Flow,    "layers",       "Parallel",         {P::Any, P::Any}},
        {"compensate",      C::Flow,    "undo",         "Compensate",       {P::Any, P::Any}},
        // Timing
        {"sleep",           C::Timing,  "timer",        "Sleep / Timer",    {P::Any, P::Any}},
        {"timeout",         C::Timing,  "alarm",        "Timeout",          {P::Any, P::Any}},
        // Signals
        {"durable-promise", C::Signal,  "sparkles",     "Durable Promise",  {P::Any, P::Signal}},
        {"awakeable",       C::Signal,  "bell",         "Awakeable",        {P::Any, P::Signal}},
        {"resolve-promise", C::Signal,  "check-circle", "Resolve Promise",  {P::Signal, P::Any}},
        {"signal-handler",  C::Signal,  "radio",        "Signal Handler",   {P::Signal, P::Signal}},
    };
    return table;
}

const NodeTypeInfo* find(std::string_view type) {
    const auto& table = catalogTable();
    auto it = std::find_if(table.begin(), table.end(),
                           [type](const NodeTypeInfo& info) { return info.type == type; });
    return it != table.end() ? &*it : nullptr;
}

}  // namespace

const std::vector<NodeTypeInfo>& NodeCatalog::all() {
    return catalogTable();
}

const NodeTypeInfo& NodeCatalog::lookup(std::string_view type) {
    const NodeTypeInfo* info = find(type);
    return info ? *info : unknownNodeType();
}

const NodeTypeInfo& NodeCatalog::unknownNodeType() {
    static const NodeTypeInfo unknown{"", C::Durable, "help-circle", "Unknown Node", {P::Any, P::Any}};
    return unknown;
}

bool NodeCatalog::isKnown(std::string_view type) {
    return find(type) != nullptr;
}

std::optional<NodePortTypes> NodeCatalog::portTypes(std::string_view type) {
    const NodeTypeInfo* info = find(type);
    if (!info) {
        return std::nullopt;
    }
    return info->ports;
}

bool NodeCatalog::arePortTypesCompatible(PortType output, PortType input) {
    if (output == PortType::None || input == PortType::None) {
        return false;
    }
    return output == input || output == PortType::Any || input == PortType::Any;
}

const char* nodeCategoryToString(NodeCategory category) {
    switch (category) {
        case NodeCategory::Entry: return "entry";
        case NodeCategory::Durable: return "durable";
        case NodeCategory::State: return "state";
        case NodeCategory::Flow: return "flow";
        case NodeCategory::Timing: return "timing";
        case NodeCategory::Signal: return "signal";
    }
    return "durable";
}

std::optional<NodeCategory> nodeCategoryFromString(std::string_view text) {
    if (text == "entry") return NodeCategory::Entry;
    if (text == "durable") return NodeCategory::Durable;
    if (text == "state") return NodeCategory::State;
    if (text == "flow") return NodeCategory::Flow;
    if (text == "timing") return NodeCategory::Timing;
    if (text == "signal") return NodeCategory::Signal;
    return std::nullopt;
}

const char* portTypeToString(PortType type) {
    switch (type) {
        case PortType::Any: return "any";
        case PortType::None: return "none";
        case PortType::Request: return "request";
        case PortType::Event: return "event";
        case PortType::Value: return "value";
        case PortType::State: return "state";
        case PortType::Signal: return "signal";
    }
    return "any";
}

}  // namespace flowgraph
