#pragma once

/// @file flowgraph.h
/// @brief Main header for the flowgraph workflow-editor core
///
/// flowgraph holds the graph model of a durable-execution workflow editor:
/// nodes and connections with undo/redo, a connectivity gate that keeps the
/// graph acyclic, a layered auto-layout and the viewport math of the canvas.
///
/// Example usage:
/// @code
/// #include <flowgraph/flowgraph.h>
///
/// flowgraph::Workflow workflow;
/// auto entry = workflow.addNode("http-handler", 0.0f, 0.0f);
/// auto step = workflow.addNode("run", 0.0f, 200.0f);
///
/// flowgraph::ConnectivityValidator validator;
/// validator.addConnectionChecked(workflow, entry, step,
///                                flowgraph::PortName::defaultOutput(),
///                                flowgraph::PortName::defaultInput());
///
/// workflow.applyLayout();
/// workflow.fitView(1280.0f, 720.0f, 40.0f);
/// @endcode

#include <string>

// Core module - Workflow model and geometry
#include "core/Types.h"
#include "core/NodeCatalog.h"
#include "core/WorkflowHistory.h"
#include "core/Workflow.h"
#include "core/GeometryUtils.h"

// Connectivity module - Edge creation gate
#include "connectivity/ConnectionResult.h"
#include "connectivity/ConnectivityValidator.h"

// Layout module
#include "layout/LayoutOptions.h"
#include "layout/ILayout.h"
#include "layout/DagLayout.h"

// Validation and I/O
#include "validation/WorkflowValidator.h"
#include "io/WorkflowSerializer.h"

namespace flowgraph {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace flowgraph
