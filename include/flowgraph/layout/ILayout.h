#pragma once

#include "LayoutOptions.h"

namespace flowgraph {

class Workflow;

/// Abstract interface for auto-layout algorithms.
///
/// Implementations only write node positions; nodes, connections and the
/// viewport are left as they are.
class ILayout {
public:
    virtual ~ILayout() = default;

    virtual void setOptions(const LayoutOptions& options) = 0;
    virtual const LayoutOptions& options() const = 0;

    /// Compute and write new node positions
    virtual LayoutStatus apply(Workflow& workflow) = 0;
};

}  // namespace flowgraph
