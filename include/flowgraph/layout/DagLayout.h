#pragma once

#include "ILayout.h"
#include "LayoutOptions.h"

namespace flowgraph {

/// Layered top-to-bottom layout for acyclic workflows
///
/// Phases:
/// 1. Graph construction - vertices in workflow insertion order, one edge per connection
/// 2. Topological sort - aborts (positions untouched) on a cycle
/// 3. Layer assignment - longest path from the sources
/// 4. Crossing minimization - fixed number of downward barycenter sweeps
/// 5. Coordinate assignment - parent-aligned x, per-layer centering, padding normalization
///
/// The result only depends on topology and insertion order, so applying the
/// layout twice yields the same positions.
class DagLayout : public ILayout {
public:
    DagLayout() = default;
    explicit DagLayout(const LayoutOptions& options) : options_(options) {}

    void setOptions(const LayoutOptions& options) override { options_ = options; }
    const LayoutOptions& options() const override { return options_; }

    LayoutStatus apply(Workflow& workflow) override;

    /// Statistics of the last successful apply()
    struct LayoutStats {
        int layerCount = 0;
        int maxLayerWidth = 0;  ///< Node count of the widest layer
        int edgeCrossings = 0;  ///< Crossings between adjacent layers after minimization
    };
    const LayoutStats& lastStats() const { return stats_; }

private:
    LayoutOptions options_;
    LayoutStats stats_;
};

}  // namespace flowgraph
