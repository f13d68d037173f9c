#include <gtest/gtest.h>
#include <flowgraph/flowgraph.h>
#include <flowgraph/common/Logger.h>

#include <cmath>
#include <vector>

using namespace flowgraph;

// ============================================================================
// DagLayoutTest - layered top-to-bottom layout of workflows
// ============================================================================

class DagLayoutTest : public ::testing::Test {
protected:
    NodeId add(const char* type = "run") {
        // Stack new nodes far apart so overlap avoidance never shifts them
        float offset = static_cast<float>(workflow_.nodeCount()) * 500.0f;
        return workflow_.addNode(type, offset, offset);
    }

    void connect(NodeId a, NodeId b) {
        ASSERT_TRUE(validator_.addConnection(
            workflow_, a, b, PortName::defaultOutput(), PortName::defaultInput()));
    }

    Point pos(NodeId id) const { return workflow_.getNode(id).position(); }

    Workflow workflow_;
    ConnectivityValidator validator_;
    DagLayout layout_;
};

// --- Basic Layout ---

TEST_F(DagLayoutTest, EmptyWorkflow_ReportsEmptyGraph) {
    EXPECT_EQ(layout_.apply(workflow_), LayoutStatus::EmptyGraph);
    EXPECT_EQ(layout_.lastStats().layerCount, 0);
}

TEST_F(DagLayoutTest, SingleNode_MovesToPaddingOrigin) {
    NodeId n = workflow_.addNode("http-handler", 731.0f, -42.0f);

    EXPECT_EQ(layout_.apply(workflow_), LayoutStatus::Applied);
    EXPECT_EQ(pos(n), (Point{120.0f, 80.0f}));
}

TEST_F(DagLayoutTest, Chain_AssignsSequentialLayers) {
    NodeId a = add("http-handler");
    NodeId b = add();
    NodeId c = add();
    connect(a, b);
    connect(b, c);

    ASSERT_EQ(layout_.apply(workflow_), LayoutStatus::Applied);

    const float layerStep = NODE_HEIGHT + 140.0f;
    EXPECT_EQ(pos(a), (Point{120.0f, 80.0f}));
    EXPECT_EQ(pos(b), (Point{120.0f, 80.0f + layerStep}));
    EXPECT_EQ(pos(c), (Point{120.0f, 80.0f + 2.0f * layerStep}));
    EXPECT_EQ(layout_.lastStats().layerCount, 3);
    EXPECT_EQ(layout_.lastStats().maxLayerWidth, 1);
}

TEST_F(DagLayoutTest, Diamond_CentersLayersOnWidest) {
    NodeId a = add("http-handler");
    NodeId b = add();
    NodeId c = add();
    NodeId d = add();
    connect(a, b);
    connect(a, c);
    connect(b, d);
    connect(c, d);

    ASSERT_EQ(layout_.apply(workflow_), LayoutStatus::Applied);

    // Layer 1 spans 0..500; layers 0 and 2 are shifted by (500 - 220) / 2
    EXPECT_FLOAT_EQ(pos(b).x, 120.0f);
    EXPECT_FLOAT_EQ(pos(c).x, 400.0f);
    EXPECT_FLOAT_EQ(pos(a).x, 260.0f);
    EXPECT_FLOAT_EQ(pos(d).x, 400.0f);
    EXPECT_FLOAT_EQ(pos(b).y, pos(c).y);

    EXPECT_EQ(layout_.lastStats().layerCount, 3);
    EXPECT_EQ(layout_.lastStats().maxLayerWidth, 2);
    EXPECT_EQ(layout_.lastStats().edgeCrossings, 0);
}

TEST_F(DagLayoutTest, LongestPath_PlacesNodeBelowDeepestParent) {
    NodeId a = add("http-handler");
    NodeId b = add();
    NodeId c = add();
    connect(a, b);
    connect(b, c);
    connect(a, c);

    ASSERT_EQ(layout_.apply(workflow_), LayoutStatus::Applied);
    EXPECT_GT(pos(c).y, pos(b).y);
    EXPECT_GT(pos(b).y, pos(a).y);
}

// --- Crossing Minimization ---

TEST_F(DagLayoutTest, BarycenterSweepRemovesCrossing) {
    NodeId a = add("http-handler");
    NodeId b = add("kafka-handler");
    NodeId c = add();
    NodeId d = add();
    connect(a, d);
    connect(b, c);

    ASSERT_EQ(layout_.apply(workflow_), LayoutStatus::Applied);
    EXPECT_LT(pos(d).x, pos(c).x);
    EXPECT_EQ(layout_.lastStats().edgeCrossings, 0);
}

TEST_F(DagLayoutTest, ZeroPassesKeepsTopologicalOrder) {
    NodeId a = add("http-handler");
    NodeId b = add("kafka-handler");
    NodeId c = add();
    NodeId d = add();
    connect(a, d);
    connect(b, c);

    LayoutOptions options;
    options.crossingPasses = 0;
    DagLayout layout(options);

    ASSERT_EQ(layout.apply(workflow_), LayoutStatus::Applied);
    EXPECT_LT(pos(c).x, pos(d).x);
    EXPECT_EQ(layout.lastStats().edgeCrossings, 1);
}

// --- Properties ---

TEST_F(DagLayoutTest, ApplyIsIdempotent) {
    NodeId a = add("http-handler");
    NodeId b = add();
    NodeId c = add();
    NodeId d = add("sleep");
    NodeId e = add("condition");
    connect(a, b);
    connect(a, c);
    connect(c, d);
    connect(b, e);
    connect(d, e);

    ASSERT_EQ(layout_.apply(workflow_), LayoutStatus::Applied);
    std::vector<Point> first;
    for (const Node& node : workflow_.nodes()) {
        first.push_back(node.position());
    }

    ASSERT_EQ(layout_.apply(workflow_), LayoutStatus::Applied);
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_NEAR(workflow_.nodes()[i].x, first[i].x, 1e-4f);
        EXPECT_NEAR(workflow_.nodes()[i].y, first[i].y, 1e-4f);
    }
}

TEST_F(DagLayoutTest, PositionsStayInsidePadding) {
    std::vector<NodeId> ids;
    ids.push_back(workflow_.addNode("http-handler", -5000.0f, -5000.0f));
    for (int i = 0; i < 8; ++i) {
        ids.push_back(workflow_.addNode("run", -1000.0f * static_cast<float>(i), 77.0f));
    }
    for (size_t i = 1; i < ids.size(); ++i) {
        connect(ids[(i - 1) / 2], ids[i]);
    }

    ASSERT_EQ(layout_.apply(workflow_), LayoutStatus::Applied);
    for (const Node& node : workflow_.nodes()) {
        EXPECT_GE(node.x, 100.0f);
        EXPECT_GE(node.y, 70.0f);
        EXPECT_TRUE(std::isfinite(node.x));
        EXPECT_TRUE(std::isfinite(node.y));
    }
}

TEST_F(DagLayoutTest, SiblingsKeepMinimumSpacing) {
    NodeId root = add("http-handler");
    std::vector<NodeId> children;
    for (int i = 0; i < 4; ++i) {
        children.push_back(add());
        connect(root, children.back());
    }

    ASSERT_EQ(layout_.apply(workflow_), LayoutStatus::Applied);
    for (size_t i = 1; i < children.size(); ++i) {
        EXPECT_GE(pos(children[i]).x - pos(children[i - 1]).x, NODE_WIDTH + 60.0f - 1e-3f);
    }
}

TEST_F(DagLayoutTest, DisconnectedComponentsAreStable) {
    NodeId a = add("http-handler");
    NodeId b = add();
    NodeId c = add("cron-trigger");
    NodeId d = add();
    NodeId lone = add("sleep");
    connect(a, b);
    connect(c, d);

    ASSERT_EQ(layout_.apply(workflow_), LayoutStatus::Applied);

    // Sources share layer 0 in insertion order; children follow their parents
    EXPECT_FLOAT_EQ(pos(a).y, pos(c).y);
    EXPECT_FLOAT_EQ(pos(a).y, pos(lone).y);
    EXPECT_LT(pos(a).x, pos(c).x);
    EXPECT_LT(pos(c).x, pos(lone).x);
    EXPECT_LT(pos(b).x, pos(d).x);
    EXPECT_GT(pos(b).y, pos(a).y);

    std::vector<Point> first;
    for (const Node& node : workflow_.nodes()) {
        first.push_back(node.position());
    }
    ASSERT_EQ(layout_.apply(workflow_), LayoutStatus::Applied);
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(workflow_.nodes()[i].position(), first[i]);
    }
}

TEST_F(DagLayoutTest, CustomSpacingAndPadding) {
    NodeId a = add("http-handler");
    NodeId b = add();
    connect(a, b);

    LayoutOptions options;
    options.layerSpacing = 32.0f;
    options.leftPadding = 10.0f;
    options.topPadding = 20.0f;
    DagLayout layout;
    layout.setOptions(options);

    ASSERT_EQ(layout.apply(workflow_), LayoutStatus::Applied);
    EXPECT_EQ(pos(a), (Point{10.0f, 20.0f}));
    EXPECT_EQ(pos(b), (Point{10.0f, 20.0f + NODE_HEIGHT + 32.0f}));
}

TEST_F(DagLayoutTest, WorkflowApplyLayoutUsesDagLayout) {
    NodeId a = add("http-handler");
    NodeId b = add();
    connect(a, b);

    EXPECT_EQ(workflow_.applyLayout(), LayoutStatus::Applied);
    EXPECT_EQ(pos(a), (Point{120.0f, 80.0f}));
}

// --- Cycles ---

TEST_F(DagLayoutTest, CyclicWorkflow_LeavesPositionsUntouched) {
    // Cycles cannot be drawn through the validator, only loaded from a file
    nlohmann::json doc = {
        {"nodes", {
            {{"id", 0}, {"node_type", "run"}, {"x", 11.0f}, {"y", 22.0f}},
            {{"id", 1}, {"node_type", "run"}, {"x", 333.0f}, {"y", 444.0f}}
        }},
        {"connections", {
            {{"id", 0}, {"source", 0}, {"target", 1}},
            {{"id", 1}, {"source", 1}, {"target", 0}}
        }}
    };
    Workflow cyclic = WorkflowSerializer::workflowFromJson(doc);

    Logger::enableCapture(true);
    Logger::clearCapturedLogs();

    EXPECT_EQ(layout_.apply(cyclic), LayoutStatus::CyclicGraph);
    EXPECT_EQ(cyclic.getNode(0).position(), (Point{11.0f, 22.0f}));
    EXPECT_EQ(cyclic.getNode(1).position(), (Point{333.0f, 444.0f}));
    EXPECT_FALSE(Logger::getCapturedLogs("[warn]").empty());

    Logger::enableCapture(false);
    Logger::clearCapturedLogs();
}

TEST(LayoutStatusTest, ToString) {
    EXPECT_STREQ(layoutStatusToString(LayoutStatus::Applied), "applied");
    EXPECT_STREQ(layoutStatusToString(LayoutStatus::EmptyGraph), "empty graph");
    EXPECT_STREQ(layoutStatusToString(LayoutStatus::CyclicGraph), "cyclic graph");
}
