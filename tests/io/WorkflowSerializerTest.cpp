#include <gtest/gtest.h>
#include <flowgraph/io/WorkflowSerializer.h>
#include <flowgraph/connectivity/ConnectivityValidator.h>
#include <flowgraph/common/Logger.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace flowgraph;

class WorkflowSerializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        entry_ = workflow_.addNode("http-handler", 0.0f, 0.0f);
        step_ = workflow_.addNode("service-call", 120.0f, 300.0f);

        ConnectivityValidator validator;
        ASSERT_TRUE(validator.addConnection(workflow_, entry_, step_,
                                            PortName::defaultOutput(), PortName("request")));

        workflow_.setNodeConfig(entry_, {{"path", "/orders"}, {"method", "POST"}});
        NodeRunState state;
        state.skipped = true;
        state.error = "boom";
        state.lastOutput = nlohmann::json{{"ok", false}};
        workflow_.setNodeRunState(step_, state);
        workflow_.selectNode(step_);
        workflow_.setViewport(Viewport{-40.0f, 12.5f, 0.75f});
        workflow_.setExecutionQueue({entry_, step_}, 1);
    }

    std::string tempPath(const std::string& name) const {
        return (std::filesystem::temp_directory_path() / name).string();
    }

    Workflow workflow_;
    NodeId entry_ = INVALID_NODE;
    NodeId step_ = INVALID_NODE;
};

TEST_F(WorkflowSerializerTest, NodeFieldNames) {
    nlohmann::json j = WorkflowSerializer::toJson(workflow_.getNode(entry_));

    EXPECT_EQ(j["id"], entry_);
    EXPECT_EQ(j["name"], "http-handler 1");
    EXPECT_EQ(j["description"], "HTTP Handler");
    EXPECT_EQ(j["node_type"], "http-handler");
    EXPECT_EQ(j["category"], "entry");
    EXPECT_EQ(j["icon"], "globe");
    EXPECT_EQ(j["config"]["path"], "/orders");
    EXPECT_TRUE(j["last_output"].is_null());
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_EQ(j["selected"], false);
}

TEST_F(WorkflowSerializerTest, ConnectionAndViewportFieldNames) {
    nlohmann::json conn = WorkflowSerializer::toJson(workflow_.connections().front());
    EXPECT_EQ(conn["source"], entry_);
    EXPECT_EQ(conn["target"], step_);
    EXPECT_EQ(conn["source_port"], "out");
    EXPECT_EQ(conn["target_port"], "request");

    nlohmann::json vp = WorkflowSerializer::toJson(workflow_.viewport());
    EXPECT_FLOAT_EQ(vp["x"].get<float>(), -40.0f);
    EXPECT_FLOAT_EQ(vp["zoom"].get<float>(), 0.75f);
}

TEST_F(WorkflowSerializerTest, PopulatedWorkflowSurvivesReload) {
    std::string text = WorkflowSerializer::toString(workflow_);
    Workflow loaded = WorkflowSerializer::workflowFromString(text);

    EXPECT_EQ(loaded.state(), workflow_.state());
    EXPECT_FALSE(loaded.canUndo());

    const Node& step = loaded.getNode(step_);
    EXPECT_TRUE(step.skipped);
    EXPECT_TRUE(step.selected);
    ASSERT_TRUE(step.error.has_value());
    EXPECT_EQ(*step.error, "boom");
    EXPECT_EQ(loaded.currentStep(), 1u);
}

TEST_F(WorkflowSerializerTest, LoadedWorkflowContinuesIds) {
    Workflow loaded = WorkflowSerializer::workflowFromJson(WorkflowSerializer::toJson(workflow_));

    NodeId added = loaded.addNode("sleep", 900.0f, 900.0f);
    EXPECT_GT(added, step_);
    EXPECT_GT(added, entry_);

    ConnectivityValidator validator;
    auto outcome = validator.addConnectionChecked(loaded, step_, added,
                                                  PortName::defaultOutput(), PortName::defaultInput());
    ASSERT_TRUE(outcome.ok());
    EXPECT_NE(outcome.value().connectionId, workflow_.connections().front().id);
}

TEST_F(WorkflowSerializerTest, MissingOptionalFieldsUseDefaults) {
    nlohmann::json doc;
    doc["nodes"] = nlohmann::json::array({
        {{"id", 3}, {"node_type", "cron-trigger"}, {"x", 10}, {"y", 20}}
    });

    Workflow loaded = WorkflowSerializer::workflowFromJson(doc);

    const Node& node = loaded.getNode(3);
    EXPECT_EQ(node.category, NodeCategory::Entry);
    EXPECT_EQ(node.icon, "clock");
    EXPECT_EQ(node.name, "cron-trigger");
    EXPECT_TRUE(node.config.is_object());
    EXPECT_EQ(loaded.viewport(), Viewport{});
    EXPECT_EQ(loaded.connectionCount(), 0u);
}

TEST_F(WorkflowSerializerTest, MalformedInputThrows) {
    EXPECT_THROW(WorkflowSerializer::workflowFromString("{ not json"), std::runtime_error);
    EXPECT_THROW(WorkflowSerializer::workflowFromString("[1, 2, 3]"), std::runtime_error);
    EXPECT_THROW(WorkflowSerializer::workflowFromString(R"({"nodes": [{"id": "zero"}]})"),
                 std::runtime_error);
}

namespace {

nlohmann::json twoNodeDocument(nlohmann::json connections) {
    return {
        {"nodes", nlohmann::json::array({
            {{"id", 3}, {"node_type", "run"}, {"x", 0.0f}, {"y", 0.0f}},
            {{"id", 7}, {"node_type", "run"}, {"x", 300.0f}, {"y", 0.0f}}
        })},
        {"connections", std::move(connections)}
    };
}

}  // namespace

TEST_F(WorkflowSerializerTest, DuplicateNodeIdsThrow) {
    nlohmann::json doc = {
        {"nodes", nlohmann::json::array({
            {{"id", 3}, {"node_type", "run"}, {"x", 0.0f}, {"y", 0.0f}},
            {{"id", 3}, {"node_type", "sleep"}, {"x", 300.0f}, {"y", 0.0f}}
        })}
    };
    EXPECT_THROW(WorkflowSerializer::workflowFromJson(doc), std::runtime_error);
}

TEST_F(WorkflowSerializerTest, InvalidIdsThrow) {
    nlohmann::json badNode = {
        {"nodes", nlohmann::json::array({
            {{"id", INVALID_NODE}, {"node_type", "run"}, {"x", 0.0f}, {"y", 0.0f}}
        })}
    };
    EXPECT_THROW(WorkflowSerializer::workflowFromJson(badNode), std::runtime_error);

    nlohmann::json badConnection = twoNodeDocument(nlohmann::json::array({
        {{"id", INVALID_CONNECTION}, {"source", 3}, {"target", 7}}
    }));
    EXPECT_THROW(WorkflowSerializer::workflowFromJson(badConnection), std::runtime_error);
}

TEST_F(WorkflowSerializerTest, DuplicateConnectionIdsThrow) {
    nlohmann::json doc = twoNodeDocument(nlohmann::json::array({
        {{"id", 0}, {"source", 3}, {"target", 7}, {"source_port", "out"}},
        {{"id", 0}, {"source", 3}, {"target", 7}, {"source_port", "error"}}
    }));
    EXPECT_THROW(WorkflowSerializer::workflowFromJson(doc), std::runtime_error);
}

TEST_F(WorkflowSerializerTest, SelfConnectionThrows) {
    nlohmann::json doc = twoNodeDocument(nlohmann::json::array({
        {{"id", 0}, {"source", 3}, {"target", 3}}
    }));
    EXPECT_THROW(WorkflowSerializer::workflowFromJson(doc), std::runtime_error);
}

TEST_F(WorkflowSerializerTest, DuplicateConnectionThrows) {
    nlohmann::json doc = twoNodeDocument(nlohmann::json::array({
        {{"id", 0}, {"source", 3}, {"target", 7}},
        {{"id", 1}, {"source", 3}, {"target", 7}}
    }));
    EXPECT_THROW(WorkflowSerializer::workflowFromJson(doc), std::runtime_error);
}

TEST_F(WorkflowSerializerTest, DistinctPortsAreNotDuplicates) {
    nlohmann::json doc = twoNodeDocument(nlohmann::json::array({
        {{"id", 0}, {"source", 3}, {"target", 7}, {"source_port", "out"}},
        {{"id", 1}, {"source", 3}, {"target", 7}, {"source_port", "error"}}
    }));
    Workflow loaded = WorkflowSerializer::workflowFromJson(doc);
    EXPECT_EQ(loaded.connectionCount(), 2u);
}

TEST_F(WorkflowSerializerTest, DanglingConnectionThrows) {
    nlohmann::json doc = twoNodeDocument(nlohmann::json::array({
        {{"id", 0}, {"source", 3}, {"target", 42}}
    }));
    EXPECT_THROW(WorkflowSerializer::workflowFromJson(doc), std::runtime_error);
}

TEST_F(WorkflowSerializerTest, CyclicWorkflowLoadsWithWarning) {
    nlohmann::json doc = twoNodeDocument(nlohmann::json::array({
        {{"id", 0}, {"source", 3}, {"target", 7}},
        {{"id", 1}, {"source", 7}, {"target", 3}}
    }));

    Logger::enableCapture(true);
    Logger::clearCapturedLogs();

    Workflow loaded = WorkflowSerializer::workflowFromJson(doc);
    EXPECT_EQ(loaded.connectionCount(), 2u);
    EXPECT_FALSE(Logger::getCapturedLogs("cycle").empty());

    Logger::enableCapture(false);
    Logger::clearCapturedLogs();
}

TEST_F(WorkflowSerializerTest, InvalidDocumentFailsFileLoad) {
    std::string path = tempPath("flowgraph_serializer_duplicate_ids.json");
    {
        std::ofstream out(path);
        out << R"({"nodes": [{"id": 1, "node_type": "run", "x": 0, "y": 0},
                             {"id": 1, "node_type": "run", "x": 50, "y": 0}]})";
    }
    EXPECT_FALSE(WorkflowSerializer::loadFromFile(path).has_value());
    std::remove(path.c_str());
}

TEST_F(WorkflowSerializerTest, SaveAndLoadFile) {
    std::string path = tempPath("flowgraph_serializer_test.json");

    ASSERT_TRUE(WorkflowSerializer::saveToFile(workflow_, path));
    auto loaded = WorkflowSerializer::loadFromFile(path);
    std::remove(path.c_str());

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->state(), workflow_.state());
}

TEST_F(WorkflowSerializerTest, LoadFromFileFailures) {
    EXPECT_FALSE(WorkflowSerializer::loadFromFile(tempPath("flowgraph_missing_file.json")).has_value());

    std::string path = tempPath("flowgraph_broken.json");
    {
        std::ofstream out(path);
        out << "{\"nodes\": [";
    }
    EXPECT_FALSE(WorkflowSerializer::loadFromFile(path).has_value());
    std::remove(path.c_str());
}

// --- Layout options ---

TEST(LayoutOptionsJsonTest, PartialDocumentKeepsDefaults) {
    nlohmann::json j = {{"node_spacing", 25.0}, {"crossing_passes", 2}};
    LayoutOptions options = WorkflowSerializer::layoutOptionsFromJson(j);

    EXPECT_FLOAT_EQ(options.nodeSpacing, 25.0f);
    EXPECT_EQ(options.crossingPasses, 2);
    EXPECT_FLOAT_EQ(options.layerSpacing, LayoutOptions{}.layerSpacing);
    EXPECT_FLOAT_EQ(options.leftPadding, LayoutOptions{}.leftPadding);
}

TEST(LayoutOptionsJsonTest, WrittenOptionsReadBack) {
    LayoutOptions options;
    options.layerSpacing = 90.0f;
    options.topPadding = 5.0f;

    LayoutOptions read = WorkflowSerializer::layoutOptionsFromJson(
        WorkflowSerializer::layoutOptionsToJson(options));
    EXPECT_FLOAT_EQ(read.layerSpacing, 90.0f);
    EXPECT_FLOAT_EQ(read.topPadding, 5.0f);
}

TEST(LayoutOptionsJsonTest, MistypedFieldThrows) {
    nlohmann::json j = {{"layer_spacing", "wide"}};
    EXPECT_THROW(WorkflowSerializer::layoutOptionsFromJson(j), std::runtime_error);
}
