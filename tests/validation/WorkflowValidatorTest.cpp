#include <gtest/gtest.h>
#include <flowgraph/validation/WorkflowValidator.h>
#include <flowgraph/connectivity/ConnectivityValidator.h>
#include <flowgraph/io/WorkflowSerializer.h>

#include <algorithm>
#include <string>

using namespace flowgraph;

class WorkflowValidatorTest : public ::testing::Test {
protected:
    NodeId addConfigured(const std::string& type, nlohmann::json config) {
        float offset = static_cast<float>(workflow_.nodeCount()) * 400.0f;
        NodeId id = workflow_.addNode(type, offset, 0.0f);
        workflow_.setNodeConfig(id, std::move(config));
        return id;
    }

    NodeId addEntry() { return addConfigured("http-handler", {{"path", "/orders"}}); }
    NodeId addStep() { return addConfigured("run", nlohmann::json::object()); }

    void connect(NodeId a, NodeId b) {
        ASSERT_TRUE(connectivity_.addConnection(
            workflow_, a, b, PortName::defaultOutput(), PortName::defaultInput()));
    }

    static bool contains(const ValidationResult& result, const std::string& text) {
        return std::any_of(result.issues.begin(), result.issues.end(),
            [&text](const ValidationIssue& i) { return i.message.find(text) != std::string::npos; });
    }

    Workflow workflow_;
    ConnectivityValidator connectivity_;
    WorkflowValidator validator_;
};

TEST_F(WorkflowValidatorTest, EmptyWorkflowHasSingleError) {
    auto result = validator_.validate(workflow_);

    EXPECT_FALSE(result.isValid());
    ASSERT_EQ(result.errorCount(), 1u);
    EXPECT_EQ(result.issues.size(), 1u);
    EXPECT_NE(result.issues[0].message.find("no nodes"), std::string::npos);
}

TEST_F(WorkflowValidatorTest, ConnectedWorkflowIsValid) {
    NodeId entry = addEntry();
    NodeId step = addStep();
    NodeId sleep = addConfigured("sleep", {{"duration_ms", 500}});
    connect(entry, step);
    connect(step, sleep);

    auto result = validator_.validate(workflow_);

    EXPECT_TRUE(result.isValid());
    EXPECT_FALSE(result.hasWarnings());
    EXPECT_TRUE(result.issues.empty());
}

TEST_F(WorkflowValidatorTest, MissingEntryPointIsError) {
    addStep();

    auto result = validator_.validate(workflow_);
    EXPECT_TRUE(result.hasErrors());
    EXPECT_TRUE(contains(result, "no entry point"));
}

TEST_F(WorkflowValidatorTest, OrphanNodeWarnings) {
    NodeId entry = addEntry();
    NodeId step = addStep();
    NodeId lonely = addStep();
    NodeId head = addStep();
    NodeId tail = addStep();
    connect(entry, step);
    connect(head, tail);

    auto result = validator_.validate(workflow_);

    EXPECT_TRUE(result.isValid());
    auto lonelyIssues = result.issuesFor(lonely);
    ASSERT_FALSE(lonelyIssues.empty());
    EXPECT_TRUE(std::any_of(lonelyIssues.begin(), lonelyIssues.end(), [](const ValidationIssue& i) {
        return i.message.find("not connected to anything") != std::string::npos;
    }));

    auto headIssues = result.issuesFor(head);
    EXPECT_TRUE(std::any_of(headIssues.begin(), headIssues.end(), [](const ValidationIssue& i) {
        return i.message.find("has no incoming connections") != std::string::npos;
    }));
    EXPECT_TRUE(std::any_of(headIssues.begin(), headIssues.end(), [](const ValidationIssue& i) {
        return i.message.find("not reachable from any entry point") != std::string::npos;
    }));

    // Fed by an unreachable node: only its chain head is reported
    EXPECT_TRUE(result.issuesFor(tail).empty());
    EXPECT_TRUE(result.issuesFor(step).empty());
}

TEST_F(WorkflowValidatorTest, SingleNodeIsNotAnOrphan) {
    addStep();
    auto result = validator_.validate(workflow_);
    EXPECT_FALSE(result.hasWarnings());
}

TEST_F(WorkflowValidatorTest, UnknownNodeTypeIsError) {
    NodeId entry = addEntry();
    NodeId odd = addConfigured("teleport", nlohmann::json::object());
    connect(entry, odd);

    auto result = validator_.validate(workflow_);
    EXPECT_FALSE(result.isValid());
    EXPECT_TRUE(contains(result, "Unknown node type: teleport"));
    ASSERT_EQ(result.issuesFor(odd).size(), 1u);
    EXPECT_EQ(result.issuesFor(odd)[0].severity, ValidationSeverity::Error);
}

TEST_F(WorkflowValidatorTest, RequiredConfigErrors) {
    NodeId entry = addConfigured("http-handler", nlohmann::json::object());
    NodeId call = addConfigured("service-call", {{"service", ""}});
    connect(entry, call);

    auto result = validator_.validate(workflow_);

    EXPECT_EQ(result.errorCount(), 2u);
    EXPECT_TRUE(contains(result, "HTTP Handler requires a path"));
    EXPECT_TRUE(contains(result, "Service Call requires a service name"));
}

TEST_F(WorkflowValidatorTest, RequiredConfigWarnings) {
    NodeId entry = addEntry();
    NodeId sleep = addConfigured("sleep", {{"duration_ms", 0}});
    NodeId delayed = addConfigured("delayed-send", {{"target", "billing"}});
    connect(entry, sleep);
    connect(sleep, delayed);

    auto result = validator_.validate(workflow_);

    EXPECT_TRUE(result.isValid());
    EXPECT_EQ(result.warningCount(), 2u);
    EXPECT_TRUE(contains(result, "Sleep should have a non-zero duration"));
    EXPECT_TRUE(contains(result, "Delayed Send should have a non-zero delay"));
}

TEST_F(WorkflowValidatorTest, LoadedCycleIsAnError) {
    nlohmann::json doc;
    doc["nodes"] = nlohmann::json::array({
        {{"id", 0}, {"node_type", "http-handler"}, {"name", "Entry"}, {"x", 0}, {"y", 0},
         {"config", {{"path", "/"}}}},
        {{"id", 1}, {"node_type", "run"}, {"name", "Charge"}, {"x", 0}, {"y", 200}},
        {{"id", 2}, {"node_type", "run"}, {"name", "Refund"}, {"x", 0}, {"y", 400}}
    });
    doc["connections"] = nlohmann::json::array({
        {{"id", 0}, {"source", 0}, {"target", 1}},
        {{"id", 1}, {"source", 1}, {"target", 2}},
        {{"id", 2}, {"source", 2}, {"target", 1}}
    });
    Workflow loaded = WorkflowSerializer::workflowFromJson(doc);

    auto result = validator_.validate(loaded);
    EXPECT_FALSE(result.isValid());
    EXPECT_TRUE(contains(result, "Connection from 'Charge' to 'Refund' is part of a cycle"));
    EXPECT_TRUE(contains(result, "Connection from 'Refund' to 'Charge' is part of a cycle"));
    EXPECT_FALSE(contains(result, "from 'Entry'"));
}

TEST_F(WorkflowValidatorTest, AcyclicWorkflowHasNoCycleErrors) {
    NodeId entry = addEntry();
    NodeId a = addStep();
    NodeId b = addStep();
    connect(entry, a);
    connect(entry, b);
    connect(a, b);

    EXPECT_FALSE(contains(validator_.validate(workflow_), "cycle"));
}

TEST(ValidationSeverityTest, ToString) {
    EXPECT_STREQ(validationSeverityToString(ValidationSeverity::Error), "error");
    EXPECT_STREQ(validationSeverityToString(ValidationSeverity::Warning), "warning");
}
