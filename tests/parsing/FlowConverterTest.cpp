#include "parsing/FlowConverter.h"
#include "../common/TestUtils.h"
#include "parsing/FlowParser.h"
#include "parsing/WorkflowParser.h"
#include "runtime/FlowEngine.h"
#include <gtest/gtest.h>

using namespace WCE;
using namespace WCE::Test::Utils;

class FlowConverterTest : public ::testing::Test {};

TEST_F(FlowConverterTest, LegacyToFlowMapsStatesToNodes) {
    WorkflowDefinition definition = makeReviewWorkflow();
    definition.states["review"].onEnter = {std::string("notifyReviewer")};
    definition.states["review"].transitions["approve"].guards = {std::string("isManager"), std::string("hasBudget")};

    FlowDefinition flow = FlowConverter::legacyToFlow(definition);

    EXPECT_EQ(flow.id, "document_review");
    EXPECT_EQ(flow.version, "1.0.0");
    ASSERT_EQ(flow.nodes.size(), 4u);

    // States are visited in name order
    EXPECT_EQ(flow.nodes[0].label, "approved");
    EXPECT_EQ(flow.nodes[0].type, "end");
    EXPECT_EQ(flow.nodes[1].label, "draft");
    EXPECT_EQ(flow.nodes[1].type, "start");
    EXPECT_EQ(flow.nodes[3].label, "review");
    EXPECT_EQ(flow.nodes[3].type, "assignment");
    EXPECT_EQ(flow.nodes[3].config["onEnter"], json::array({"notifyReviewer"}));

    ASSERT_EQ(flow.edges.size(), 4u);
    EXPECT_EQ(flow.edges[0].source, "node_1");
    EXPECT_EQ(flow.edges[0].target, "node_3");
    EXPECT_EQ(flow.edges[0].label, "submit");
    EXPECT_EQ(flow.edges[1].label, "approve");
    EXPECT_EQ(flow.edges[1].condition, "isManager && hasBudget");
    EXPECT_FALSE(flow.edges[2].condition.has_value());
}

TEST_F(FlowConverterTest, ConvertedFlowPassesValidationAndRuns) {
    FlowDefinition flow = FlowConverter::legacyToFlow(makeReviewWorkflow());

    auto issues = FlowParser::validateFlow(flow);
    EXPECT_TRUE(issues.empty()) << issues.front();

    FlowEngine engine;
    WorkflowInstance instance = engine.createInstance(flow);
    auto result = engine.execute(flow, instance);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(instance.status, InstanceStatus::COMPLETED);
}

TEST_F(FlowConverterTest, FlowToLegacyMapsNodesToStates) {
    FlowDefinition flow = makeRoutingFlow();
    flow.nodes[1].label = "Amount check";

    WorkflowDefinition definition = FlowConverter::flowToLegacy(flow, {std::string("routing_fsm"), WorkflowType::CONDITIONAL});

    EXPECT_EQ(definition.id, "routing_fsm");
    EXPECT_EQ(definition.type, WorkflowType::CONDITIONAL);
    EXPECT_EQ(definition.initialState, "start");
    ASSERT_EQ(definition.states.size(), 5u);
    EXPECT_TRUE(definition.findState("end")->final);

    const StateConfig *check = definition.findState("Amount check");
    ASSERT_NE(check, nullptr);
    const TransitionConfig *toA = check->findTransition("to_path_a");
    ASSERT_NE(toA, nullptr);
    ASSERT_EQ(toA->guards.size(), 1u);
    EXPECT_EQ(referenceName(toA->guards[0]), "amount > 1000");
    EXPECT_NE(check->findTransition("to_path_b"), nullptr);

    EXPECT_EQ(definition.findState("path_a")->metadata["route"], "a");
    EXPECT_TRUE(WorkflowParser::validateWorkflowDefinition(definition).empty());
}

TEST_F(FlowConverterTest, FlowToLegacyFallsBackToFirstNodeAsInitial) {
    FlowDefinition flow;
    flow.name = "No Start";
    flow.nodes = {makeNode("a", "assignment"), makeNode("b", "end")};
    flow.edges = {makeEdge("e1", "a", "b", std::nullopt, std::string("finish"))};

    WorkflowDefinition definition = FlowConverter::flowToLegacy(flow);

    EXPECT_EQ(definition.id, "no_start");
    EXPECT_EQ(definition.initialState, "a");
    EXPECT_TRUE(definition.findState("a")->initial);
    EXPECT_NE(definition.findState("a")->findTransition("finish"), nullptr);
}
