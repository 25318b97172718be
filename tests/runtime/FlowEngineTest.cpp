#include "runtime/FlowEngine.h"
#include "../common/TestUtils.h"
#include "common/WorkflowError.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace WCE;
using namespace WCE::Test::Utils;

class FlowEngineTest : public ::testing::Test {
protected:
    FlowExecutionResult run(const FlowDefinition &flow, const json &variables = json::object()) {
        instance = engine.createInstance(flow, json::object(), std::string("runner"));
        return engine.execute(flow, instance, variables);
    }

    FlowEngine engine;
    WorkflowInstance instance;
};

TEST_F(FlowEngineTest, CreateInstanceStartsAtStartNode) {
    FlowDefinition flow = makeRoutingFlow();
    std::swap(flow.nodes[0], flow.nodes[1]);

    WorkflowInstance created = engine.createInstance(flow);

    EXPECT_EQ(created.currentState, "start");
    EXPECT_EQ(created.status, InstanceStatus::PENDING);
    EXPECT_EQ(created.workflowId, "amount_routing");
    EXPECT_EQ(created.id.rfind("flow", 0), 0u);
}

TEST_F(FlowEngineTest, CreateInstanceFallsBackToFirstNode) {
    FlowDefinition flow;
    flow.name = "untagged";
    flow.nodes = {makeNode("first", "assignment"), makeNode("second", "assignment")};

    WorkflowInstance created = engine.createInstance(flow);

    EXPECT_EQ(created.currentState, "first");
    EXPECT_EQ(created.workflowId, "untagged");
    EXPECT_EQ(created.version, "1.0.0");
}

TEST_F(FlowEngineTest, DecisionFollowsMatchingCondition) {
    FlowDefinition flow = makeRoutingFlow();

    auto result = run(flow, {{"amount", 1500}});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.variables["route"], "a");
    EXPECT_EQ(instance.status, InstanceStatus::COMPLETED);
    EXPECT_EQ(instance.currentState, "end");
    EXPECT_TRUE(instance.completedAt.has_value());
    EXPECT_EQ(result.nodesVisited, 4u);
    ASSERT_EQ(instance.history.size(), 3u);
    EXPECT_EQ(instance.history[1].fromState, "check");
    EXPECT_EQ(instance.history[1].toState, "path_a");
    EXPECT_EQ(instance.history[1].transition, "decision->");
    EXPECT_EQ(instance.history[1].triggeredBy, "runner");
}

TEST_F(FlowEngineTest, DecisionFallsBackToUnconditionedEdge) {
    FlowDefinition flow = makeRoutingFlow();

    auto result = run(flow, {{"amount", 500}});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.variables["route"], "b");
    EXPECT_EQ(instance.status, InstanceStatus::COMPLETED);
}

TEST_F(FlowEngineTest, DecisionWithNoMatchAndNoDefaultTakesFirstEdge) {
    FlowDefinition flow = makeRoutingFlow();
    flow.edges[2].condition = std::string("amount == 7");

    auto result = run(flow, {{"amount", 500}});

    EXPECT_EQ(result.variables["route"], "a");
}

TEST_F(FlowEngineTest, MalformedConditionSkipsBranch) {
    FlowDefinition flow = makeRoutingFlow();
    flow.edges[1].condition = std::string("amount >>> 1000");

    auto result = run(flow, {{"amount", 1500}});

    EXPECT_EQ(result.variables["route"], "b");
}

TEST_F(FlowEngineTest, AssignmentCopiesConfigIntoVariables) {
    FlowDefinition flow;
    flow.name = "assign";
    flow.nodes = {makeNode("start", "start"), makeNode("set", "assignment", {{"status", "open"}, {"count", 2}}),
                  makeNode("end", "end")};
    flow.edges = {makeEdge("e1", "start", "set"), makeEdge("e2", "set", "end")};

    auto result = run(flow, {{"count", 1}, {"owner", "amy"}});

    EXPECT_EQ(result.variables["status"], "open");
    EXPECT_EQ(result.variables["count"], 2);
    EXPECT_EQ(result.variables["owner"], "amy");
}

TEST_F(FlowEngineTest, VariablesDoNotLeakIntoInstanceData) {
    auto result = run(makeRoutingFlow(), {{"amount", 1500}});

    EXPECT_TRUE(result.variables.contains("route"));
    EXPECT_FALSE(instance.data.contains("route"));
}

TEST_F(FlowEngineTest, DeadEndCompletes) {
    FlowDefinition flow;
    flow.name = "dead_end";
    flow.nodes = {makeNode("start", "start"), makeNode("work", "assignment", {{"done", true}})};
    flow.edges = {makeEdge("e1", "start", "work")};

    auto result = run(flow);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(instance.status, InstanceStatus::COMPLETED);
    EXPECT_EQ(instance.currentState, "work");
    EXPECT_EQ(instance.history.size(), 1u);
}

TEST_F(FlowEngineTest, EndNodeStopsTraversalEvenWithOutgoingEdges) {
    FlowDefinition flow = makeRoutingFlow();
    flow.edges.push_back(makeEdge("loop", "end", "start"));

    auto result = run(flow, {{"amount", 1}});

    EXPECT_TRUE(result.success);
    EXPECT_EQ(instance.currentState, "end");
}

TEST_F(FlowEngineTest, CycleTripsTraversalLimit) {
    EngineConfig config;
    config.maxFlowNodes = 10;
    FlowEngine bounded(config);

    FlowDefinition flow;
    flow.name = "cycle";
    flow.nodes = {makeNode("a", "wait"), makeNode("b", "wait")};
    flow.edges = {makeEdge("e1", "a", "b"), makeEdge("e2", "b", "a")};

    WorkflowInstance cyclic = bounded.createInstance(flow);
    auto result = bounded.execute(flow, cyclic);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::TRAVERSAL_LIMIT_EXCEEDED);
    EXPECT_EQ(result.nodesVisited, 10u);
    EXPECT_EQ(cyclic.status, InstanceStatus::FAILED);
    EXPECT_TRUE(cyclic.failedAt.has_value());
    ASSERT_TRUE(cyclic.error.has_value());
    EXPECT_NE(cyclic.error->find("max node limit exceeded"), std::string::npos);
}

TEST_F(FlowEngineTest, DefaultLimitIsFiveHundred) {
    EXPECT_EQ(engine.getMaxNodes(), 500u);

    EngineConfig config;
    config.maxFlowNodes = 0;
    FlowEngine fallback(config);
    EXPECT_EQ(fallback.getMaxNodes(), 500u);
}

TEST_F(FlowEngineTest, HandlerFailureMarksInstanceFailed) {
    engine.registerHandler("http_request", [](const FlowNode &, FlowExecutionContext &) {
        FlowNodeResult result = FlowNodeResult::failure("upstream unavailable");
        result.output = {{"partial", true}};
        return result;
    });

    FlowDefinition flow;
    flow.name = "failing";
    flow.nodes = {makeNode("start", "start"), makeNode("call", "http_request"), makeNode("end", "end")};
    flow.edges = {makeEdge("e1", "start", "call"), makeEdge("e2", "call", "end")};

    auto result = run(flow);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::HANDLER_FAILURE);
    EXPECT_EQ(result.error, "upstream unavailable");
    EXPECT_FALSE(result.variables.contains("partial"));
    EXPECT_EQ(instance.status, InstanceStatus::FAILED);
    EXPECT_EQ(instance.currentState, "call");
    EXPECT_EQ(instance.error, "upstream unavailable");
}

TEST_F(FlowEngineTest, ThrowingHandlerIsReportedAsFailure) {
    engine.registerHandler("custom", [](const FlowNode &, FlowExecutionContext &) -> FlowNodeResult {
        throw std::runtime_error("handler crashed");
    });

    FlowDefinition flow;
    flow.name = "throwing";
    flow.nodes = {makeNode("only", "custom")};

    auto result = run(flow);

    EXPECT_EQ(result.errorCode, ErrorCode::HANDLER_FAILURE);
    EXPECT_EQ(result.error, "handler crashed");
    EXPECT_EQ(instance.status, InstanceStatus::FAILED);
}

TEST_F(FlowEngineTest, MissingNodeFails) {
    FlowDefinition flow;
    flow.name = "broken";
    flow.nodes = {makeNode("start", "start")};
    flow.edges = {makeEdge("e1", "start", "ghost")};

    auto result = run(flow);

    EXPECT_EQ(result.errorCode, ErrorCode::NODE_NOT_FOUND);
    EXPECT_EQ(instance.status, InstanceStatus::FAILED);
    EXPECT_EQ(instance.currentState, "ghost");
}

TEST_F(FlowEngineTest, UnhandledNodeTypeIsNoOp) {
    FlowDefinition flow;
    flow.name = "crud";
    flow.nodes = {makeNode("start", "start"), makeNode("create", "create_record"), makeNode("end", "end")};
    flow.edges = {makeEdge("e1", "start", "create"), makeEdge("e2", "create", "end")};

    EXPECT_EQ(engine.findUnhandledNodeTypes(flow), std::vector<std::string>{"create_record"});

    auto result = run(flow);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(instance.status, InstanceStatus::COMPLETED);
}

TEST_F(FlowEngineTest, RequiredHandlerTypeWithoutHandlerFails) {
    EngineConfig config;
    config.requiredHandlerTypes = {"create_record"};
    FlowEngine strict(config);

    FlowDefinition flow;
    flow.name = "crud";
    flow.nodes = {makeNode("start", "start"), makeNode("create", "create_record")};
    flow.edges = {makeEdge("e1", "start", "create")};

    WorkflowInstance strictInstance = strict.createInstance(flow);
    auto result = strict.execute(flow, strictInstance);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorCode, ErrorCode::HANDLER_FAILURE);
    EXPECT_NE(result.error.find("create_record"), std::string::npos);
}

TEST_F(FlowEngineTest, ScriptNodeIsNotExecuted) {
    FlowDefinition flow;
    flow.name = "script";
    flow.nodes = {makeNode("start", "start"), makeNode("run", "script", {{"script", "process.exit(1)"}})};
    flow.edges = {makeEdge("e1", "start", "run")};

    auto result = run(flow);

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.variables.contains("script"));
}

TEST_F(FlowEngineTest, HandlerNextEdgeSelectsLabelledEdge) {
    engine.registerHandler("router", [](const FlowNode &, FlowExecutionContext &context) {
        FlowNodeResult result = FlowNodeResult::ok({{"routed", true}});
        result.nextEdge = context.variables().get("choice").get<std::string>();
        return result;
    });

    FlowDefinition flow;
    flow.name = "labelled";
    flow.nodes = {makeNode("route", "router"), makeNode("left", "assignment", {{"side", "left"}}),
                  makeNode("right", "assignment", {{"side", "right"}})};
    flow.edges = {makeEdge("e1", "route", "left", std::nullopt, std::string("go_left")),
                  makeEdge("e2", "route", "right", std::nullopt, std::string("go_right"))};

    auto result = run(flow, {{"choice", "go_right"}});

    EXPECT_EQ(result.variables["side"], "right");
    EXPECT_EQ(result.variables["routed"], true);
}

TEST_F(FlowEngineTest, HandlerSeesFlowAndInstance) {
    std::string flowName;
    std::string instanceId;
    engine.registerHandler("probe", [&](const FlowNode &, FlowExecutionContext &context) {
        flowName = context.getFlow().name;
        instanceId = context.getInstance().id;
        context.instanceData().set("probed", true);
        return FlowNodeResult::ok();
    });

    FlowDefinition flow;
    flow.name = "probe_flow";
    flow.nodes = {makeNode("p", "probe")};

    run(flow);

    EXPECT_EQ(flowName, "probe_flow");
    EXPECT_EQ(instanceId, instance.id);
    EXPECT_EQ(instance.data["probed"], true);
}

TEST_F(FlowEngineTest, ExecuteTwiceFailsWithInvalidLifecycle) {
    FlowDefinition flow = makeRoutingFlow();
    run(flow, {{"amount", 1}});
    auto historySize = instance.history.size();

    try {
        engine.execute(flow, instance);
        FAIL() << "Expected InvalidLifecycle";
    } catch (const WorkflowError &e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_LIFECYCLE);
    }
    EXPECT_EQ(instance.history.size(), historySize);
    EXPECT_EQ(instance.status, InstanceStatus::COMPLETED);
}

TEST_F(FlowEngineTest, EmptyFlowCompletesImmediately) {
    FlowDefinition flow;
    flow.name = "empty";

    auto result = run(flow);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.nodesVisited, 0u);
    EXPECT_EQ(instance.status, InstanceStatus::COMPLETED);
}

TEST_F(FlowEngineTest, ResolveNextNodePrefersUnconditionedEdge) {
    FlowDefinition flow;
    flow.name = "routing";
    flow.nodes = {makeNode("a", "wait"), makeNode("b", "wait"), makeNode("c", "wait")};
    flow.edges = {makeEdge("e1", "a", "b", std::string("flag")), makeEdge("e2", "a", "c")};

    // Conditions are only evaluated on decision nodes
    EXPECT_EQ(engine.resolveNextNode(flow, flow.nodes[0], {{"flag", true}}), "c");
    EXPECT_FALSE(engine.resolveNextNode(flow, flow.nodes[2], json::object()).has_value());
}
