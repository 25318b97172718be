#include "parsing/FlowParser.h"
#include "../common/TestUtils.h"
#include <algorithm>
#include <gtest/gtest.h>

using namespace WCE;
using namespace WCE::Test::Utils;

class FlowParserTest : public ::testing::Test {
protected:
    static bool contains(const std::vector<std::string> &messages, const std::string &fragment) {
        return std::any_of(messages.begin(), messages.end(),
                           [&](const std::string &message) { return message.find(fragment) != std::string::npos; });
    }

    FlowParser parser;

    const std::string routingFlow = R"({
        "name": "Order Routing",
        "version": 3,
        "nodes": [
            {"id": "start", "type": "start"},
            {"id": "check", "type": "decision", "label": "Amount check"},
            {"id": "big", "type": "assignment", "config": {"queue": "finance"}},
            {"id": "small", "type": "assignment", "config": {"queue": "auto"}, "position": {"x": 10, "y": 20}},
            {"id": "end", "type": "end"}
        ],
        "edges": [
            {"id": "e1", "source": "start", "target": "check"},
            {"id": "e2", "source": "check", "target": "big", "condition": "amount > 1000", "label": "large"},
            {"source": "check", "target": "small"},
            {"id": "e4", "source": "big", "target": "end"},
            {"id": "e5", "source": "small", "target": "end"}
        ]
    })";
};

TEST_F(FlowParserTest, ParsesFlow) {
    auto flow = parser.parseContent(routingFlow);

    ASSERT_NE(flow, nullptr);
    EXPECT_FALSE(parser.hasErrors());
    EXPECT_TRUE(parser.getWarningMessages().empty());
    EXPECT_EQ(flow->id, "order_routing");
    EXPECT_EQ(flow->version, "3");
    ASSERT_EQ(flow->nodes.size(), 5u);
    EXPECT_EQ(flow->findNode("check")->label, "Amount check");
    EXPECT_EQ(flow->findNode("start")->label, "start");
    EXPECT_EQ(flow->findNode("big")->config["queue"], "finance");
    EXPECT_EQ(flow->findNode("small")->position["x"], 10);

    ASSERT_EQ(flow->edges.size(), 5u);
    EXPECT_EQ(flow->edges[1].condition, "amount > 1000");
    EXPECT_EQ(flow->edges[1].label, "large");
    EXPECT_EQ(flow->edges[2].id, "edge_2");
    EXPECT_FALSE(flow->edges[2].condition.has_value());
}

TEST_F(FlowParserTest, MissingNameAndNodesAreErrors) {
    EXPECT_EQ(parser.parseDocument({{"nodes", json::array()}}), nullptr);
    EXPECT_TRUE(contains(parser.getErrorMessages(), "Flow must have a name"));
    EXPECT_TRUE(contains(parser.getErrorMessages(), "Flow must have at least one node"));
}

TEST_F(FlowParserTest, EdgeToUnknownNodeIsAnError) {
    auto flow = parser.parseDocument({{"name", "Broken"},
                                      {"nodes", {{{"id", "start"}, {"type", "start"}}}},
                                      {"edges", {{{"id", "e1"}, {"source", "start"}, {"target", "ghost"}}}}});

    EXPECT_EQ(flow, nullptr);
    EXPECT_TRUE(contains(parser.getErrorMessages(), "Edge e1 references unknown target node: ghost"));
}

TEST_F(FlowParserTest, DuplicateNodeIdIsAnError) {
    auto flow = parser.parseDocument(
        {{"name", "Dup"}, {"nodes", {{{"id", "a"}, {"type", "start"}}, {{"id", "a"}, {"type", "end"}}}}});

    EXPECT_EQ(flow, nullptr);
    EXPECT_TRUE(contains(parser.getErrorMessages(), "Duplicate node id: a"));
}

TEST_F(FlowParserTest, NodeWithoutTypeIsAnError) {
    EXPECT_EQ(parser.parseDocument({{"name", "Untyped"}, {"nodes", {{{"id", "a"}}}}}), nullptr);
    EXPECT_TRUE(contains(parser.getErrorMessages(), "Node a must have a type"));
}

TEST_F(FlowParserTest, MultipleStartNodesIsAnError) {
    auto flow = parser.parseDocument({{"name", "Two starts"},
                                      {"nodes", {{{"id", "a"}, {"type", "start"}}, {{"id", "b"}, {"type", "start"}}}}});

    EXPECT_EQ(flow, nullptr);
    EXPECT_TRUE(contains(parser.getErrorMessages(), "exactly one start node"));
}

TEST_F(FlowParserTest, StructuralFindingsAreWarnings) {
    auto flow = parser.parseDocument({{"name", "Loose"},
                                      {"nodes", {{{"id", "work"}, {"type", "http_request"}}, {{"id", "odd"}, {"type", "teleport"}}}},
                                      {"edges", {{{"id", "e1"}, {"source", "work"}, {"target", "odd"}, {"condition", "a &&"}}}}});

    ASSERT_NE(flow, nullptr);
    const auto &warnings = parser.getWarningMessages();
    EXPECT_TRUE(contains(warnings, "custom type 'teleport'"));
    EXPECT_TRUE(contains(warnings, "unparsable condition"));
    EXPECT_TRUE(contains(warnings, "Flow must have at least one start node"));
    EXPECT_TRUE(contains(warnings, "Flow must have at least one end node"));
    EXPECT_TRUE(contains(warnings, "Node odd (odd) has no outgoing edges"));
}

TEST_F(FlowParserTest, ValidateFlowReportsOrphans) {
    FlowDefinition flow = makeRoutingFlow();
    flow.nodes.push_back(makeNode("orphan", "assignment"));

    auto issues = FlowParser::validateFlow(flow);

    EXPECT_TRUE(contains(issues, "Node  (orphan) has no incoming edges"));
    EXPECT_TRUE(contains(issues, "Node  (orphan) has no outgoing edges"));
    EXPECT_EQ(issues.size(), 2u);
}

TEST_F(FlowParserTest, ValidRoutingFlowHasNoIssues) {
    EXPECT_TRUE(FlowParser::validateFlow(makeRoutingFlow()).empty());
}
