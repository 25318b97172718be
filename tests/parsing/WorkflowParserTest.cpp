#include "parsing/WorkflowParser.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace WCE;

class WorkflowParserTest : public ::testing::Test {
protected:
    bool hasError(const std::string &fragment) const {
        const auto &errors = parser.getErrorMessages();
        return std::any_of(errors.begin(), errors.end(),
                           [&](const std::string &error) { return error.find(fragment) != std::string::npos; });
    }

    WorkflowParser parser;

    const std::string reviewDefinition = R"({
        "name": "Document Review",
        "type": "approval",
        "version": "2.1.0",
        "description": "Review a document before publication",
        "states": {
            "draft": {
                "initial": true,
                "on_exit": ["stampSubmission"],
                "transitions": { "submit": "review" }
            },
            "review": {
                "on_enter": ["notifyReviewer", {"type": "setField", "params": {"field": "stage", "value": 2}}],
                "transitions": {
                    "approve": {
                        "target": "approved",
                        "guards": ["isReviewer", {"type": "minAmount", "params": {"min": 10}}],
                        "actions": ["publish"]
                    },
                    "reject": {"target": "rejected"}
                }
            },
            "approved": {"final": true},
            "rejected": {"final": true}
        }
    })";
};

TEST_F(WorkflowParserTest, ParsesFullDefinition) {
    auto definition = parser.parseContent(reviewDefinition);

    ASSERT_NE(definition, nullptr) << (parser.hasErrors() ? parser.getErrorMessages().front() : "");
    EXPECT_FALSE(parser.hasErrors());
    EXPECT_EQ(definition->id, "document_review");
    EXPECT_EQ(definition->name, "Document Review");
    EXPECT_EQ(definition->type, WorkflowType::APPROVAL);
    EXPECT_STREQ(workflowTypeToString(definition->type), "approval");
    EXPECT_EQ(definition->version, "2.1.0");
    EXPECT_EQ(definition->initialState, "draft");
    EXPECT_EQ(definition->states.size(), 4u);

    const StateConfig *draft = definition->findState("draft");
    ASSERT_NE(draft, nullptr);
    EXPECT_TRUE(draft->initial);
    ASSERT_EQ(draft->onExit.size(), 1u);
    EXPECT_EQ(referenceName(draft->onExit[0]), "stampSubmission");
    ASSERT_NE(draft->findTransition("submit"), nullptr);
    EXPECT_EQ(draft->findTransition("submit")->target, "review");

    const StateConfig *review = definition->findState("review");
    ASSERT_EQ(review->onEnter.size(), 2u);
    EXPECT_TRUE(isInlineReference(review->onEnter[1]));
    EXPECT_EQ(referenceParams(review->onEnter[1])["value"], 2);

    const TransitionConfig *approve = review->findTransition("approve");
    ASSERT_NE(approve, nullptr);
    ASSERT_EQ(approve->guards.size(), 2u);
    EXPECT_EQ(referenceName(approve->guards[0]), "isReviewer");
    EXPECT_EQ(referenceName(approve->guards[1]), "minAmount");
    ASSERT_EQ(approve->actions.size(), 1u);

    EXPECT_TRUE(definition->findState("approved")->final);
}

TEST_F(WorkflowParserTest, ExplicitIdOverridesGeneratedOne) {
    auto definition = parser.parseContent(reviewDefinition, "custom_id");
    ASSERT_NE(definition, nullptr);
    EXPECT_EQ(definition->id, "custom_id");
}

TEST_F(WorkflowParserTest, DefaultsVersionAndAcceptsCamelCaseHooks) {
    auto definition = parser.parseDocument({{"name", "Mini"},
                                            {"states",
                                             {{"start", {{"initial", true}, {"onEnter", {"hello"}}, {"transitions", {{"go", "done"}}}}},
                                              {"done", {{"final", true}}}}}});

    ASSERT_NE(definition, nullptr);
    EXPECT_EQ(definition->version, "1.0.0");
    EXPECT_EQ(definition->findState("start")->onEnter.size(), 1u);
}

TEST_F(WorkflowParserTest, MissingNameIsAnError) {
    auto definition = parser.parseDocument({{"states", {{"a", {{"initial", true}, {"final", true}}}}}});

    EXPECT_EQ(definition, nullptr);
    EXPECT_TRUE(hasError("Workflow definition must have a name"));
}

TEST_F(WorkflowParserTest, ZeroStatesIsAnError) {
    EXPECT_EQ(parser.parseDocument({{"name", "Empty"}, {"states", json::object()}}), nullptr);
    EXPECT_TRUE(hasError("at least one state"));

    EXPECT_EQ(parser.parseDocument({{"name", "Empty"}}), nullptr);
    EXPECT_TRUE(hasError("at least one state"));
}

TEST_F(WorkflowParserTest, MissingInitialStateIsAnError) {
    auto definition = parser.parseDocument({{"name", "No start"}, {"states", {{"done", {{"final", true}}}}}});

    EXPECT_EQ(definition, nullptr);
    EXPECT_TRUE(hasError("Workflow definition must have an initial state"));
}

TEST_F(WorkflowParserTest, MultipleInitialStatesIsAnError) {
    auto definition = parser.parseDocument(
        {{"name", "Twins"},
         {"states", {{"a", {{"initial", true}}}, {"b", {{"initial", true}}}, {"c", {{"final", true}}}}}});

    EXPECT_EQ(definition, nullptr);
    EXPECT_TRUE(hasError("exactly one initial state"));
}

TEST_F(WorkflowParserTest, TransitionToUnknownStateIsAnError) {
    auto definition = parser.parseDocument(
        {{"name", "Dangling"},
         {"states", {{"a", {{"initial", true}, {"transitions", {{"go", "nowhere"}}}}}, {"b", {{"final", true}}}}}});

    EXPECT_EQ(definition, nullptr);
    EXPECT_TRUE(hasError("target state \"nowhere\" does not exist"));
}

TEST_F(WorkflowParserTest, TransitionWithoutTargetIsAnError) {
    auto definition = parser.parseDocument(
        {{"name", "No target"},
         {"states",
          {{"a", {{"initial", true}, {"transitions", {{"go", {{"guards", {"x"}}}}}}}}, {"b", {{"final", true}}}}}});

    EXPECT_EQ(definition, nullptr);
    EXPECT_TRUE(hasError("must have a target state"));
}

TEST_F(WorkflowParserTest, MissingFinalStateIsAnError) {
    auto definition = parser.parseDocument(
        {{"name", "Endless"}, {"states", {{"a", {{"initial", true}, {"transitions", {{"loop", "a"}}}}}}}});

    EXPECT_EQ(definition, nullptr);
    EXPECT_TRUE(hasError("at least one final state"));
}

TEST_F(WorkflowParserTest, InvalidReferenceIsAnError) {
    auto definition = parser.parseDocument(
        {{"name", "Bad hook"},
         {"states", {{"a", {{"initial", true}, {"final", true}, {"on_enter", {{{"params", 1}}}}}}}}});

    EXPECT_EQ(definition, nullptr);
    EXPECT_TRUE(hasError("on_enter[0]"));
}

TEST_F(WorkflowParserTest, UnknownTypeIsAWarning) {
    auto definition = parser.parseDocument(
        {{"name", "Odd"}, {"type", "swarm"}, {"states", {{"a", {{"initial", true}, {"final", true}}}}}});

    ASSERT_NE(definition, nullptr);
    EXPECT_EQ(definition->type, WorkflowType::SEQUENTIAL);
    EXPECT_EQ(parser.getWarningMessages().size(), 1u);
}

TEST_F(WorkflowParserTest, MalformedJsonIsAnError) {
    EXPECT_EQ(parser.parseContent("{ \"name\": "), nullptr);
    EXPECT_TRUE(hasError("Invalid workflow definition"));
}

TEST_F(WorkflowParserTest, ParseFile) {
    auto path = std::filesystem::temp_directory_path() / "wce_workflow_parser_test.json";
    {
        std::ofstream file(path);
        file << reviewDefinition;
    }

    auto definition = parser.parseFile(path.string());
    std::filesystem::remove(path);

    ASSERT_NE(definition, nullptr);
    EXPECT_EQ(definition->states.size(), 4u);

    EXPECT_EQ(parser.parseFile("/nonexistent/workflow.json"), nullptr);
    EXPECT_TRUE(hasError("File not found"));
}

TEST_F(WorkflowParserTest, ValidateWorkflowDefinition) {
    WorkflowDefinition definition;
    definition.id = "x";
    definition.name = "X";
    definition.version = "1.0.0";
    definition.initialState = "missing";
    definition.states["a"].name = "a";

    auto errors = WorkflowParser::validateWorkflowDefinition(definition);

    EXPECT_NE(std::find(errors.begin(), errors.end(), "Initial state \"missing\" does not exist"), errors.end());
    EXPECT_NE(std::find(errors.begin(), errors.end(), "Workflow must have at least one final state"), errors.end());
}
