#include "model/WorkflowInstance.h"
#include "common/JsonUtils.h"
#include "model/WorkflowTask.h"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace WCE;

class WorkflowInstanceTest : public ::testing::Test {
protected:
    WorkflowInstance makeCompletedInstance() {
        WorkflowInstance instance;
        instance.id = "wf_123";
        instance.workflowId = "document_review";
        instance.version = "1.0.0";
        instance.currentState = "approved";
        instance.status = InstanceStatus::COMPLETED;
        instance.data = {{"amount", 250}, {"tags", {"urgent"}}};
        instance.createdAt = *JsonUtils::parseTimestamp("2025-03-01T09:00:00.000Z");
        instance.startedAt = *JsonUtils::parseTimestamp("2025-03-01T09:00:01.250Z");
        instance.completedAt = *JsonUtils::parseTimestamp("2025-03-02T17:30:00.000Z");
        instance.startedBy = "alice";
        instance.completedBy = "bob";

        StateHistoryEntry entry;
        entry.fromState = "review";
        entry.toState = "approved";
        entry.transition = "approve";
        entry.timestamp = *instance.completedAt;
        entry.triggeredBy = "bob";
        entry.data = {{"comment", "looks good"}};
        instance.history.push_back(entry);
        return instance;
    }
};

TEST_F(WorkflowInstanceTest, StatusNames) {
    EXPECT_STREQ(instanceStatusToString(InstanceStatus::PENDING), "pending");
    EXPECT_STREQ(instanceStatusToString(InstanceStatus::ABORTED), "aborted");
    EXPECT_EQ(instanceStatusFromString("failed"), InstanceStatus::FAILED);
    EXPECT_FALSE(instanceStatusFromString("paused").has_value());

    EXPECT_FALSE(isTerminalStatus(InstanceStatus::PENDING));
    EXPECT_FALSE(isTerminalStatus(InstanceStatus::RUNNING));
    EXPECT_TRUE(isTerminalStatus(InstanceStatus::COMPLETED));
    EXPECT_TRUE(isTerminalStatus(InstanceStatus::ABORTED));
    EXPECT_TRUE(isTerminalStatus(InstanceStatus::FAILED));
}

TEST_F(WorkflowInstanceTest, SerializesToJson) {
    json j = makeCompletedInstance();

    EXPECT_EQ(j["status"], "completed");
    EXPECT_EQ(j["createdAt"], "2025-03-01T09:00:00.000Z");
    EXPECT_EQ(j["startedAt"], "2025-03-01T09:00:01.250Z");
    EXPECT_EQ(j["completedBy"], "bob");
    EXPECT_FALSE(j.contains("abortedAt"));
    EXPECT_FALSE(j.contains("error"));
    ASSERT_EQ(j["history"].size(), 1u);
    EXPECT_EQ(j["history"][0]["transition"], "approve");
    EXPECT_EQ(j["history"][0]["data"]["comment"], "looks good");
}

TEST_F(WorkflowInstanceTest, ParsesFromJson) {
    json j = makeCompletedInstance();

    auto instance = j.get<WorkflowInstance>();

    EXPECT_EQ(instance.id, "wf_123");
    EXPECT_EQ(instance.status, InstanceStatus::COMPLETED);
    EXPECT_EQ(instance.data["tags"][0], "urgent");
    ASSERT_TRUE(instance.startedAt.has_value());
    EXPECT_EQ(JsonUtils::formatTimestamp(*instance.startedAt), "2025-03-01T09:00:01.250Z");
    EXPECT_FALSE(instance.abortedAt.has_value());
    ASSERT_EQ(instance.history.size(), 1u);
    EXPECT_EQ(instance.history[0].triggeredBy, "bob");
    EXPECT_TRUE(instance.isTerminal());
}

TEST_F(WorkflowInstanceTest, RejectsUnknownStatusAndBadTimestamps) {
    json j = makeCompletedInstance();
    j["status"] = "paused";
    EXPECT_THROW(j.get<WorkflowInstance>(), std::invalid_argument);

    j["status"] = "running";
    j["startedAt"] = "yesterday";
    EXPECT_THROW(j.get<WorkflowInstance>(), std::invalid_argument);
}

TEST_F(WorkflowInstanceTest, TaskJsonKeepsAuditFields) {
    WorkflowTask task;
    task.id = "task_1";
    task.instanceId = "wf_123";
    task.assignedTo = "mgr";
    task.createdAt = *JsonUtils::parseTimestamp("2025-03-01T09:00:00.000Z");
    task.originalAssignee = "mgr";
    task.delegatedTo = "deputy";
    task.escalatedTo = "director";

    json j = task;
    EXPECT_EQ(j["status"], "pending");
    EXPECT_FALSE(j.contains("result"));

    auto parsed = j.get<WorkflowTask>();
    EXPECT_EQ(parsed.originalAssignee, "mgr");
    EXPECT_EQ(parsed.delegatedTo, "deputy");
    EXPECT_EQ(parsed.effectiveAssignee(), "director");
}
