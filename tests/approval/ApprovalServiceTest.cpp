#include "approval/ApprovalService.h"
#include "common/WorkflowError.h"
#include "storage/InMemoryWorkflowStorage.h"
#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <string>
#include <thread>

using namespace WCE;

class ApprovalServiceTest : public ::testing::Test {
protected:
    TaskSpec spec(const std::string &assignedTo, const std::string &instanceId = "wf_1") {
        TaskSpec taskSpec;
        taskSpec.instanceId = instanceId;
        taskSpec.name = "approve_expense";
        taskSpec.description = "Approve the expense report";
        taskSpec.assignedTo = assignedTo;
        return taskSpec;
    }

    ErrorCode errorOf(const std::function<void()> &call) {
        try {
            call();
        } catch (const WorkflowError &e) {
            return e.code();
        }
        ADD_FAILURE() << "Expected WorkflowError";
        return ErrorCode::VALIDATION_ERROR;
    }

    InMemoryWorkflowStorage storage;
    ApprovalService service{storage};
};

TEST_F(ApprovalServiceTest, CreateTaskIsPendingAndStored) {
    WorkflowTask task = service.createTask(spec("mgr"));

    EXPECT_FALSE(task.id.empty());
    EXPECT_EQ(task.status, TaskStatus::PENDING);
    EXPECT_EQ(task.assignedTo, "mgr");
    EXPECT_EQ(task.effectiveAssignee(), "mgr");
    EXPECT_FALSE(task.completedAt.has_value());
    EXPECT_TRUE(task.result.is_null());

    EXPECT_EQ(service.getTask(task.id).name, "approve_expense");
    EXPECT_EQ(storage.getTaskCount(), 1u);
}

TEST_F(ApprovalServiceTest, DelegateThenCompleteScenario) {
    WorkflowTask task = service.createTask(spec("mgr"));

    service.delegateTask(task.id, "deputy", "mgr", std::string("OOO"));
    WorkflowTask done = service.completeTask(task.id, {{"approved", true}});

    EXPECT_EQ(done.originalAssignee, "mgr");
    EXPECT_EQ(done.delegatedTo, "deputy");
    EXPECT_EQ(done.delegatedBy, "mgr");
    EXPECT_EQ(done.delegationReason, "OOO");
    EXPECT_EQ(done.status, TaskStatus::COMPLETED);
    EXPECT_TRUE(done.completedAt.has_value());
    EXPECT_EQ(done.result["approved"], true);
    EXPECT_EQ(done.assignedTo, "mgr");
}

TEST_F(ApprovalServiceTest, RedelegationKeepsOriginalAssignee) {
    WorkflowTask task = service.createTask(spec("mgr"));

    service.delegateTask(task.id, "deputy", "mgr", std::string("OOO"));
    WorkflowTask again = service.delegateTask(task.id, "backup", "deputy", std::string("also OOO"));

    EXPECT_EQ(again.originalAssignee, "mgr");
    EXPECT_EQ(again.delegatedTo, "backup");
    EXPECT_EQ(again.delegationReason, "also OOO");
    EXPECT_EQ(again.effectiveAssignee(), "backup");
}

TEST_F(ApprovalServiceTest, EscalationTakesPriorityOverDelegation) {
    WorkflowTask task = service.createTask(spec("mgr"));

    service.delegateTask(task.id, "deputy", "mgr");
    WorkflowTask escalated = service.escalateTask(task.id, "director", std::string("stalled"), std::string("ops"));

    EXPECT_EQ(escalated.escalatedTo, "director");
    EXPECT_EQ(escalated.escalationReason, "stalled");
    EXPECT_EQ(escalated.escalatedBy, "ops");
    EXPECT_TRUE(escalated.escalatedAt.has_value());
    EXPECT_EQ(escalated.delegatedTo, "deputy");
    EXPECT_EQ(escalated.effectiveAssignee(), "director");
    EXPECT_EQ(escalated.status, TaskStatus::PENDING);
}

TEST_F(ApprovalServiceTest, ResolvedTasksAreTerminal) {
    WorkflowTask task = service.createTask(spec("mgr"));
    service.rejectTask(task.id, {{"reason", "missing receipt"}});

    EXPECT_EQ(errorOf([&] { service.completeTask(task.id); }), ErrorCode::INVALID_TASK_STATE);
    EXPECT_EQ(errorOf([&] { service.rejectTask(task.id); }), ErrorCode::INVALID_TASK_STATE);
    EXPECT_EQ(errorOf([&] { service.delegateTask(task.id, "x", "y"); }), ErrorCode::INVALID_TASK_STATE);
    EXPECT_EQ(errorOf([&] { service.escalateTask(task.id, "x"); }), ErrorCode::INVALID_TASK_STATE);

    WorkflowTask stored = service.getTask(task.id);
    EXPECT_EQ(stored.status, TaskStatus::REJECTED);
    EXPECT_EQ(stored.result["reason"], "missing receipt");
}

TEST_F(ApprovalServiceTest, UnknownTaskFails) {
    EXPECT_EQ(errorOf([&] { service.getTask("nope"); }), ErrorCode::TASK_NOT_FOUND);
    EXPECT_EQ(errorOf([&] { service.completeTask("nope"); }), ErrorCode::TASK_NOT_FOUND);
    EXPECT_EQ(errorOf([&] { service.delegateTask("nope", "a", "b"); }), ErrorCode::TASK_NOT_FOUND);
}

TEST_F(ApprovalServiceTest, ApprovalChainCreatesOneTaskPerLevel) {
    ApprovalChain chain;
    chain.levels = {ApprovalLevel{1, "team_lead", "", true, std::nullopt, std::nullopt},
                    ApprovalLevel{2, "finance", "Finance sign-off", false, std::string("cfo"),
                                  std::chrono::hours(24)}};

    auto tasks = service.createApprovalChain("wf_chain", chain, "expense");

    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].name, "expense_approval_level_1");
    EXPECT_EQ(tasks[0].description, "Approval required at level 1");
    EXPECT_EQ(tasks[0].assignedTo, "team_lead");
    EXPECT_EQ(tasks[0].data["approvalLevel"], 1);
    EXPECT_FALSE(tasks[0].autoEscalate);
    EXPECT_FALSE(tasks[0].dueDate.has_value());

    EXPECT_EQ(tasks[1].description, "Finance sign-off");
    EXPECT_EQ(tasks[1].data["required"], false);
    EXPECT_TRUE(tasks[1].autoEscalate);
    EXPECT_EQ(tasks[1].escalationTarget, "cfo");
    ASSERT_TRUE(tasks[1].dueDate.has_value());
    EXPECT_GT(*tasks[1].dueDate, tasks[1].createdAt);
}

TEST_F(ApprovalServiceTest, ChainCompletesWhenRequiredLevelsApprove) {
    ApprovalChain chain;
    chain.levels = {ApprovalLevel{1, "lead", "", true, std::nullopt, std::nullopt},
                    ApprovalLevel{2, "observer", "", false, std::nullopt, std::nullopt}};
    auto tasks = service.createApprovalChain("wf_chain", chain, "expense");

    EXPECT_FALSE(service.isApprovalChainComplete("wf_chain"));
    service.completeTask(tasks[0].id);
    EXPECT_TRUE(service.isApprovalChainComplete("wf_chain"));
    EXPECT_FALSE(service.hasRejectedApproval("wf_chain"));

    service.rejectTask(tasks[1].id);
    EXPECT_TRUE(service.hasRejectedApproval("wf_chain"));
}

TEST_F(ApprovalServiceTest, ApprovalHistoryListsResolvedTasksFirst) {
    WorkflowTask first = service.createTask(spec("a", "wf_hist"));
    WorkflowTask second = service.createTask(spec("b", "wf_hist"));
    WorkflowTask third = service.createTask(spec("c", "wf_hist"));
    service.createTask(spec("d", "wf_other"));

    service.completeTask(third.id);
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    service.completeTask(first.id);

    auto history = service.getApprovalHistory("wf_hist");

    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].id, third.id);
    EXPECT_EQ(history[1].id, first.id);
    EXPECT_EQ(history[2].id, second.id);
}

TEST_F(ApprovalServiceTest, AutoEscalationEscalatesOverdueTasksOnce) {
    Timestamp due = now() + std::chrono::hours(1);

    TaskSpec overdue = spec("mgr");
    overdue.dueDate = due;
    overdue.autoEscalate = true;
    overdue.escalationTarget = "director";
    WorkflowTask task = service.createTask(overdue);

    TaskSpec manual = spec("mgr");
    manual.dueDate = due;
    manual.escalationTarget = "director";
    WorkflowTask untouched = service.createTask(manual);

    EXPECT_TRUE(service.checkAutoEscalation(due - std::chrono::minutes(1)).empty());

    auto escalated = service.checkAutoEscalation(due + std::chrono::minutes(1));
    ASSERT_EQ(escalated.size(), 1u);
    EXPECT_EQ(escalated[0].id, task.id);
    EXPECT_EQ(escalated[0].escalatedTo, "director");
    ASSERT_TRUE(escalated[0].escalationReason.has_value());
    EXPECT_EQ(escalated[0].escalationReason->rfind("Automatic escalation - task overdue since ", 0), 0u);

    EXPECT_TRUE(service.checkAutoEscalation(due + std::chrono::minutes(2)).empty());
    EXPECT_FALSE(service.getTask(untouched.id).escalatedTo.has_value());
}

TEST_F(ApprovalServiceTest, AutoEscalationSkipsResolvedTasks) {
    TaskSpec overdue = spec("mgr");
    overdue.dueDate = now() - std::chrono::hours(1);
    overdue.autoEscalate = true;
    overdue.escalationTarget = "director";
    WorkflowTask task = service.createTask(overdue);
    service.completeTask(task.id);

    EXPECT_TRUE(service.checkAutoEscalation(now()).empty());
}
