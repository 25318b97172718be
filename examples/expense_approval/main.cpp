#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "common/WorkflowError.h"
#include "parsing/WorkflowParser.h"
#include "runtime/WorkflowService.h"
#include "storage/InMemoryWorkflowStorage.h"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

using namespace WCE;

namespace {

double amountOf(WorkflowContext &context) {
    json amount = context.getData("amount");
    return amount.is_number() ? amount.get<double>() : 0.0;
}

void registerExpenseHooks(WorkflowService &service) {
    WorkflowEngine &engine = service.getEngine();

    engine.registerGuard("hasReceipt",
                         [](WorkflowContext &context, const json &) { return context.data().has("receiptId"); });
    engine.registerGuard("amountAtMost", [](WorkflowContext &context, const json &params) {
        return amountOf(context) <= params.value("max", 0.0);
    });
    engine.registerGuard("amountAbove", [](WorkflowContext &context, const json &params) {
        return amountOf(context) > params.value("min", 0.0);
    });

    engine.registerAction("stampSubmission", [](WorkflowContext &context, const json &) {
        context.setData("submittedAt", JsonUtils::formatTimestamp(now()));
    });

    // Opens one approval task per review state; finance tasks escalate to the CFO after a day
    engine.registerAction("requestApproval", [&service](WorkflowContext &context, const json &params) {
        ApprovalChain chain;
        ApprovalLevel level;
        level.level = params.value("level", 1);
        level.approver = params.value("approver", std::string("manager"));
        if (level.level > 1) {
            level.escalationTarget = "cfo";
            level.escalationTimeout = std::chrono::hours(24);
        }
        chain.levels.push_back(level);

        auto tasks = service.getApprovalService().createApprovalChain(context.getInstance().id, chain,
                                                                      context.getDefinition().id);
        context.setData("openTask", tasks.front().id);
    });

    engine.registerAction("notifyRequester", [](WorkflowContext &context, const json &) {
        std::cout << "  [notify] " << JsonUtils::getString(context.data().all(), "requester") << ": expense "
                  << context.getInstance().id << " is now '" << context.getCurrentState() << "'\n";
    });
}

std::string openTask(WorkflowService &service, const std::string &instanceId) {
    return service.getWorkflowStatus(instanceId).data.at("openTask").get<std::string>();
}

void printHistory(const WorkflowInstance &instance) {
    std::cout << "  status: " << instanceStatusToString(instance.status) << ", state: " << instance.currentState
              << "\n";
    for (const auto &entry : instance.history) {
        std::cout << "    " << entry.fromState << " --" << entry.transition << "--> " << entry.toState << " by "
                  << entry.triggeredBy.value_or("system") << "\n";
    }
}

}  // namespace

int main(int argc, char **argv) {
    std::string definitionPath = argc > 1 ? argv[1] : WCE_EXAMPLES_DIR "/expense_approval/expense_approval.json";

    Logger::initialize();
    Logger::setLevel(LogLevel::Warn);

    std::cout << "=== Expense Approval Example ===" << "\n\n";

    WorkflowParser parser;
    auto definition = parser.parseFile(definitionPath);
    if (!definition) {
        for (const auto &error : parser.getErrorMessages()) {
            std::cerr << "Error: " << error << "\n";
        }
        return 1;
    }

    try {
        WorkflowService service(std::make_shared<InMemoryWorkflowStorage>());
        registerExpenseHooks(service);
        service.registerWorkflow(*definition);

        // Small expense: manager approval is enough
        std::cout << "Small expense (450):" << "\n";
        {
            auto instance = service.startWorkflow(definition->id,
                                                  {{"amount", 450}, {"receiptId", "R-1001"}, {"requester", "dana"}},
                                                  std::string("dana"));
            service.executeTransition(instance.id, "submit", std::string("dana"));
            std::cout << "  available: ";
            for (const auto &name : service.getAvailableTransitions(instance.id)) {
                std::cout << name << (service.canExecuteTransition(instance.id, name) ? "(ok) " : "(blocked) ");
            }
            std::cout << "\n";

            service.resolveTask(openTask(service, instance.id), true, {{"comment", "fine"}}, std::string("approve"));
            printHistory(service.getWorkflowStatus(instance.id));
        }

        std::cout << "\n";

        // Large expense: manager delegates, escalates to finance, finance task auto-escalates to the CFO
        std::cout << "Large expense (4200):" << "\n";
        {
            auto instance = service.startWorkflow(definition->id,
                                                  {{"amount", 4200}, {"receiptId", "R-1002"}, {"requester", "eli"}},
                                                  std::string("eli"));
            service.executeTransition(instance.id, "submit", std::string("eli"));

            ApprovalService &approvals = service.getApprovalService();
            std::string managerTask = openTask(service, instance.id);
            approvals.delegateTask(managerTask, "deputy", "manager", std::string("On leave"));
            service.resolveTask(managerTask, true, {{"comment", "needs finance"}}, std::string("escalate"));

            std::string financeTask = openTask(service, instance.id);
            auto escalated = approvals.checkAutoEscalation(now() + std::chrono::hours(48));
            for (const auto &task : escalated) {
                std::cout << "  escalated " << task.name << " to " << task.effectiveAssignee() << "\n";
            }

            service.resolveTask(financeTask, false, {{"comment", "over budget"}}, std::string("reject"));
            printHistory(service.getWorkflowStatus(instance.id));

            std::cout << "  approval trail:" << "\n";
            for (const auto &task : approvals.getApprovalHistory(instance.id)) {
                std::cout << "    " << task.name << ": " << taskStatusToString(task.status) << " ("
                          << task.assignedTo;
                if (task.originalAssignee && task.delegatedTo) {
                    std::cout << ", delegated to " << *task.delegatedTo;
                }
                if (task.escalatedTo) {
                    std::cout << ", escalated to " << *task.escalatedTo;
                }
                std::cout << ")\n";
            }
        }

        // Missing receipt: the submit guard blocks the transition
        std::cout << "\n" << "Expense without receipt:" << "\n";
        {
            auto instance = service.startWorkflow(definition->id, {{"amount", 80}}, std::string("fay"));
            try {
                service.executeTransition(instance.id, "submit", std::string("fay"));
            } catch (const WorkflowError &e) {
                std::cout << "  " << errorCodeToString(e.code()) << ": " << e.what() << "\n";
            }
        }
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
