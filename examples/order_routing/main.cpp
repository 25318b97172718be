#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "events/CppHttplibClient.h"
#include "handlers/HttpRequestHandler.h"
#include "parsing/FlowConverter.h"
#include "parsing/FlowParser.h"
#include "runtime/WorkflowService.h"
#include "storage/InMemoryWorkflowStorage.h"
#include <iostream>
#include <memory>
#include <string>

using namespace WCE;

namespace {

void printRun(const FlowRun &run) {
    std::cout << "  status: " << instanceStatusToString(run.instance.status) << " after "
              << run.result.nodesVisited << " nodes" << "\n";
    std::cout << "  path: ";
    for (const auto &entry : run.instance.history) {
        std::cout << entry.fromState << " -> ";
    }
    std::cout << run.instance.currentState << "\n";
    std::cout << "  queue=" << run.result.variables.value("queue", std::string("?"))
              << " priority=" << run.result.variables.value("priority", std::string("?")) << "\n";
}

}  // namespace

int main(int argc, char **argv) {
    std::string flowPath = argc > 1 ? argv[1] : WCE_EXAMPLES_DIR "/order_routing/order_routing.json";

    Logger::initialize();
    Logger::setLevel(LogLevel::Warn);

    std::cout << "=== Order Routing Example ===" << "\n\n";

    FlowParser parser;
    auto flow = parser.parseFile(flowPath);
    if (!flow) {
        for (const auto &error : parser.getErrorMessages()) {
            std::cerr << "Error: " << error << "\n";
        }
        return 1;
    }

    try {
        EngineConfig config;
        config.requiredHandlerTypes = {Constants::NODE_HTTP_REQUEST};
        WorkflowService service(std::make_shared<InMemoryWorkflowStorage>(), config);

        // Custom node type: prints the interpolated message instead of posting to a channel
        service.getFlowEngine().registerHandler("notify", [](const FlowNode &node, FlowExecutionContext &context) {
            std::string message =
                HttpRequestHandler::interpolate(JsonUtils::getString(node.config, "message"), context.variables().all());
            std::cout << "  [" << JsonUtils::getString(node.config, "channel", "default") << "] " << message << "\n";
            return FlowNodeResult::ok({{"notified", true}});
        });
        auto httpClient = std::make_shared<CppHttplibClient>();
        httpClient->setCustomHeaders({{"User-Agent", "wce-order-routing"}});
        httpClient->setSSLVerification(true);
        registerHttpRequestHandler(service.getFlowEngine(), httpClient);

        service.registerFlow(*flow);

        struct Order {
            const char *title;
            json variables;
        };
        const Order orders[] = {
            {"Regular order", {{"orderId", "O-1"}, {"amount", 120}, {"customer", {{"tier", "silver"}}}}},
            {"Large order", {{"orderId", "O-2"}, {"amount", 2500}, {"customer", {{"tier", "silver"}}}}},
            {"Large gold order", {{"orderId", "O-3"}, {"amount", 9000}, {"customer", {{"tier", "gold"}}}}},
        };

        for (const auto &order : orders) {
            std::cout << order.title << ":" << "\n";
            FlowRun run = service.runFlow(flow->id, order.variables, std::string("order-intake"));
            printRun(run);
            std::cout << "\n";
        }

        // The same graph run step-wise through the FSM engine
        std::cout << "Converted to a state machine:" << "\n";
        WorkflowDefinition legacy = FlowConverter::flowToLegacy(*flow, {std::string("order_routing_fsm"), std::nullopt});
        std::cout << "  " << legacy.states.size() << " states, initial '" << legacy.initialState << "'\n";
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
