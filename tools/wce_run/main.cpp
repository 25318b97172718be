// WCE command-line runner
// Loads a workflow definition, starts an instance and applies transitions, or executes a flow graph

#include "common/JsonUtils.h"
#include "common/Logger.h"
#include "common/WorkflowError.h"
#include "handlers/HttpRequestHandler.h"
#include "parsing/FlowParser.h"
#include "parsing/ParsingCommon.h"
#include "parsing/WorkflowParser.h"
#include "runtime/WorkflowService.h"
#include "storage/InMemoryWorkflowStorage.h"
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace WCE;

namespace {

struct Options {
    std::optional<std::string> configPath;
    std::optional<std::string> actor;
    std::optional<std::string> dataPath;
    bool flowMode = false;
    bool permissive = false;
    std::string definitionPath;
    std::vector<std::string> positional;
};

void printUsage(const char *programName) {
    std::cout << "Usage: " << programName << " [options] <definition.json> [transition...]\n";
    std::cout << "   or: " << programName << " [options] --flow <flow.json> [variables.json]\n\n";
    std::cout << "Run a workflow definition or flow graph and print the resulting instance as JSON.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>   Engine configuration (maxFlowNodes, requiredHandlerTypes, logLevel, logDir)\n";
    std::cout << "  --actor <name>    Actor recorded as startedBy and triggeredBy\n";
    std::cout << "  --data <file>     Initial instance data (workflow mode)\n";
    std::cout << "  --permissive      Treat referenced guards as passing and actions as no-ops\n";
    std::cout << "  --flow            Execute a flow graph instead of a state machine\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " --permissive expense_approval.json submit approve\n";
    std::cout << "  " << programName << " --flow order_routing.json order.json\n";
}

std::optional<Options> parseArguments(int argc, char **argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto requireValue = [&](const std::string &flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << flag << " requires a value\n";
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--config") {
            options.configPath = requireValue(arg);
            if (!options.configPath) {
                return std::nullopt;
            }
        } else if (arg == "--actor") {
            options.actor = requireValue(arg);
            if (!options.actor) {
                return std::nullopt;
            }
        } else if (arg == "--data") {
            options.dataPath = requireValue(arg);
            if (!options.dataPath) {
                return std::nullopt;
            }
        } else if (arg == "--permissive") {
            options.permissive = true;
        } else if (arg == "--flow") {
            options.flowMode = true;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Error: unknown option " << arg << "\n";
            return std::nullopt;
        } else if (options.definitionPath.empty()) {
            options.definitionPath = arg;
        } else {
            options.positional.push_back(arg);
        }
    }

    if (options.definitionPath.empty()) {
        return std::nullopt;
    }
    return options;
}

json readJsonFile(const std::string &path) {
    auto content = ParsingCommon::readFile(path);
    if (!content) {
        throw std::runtime_error("File not found: " + path);
    }
    std::string error;
    auto document = JsonUtils::parseJson(*content, &error);
    if (!document) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + error);
    }
    return *document;
}

template <typename Parser> void reportParser(const Parser &parser) {
    for (const auto &warning : parser.getWarningMessages()) {
        std::cerr << "Warning: " << warning << "\n";
    }
    for (const auto &error : parser.getErrorMessages()) {
        std::cerr << "Error: " << error << "\n";
    }
}

// Registers a passing guard / no-op action for every hook the definition names
void registerPermissiveHooks(WorkflowEngine &engine, const WorkflowDefinition &definition) {
    for (const auto &reference : engine.findUnresolvedReferences(definition)) {
        auto separator = reference.find(':');
        std::string kind = reference.substr(0, separator);
        std::string name = reference.substr(separator + 1);
        if (kind == "guard") {
            engine.registerGuard(name, [](WorkflowContext &, const json &) { return true; });
        } else {
            engine.registerAction(name, [name](WorkflowContext &context, const json &) {
                LOG_INFO("[permissive] action '{}' in state '{}'", name, context.getCurrentState());
            });
        }
    }
}

int runWorkflow(WorkflowService &service, const Options &options) {
    WorkflowParser parser;
    auto definition = parser.parseFile(options.definitionPath);
    reportParser(parser);
    if (!definition) {
        return 1;
    }

    if (options.permissive) {
        registerPermissiveHooks(service.getEngine(), *definition);
    }
    service.registerWorkflow(*definition);

    json data = options.dataPath ? readJsonFile(*options.dataPath) : json::object();
    WorkflowInstance instance = service.startWorkflow(definition->id, data, options.actor);

    int exitCode = 0;
    for (const auto &transition : options.positional) {
        try {
            instance = service.executeTransition(instance.id, transition, options.actor);
        } catch (const WorkflowError &e) {
            std::cerr << "Error: " << errorCodeToString(e.code()) << ": " << e.what() << "\n";
            exitCode = 2;
            break;
        }
    }

    instance = service.getWorkflowStatus(instance.id);
    json output = instance;
    output["availableTransitions"] = service.getAvailableTransitions(instance.id);
    std::cout << JsonUtils::toPrettyString(output) << "\n";
    return exitCode;
}

int runFlow(WorkflowService &service, const Options &options) {
    FlowParser parser;
    auto flow = parser.parseFile(options.definitionPath);
    reportParser(parser);
    if (!flow) {
        return 1;
    }

    registerHttpRequestHandler(service.getFlowEngine());
    service.registerFlow(*flow);

    json variables = options.positional.empty() ? json::object() : readJsonFile(options.positional.front());
    FlowRun run = service.runFlow(flow->id, variables, options.actor);

    json output = run.instance;
    output["variables"] = run.result.variables;
    output["nodesVisited"] = run.result.nodesVisited;
    if (run.result.errorCode) {
        output["errorCode"] = errorCodeToString(*run.result.errorCode);
    }
    std::cout << JsonUtils::toPrettyString(output) << "\n";
    return run.result.success ? 0 : 2;
}

}  // namespace

int main(int argc, char **argv) {
    auto options = parseArguments(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        EngineConfig config;
        if (options->configPath) {
            config = EngineConfig::fromFile(*options->configPath);
        } else {
            // Log lines share stdout with the JSON result
            config.logLevel = LogLevel::Warn;
        }
        config.applyEnvironment();
        config.applyLogging();

        WorkflowService service(std::make_shared<InMemoryWorkflowStorage>(), config);
        return options->flowMode ? runFlow(service, *options) : runWorkflow(service, *options);

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
