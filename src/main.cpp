#include <iostream>
#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "core/Errors.h"
#include "process/ProcessRunner.h"
#include "sandbox/BoundarySet.h"
#include "sandbox/PathResolver.h"
#include "tools/CoreTools.h"
#include "tools/ToolRegistry.h"
#include "utils/Logger.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitToolError = 1;
constexpr int kExitUsage = 2;

void printUsage() {
    std::cerr << "Usage: warden [--config FILE] [--root DIR]... [--debug] <command>\n"
              << "\n"
              << "Commands:\n"
              << "  list-tools              Print the tool definitions as JSON\n"
              << "  call TOOL [JSON_ARGS]   Run one tool and print its JSON result\n"
              << "\n"
              << "Without --root the current directory is the only allowed directory.\n";
}

struct CommandLine {
    std::string configPath;
    std::vector<std::string> roots;
    bool debug = false;
    std::vector<std::string> positional;
};

bool parseCommandLine(int argc, char* argv[], CommandLine& cli) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--root") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            if (arg == "--config") {
                cli.configPath = argv[++i];
            } else {
                cli.roots.push_back(argv[++i]);
            }
        } else if (arg == "--debug") {
            cli.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else {
            cli.positional.push_back(arg);
        }
    }
    return !cli.positional.empty();
}

}

int main(int argc, char* argv[]) {
    CommandLine cli;
    if (!parseCommandLine(argc, argv, cli)) {
        printUsage();
        return kExitUsage;
    }

    Config cfg;
    std::shared_ptr<const BoundarySet> boundaries;
    try {
        if (!cli.configPath.empty()) {
            cfg = Config::load(cli.configPath);
        }
        if (!cli.roots.empty()) {
            cfg.boundary.directories = cli.roots;
        }
        if (cli.debug) {
            cfg.logging.debug = true;
        }

        Logger::getInstance().setLogFile(cfg.logging.file);
        Logger::getInstance().setDebugEnabled(cfg.logging.debug);

        boundaries = std::make_shared<const BoundarySet>(BoundarySet::create(cfg.boundarySource()));
    } catch (const ConfigError& e) {
        Logger::getInstance().error(std::string("Configuration error: ") + e.what());
        return kExitUsage;
    }

    Logger::getInstance().info("Allowed directories: " + boundaries->describe());
    Logger::getInstance().debug("Relative paths resolve against " + boundaries->baseDirectory().string());

    auto resolver = std::make_shared<const PathResolver>(boundaries);
    auto runner = std::make_shared<ProcessRunner>(std::chrono::milliseconds(cfg.process.killGraceMs));

    ToolRegistry registry;
    registerBuiltinTools(registry, resolver, runner, cfg);

    const std::string& command = cli.positional[0];
    if (command == "list-tools") {
        nlohmann::json tools = registry.listToolSchemas();
        std::cout << tools.dump(2) << std::endl;
        return kExitOk;
    }

    if (command == "call") {
        if (cli.positional.size() < 2 || cli.positional.size() > 3) {
            printUsage();
            return kExitUsage;
        }
        const std::string& toolName = cli.positional[1];
        nlohmann::json args = nlohmann::json::object();
        if (cli.positional.size() == 3) {
            try {
                args = nlohmann::json::parse(cli.positional[2]);
            } catch (const nlohmann::json::parse_error& e) {
                std::cerr << "Invalid JSON arguments: " << e.what() << std::endl;
                return kExitUsage;
            }
        }

        nlohmann::json result = registry.executeTool(toolName, args);
        std::cout << result.dump(2) << std::endl;
        return ToolRegistry::isError(result) ? kExitToolError : kExitOk;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage();
    return kExitUsage;
}
