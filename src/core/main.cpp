#include <iostream>
#include <string>
#include <memory>
#include <vector>
#include <filesystem>
#include <csignal>
#include <unistd.h>
#include "core/ConfigManager.h"
#include "core/LLMClient.h"
#include "core/CommandRouter.h"
#include "mcp/MCPManager.h"
#include "mcp/RpcServer.h"
#include "protocol/MessageFramer.h"
#include "tools/ToolRegistry.h"
#include "tools/CoreTools.h"
#include "tools/Sandbox.h"
#include "utils/CallLogger.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;244m";

static void printUsage() {
    std::cout << "Usage: toolhost [serve|chat] [--config <path>] [--debug]\n"
              << "       toolhost --version | --help\n\n"
              << "  serve    Serve the local tools as JSON-RPC over stdin/stdout\n"
              << "  chat     Interactive router (default)\n\n"
              << "Without --config, ./toolhost.json is used when present.\n";
}

static int runServe(ToolRegistry& registry, CallLogger& audit) {
    FdChannel channel(STDIN_FILENO, STDOUT_FILENO);
    MessageFramer framer(channel);
    RpcServer server(registry, &audit, TOOLHOST_VERSION);

    Logger::getInstance().info("Serving " + std::to_string(registry.getToolCount()) + " tools on stdio");
    server.serve(framer);
    Logger::getInstance().info("Input closed after " + std::to_string(server.getHandledCount()) + " messages");
    return 0;
}

static int runChat(const Config& cfg, ToolRegistry& registry, CallLogger& audit) {
    MCPManager peers;
    auto failures = peers.initFromConfig(cfg.mcpServers, cfg.debug);
    for (const auto& f : failures) {
        if (f.required) {
            std::cerr << RED << "✖ External server '" << f.alias << "' failed to start: " << f.reason << RESET << std::endl;
            return 2;
        }
    }

    CommandRouter router(registry, &peers, &audit, cfg.router, cfg.llm);

    std::cout << BOLD << CYAN << "toolhost " << TOOLHOST_VERSION << RESET
              << GRAY << "  (model: " << cfg.llm.model << ", /help for commands)" << RESET << std::endl;

    std::string line;
    while (true) {
        std::cout << BOLD << "> " << RESET << std::flush;
        if (!std::getline(std::cin, line)) break;

        RouterReply reply = router.handleLine(line);
        if (!reply.text.empty()) {
            if (reply.ok) std::cout << reply.text << std::endl;
            else std::cout << RED << reply.text << RESET << std::endl;
        }
        if (reply.quit) break;
    }

    peers.stopAll();
    return 0;
}

int main(int argc, char* argv[]) {
    std::string mode = "chat";
    std::string configPath;
    bool debugFlag = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--version") {
            std::cout << "toolhost " << TOOLHOST_VERSION << std::endl;
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--debug") {
            debugFlag = true;
        } else if (arg == "serve" || arg == "chat") {
            mode = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage();
            return 1;
        }
    }

    // stdout carries protocol messages in serve mode.
    Logger::getInstance().setSink(mode == "serve" ? Logger::Sink::Stderr : Logger::Sink::Stdout);
    std::signal(SIGPIPE, SIG_IGN);

    Config cfg;
    try {
        if (configPath.empty()) {
            cfg = Config::load("toolhost.json", false);
        } else {
            cfg = Config::load(configPath);
        }
        cfg.applyEnvironment();
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        return 1;
    }
    cfg.debug = cfg.debug || debugFlag;

    Logger::getInstance().setDebug(cfg.debug);
    if (!cfg.logPath.empty() && !Logger::getInstance().setLogFile(cfg.logPath)) {
        std::cerr << "Cannot open diagnostic log " << cfg.logPath << std::endl;
    }

    CallLogger::Options auditOptions;
    auditOptions.path = cfg.audit.path;
    auditOptions.maxBytes = cfg.audit.maxBytes;
    auditOptions.redactChars = cfg.audit.redactChars;
    CallLogger audit(auditOptions);

    Sandbox sandbox(cfg.sandbox.allowedDirs, cfg.sandbox.maxBytes);
    ToolRegistry registry;
    try {
        auto llm = std::make_shared<LLMClient>(cfg.llm.apiKey, cfg.llm.baseUrl, cfg.llm.model);
        registerCoreTools(registry, cfg, sandbox, llm);
        registry.freeze();
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Startup failed: " << e.what() << RESET << std::endl;
        return 1;
    }
    Logger::getInstance().debug("Registered " + std::to_string(registry.getToolCount()) + " tools");

    if (mode == "serve") {
        return runServe(registry, audit);
    }
    return runChat(cfg, registry, audit);
}
