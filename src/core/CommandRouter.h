#pragma once
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "core/ConversationContext.h"
#include "protocol/JsonRpc.h"

class ToolRegistry;
class MCPManager;
class CallLogger;

/**
 * @brief What the front-end prints for one input line.
 */
struct RouterReply {
    std::string text;
    bool ok = true;
    bool quit = false;
};

/**
 * @brief Interactive command router
 *
 * Lines starting with '/' are commands: router-local verbs, local tool calls
 * through the registry, or "<alias>.<verb>" calls routed to an external
 * process. Anything else is a chat turn sent to llm_chat together with the
 * whole conversation context.
 */
class CommandRouter {
public:
    struct ParsedCommand {
        bool isCommand = false;
        std::string target;     // external alias, empty for local
        std::string verb;       // lower-case; "chat" for plain text
        std::string args;       // remainder of the line, trimmed
    };

    CommandRouter(ToolRegistry& registry, MCPManager* peers, CallLogger* audit,
                  const Config::Router& settings, const Config::LLM& llm);

    RouterReply handleLine(const std::string& line);

    static ParsedCommand parse(const std::string& line);

    // "[ERROR <code>] message" followed by the data, if any.
    static std::string renderError(const RpcError& error);

    std::string helpText() const;

    ConversationContext& getContext() { return context; }
    const ConversationContext& getContext() const { return context; }

private:
    ToolRegistry& registry;
    MCPManager* peers;
    CallLogger* audit;
    Config::Router settings;
    Config::LLM llm;
    ConversationContext context;

    RouterReply route(const ParsedCommand& cmd);
    RouterReply handleChat(const std::string& text);
    RouterReply handleLocalCall(const std::string& args);
    RouterReply handleTools();
    RouterReply handleSave(const std::string& args);
    RouterReply handleRemote(const ParsedCommand& cmd);

    std::chrono::milliseconds timeoutFor(const std::string& alias) const;
};
