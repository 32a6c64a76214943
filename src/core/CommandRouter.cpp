#include "core/CommandRouter.h"
#include "tools/ToolRegistry.h"
#include "mcp/MCPManager.h"
#include "utils/CallLogger.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <sstream>

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// "NAME {json}" -> name, json text ("{}" when absent)
static std::pair<std::string, std::string> splitNameAndJson(const std::string& args) {
    size_t ws = 0;
    while (ws < args.size() && !std::isspace(static_cast<unsigned char>(args[ws]))) ++ws;
    std::string name = args.substr(0, ws);
    std::string rest = trim(args.substr(ws));
    return {name, rest.empty() ? "{}" : rest};
}

// Tool output may carry raw non-UTF-8 bytes (CSV cells, PDF text); render them as U+FFFD.
static std::string renderJson(const nlohmann::json& value) {
    return value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

static nlohmann::json parseJsonArgs(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw RpcError(RpcErrorCode::ParseError, std::string("Invalid JSON: ") + e.what());
    }
}

CommandRouter::CommandRouter(ToolRegistry& registry, MCPManager* peers, CallLogger* audit,
                             const Config::Router& settings, const Config::LLM& llm)
    : registry(registry), peers(peers), audit(audit), settings(settings), llm(llm),
      context(settings.contextChars) {}

CommandRouter::ParsedCommand CommandRouter::parse(const std::string& line) {
    ParsedCommand cmd;
    std::string text = trim(line);
    if (text.empty() || text[0] != '/') {
        cmd.verb = "chat";
        cmd.args = text;
        return cmd;
    }

    cmd.isCommand = true;
    size_t ws = 1;
    while (ws < text.size() && !std::isspace(static_cast<unsigned char>(text[ws]))) ++ws;
    std::string head = text.substr(1, ws - 1);
    cmd.args = trim(text.substr(ws));

    // Aliases match the configured server names exactly; only verbs are case-insensitive.
    size_t dot = head.find('.');
    if (dot != std::string::npos) {
        cmd.target = head.substr(0, dot);
        cmd.verb = head.substr(dot + 1);
    } else {
        cmd.verb = head;
    }
    std::transform(cmd.verb.begin(), cmd.verb.end(), cmd.verb.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return cmd;
}

std::string CommandRouter::renderError(const RpcError& error) {
    std::string text = "[ERROR " + std::to_string(error.code()) + "] " + error.what();
    if (!error.data().is_null()) {
        text += "\n" + renderJson(error.data());
    }
    return text;
}

std::string CommandRouter::helpText() const {
    std::ostringstream out;
    out << "Commands:\n"
        << "  /help                  Show this help\n"
        << "  /tools                 List local tools\n"
        << "  /new, /reset           Reset the conversation context\n"
        << "  /save [file.md]        Save the transcript (default: " << settings.transcriptPath << ")\n"
        << "  /call NAME {json}      Call a local tool with JSON arguments\n"
        << "  /<alias>.list          List the tools of an external server\n"
        << "  /<alias>.call NAME {json}\n"
        << "                         Call a tool on an external server\n"
        << "  /<alias>.rpc {json}    Raw request, e.g. {\"method\":\"tools/list\"}\n"
        << "  /<alias>.restart       Restart an external server\n"
        << "  /exit, /quit, /q       Quit\n";
    if (peers) {
        auto aliases = peers->aliases();
        if (!aliases.empty()) {
            out << "\nExternal servers:";
            for (const auto& a : aliases) out << " " << a;
            out << "\n";
        }
    }
    out << "\nAny other text is sent to llm_chat with the conversation context.";
    return out.str();
}

RouterReply CommandRouter::handleLine(const std::string& line) {
    try {
        return route(parse(line));
    } catch (const RpcError& e) {
        return {renderError(e), false, false};
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Command failed: ") + e.what());
        return {renderError(RpcError(RpcErrorCode::InternalError, e.what())), false, false};
    }
}

RouterReply CommandRouter::route(const ParsedCommand& cmd) {
    if (!cmd.isCommand) {
        if (cmd.args.empty()) return {"", true, false};
        return handleChat(cmd.args);
    }

    if (!cmd.target.empty()) {
        return handleRemote(cmd);
    }

    if (cmd.verb == "exit" || cmd.verb == "quit" || cmd.verb == "q") {
        return {"Bye.", true, true};
    }
    if (cmd.verb == "help") {
        return {helpText(), true, false};
    }
    if (cmd.verb == "new" || cmd.verb == "reset") {
        context.reset();
        return {"Context reset.", true, false};
    }
    if (cmd.verb == "tools") {
        return handleTools();
    }
    if (cmd.verb == "save") {
        return handleSave(cmd.args);
    }
    if (cmd.verb == "call") {
        return handleLocalCall(cmd.args);
    }
    return {"Unknown command: /" + cmd.verb + ". Type /help for help.", false, false};
}

RouterReply CommandRouter::handleChat(const std::string& text) {
    context.append("user", text);

    nlohmann::json args = {
        {"prompt", context.buildPrompt()},
        {"temperature", llm.temperature},
        {"max_tokens", llm.maxTokens},
        {"history", context.toJson()}
    };

    RouterReply reply;
    ScopedAudit record(audit, "tools/call", "local", "llm_chat", args);
    try {
        nlohmann::json result = registry.invoke("llm_chat", args);
        record.succeed(result);
        std::string answer;
        if (result.is_object() && result.contains("text") && result["text"].is_string()) {
            answer = trim(result["text"].get<std::string>());
        }
        reply.text = answer.empty() ? "(empty reply)" : answer;
    } catch (const RpcError& e) {
        record.fail(e.what());
        reply.text = renderError(e);
        reply.ok = false;
    }

    context.append("assistant", reply.text);
    return reply;
}

RouterReply CommandRouter::handleTools() {
    nlohmann::json tools = registry.listTools();
    std::string names;
    for (const auto& t : tools) {
        names += (names.empty() ? "" : ", ") + t["name"].get<std::string>();
    }
    std::string text = "Tools: " + (names.empty() ? std::string("(none)") : names);
    if (peers) {
        auto aliases = peers->aliases();
        if (!aliases.empty()) {
            text += "\nExternal servers:";
            for (const auto& a : aliases) text += " " + a;
        }
    }
    return {text, true, false};
}

RouterReply CommandRouter::handleSave(const std::string& args) {
    std::string path = args.empty() ? settings.transcriptPath : args;
    try {
        std::string written = context.saveTranscript(path);
        return {"Transcript saved to " + written, true, false};
    } catch (const std::exception& e) {
        return {std::string("[ERROR] ") + e.what(), false, false};
    }
}

RouterReply CommandRouter::handleLocalCall(const std::string& args) {
    auto [name, jsonText] = splitNameAndJson(args);
    if (name.empty()) {
        return {"Usage: /call NAME {json_args}", false, false};
    }

    try {
        nlohmann::json callArgs = parseJsonArgs(jsonText);
        ScopedAudit record(audit, "tools/call", "local", name, callArgs);
        try {
            nlohmann::json result = registry.invoke(name, callArgs);
            record.succeed(result);
            return {renderJson(result), true, false};
        } catch (const RpcError& e) {
            record.fail(e.what());
            throw;
        }
    } catch (const RpcError& e) {
        return {renderError(e), false, false};
    } catch (const std::exception& e) {
        return {renderError(RpcError(RpcErrorCode::InternalError, e.what())), false, false};
    }
}

std::chrono::milliseconds CommandRouter::timeoutFor(const std::string& alias) const {
    if (peers && peers->hasAlias(alias)) return peers->getTimeout(alias);
    return std::chrono::milliseconds(settings.callTimeoutMs);
}

RouterReply CommandRouter::handleRemote(const ParsedCommand& cmd) {
    ExternalProcessClient* client = peers ? peers->getClient(cmd.target) : nullptr;
    if (!client) {
        return {"External server '" + cmd.target + "' is not configured.", false, false};
    }
    auto timeout = timeoutFor(cmd.target);

    try {
        if (cmd.verb == "list") {
            ScopedAudit record(audit, "tools/list", cmd.target, "", nullptr);
            try {
                nlohmann::json tools = client->listTools(timeout);
                record.succeed(tools);
                std::string names;
                for (const auto& t : tools) {
                    if (t.is_object() && t.contains("name")) {
                        names += (names.empty() ? "" : ", ") + t["name"].get<std::string>();
                    }
                }
                return {cmd.target + " tools: " + (names.empty() ? std::string("(none)") : names), true, false};
            } catch (const RpcError& e) {
                record.fail(e.what());
                throw;
            }
        }

        if (cmd.verb == "call") {
            auto [name, jsonText] = splitNameAndJson(cmd.args);
            if (name.empty()) {
                return {"Usage: /" + cmd.target + ".call NAME {json_args}", false, false};
            }
            nlohmann::json callArgs = parseJsonArgs(jsonText);
            ScopedAudit record(audit, "tools/call", cmd.target, name, callArgs);
            try {
                nlohmann::json result = client->callTool(name, callArgs, timeout);
                record.succeed(result);
                return {renderJson(result), true, false};
            } catch (const RpcError& e) {
                record.fail(e.what());
                throw;
            }
        }

        if (cmd.verb == "rpc") {
            if (cmd.args.empty()) {
                return {"Usage: /" + cmd.target + ".rpc {\"method\":\"tools/list\"}", false, false};
            }
            nlohmann::json payload = parseJsonArgs(cmd.args);
            if (!payload.is_object() || !payload.contains("method") || !payload["method"].is_string()) {
                throw RpcError(RpcErrorCode::InvalidRequest, "Payload needs a string 'method'");
            }
            std::string method = payload["method"].get<std::string>();
            nlohmann::json params = payload.value("params", nlohmann::json::object());
            if (params.is_null()) params = nlohmann::json::object();

            ScopedAudit record(audit, method, cmd.target, "", params);
            try {
                nlohmann::json result = client->call(method, params, timeout);
                record.succeed(result);
                return {renderJson(result), true, false};
            } catch (const RpcError& e) {
                record.fail(e.what());
                throw;
            }
        }

        if (cmd.verb == "restart") {
            client->restart(timeout);
            return {"Restarted '" + cmd.target + "' (pid " + std::to_string(client->getPid()) + ")", true, false};
        }
    } catch (const RpcError& e) {
        return {renderError(e), false, false};
    } catch (const std::exception& e) {
        return {renderError(RpcError(RpcErrorCode::InternalError, e.what())), false, false};
    }

    return {"Unknown command: /" + cmd.target + "." + cmd.verb + ". Type /help for help.", false, false};
}
