#include "mcp/RpcServer.h"
#include "tools/ToolRegistry.h"
#include "utils/CallLogger.h"
#include "utils/Logger.h"

RpcServer::RpcServer(ToolRegistry& registry, CallLogger* audit, std::string serverVersion)
    : registry(registry), audit(audit), serverVersion(std::move(serverVersion)) {}

void RpcServer::serve(MessageFramer& framer) {
    auto& logger = Logger::getInstance();
    logger.info("RPC server ready (" + std::to_string(registry.getToolCount()) + " tools)");

    while (state != State::Closed) {
        FrameEvent event = framer.readMessage();

        if (event.type == FrameEvent::Type::EndOfStream) {
            logger.info("Input closed, server loop exiting");
            state = State::Closed;
            break;
        }

        std::optional<RpcMessage> response;
        if (event.type == FrameEvent::Type::Invalid) {
            response = handleInvalidFrame(event);
        } else {
            response = handle(event.message);
        }

        if (response && !framer.writeMessage(*response)) {
            logger.error("Failed to write response, output channel closed");
            state = State::Closed;
        }
    }
}

RpcMessage RpcServer::handleInvalidFrame(const FrameEvent& event) {
    auto& logger = Logger::getInstance();
    if (event.recoveredId) {
        logger.warn(std::string(rpcErrorName(static_cast<int>(event.errorCode))) + " for id " +
                    event.recoveredId->dump() + ": " + event.error);
    } else {
        logger.warn("Discarded undecodable line: " + event.error);
    }

    if (event.errorCode == RpcErrorCode::ParseError) {
        ScopedAudit record(audit, "<parse>", "local", "", nullptr);
        record.fail(event.error);
    }

    RpcError err(event.errorCode, event.error);
    return RpcMessage::errorResponse(event.recoveredId.value_or(nullptr), err);
}

std::optional<RpcMessage> RpcServer::handle(const RpcMessage& message) {
    auto& logger = Logger::getInstance();

    if (message.isResponse()) {
        logger.warn("Ignoring unsolicited response with id " + message.id.value_or(nullptr).dump());
        return std::nullopt;
    }

    const std::string& method = *message.method;
    nlohmann::json params = message.params.value_or(nlohmann::json::object());
    if (params.is_null()) params = nlohmann::json::object();
    ++handled;

    if (message.isNotification()) {
        if (method == "notifications/initialized") {
            logger.debug("Peer acknowledged initialization");
        } else {
            logger.debug("Ignoring notification " + method);
        }
        return std::nullopt;
    }

    try {
        return RpcMessage::response(*message.id, dispatch(method, params));
    } catch (const RpcError& e) {
        return RpcMessage::errorResponse(*message.id, e);
    } catch (const std::exception& e) {
        logger.error("Unhandled failure in " + method + ": " + e.what());
        return RpcMessage::errorResponse(*message.id,
            RpcError(RpcErrorCode::InternalError, e.what(), {{"method", method}}));
    }
}

bool RpcServer::isToolMethod(const std::string& method) {
    return method == "tools/list" || method == "tools/call";
}

nlohmann::json RpcServer::dispatch(const std::string& method, const nlohmann::json& params) {
    if (isToolMethod(method) && state != State::Ready) {
        throw RpcError(RpcErrorCode::Uninitialized, "Server not initialized: call initialize first",
                       {{"method", method}});
    }

    // tools/call checks the params shape itself so the attempt is journaled.
    if (method == "tools/call") {
        return handleToolsCall(params);
    }

    if (!params.is_object()) {
        throw RpcError(RpcErrorCode::InvalidParams, "Invalid params: expected object");
    }

    if (method == "initialize") {
        return handleInitialize(params);
    }
    if (method == "ping") {
        return nlohmann::json::object();
    }
    if (method == "shutdown") {
        state = State::Closed;
        return {{"ok", true}};
    }

    if (method == "tools/list") {
        return {{"tools", registry.listTools()}};
    }

    throw RpcError(RpcErrorCode::MethodNotFound, "Method not found: " + method, {{"method", method}});
}

nlohmann::json RpcServer::handleInitialize(const nlohmann::json& params) {
    if (state == State::Uninitialized) {
        std::string client = "unknown";
        if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
            client = params["clientInfo"].value("name", client);
        } else if (params.contains("client") && params["client"].is_string()) {
            client = params["client"].get<std::string>();
        }
        Logger::getInstance().info("Initialized by " + client);
        state = State::Ready;
    }

    return {
        {"protocolVersion", kProtocolVersion},
        {"serverInfo", {{"name", "toolhost"}, {"version", serverVersion}}},
        {"capabilities", {{"tools", nlohmann::json::object()}}}
    };
}

nlohmann::json RpcServer::handleToolsCall(const nlohmann::json& params) {
    if (!params.is_object()) {
        ScopedAudit record(audit, "tools/call", "local", "<missing>", params);
        record.fail("Invalid params: expected object");
        throw RpcError(RpcErrorCode::InvalidParams, "Invalid params: expected object");
    }

    std::string name;
    if (params.contains("name") && params["name"].is_string()) {
        name = params["name"].get<std::string>();
    }

    nlohmann::json args = nlohmann::json::object();
    if (params.contains("args") && !params["args"].is_null()) {
        args = params["args"];
    } else if (params.contains("arguments") && !params["arguments"].is_null()) {
        args = params["arguments"];
    }

    ScopedAudit record(audit, "tools/call", "local", name.empty() ? "<missing>" : name, args);

    if (name.empty()) {
        record.fail("Missing 'name'");
        throw RpcError(RpcErrorCode::InvalidParams, "Missing 'name' in params");
    }

    try {
        nlohmann::json result = registry.invoke(name, args);
        record.succeed(result);
        return result;
    } catch (const RpcError& e) {
        record.fail(e.what());
        throw;
    }
}
