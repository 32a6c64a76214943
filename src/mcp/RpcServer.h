#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include "protocol/JsonRpc.h"
#include "protocol/MessageFramer.h"

class ToolRegistry;
class CallLogger;

/**
 * @brief Local RPC server loop: serves the registry to one peer over one channel.
 *
 * Requests are handled strictly one after another. The loop ends on
 * end-of-stream or after answering "shutdown"; no protocol or handler error
 * ever ends it.
 */
class RpcServer {
public:
    enum class State {
        Uninitialized,
        Ready,
        Closed
    };

    static constexpr const char* kProtocolVersion = "2024-11-05";

    RpcServer(ToolRegistry& registry, CallLogger* audit, std::string serverVersion = "1.0.0");

    // Runs until end-of-stream or shutdown.
    void serve(MessageFramer& framer);

    // Handles one decoded message. Returns the response, or nullopt for notifications
    // and stray responses.
    std::optional<RpcMessage> handle(const RpcMessage& message);

    // Response for a line the framer could not decode.
    RpcMessage handleInvalidFrame(const FrameEvent& event);

    State getState() const { return state; }
    size_t getHandledCount() const { return handled; }

private:
    ToolRegistry& registry;
    CallLogger* audit;
    std::string serverVersion;
    State state = State::Uninitialized;
    size_t handled = 0;

    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);
    nlohmann::json handleInitialize(const nlohmann::json& params);
    nlohmann::json handleToolsCall(const nlohmann::json& params);
    static bool isToolMethod(const std::string& method);
};
