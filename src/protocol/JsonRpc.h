#pragma once
#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

/**
 * @brief JSON-RPC 2.0 message model shared by the server loop, the external
 * process client and the router.
 */

// Standard JSON-RPC codes plus the host-specific ones in the -32000 range.
enum class RpcErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    Timeout = -32001,
    Uninitialized = -32002,
    ProcessTerminated = -32003
};

const char* rpcErrorName(int code);

class RpcError : public std::runtime_error {
public:
    RpcError(RpcErrorCode code, const std::string& message, nlohmann::json data = nullptr);
    RpcError(int code, const std::string& message, nlohmann::json data = nullptr);

    int code() const { return errorCode; }
    bool is(RpcErrorCode c) const { return errorCode == static_cast<int>(c); }
    const nlohmann::json& data() const { return errorData; }

    // {"code", "message", "data"?}
    nlohmann::json toJson() const;

    // Accepts a wire "error" member; anything malformed becomes an InternalError.
    static RpcError fromJson(const nlohmann::json& error);

private:
    int errorCode;
    nlohmann::json errorData;
};

struct RpcMessage {
    std::optional<nlohmann::json> id;
    std::optional<std::string> method;
    std::optional<nlohmann::json> params;
    std::optional<nlohmann::json> result;
    std::optional<nlohmann::json> error;

    bool isRequest() const { return method.has_value() && id.has_value(); }
    bool isNotification() const { return method.has_value() && !id.has_value(); }
    bool isResponse() const { return !method.has_value() && (result.has_value() || error.has_value()); }

    nlohmann::json toJson() const;

    // Throws RpcError(InvalidRequest) when the object is not a structurally valid message.
    static RpcMessage fromJson(const nlohmann::json& j);

    static RpcMessage request(const nlohmann::json& id, const std::string& method, const nlohmann::json& params);
    static RpcMessage notification(const std::string& method, const nlohmann::json& params);
    static RpcMessage response(const nlohmann::json& id, const nlohmann::json& result);
    static RpcMessage errorResponse(const nlohmann::json& id, const RpcError& err);

    bool operator==(const RpcMessage& other) const;
    bool operator!=(const RpcMessage& other) const { return !(*this == other); }
};
