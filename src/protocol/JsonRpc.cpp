#include "protocol/JsonRpc.h"

const char* rpcErrorName(int code) {
    switch (static_cast<RpcErrorCode>(code)) {
        case RpcErrorCode::ParseError: return "ParseError";
        case RpcErrorCode::InvalidRequest: return "InvalidRequest";
        case RpcErrorCode::MethodNotFound: return "MethodNotFound";
        case RpcErrorCode::InvalidParams: return "InvalidParams";
        case RpcErrorCode::InternalError: return "InternalError";
        case RpcErrorCode::Timeout: return "Timeout";
        case RpcErrorCode::Uninitialized: return "Uninitialized";
        case RpcErrorCode::ProcessTerminated: return "ProcessTerminated";
    }
    return "RemoteError";
}

RpcError::RpcError(RpcErrorCode code, const std::string& message, nlohmann::json data)
    : RpcError(static_cast<int>(code), message, std::move(data)) {}

RpcError::RpcError(int code, const std::string& message, nlohmann::json data)
    : std::runtime_error(message), errorCode(code), errorData(std::move(data)) {}

nlohmann::json RpcError::toJson() const {
    nlohmann::json err = {
        {"code", errorCode},
        {"message", what()}
    };
    if (!errorData.is_null()) {
        err["data"] = errorData;
    }
    return err;
}

RpcError RpcError::fromJson(const nlohmann::json& error) {
    if (!error.is_object()) {
        return RpcError(RpcErrorCode::InternalError, "Malformed error object", error);
    }
    int code = static_cast<int>(RpcErrorCode::InternalError);
    if (error.contains("code") && error["code"].is_number_integer()) {
        code = error["code"].get<int>();
    }
    std::string message = "Unknown error";
    if (error.contains("message") && error["message"].is_string()) {
        message = error["message"].get<std::string>();
    }
    return RpcError(code, message, error.value("data", nlohmann::json()));
}

nlohmann::json RpcMessage::toJson() const {
    nlohmann::json j = {{"jsonrpc", "2.0"}};
    if (id) j["id"] = *id;
    if (method) j["method"] = *method;
    if (params) j["params"] = *params;
    if (result) j["result"] = *result;
    if (error) j["error"] = *error;
    return j;
}

RpcMessage RpcMessage::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw RpcError(RpcErrorCode::InvalidRequest, "Message is not a JSON object");
    }

    RpcMessage msg;
    if (j.contains("id")) {
        const auto& id = j["id"];
        if (!id.is_null() && !id.is_number_integer() && !id.is_string()) {
            throw RpcError(RpcErrorCode::InvalidRequest, "id must be an integer or a string");
        }
        msg.id = id;
    }
    if (j.contains("method")) {
        if (!j["method"].is_string()) {
            throw RpcError(RpcErrorCode::InvalidRequest, "method must be a string", msg.id.value_or(nullptr));
        }
        msg.method = j["method"].get<std::string>();
    }
    if (j.contains("params")) msg.params = j["params"];
    if (j.contains("result")) msg.result = j["result"];
    if (j.contains("error")) msg.error = j["error"];

    if (msg.method) {
        if (msg.result || msg.error) {
            throw RpcError(RpcErrorCode::InvalidRequest, "A request cannot carry result or error");
        }
    } else {
        if (!msg.result && !msg.error) {
            throw RpcError(RpcErrorCode::InvalidRequest, "Message has neither method nor result/error");
        }
        if (msg.result && msg.error) {
            throw RpcError(RpcErrorCode::InvalidRequest, "A response carries exactly one of result or error");
        }
    }
    return msg;
}

RpcMessage RpcMessage::request(const nlohmann::json& id, const std::string& method, const nlohmann::json& params) {
    RpcMessage msg;
    msg.id = id;
    msg.method = method;
    msg.params = params;
    return msg;
}

RpcMessage RpcMessage::notification(const std::string& method, const nlohmann::json& params) {
    RpcMessage msg;
    msg.method = method;
    msg.params = params;
    return msg;
}

RpcMessage RpcMessage::response(const nlohmann::json& id, const nlohmann::json& result) {
    RpcMessage msg;
    msg.id = id;
    msg.result = result;
    return msg;
}

RpcMessage RpcMessage::errorResponse(const nlohmann::json& id, const RpcError& err) {
    RpcMessage msg;
    msg.id = id;
    msg.error = err.toJson();
    return msg;
}

bool RpcMessage::operator==(const RpcMessage& other) const {
    return id == other.id && method == other.method && params == other.params &&
           result == other.result && error == other.error;
}
