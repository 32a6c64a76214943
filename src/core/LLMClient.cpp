#include "core/LLMClient.h"
#define CPPHTTPLIB_OPENSSL_SUPPORT
#include "httplib.h"
#include "utils/Logger.h"
#include <regex>
#include <thread>
#include <chrono>
#include <stdexcept>

LLMClient::LLMClient(const std::string& apiKey, const std::string& baseUrl, const std::string& model)
    : apiKey(apiKey), baseUrl(baseUrl), modelName(model) {
    parseBaseUrl(baseUrl);
}

void LLMClient::parseBaseUrl(const std::string& url) {
    std::regex urlRegex(R"((http|https)://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (std::regex_match(url, match, urlRegex)) {
        isSsl = (match[1] == "https");
        host = match[2];
        if (match[3].matched) {
            port = std::stoi(match[3]);
        } else {
            port = isSsl ? 443 : 80;
        }
        pathPrefix = match[4];
        while (!pathPrefix.empty() && pathPrefix.back() == '/') pathPrefix.pop_back();
    } else {
        throw std::runtime_error("Invalid LLM base url: " + url);
    }
}

// Assistant content may come back as an array of text parts.
static std::string flattenContent(const nlohmann::json& content) {
    if (content.is_string()) return content.get<std::string>();
    std::string flat;
    if (content.is_array()) {
        for (const auto& part : content) {
            if (part.is_object() && part.contains("text") && part["text"].is_string())
                flat += part["text"].get<std::string>();
        }
    }
    return flat;
}

std::string LLMClient::chat(const nlohmann::json& messages, double temperature, int maxTokens) {
    httplib::Headers headers = {
        {"Authorization", "Bearer " + apiKey}
    };

    nlohmann::json body = {
        {"model", modelName},
        {"messages", messages},
        {"temperature", temperature},
        {"max_tokens", maxTokens}
    };

    std::string endpoint = pathPrefix + "/chat/completions";
    std::string bodyStr = body.dump();

    httplib::Result res;
    std::string lastError;
    int retryCount = 0;
    const int maxRetries = 3;

    while (retryCount < maxRetries) {
        if (isSsl) {
            httplib::SSLClient cli(host, port);
            cli.set_follow_location(true);
            cli.set_connection_timeout(10);
            cli.set_read_timeout(120);
            res = cli.Post(endpoint.c_str(), headers, bodyStr, "application/json");
        } else {
            httplib::Client cli(host, port);
            cli.set_follow_location(true);
            cli.set_connection_timeout(10);
            cli.set_read_timeout(120);
            res = cli.Post(endpoint.c_str(), headers, bodyStr, "application/json");
        }

        if (res && res->status == 200) break;
        // Client errors will not improve on retry.
        if (res && res->status >= 400 && res->status < 500) break;

        lastError = res ? "HTTP " + std::to_string(res->status) : httplib::to_string(res.error());
        retryCount++;
        if (retryCount < maxRetries) {
            Logger::getInstance().warn("LLM request failed (" + lastError + "). Retrying (" +
                                       std::to_string(retryCount) + "/" + std::to_string(maxRetries) + ")");
            std::this_thread::sleep_for(std::chrono::seconds(retryCount));
        }
    }

    if (!res) {
        throw std::runtime_error("LLM request failed: " + lastError);
    }
    if (res->status != 200) {
        throw std::runtime_error("LLM HTTP " + std::to_string(res->status) + ": " + res->body.substr(0, 500));
    }

    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("LLM reply is not JSON: ") + e.what());
    }

    if (!reply.is_object() || !reply.contains("choices") || !reply["choices"].is_array() || reply["choices"].empty()) {
        throw std::runtime_error("LLM reply has no choices");
    }
    const auto& msg = reply["choices"][0].value("message", nlohmann::json::object());
    if (!msg.contains("content") || msg["content"].is_null()) return "";
    return flattenContent(msg["content"]);
}
