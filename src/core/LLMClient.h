#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief OpenAI-compatible chat completions client.
 *
 * Methods are virtual so tests can substitute a scripted model.
 */
class LLMClient {
public:
    LLMClient(const std::string& apiKey,
              const std::string& baseUrl = "http://localhost:11434/v1",
              const std::string& model = "llama3.2:3b");
    virtual ~LLMClient() = default;

    /**
     * @brief Send a message list and return the assistant text.
     * @throws std::runtime_error on transport failure or a malformed reply
     */
    virtual std::string chat(const nlohmann::json& messages, double temperature, int maxTokens);

    const std::string& getModel() const { return modelName; }
    const std::string& getHost() const { return host; }
    int getPort() const { return port; }
    bool usesSsl() const { return isSsl; }
    const std::string& getPathPrefix() const { return pathPrefix; }

private:
    std::string apiKey;
    std::string baseUrl;
    std::string modelName;
    bool isSsl = false;
    std::string host;
    int port = 80;
    std::string pathPrefix;

    void parseBaseUrl(const std::string& url);
};
