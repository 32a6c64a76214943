#pragma once
#include <vector>
#include <memory>
#include <map>
#include <string>
#include <chrono>
#include <future>
#include "mcp/ExternalProcessClient.h"
#include "core/ConfigManager.h"
#include "utils/Logger.h"

/**
 * @brief Owns one ExternalProcessClient per configured alias.
 *
 * Clients share no state; each has its own id space and outstanding table.
 */
class MCPManager {
public:
    struct StartFailure {
        std::string alias;
        std::string reason;
        bool required;
    };

    ~MCPManager() { stopAll(); }

    // Start and initialize every configured server in parallel.
    std::vector<StartFailure> initFromConfig(const std::vector<Config::MCPServerConfig>& configs, bool debug = false) {
        std::vector<StartFailure> failures;
        if (configs.empty()) return failures;

        std::vector<std::pair<Config::MCPServerConfig, std::future<std::string>>> futures;
        for (const auto& cfg : configs) {
            ExternalProcessClient::Options options;
            options.cwd = cfg.cwd;
            options.inheritStderr = debug;
            auto client = std::make_unique<ExternalProcessClient>(cfg.command, options);
            ExternalProcessClient* raw = client.get();
            clients[cfg.name] = Entry{std::move(client), cfg.timeoutMs};

            futures.push_back({cfg, std::async(std::launch::async, [raw, timeout = cfg.timeoutMs]() -> std::string {
                try {
                    raw->start();
                    raw->initialize(std::chrono::milliseconds(timeout));
                    return "";
                } catch (const std::exception& e) {
                    return e.what();
                }
            })});
        }

        for (auto& f : futures) {
            std::string error = f.second.get();
            if (error.empty()) {
                Logger::getInstance().success("External server '" + f.first.name + "' ready");
            } else {
                Logger::getInstance().warn("External server '" + f.first.name + "' failed to start: " + error);
                failures.push_back({f.first.name, error, f.first.required});
            }
        }
        return failures;
    }

    // Takes ownership of an already constructed client (tests, programmatic setup).
    void addClient(const std::string& alias, std::unique_ptr<ExternalProcessClient> client, int timeoutMs) {
        clients[alias] = Entry{std::move(client), timeoutMs};
    }

    ExternalProcessClient* getClient(const std::string& alias) {
        auto it = clients.find(alias);
        return it == clients.end() ? nullptr : it->second.client.get();
    }

    std::chrono::milliseconds getTimeout(const std::string& alias) const {
        auto it = clients.find(alias);
        return std::chrono::milliseconds(it == clients.end() ? 30000 : it->second.timeoutMs);
    }

    bool hasAlias(const std::string& alias) const { return clients.count(alias) > 0; }

    std::vector<std::string> aliases() const {
        std::vector<std::string> names;
        for (const auto& [name, entry] : clients) names.push_back(name);
        return names;
    }

    void stopAll() {
        for (auto& [name, entry] : clients) {
            if (entry.client) entry.client->stop();
        }
    }

private:
    struct Entry {
        std::unique_ptr<ExternalProcessClient> client;
        int timeoutMs = 30000;
    };
    std::map<std::string, Entry> clients;
};
