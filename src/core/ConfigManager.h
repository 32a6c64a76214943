#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <cstdlib>
#include <cstdint>
#include <nlohmann/json.hpp>

struct Config {
    struct LLM {
        std::string apiKey = "ollama";
        std::string baseUrl = "http://localhost:11434/v1";
        std::string model = "llama3.2:3b";
        std::string systemPrompt;
        std::string systemPromptPath;
        double temperature = 0.2;
        int maxTokens = 120;
    } llm;

    struct Sandbox {
        std::vector<std::string> allowedDirs = {"./samples", "~/datasets", "~/docs"};
        std::uintmax_t maxBytes = 25 * 1024 * 1024;
    } sandbox;

    struct Audit {
        std::string path = "reports/mcp.log.jsonl";
        std::uintmax_t maxBytes = 5 * 1024 * 1024;
        size_t redactChars = 1000;
    } audit;

    struct Router {
        size_t contextChars = 4000;
        int callTimeoutMs = 30000;
        std::string transcriptPath = "reports/chat.md";
    } router;

    struct MCPServerConfig {
        std::string name;
        std::string command;
        std::string cwd;
        int timeoutMs = 30000;
        bool required = false;
    };
    std::vector<MCPServerConfig> mcpServers;

    std::string reportsDir = "reports";
    std::string logPath = ".toolhost/toolhost.log";
    bool debug = false;

    /**
     * @brief Load from a JSON file. Missing keys keep their defaults.
     * @param mustExist when false, a missing file yields the defaults
     */
    static Config load(const std::string& pathStr, bool mustExist = true) {
        Config cfg;
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            if (mustExist) {
                throw std::runtime_error("Could not open config file: " + pathStr);
            }
            return cfg;
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j);
    }

    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (!j.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        try {
            if (j.contains("llm")) {
                const auto& l = j.at("llm");
                cfg.llm.apiKey = l.value("api_key", cfg.llm.apiKey);
                cfg.llm.baseUrl = l.value("base_url", cfg.llm.baseUrl);
                cfg.llm.model = l.value("model", cfg.llm.model);
                cfg.llm.systemPrompt = l.value("system_prompt", cfg.llm.systemPrompt);
                cfg.llm.systemPromptPath = l.value("system_prompt_path", cfg.llm.systemPromptPath);
                cfg.llm.temperature = l.value("temperature", cfg.llm.temperature);
                cfg.llm.maxTokens = l.value("max_tokens", cfg.llm.maxTokens);
            }

            if (j.contains("sandbox")) {
                const auto& s = j.at("sandbox");
                if (s.contains("allowed_dirs")) {
                    cfg.sandbox.allowedDirs = s["allowed_dirs"].get<std::vector<std::string>>();
                }
                cfg.sandbox.maxBytes = s.value("max_bytes", cfg.sandbox.maxBytes);
            }

            if (j.contains("audit")) {
                const auto& a = j.at("audit");
                cfg.audit.path = a.value("path", cfg.audit.path);
                cfg.audit.maxBytes = a.value("max_bytes", cfg.audit.maxBytes);
                cfg.audit.redactChars = a.value("redact_chars", cfg.audit.redactChars);
            }

            if (j.contains("router")) {
                const auto& r = j.at("router");
                cfg.router.contextChars = r.value("context_chars", cfg.router.contextChars);
                cfg.router.callTimeoutMs = r.value("call_timeout_ms", cfg.router.callTimeoutMs);
                cfg.router.transcriptPath = r.value("transcript_path", cfg.router.transcriptPath);
            }

            cfg.reportsDir = j.value("reports_dir", cfg.reportsDir);
            cfg.logPath = j.value("log_path", cfg.logPath);
            cfg.debug = j.value("debug", cfg.debug);

            if (j.contains("mcp_servers")) {
                for (const auto& item : j["mcp_servers"]) {
                    MCPServerConfig server;
                    server.name = item.at("name").get<std::string>();
                    server.command = item.at("command").get<std::string>();
                    server.cwd = item.value("cwd", "");
                    server.timeoutMs = item.value("timeout_ms", cfg.router.callTimeoutMs);
                    server.required = item.value("required", false);
                    cfg.addServer(server);
                }
            }
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid config: ") + e.what());
        }
        return cfg;
    }

    // FS_MCP_CMD, GIT_MCP_CMD, PEER1_MCP_CMD, LLM_*, OPENAI_*, REPORTS_DIR, MCP_LOG_*
    void applyEnvironment() {
        auto env = [](const char* name) -> std::string {
            const char* v = std::getenv(name);
            return v ? std::string(v) : std::string();
        };

        struct EnvPeer { const char* alias; const char* cmdVar; const char* cwdVar; };
        const EnvPeer peers[] = {
            {"fs", "FS_MCP_CMD", nullptr},
            {"git", "GIT_MCP_CMD", nullptr},
            {"peer1", "PEER1_MCP_CMD", "PEER1_MCP_CWD"}
        };
        for (const auto& p : peers) {
            std::string cmd = env(p.cmdVar);
            if (cmd.empty()) continue;
            MCPServerConfig server;
            server.name = p.alias;
            server.command = cmd;
            server.cwd = p.cwdVar ? env(p.cwdVar) : "";
            server.timeoutMs = router.callTimeoutMs;
            server.required = true;
            addServer(server);
        }

        if (!env("LLM_MODEL").empty()) llm.model = env("LLM_MODEL");
        if (!env("OPENAI_API_BASE").empty()) llm.baseUrl = env("OPENAI_API_BASE");
        if (!env("OPENAI_API_KEY").empty()) llm.apiKey = env("OPENAI_API_KEY");
        if (!env("LLM_SYSTEM_PROMPT").empty()) llm.systemPrompt = env("LLM_SYSTEM_PROMPT");
        if (!env("LLM_SYSTEM_PROMPT_PATH").empty()) llm.systemPromptPath = env("LLM_SYSTEM_PROMPT_PATH");
        try {
            if (!env("LLM_TEMPERATURE").empty()) llm.temperature = std::stod(env("LLM_TEMPERATURE"));
            if (!env("LLM_MAX_TOKENS").empty()) llm.maxTokens = std::stoi(env("LLM_MAX_TOKENS"));
            if (!env("MCP_LOG_MAX_BYTES").empty()) audit.maxBytes = std::stoull(env("MCP_LOG_MAX_BYTES"));
        } catch (const std::exception&) {
            throw std::runtime_error("Invalid numeric value in LLM_TEMPERATURE, LLM_MAX_TOKENS or MCP_LOG_MAX_BYTES");
        }
        if (!env("REPORTS_DIR").empty()) {
            reportsDir = env("REPORTS_DIR");
            if (env("MCP_LOG_PATH").empty()) {
                audit.path = (std::filesystem::u8path(reportsDir) / "mcp.log.jsonl").u8string();
            }
        }
        if (!env("MCP_LOG_PATH").empty()) audit.path = env("MCP_LOG_PATH");
    }

    // Same alias twice: the later definition wins.
    void addServer(const MCPServerConfig& server) {
        if (server.name.empty() || server.command.empty()) {
            throw std::runtime_error("mcp_servers entries need a name and a command");
        }
        for (auto& existing : mcpServers) {
            if (existing.name == server.name) {
                existing = server;
                return;
            }
        }
        mcpServers.push_back(server);
    }
};
