#pragma once
#include <string>
#include <optional>
#include <mutex>
#include <fstream>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

/**
 * @brief One audit journal entry per invocation attempt.
 */
struct AuditRecord {
    std::string timestamp;          // ISO-8601 local time
    std::string method;
    bool ok = false;
    double durationMs = 0.0;
    std::string target;             // "local" or an external alias
    std::string tool;
    nlohmann::json args;            // tools/call arguments, redacted
    nlohmann::json params;          // other methods, redacted
    std::optional<size_t> resultSize;
    std::string error;

    nlohmann::json toJson() const;
};

/**
 * @brief Append-only, line-delimited audit journal.
 *
 * The file handle is held for the logger's lifetime. append() never throws
 * and never turns a write failure into a caller-visible error; failures go
 * to the diagnostic Logger instead.
 */
class CallLogger {
public:
    struct Options {
        std::string path = "reports/mcp.log.jsonl";
        std::uintmax_t maxBytes = 5 * 1024 * 1024;   // rotation threshold, 0 disables
        size_t redactChars = 1000;
    };

    explicit CallLogger(Options options);
    ~CallLogger();

    CallLogger(const CallLogger&) = delete;
    CallLogger& operator=(const CallLogger&) = delete;

    bool append(const AuditRecord& record);

    bool isOpen() const;
    const std::string& getPath() const { return options.path; }
    size_t getFailureCount() const;
    size_t getRedactChars() const { return options.redactChars; }

    static nlohmann::json redact(const nlohmann::json& value, size_t maxChars);
    static std::string nowIso();

private:
    Options options;
    mutable std::mutex mtx;
    std::ofstream out;
    size_t failures = 0;

    bool open();
    void rotateIfNeeded();
};

/**
 * @brief Measures one invocation and writes its record exactly once.
 *
 * If neither succeed() nor fail() was called before destruction, the record
 * is written as a failure.
 */
class ScopedAudit {
public:
    ScopedAudit(CallLogger* logger, const std::string& method, const std::string& target,
                const std::string& tool, const nlohmann::json& args);
    ~ScopedAudit();

    ScopedAudit(const ScopedAudit&) = delete;
    ScopedAudit& operator=(const ScopedAudit&) = delete;

    void succeed(const nlohmann::json& result);
    void fail(const std::string& error);

private:
    CallLogger* logger;
    AuditRecord record;
    std::chrono::steady_clock::time_point started;
    bool committed = false;

    void commit();
};
