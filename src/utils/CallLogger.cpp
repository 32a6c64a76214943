#include "utils/CallLogger.h"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>
#include "utils/Logger.h"

namespace fs = std::filesystem;

nlohmann::json AuditRecord::toJson() const {
    nlohmann::json j = {
        {"ts", timestamp},
        {"method", method},
        {"ok", ok},
        {"duration_ms", std::round(durationMs * 1000.0) / 1000.0}
    };
    if (!target.empty()) j["target"] = target;
    if (!tool.empty()) {
        j["tool"] = tool;
        j["args"] = args.is_null() ? nlohmann::json::object() : args;
    } else if (!params.is_null()) {
        j["params"] = params;
    }
    if (ok && resultSize) j["result_size"] = *resultSize;
    if (!ok && !error.empty()) j["error"] = error;
    return j;
}

CallLogger::CallLogger(Options options) : options(std::move(options)) {
    if (!open()) {
        Logger::getInstance().warn("Audit journal unavailable: " + this->options.path);
    }
}

CallLogger::~CallLogger() {
    std::lock_guard<std::mutex> lock(mtx);
    if (out.is_open()) {
        out.flush();
        out.close();
    }
}

bool CallLogger::open() {
    std::error_code ec;
    fs::path p = fs::u8path(options.path);
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
    }
    out.open(p, std::ios::app | std::ios::binary);
    return out.is_open();
}

bool CallLogger::isOpen() const {
    std::lock_guard<std::mutex> lock(mtx);
    return out.is_open();
}

size_t CallLogger::getFailureCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return failures;
}

void CallLogger::rotateIfNeeded() {
    if (options.maxBytes == 0) return;
    std::error_code ec;
    fs::path p = fs::u8path(options.path);
    auto size = fs::file_size(p, ec);
    if (ec || size <= options.maxBytes) return;

    out.close();
    fs::path backup = p;
    backup += ".1";
    fs::remove(backup, ec);
    fs::rename(p, backup, ec);
    if (ec) {
        Logger::getInstance().warn("Audit rotation failed: " + ec.message());
    }
    open();
}

bool CallLogger::append(const AuditRecord& record) {
    std::string line;
    try {
        line = record.toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const std::exception& e) {
        Logger::getInstance().warn(std::string("Audit record not serializable: ") + e.what());
        std::lock_guard<std::mutex> lock(mtx);
        ++failures;
        return false;
    }

    std::lock_guard<std::mutex> lock(mtx);
    rotateIfNeeded();
    if (!out.is_open() && !open()) {
        ++failures;
        Logger::getInstance().warn("Audit write skipped, journal not open: " + options.path);
        return false;
    }

    out << line << '\n';
    out.flush();
    if (!out) {
        ++failures;
        out.clear();
        Logger::getInstance().warn("Audit write failed: " + options.path);
        return false;
    }
    return true;
}

nlohmann::json CallLogger::redact(const nlohmann::json& value, size_t maxChars) {
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (s.size() > maxChars) {
            return s.substr(0, maxChars) + "…";
        }
        return value;
    }
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = redact(it.value(), maxChars);
        }
        return out;
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : value) out.push_back(redact(item, maxChars));
        return out;
    }
    if (value.is_binary()) {
        return "<binary:" + std::to_string(value.get_binary().size()) + " bytes>";
    }
    return value;
}

std::string CallLogger::nowIso() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

// ---------------------------------------------------------------------------
// ScopedAudit
// ---------------------------------------------------------------------------

ScopedAudit::ScopedAudit(CallLogger* logger, const std::string& method, const std::string& target,
                         const std::string& tool, const nlohmann::json& args)
    : logger(logger), started(std::chrono::steady_clock::now()) {
    record.timestamp = CallLogger::nowIso();
    record.method = method;
    record.target = target;
    record.tool = tool;
    if (logger) {
        if (!tool.empty()) {
            record.args = CallLogger::redact(args, logger->getRedactChars());
        } else if (!args.is_null()) {
            record.params = CallLogger::redact(args, logger->getRedactChars());
        }
    }
}

ScopedAudit::~ScopedAudit() {
    if (!committed) {
        record.ok = false;
        if (record.error.empty()) record.error = "abandoned";
        commit();
    }
}

void ScopedAudit::succeed(const nlohmann::json& result) {
    if (committed) return;
    record.ok = true;
    record.resultSize = result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size();
    commit();
}

void ScopedAudit::fail(const std::string& error) {
    if (committed) return;
    record.ok = false;
    record.error = error;
    commit();
}

void ScopedAudit::commit() {
    committed = true;
    auto elapsed = std::chrono::steady_clock::now() - started;
    record.durationMs = std::chrono::duration<double, std::milli>(elapsed).count();
    if (logger) logger->append(record);
}
