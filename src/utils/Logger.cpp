#include "utils/Logger.h"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <filesystem>

// ANSI Color Codes
namespace {
    const std::string RESET = "\033[0m";
    const std::string BOLD = "\033[1m";
    const std::string RED = "\033[38;5;196m";
    const std::string GREEN = "\033[38;5;46m";
    const std::string YELLOW = "\033[38;5;226m";
    const std::string CYAN = "\033[38;5;51m";
    const std::string GRAY = "\033[38;5;242m";

    const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "[ERROR] ";
            case LogLevel::WARNING: return "[WARN] ";
            case LogLevel::INFO: return "[INFO] ";
            case LogLevel::SUCCESS: return "[OK] ";
            case LogLevel::DEBUG: return "[DEBUG] ";
        }
        return "[INFO] ";
    }
}

bool Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mtx);
    if (logFile.is_open()) logFile.close();
    if (path.empty()) return true;

    std::error_code ec;
    auto parent = std::filesystem::u8path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    logFile.open(std::filesystem::u8path(path), std::ios::app);
    return logFile.is_open();
}

void Logger::writeToFile(LogLevel level, const std::string& message) {
    if (!logFile.is_open()) return;
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    logFile << std::put_time(&tmBuf, "[%Y-%m-%d %H:%M:%S] ") << levelTag(level) << message << std::endl;
}

void Logger::printToConsole(LogLevel level, const std::string& message) {
    if (sink == Sink::None) return;
    std::ostream& os = (sink == Sink::Stdout) ? std::cout : std::cerr;

    // Plain tags on stderr; the interactive console gets colors.
    bool colored = (sink == Sink::Stdout);
    std::string prefix;
    if (!colored) {
        prefix = std::string("[toolhost] ") + levelTag(level);
    } else {
        switch (level) {
            case LogLevel::INFO:
                prefix = CYAN + "[Info] " + RESET;
                break;
            case LogLevel::SUCCESS:
                prefix = GREEN + "✔ " + RESET;
                break;
            case LogLevel::WARNING:
                prefix = YELLOW + "⚠ " + RESET;
                break;
            case LogLevel::ERROR:
                prefix = RED + BOLD + "✖ " + RESET;
                break;
            case LogLevel::DEBUG:
                prefix = GRAY + "[Debug] " + RESET;
                break;
        }
    }

    std::string trimmedMsg = message;
    while (!trimmedMsg.empty() && (trimmedMsg.back() == '\n' || trimmedMsg.back() == '\r')) {
        trimmedMsg.pop_back();
    }

    std::stringstream ss(trimmedMsg);
    std::string line;
    while (std::getline(ss, line)) {
        os << prefix << line << std::endl;
    }
}
