#pragma once
#include <string>
#include <functional>
#include <mutex>
#include <fstream>

enum class LogLevel {
    INFO,
    SUCCESS,
    WARNING,
    ERROR,
    DEBUG
};

/**
 * @brief Diagnostic logger shared by the whole process.
 *
 * Records go to the diagnostic file (if one is set) and to the console sink.
 * In server mode the console sink must be stderr: stdout carries protocol
 * messages only.
 */
class Logger {
public:
    enum class Sink {
        Stdout,
        Stderr,
        None
    };

    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
    }

    void setSink(Sink sink) {
        std::lock_guard<std::mutex> lock(mtx);
        this->sink = sink;
    }

    void setDebug(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        debugEnabled = enabled;
    }

    // Empty path disables the diagnostic file. Returns false if it cannot be opened.
    bool setLogFile(const std::string& path);

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mtx);
        if (level == LogLevel::DEBUG && !debugEnabled) return;
        writeToFile(level, message);
        printToConsole(level, message);

        if (callback) {
            callback(level, message);
        }
    }

    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }

private:
    Logger() = default;
    LogCallback callback;
    std::mutex mtx;
    Sink sink = Sink::Stderr;
    bool debugEnabled = false;
    std::ofstream logFile;

    void writeToFile(LogLevel level, const std::string& message);
    void printToConsole(LogLevel level, const std::string& message);
};
