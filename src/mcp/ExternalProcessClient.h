#pragma once
#include <string>
#include <vector>
#include <memory>
#include <map>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>
#include <cstdint>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "protocol/JsonRpc.h"
#include "protocol/MessageFramer.h"

/**
 * @brief Client for a tool-provider child process speaking newline-delimited
 * JSON-RPC over its stdin/stdout.
 *
 * One background reader decodes the child's output and resolves outstanding
 * requests by id; any number of threads may call() concurrently. Ids come
 * from a counter that only ever increases for the lifetime of the client,
 * restarts included.
 *
 * State: NotStarted -> Starting -> Ready -> Degraded -> Terminated.
 * Degraded follows an unparsable line from the child; the process keeps
 * running and calls still go through. Terminated follows child exit (its
 * stdout reaching end-of-stream) or stop(); it is left only by restart().
 */
class ExternalProcessClient {
public:
    enum class State {
        NotStarted,
        Starting,
        Ready,
        Degraded,
        Terminated
    };

    struct Options {
        std::string cwd;                 // empty: inherit
        bool inheritStderr = false;      // otherwise the child's stderr goes to /dev/null
        int stopTimeoutMs = 2000;        // grace period after closing the child's stdin
        int killTimeoutMs = 1000;        // grace period after SIGTERM
        int exitPollMs = 200;            // child liveness check while its stdout is idle
        std::string clientName = "toolhost";
        std::string clientVersion = "1.0.0";
    };

    explicit ExternalProcessClient(const std::string& command);
    ExternalProcessClient(const std::string& command, const Options& options);
    ~ExternalProcessClient();

    ExternalProcessClient(const ExternalProcessClient&) = delete;
    ExternalProcessClient& operator=(const ExternalProcessClient&) = delete;

    /**
     * @brief Spawn the child and start the reader. No-op while running.
     * @throws std::runtime_error if the command cannot be executed
     */
    void start();

    /**
     * @brief MCP handshake: initialize request + notifications/initialized.
     * Moves Starting -> Ready.
     */
    nlohmann::json initialize(std::chrono::milliseconds timeout);

    /**
     * @brief Issue one request and block until its response or the deadline.
     *
     * @return the response's result
     * @throws RpcError the peer's error, Timeout, or ProcessTerminated
     */
    nlohmann::json call(const std::string& method, const nlohmann::json& params,
                        std::chrono::milliseconds timeout);

    // Fire-and-forget; returns false if the write failed.
    bool notify(const std::string& method, const nlohmann::json& params);

    // result.tools of tools/list
    nlohmann::json listTools(std::chrono::milliseconds timeout);

    // tools/call with {name, arguments}
    nlohmann::json callTool(const std::string& name, const nlohmann::json& arguments,
                            std::chrono::milliseconds timeout);

    /**
     * @brief Close the child's stdin, wait a bounded interval, then SIGTERM and
     * finally SIGKILL. The child is always reaped. Outstanding calls fail with
     * ProcessTerminated.
     */
    void stop();

    // stop() + start() + initialize()
    nlohmann::json restart(std::chrono::milliseconds timeout);

    State getState() const;
    pid_t getPid() const;
    size_t getOutstandingCount() const;
    size_t getAnomalyCount() const;
    int64_t getLastIssuedId() const;
    const std::string& getCommand() const { return command; }

    static const char* stateName(State state);

    // Shell-like word splitting: whitespace, '...', "..." and backslash escapes.
    static std::vector<std::string> splitCommandLine(const std::string& cmd);

private:
    struct OutstandingRequest {
        int64_t id = 0;
        std::string method;
        std::chrono::steady_clock::time_point issuedAt;
        std::chrono::steady_clock::time_point deadline;
        bool done = false;
        std::optional<nlohmann::json> result;
        std::optional<RpcError> error;
    };

    std::string command;
    Options options;

    mutable std::mutex mtx;
    std::condition_variable cv;
    State state = State::NotStarted;
    std::map<int64_t, std::shared_ptr<OutstandingRequest>> outstanding;
    std::atomic<int64_t> nextId{0};
    size_t anomalies = 0;

    // Pipes and framer of one child lifetime. Callers hold a reference while
    // writing so stop() never frees a framer that is in use.
    struct Session {
        Session(int readFd, int writeFd) : channel(readFd, writeFd, true), framer(channel) {}
        FdChannel channel;
        MessageFramer framer;
    };

    pid_t pid = -1;
    std::shared_ptr<Session> session;
    std::thread readerThread;

    void readerLoop(std::shared_ptr<Session> current);
    void resolve(const RpcMessage& message);
    void failAllOutstanding(const std::string& reason);
    void spawn();
    static bool waitForExit(pid_t child, int timeoutMs);
};
