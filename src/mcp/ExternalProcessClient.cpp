#include "mcp/ExternalProcessClient.h"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include "utils/Logger.h"

namespace {
void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}
} // namespace

ExternalProcessClient::ExternalProcessClient(const std::string& command)
    : ExternalProcessClient(command, Options()) {}

ExternalProcessClient::ExternalProcessClient(const std::string& command, const Options& options)
    : command(command), options(options) {}

ExternalProcessClient::~ExternalProcessClient() {
    stop();
}

const char* ExternalProcessClient::stateName(State state) {
    switch (state) {
        case State::NotStarted: return "NotStarted";
        case State::Starting: return "Starting";
        case State::Ready: return "Ready";
        case State::Degraded: return "Degraded";
        case State::Terminated: return "Terminated";
    }
    return "Unknown";
}

void ExternalProcessClient::start() {
    bool needsCleanup = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (state == State::Starting || state == State::Ready || state == State::Degraded) {
            return;
        }
        needsCleanup = (state == State::Terminated);
    }
    if (needsCleanup) {
        stop();
    }

    std::shared_ptr<Session> current;
    {
        std::lock_guard<std::mutex> lock(mtx);
        spawn();
        state = State::Starting;
        current = session;
    }
    readerThread = std::thread(&ExternalProcessClient::readerLoop, this, current);
    Logger::getInstance().info("Started external process [" + std::to_string(pid) + "]: " + command);
}

void ExternalProcessClient::spawn() {
    auto args = splitCommandLine(command);
    if (args.empty()) {
        throw std::runtime_error("Empty external process command");
    }

    // A dead child must surface as a failed write, not as a fatal signal.
    signal(SIGPIPE, SIG_IGN);

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (pipe2(inPipe, O_CLOEXEC) != 0 || pipe2(outPipe, O_CLOEXEC) != 0 || pipe2(execPipe, O_CLOEXEC) != 0) {
        int err = errno;
        closeFd(inPipe[0]); closeFd(inPipe[1]);
        closeFd(outPipe[0]); closeFd(outPipe[1]);
        closeFd(execPipe[0]); closeFd(execPipe[1]);
        throw std::runtime_error("pipe() failed for '" + command + "': " + std::strerror(err));
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char* workDir = options.cwd.empty() ? nullptr : options.cwd.c_str();
    bool inheritStderr = options.inheritStderr;

    pid_t child = fork();
    if (child == 0) {
        dup2(inPipe[0], STDIN_FILENO);
        dup2(outPipe[1], STDOUT_FILENO);
        if (!inheritStderr) {
            int devNull = open("/dev/null", O_WRONLY);
            if (devNull >= 0) {
                dup2(devNull, STDERR_FILENO);
            }
        }
        int err = 0;
        if (workDir && chdir(workDir) != 0) {
            err = errno;
        } else {
            execvp(argv[0], argv.data());
            err = errno;
        }
        ssize_t ignored = write(execPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(execPipe[1]);

    if (child < 0) {
        int err = errno;
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        closeFd(execPipe[0]);
        throw std::runtime_error("fork() failed for '" + command + "': " + std::strerror(err));
    }

    // The exec pipe closes on a successful exec; otherwise it carries errno.
    int execErr = 0;
    ssize_t n;
    do {
        n = read(execPipe[0], &execErr, sizeof(execErr));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n > 0) {
        int status = 0;
        waitpid(child, &status, 0);
        closeFd(inPipe[1]);
        closeFd(outPipe[0]);
        throw std::runtime_error("Failed to start '" + command + "': " + std::strerror(execErr));
    }

    pid = child;
    session = std::make_shared<Session>(outPipe[0], inPipe[1]);

    // A grandchild can keep stdout open after the child exits. Peek with WNOWAIT
    // so stop() still reaps.
    session->channel.setIdleCheck(options.exitPollMs, [child] {
        siginfo_t info{};
        if (waitid(P_PID, static_cast<id_t>(child), &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
            return errno == ECHILD;
        }
        return info.si_pid == child;
    });
}

void ExternalProcessClient::readerLoop(std::shared_ptr<Session> current) {
    auto& logger = Logger::getInstance();

    while (true) {
        FrameEvent event = current->framer.readMessage();
        if (event.type == FrameEvent::Type::EndOfStream) {
            break;
        }

        if (event.type == FrameEvent::Type::Invalid) {
            {
                std::lock_guard<std::mutex> lock(mtx);
                ++anomalies;
                if (state == State::Starting || state == State::Ready) {
                    state = State::Degraded;
                }
            }
            logger.warn("Protocol anomaly from '" + command + "': " + event.error +
                        (event.raw.empty() ? "" : " [" + event.raw.substr(0, 120) + "]"));
            continue;
        }

        resolve(event.message);
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        if (state != State::Terminated) {
            state = State::Terminated;
        }
        failAllOutstanding("External process exited: " + command);
    }
    cv.notify_all();
    logger.warn("External process output closed: " + command);
}

void ExternalProcessClient::resolve(const RpcMessage& message) {
    std::string anomaly;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!message.isResponse()) {
            ++anomalies;
            anomaly = "discarded " + std::string(message.isNotification() ? "notification " : "request ") +
                      message.method.value_or("");
        } else if (!message.id || !message.id->is_number_integer()) {
            ++anomalies;
            anomaly = "discarded response with unmatched id " + message.id.value_or(nullptr).dump();
        } else {
            int64_t id = message.id->get<int64_t>();
            auto it = outstanding.find(id);
            if (it == outstanding.end()) {
                ++anomalies;
                anomaly = "discarded stale or unknown response id " + std::to_string(id);
            } else {
                auto entry = it->second;
                outstanding.erase(it);
                if (message.error) {
                    entry->error = RpcError::fromJson(*message.error);
                } else {
                    entry->result = *message.result;
                }
                entry->done = true;
            }
        }
    }

    if (anomaly.empty()) {
        cv.notify_all();
    } else {
        Logger::getInstance().debug("'" + command + "': " + anomaly);
    }
}

void ExternalProcessClient::failAllOutstanding(const std::string& reason) {
    for (auto& [id, entry] : outstanding) {
        entry->error = RpcError(RpcErrorCode::ProcessTerminated, reason,
                                {{"id", id}, {"method", entry->method}});
        entry->done = true;
    }
    outstanding.clear();
}

nlohmann::json ExternalProcessClient::call(const std::string& method, const nlohmann::json& params,
                                           std::chrono::milliseconds timeout) {
    std::shared_ptr<OutstandingRequest> entry;
    std::shared_ptr<Session> current;
    int64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (state == State::Terminated) {
            throw RpcError(RpcErrorCode::ProcessTerminated, "External process terminated: " + command,
                           {{"method", method}});
        }
        if (state == State::NotStarted || !session) {
            throw RpcError(RpcErrorCode::ProcessTerminated, "External process not started: " + command,
                           {{"method", method}});
        }
        current = session;
        id = ++nextId;
        entry = std::make_shared<OutstandingRequest>();
        entry->id = id;
        entry->method = method;
        entry->issuedAt = std::chrono::steady_clock::now();
        entry->deadline = entry->issuedAt + timeout;
        outstanding[id] = entry;
    }

    if (!current->framer.writeMessage(RpcMessage::request(id, method, params))) {
        std::lock_guard<std::mutex> lock(mtx);
        outstanding.erase(id);
        if (entry->done && entry->error) {
            throw *entry->error;
        }
        throw RpcError(RpcErrorCode::ProcessTerminated, "Failed to write to external process: " + command,
                       {{"id", id}, {"method", method}});
    }

    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_until(lock, entry->deadline, [&] { return entry->done; });

    if (!entry->done) {
        // Removal under the lock makes the timeout and a late response mutually exclusive.
        outstanding.erase(id);
        throw RpcError(RpcErrorCode::Timeout,
                       method + " timed out after " + std::to_string(timeout.count()) + " ms",
                       {{"id", id}, {"method", method}});
    }

    if (entry->error) {
        throw *entry->error;
    }
    return entry->result.value_or(nullptr);
}

bool ExternalProcessClient::notify(const std::string& method, const nlohmann::json& params) {
    std::shared_ptr<Session> current;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (state == State::Terminated || state == State::NotStarted || !session) {
            return false;
        }
        current = session;
    }
    return current->framer.writeMessage(RpcMessage::notification(method, params));
}

nlohmann::json ExternalProcessClient::initialize(std::chrono::milliseconds timeout) {
    nlohmann::json params = {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", options.clientName}, {"version", options.clientVersion}}}
    };
    auto result = call("initialize", params, timeout);

    if (!notify("notifications/initialized", nlohmann::json::object())) {
        Logger::getInstance().warn("Could not send notifications/initialized to " + command);
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        if (state == State::Starting) {
            state = State::Ready;
        }
    }
    return result;
}

nlohmann::json ExternalProcessClient::listTools(std::chrono::milliseconds timeout) {
    auto result = call("tools/list", nlohmann::json::object(), timeout);
    if (result.is_object() && result.contains("tools") && result["tools"].is_array()) {
        return result["tools"];
    }
    return nlohmann::json::array();
}

nlohmann::json ExternalProcessClient::callTool(const std::string& name, const nlohmann::json& arguments,
                                               std::chrono::milliseconds timeout) {
    return call("tools/call", {{"name", name}, {"arguments", arguments}}, timeout);
}

bool ExternalProcessClient::waitForExit(pid_t child, int timeoutMs) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (true) {
        int status = 0;
        pid_t r = waitpid(child, &status, WNOHANG);
        if (r == child || (r < 0 && errno == ECHILD)) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ExternalProcessClient::stop() {
    std::shared_ptr<Session> current;
    pid_t child = -1;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!session && pid <= 0 && !readerThread.joinable()) {
            return;
        }
        current = session;
        child = pid;
    }

    if (current) {
        current->channel.closeWrite();
    }

    if (child > 0) {
        bool exited = waitForExit(child, options.stopTimeoutMs);
        if (!exited) {
            Logger::getInstance().warn("External process did not exit, sending SIGTERM: " + command);
            kill(child, SIGTERM);
            exited = waitForExit(child, options.killTimeoutMs);
        }
        if (!exited) {
            Logger::getInstance().warn("External process ignored SIGTERM, sending SIGKILL: " + command);
            kill(child, SIGKILL);
            int status = 0;
            while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }

    // A grandchild may still hold the pipe open; release the reader explicitly.
    if (current) {
        current->channel.interrupt();
    }
    if (readerThread.joinable()) {
        readerThread.join();
    }

    {
        std::lock_guard<std::mutex> lock(mtx);
        state = State::Terminated;
        failAllOutstanding("External process stopped: " + command);
        pid = -1;
        session.reset();
    }
    cv.notify_all();
}

nlohmann::json ExternalProcessClient::restart(std::chrono::milliseconds timeout) {
    stop();
    start();
    return initialize(timeout);
}

ExternalProcessClient::State ExternalProcessClient::getState() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state;
}

pid_t ExternalProcessClient::getPid() const {
    std::lock_guard<std::mutex> lock(mtx);
    return pid;
}

size_t ExternalProcessClient::getOutstandingCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return outstanding.size();
}

size_t ExternalProcessClient::getAnomalyCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return anomalies;
}

int64_t ExternalProcessClient::getLastIssuedId() const {
    return nextId.load();
}

std::vector<std::string> ExternalProcessClient::splitCommandLine(const std::string& cmd) {
    std::vector<std::string> out;
    std::string token;
    bool inToken = false;
    char quote = 0;

    for (size_t i = 0; i < cmd.size(); ++i) {
        char c = cmd[i];
        if (quote) {
            if (c == quote) {
                quote = 0;
            } else if (c == '\\' && quote == '"' && i + 1 < cmd.size() &&
                       (cmd[i + 1] == '"' || cmd[i + 1] == '\\')) {
                token += cmd[++i];
            } else {
                token += c;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            inToken = true;
        } else if (c == '\\' && i + 1 < cmd.size()) {
            token += cmd[++i];
            inToken = true;
        } else if (c == ' ' || c == '\t' || c == '\n') {
            if (inToken) {
                out.push_back(token);
                token.clear();
                inToken = false;
            }
        } else {
            token += c;
            inToken = true;
        }
    }
    if (inToken) {
        out.push_back(token);
    }
    return out;
}
