#include <gtest/gtest.h>
#include "mcp/ExternalProcessClient.h"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

using namespace std::chrono_literals;
using State = ExternalProcessClient::State;

namespace {
std::string PeerCommand(const std::string& mode) {
    return std::string(TOOLHOST_FAKE_PEER_PATH) + " " + mode;
}

bool ProcessGone(pid_t pid) {
    return kill(pid, 0) != 0 && errno == ESRCH;
}

// Polls a condition that the reader thread makes true asynchronously.
template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds limit = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}
} // namespace

TEST(ExternalProcessClientTest, SplitsCommandLines) {
    using V = std::vector<std::string>;
    EXPECT_EQ(ExternalProcessClient::splitCommandLine("python3 -m server"), (V{"python3", "-m", "server"}));
    EXPECT_EQ(ExternalProcessClient::splitCommandLine("  a   b\t c "), (V{"a", "b", "c"}));
    EXPECT_EQ(ExternalProcessClient::splitCommandLine("run 'two words' \"and \\\"more\\\"\""),
              (V{"run", "two words", "and \"more\""}));
    EXPECT_EQ(ExternalProcessClient::splitCommandLine("path\\ with\\ spaces x"), (V{"path with spaces", "x"}));
    EXPECT_EQ(ExternalProcessClient::splitCommandLine("empty ''"), (V{"empty", ""}));
    EXPECT_TRUE(ExternalProcessClient::splitCommandLine("   ").empty());
}

TEST(ExternalProcessClientTest, EchoPeerHandshakeAndCall) {
    ExternalProcessClient client(PeerCommand("echo"));
    EXPECT_EQ(client.getState(), State::NotStarted);

    client.start();
    EXPECT_GT(client.getPid(), 0);
    auto init = client.initialize(2000ms);
    EXPECT_EQ(init["serverInfo"]["name"], "fake_peer");
    EXPECT_EQ(client.getState(), State::Ready);

    auto start = std::chrono::steady_clock::now();
    auto result = client.call("ping", nlohmann::json::object(), 1000ms);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(result, nlohmann::json({{"echo", true}}));
    EXPECT_LT(elapsed, 1000ms);
    EXPECT_EQ(client.getOutstandingCount(), 0u);
    EXPECT_EQ(client.getAnomalyCount(), 0u);

    auto tools = client.listTools(1000ms);
    ASSERT_TRUE(tools.is_array());
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["name"], "echo");

    auto called = client.callTool("upper", {{"text", "hi"}}, 1000ms);
    EXPECT_EQ(called["name"], "upper");
    EXPECT_EQ(called["arguments"]["text"], "hi");

    client.stop();
    EXPECT_EQ(client.getState(), State::Terminated);
}

TEST(ExternalProcessClientTest, PeerErrorIsPropagated) {
    ExternalProcessClient client(PeerCommand("echo"));
    client.start();
    client.initialize(2000ms);

    try {
        client.call("fail", nlohmann::json::object(), 1000ms);
        FAIL() << "expected RpcError";
    } catch (const RpcError& e) {
        EXPECT_TRUE(e.is(RpcErrorCode::InvalidParams));
        EXPECT_STREQ(e.what(), "bad params from peer");
    }
    // An error response is still a normal exchange.
    EXPECT_EQ(client.getState(), State::Ready);
    EXPECT_EQ(client.call("ping", nlohmann::json::object(), 1000ms)["echo"], true);
}

TEST(ExternalProcessClientTest, OutOfOrderResponsesReachTheirCallers) {
    ExternalProcessClient client(PeerCommand("reverse"));
    client.start();
    client.initialize(2000ms);

    const int callers = 6;
    std::vector<std::thread> threads;
    std::vector<nlohmann::json> results(callers);
    std::atomic<int> failures{0};
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([&, i] {
            try {
                results[i] = client.call("whoami", {{"tag", i}}, 5000ms);
            } catch (const std::exception&) {
                ++failures;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(failures.load(), 0);
    for (int i = 0; i < callers; ++i) {
        EXPECT_EQ(results[i]["tag"], i) << "caller " << i;
    }
    EXPECT_EQ(client.getOutstandingCount(), 0u);
    EXPECT_EQ(client.getAnomalyCount(), 0u);
}

TEST(ExternalProcessClientTest, SilentPeerTimesOut) {
    ExternalProcessClient client(PeerCommand("silent"));
    client.start();
    client.initialize(2000ms);

    auto start = std::chrono::steady_clock::now();
    try {
        client.call("ping", nlohmann::json::object(), 150ms);
        FAIL() << "expected Timeout";
    } catch (const RpcError& e) {
        EXPECT_TRUE(e.is(RpcErrorCode::Timeout));
        EXPECT_EQ(e.data()["method"], "ping");
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 150ms);
    EXPECT_LT(elapsed, 2000ms);
    EXPECT_EQ(client.getOutstandingCount(), 0u);
    EXPECT_EQ(client.getState(), State::Ready);
}

TEST(ExternalProcessClientTest, LateResponseIsDiscardedAfterTimeout) {
    ExternalProcessClient client(PeerCommand("late 300"));
    client.start();
    client.initialize(2000ms);

    EXPECT_THROW(client.call("ping", nlohmann::json::object(), 50ms), RpcError);
    EXPECT_EQ(client.getOutstandingCount(), 0u);

    EXPECT_TRUE(WaitFor([&] { return client.getAnomalyCount() == 1; }));

    // The next call gets its own response, not the stale one.
    auto result = client.call("whoami", {{"tag", "second"}}, 3000ms);
    EXPECT_EQ(result["tag"], "second");
    EXPECT_EQ(client.getAnomalyCount(), 1u);
}

TEST(ExternalProcessClientTest, GarbageOutputDegradesButKeepsWorking) {
    ExternalProcessClient client(PeerCommand("garbage"));
    client.start();
    client.initialize(2000ms);

    EXPECT_EQ(client.getState(), State::Degraded);
    EXPECT_GE(client.getAnomalyCount(), 1u);

    auto result = client.call("whoami", {{"tag", 7}}, 2000ms);
    EXPECT_EQ(result["tag"], 7);
    EXPECT_EQ(client.getState(), State::Degraded);
    EXPECT_GE(client.getAnomalyCount(), 2u);
}

TEST(ExternalProcessClientTest, CrashFailsOutstandingAndLaterCalls) {
    ExternalProcessClient client(PeerCommand("crash"));
    client.start();
    client.initialize(2000ms);

    try {
        client.callTool("anything", nlohmann::json::object(), 5000ms);
        FAIL() << "expected ProcessTerminated";
    } catch (const RpcError& e) {
        EXPECT_TRUE(e.is(RpcErrorCode::ProcessTerminated));
    }
    EXPECT_EQ(client.getState(), State::Terminated);
    EXPECT_EQ(client.getOutstandingCount(), 0u);

    auto start = std::chrono::steady_clock::now();
    try {
        client.call("ping", nlohmann::json::object(), 5000ms);
        FAIL() << "expected ProcessTerminated";
    } catch (const RpcError& e) {
        EXPECT_TRUE(e.is(RpcErrorCode::ProcessTerminated));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
}

TEST(ExternalProcessClientTest, ExitIsDetectedWhileAGrandchildHoldsStdout) {
    ExternalProcessClient::Options options;
    options.exitPollMs = 50;
    // The shell exits quickly; the background sleep keeps the shared stdout open.
    ExternalProcessClient client("/bin/sh -c 'sleep 3 & sleep 0.3'", options);
    client.start();

    auto start = std::chrono::steady_clock::now();
    try {
        client.call("ping", nlohmann::json::object(), 5000ms);
        FAIL() << "expected ProcessTerminated";
    } catch (const RpcError& e) {
        EXPECT_TRUE(e.is(RpcErrorCode::ProcessTerminated));
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2500ms);
    EXPECT_EQ(client.getState(), State::Terminated);
    EXPECT_EQ(client.getOutstandingCount(), 0u);

    client.stop();
}

TEST(ExternalProcessClientTest, StopReapsTheChild) {
    ExternalProcessClient client(PeerCommand("echo"));
    client.start();
    client.initialize(2000ms);
    pid_t pid = client.getPid();
    ASSERT_GT(pid, 0);

    client.stop();
    EXPECT_TRUE(ProcessGone(pid));
    EXPECT_EQ(client.getPid(), -1);
    EXPECT_EQ(client.getState(), State::Terminated);

    // Idempotent.
    client.stop();
    EXPECT_EQ(client.getState(), State::Terminated);
}

TEST(ExternalProcessClientTest, StopKillsAStubbornChild) {
    ExternalProcessClient::Options options;
    options.stopTimeoutMs = 200;
    options.killTimeoutMs = 200;
    ExternalProcessClient client(PeerCommand("stubborn"), options);
    client.start();
    client.initialize(2000ms);
    pid_t pid = client.getPid();

    auto start = std::chrono::steady_clock::now();
    client.stop();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(ProcessGone(pid));
    EXPECT_GE(elapsed, 400ms);
    EXPECT_LT(elapsed, 3000ms);
}

TEST(ExternalProcessClientTest, RestartKeepsIdsIncreasing) {
    ExternalProcessClient client(PeerCommand("echo"));
    client.start();
    client.initialize(2000ms);
    client.call("ping", nlohmann::json::object(), 1000ms);
    int64_t before = client.getLastIssuedId();
    pid_t oldPid = client.getPid();

    client.restart(2000ms);
    EXPECT_EQ(client.getState(), State::Ready);
    EXPECT_NE(client.getPid(), oldPid);
    EXPECT_GT(client.getLastIssuedId(), before);

    EXPECT_EQ(client.call("ping", nlohmann::json::object(), 1000ms)["echo"], true);
    EXPECT_EQ(client.getLastIssuedId(), before + 2);
}

TEST(ExternalProcessClientTest, RestartRecoversFromCrash) {
    ExternalProcessClient client(PeerCommand("crash"));
    client.start();
    client.initialize(2000ms);
    EXPECT_THROW(client.callTool("x", nlohmann::json::object(), 5000ms), RpcError);
    ASSERT_EQ(client.getState(), State::Terminated);

    client.restart(2000ms);
    EXPECT_EQ(client.getState(), State::Ready);
    EXPECT_EQ(client.call("ping", nlohmann::json::object(), 1000ms)["echo"], true);
}

TEST(ExternalProcessClientTest, MissingExecutableFailsToStart) {
    ExternalProcessClient client("/nonexistent/toolhost_missing_binary --flag");
    EXPECT_THROW(client.start(), std::runtime_error);
    EXPECT_EQ(client.getState(), State::NotStarted);

    try {
        client.call("ping", nlohmann::json::object(), 100ms);
        FAIL() << "expected ProcessTerminated";
    } catch (const RpcError& e) {
        EXPECT_TRUE(e.is(RpcErrorCode::ProcessTerminated));
    }
}

TEST(ExternalProcessClientTest, EmptyCommandIsRejected) {
    ExternalProcessClient client("   ");
    EXPECT_THROW(client.start(), std::runtime_error);
}
