#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "utils/CallLogger.h"

namespace fs = std::filesystem;

namespace {
std::vector<nlohmann::json> readJournal(const fs::path& p) {
    std::vector<nlohmann::json> records;
    std::ifstream in(p);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) records.push_back(nlohmann::json::parse(line));
    }
    return records;
}
} // namespace

class CallLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / ("toolhost_audit_test_" + std::to_string(now));
        fs::create_directories(testDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    CallLogger::Options optionsFor(const std::string& name) {
        CallLogger::Options o;
        o.path = (testDir / "reports" / name).u8string();
        return o;
    }

    fs::path testDir;
};

TEST_F(CallLoggerTest, AppendWritesOneFlushedLinePerRecord) {
    auto options = optionsFor("mcp.log.jsonl");
    CallLogger logger(options);
    ASSERT_TRUE(logger.isOpen());

    AuditRecord record;
    record.timestamp = CallLogger::nowIso();
    record.method = "tools/call";
    record.ok = true;
    record.durationMs = 1.23456;
    record.target = "local";
    record.tool = "sum";
    record.args = {{"a", 2}, {"b", 3}};
    record.resultSize = 1;
    EXPECT_TRUE(logger.append(record));

    // Readable before the logger is destroyed.
    auto records = readJournal(options.path);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["method"], "tools/call");
    EXPECT_EQ(records[0]["tool"], "sum");
    EXPECT_EQ(records[0]["args"]["a"], 2);
    EXPECT_EQ(records[0]["ok"], true);
    EXPECT_EQ(records[0]["result_size"], 1);
    EXPECT_EQ(records[0]["target"], "local");
    EXPECT_DOUBLE_EQ(records[0]["duration_ms"].get<double>(), 1.235);
    EXPECT_FALSE(records[0].contains("error"));
}

TEST_F(CallLoggerTest, FailureRecordCarriesErrorNotResultSize) {
    auto options = optionsFor("fail.jsonl");
    CallLogger logger(options);

    AuditRecord record;
    record.method = "tools/call";
    record.ok = false;
    record.tool = "boom";
    record.error = "Tool execution failed";
    record.resultSize = 10;
    logger.append(record);

    auto records = readJournal(options.path);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["ok"], false);
    EXPECT_EQ(records[0]["error"], "Tool execution failed");
    EXPECT_FALSE(records[0].contains("result_size"));
}

TEST_F(CallLoggerTest, RedactTruncatesLongStringsRecursively) {
    std::string longText(50, 'x');
    nlohmann::json value = {{"text", longText}, {"nested", {longText, "short"}}, {"n", 5}};

    nlohmann::json redacted = CallLogger::redact(value, 10);
    EXPECT_EQ(redacted["text"], std::string(10, 'x') + "…");
    EXPECT_EQ(redacted["nested"][0], std::string(10, 'x') + "…");
    EXPECT_EQ(redacted["nested"][1], "short");
    EXPECT_EQ(redacted["n"], 5);
}

TEST_F(CallLoggerTest, ScopedAuditRedactsArgsAndWritesOnce) {
    auto options = optionsFor("scoped.jsonl");
    options.redactChars = 4;
    CallLogger logger(options);
    {
        ScopedAudit audit(&logger, "tools/call", "local", "echo", {{"msg", "abcdefgh"}});
        audit.succeed({{"ok", true}});
        audit.fail("ignored after commit");
    }

    auto records = readJournal(options.path);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["ok"], true);
    EXPECT_EQ(records[0]["args"]["msg"], "abcd…");
    EXPECT_EQ(records[0]["result_size"], nlohmann::json({{"ok", true}}).dump().size());
}

TEST_F(CallLoggerTest, ScopedAuditWithoutOutcomeIsRecordedAsAbandoned) {
    auto options = optionsFor("abandoned.jsonl");
    CallLogger logger(options);
    {
        ScopedAudit audit(&logger, "tools/list", "fs", "", nlohmann::json::object());
    }
    auto records = readJournal(options.path);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["ok"], false);
    EXPECT_EQ(records[0]["error"], "abandoned");
    EXPECT_EQ(records[0]["target"], "fs");
    EXPECT_TRUE(records[0].contains("params"));
    EXPECT_FALSE(records[0].contains("tool"));
}

TEST_F(CallLoggerTest, RotatesWhenJournalExceedsMaxBytes) {
    auto options = optionsFor("rotate.jsonl");
    options.maxBytes = 256;
    CallLogger logger(options);

    AuditRecord record;
    record.method = "tools/call";
    record.ok = true;
    record.tool = "sum";
    record.args = {{"payload", std::string(100, 'p')}};
    for (int i = 0; i < 6; ++i) logger.append(record);

    fs::path backup = options.path + ".1";
    EXPECT_TRUE(fs::exists(backup));
    EXPECT_LE(fs::file_size(options.path), 256u + 200u);
    EXPECT_GE(readJournal(options.path).size(), 1u);
    EXPECT_EQ(logger.getFailureCount(), 0u);
}

TEST_F(CallLoggerTest, WriteFailureIsToleratedAndCounted) {
    // A regular file where the parent directory should be.
    fs::path blocker = testDir / "blocker";
    std::ofstream(blocker) << "x";

    CallLogger::Options options;
    options.path = (blocker / "mcp.log.jsonl").u8string();
    CallLogger logger(options);
    EXPECT_FALSE(logger.isOpen());

    AuditRecord record;
    record.method = "tools/call";
    EXPECT_NO_THROW({
        EXPECT_FALSE(logger.append(record));
    });
    EXPECT_EQ(logger.getFailureCount(), 1u);

    // ScopedAudit never surfaces the failure either.
    EXPECT_NO_THROW({
        ScopedAudit audit(&logger, "tools/call", "local", "sum", {{"a", 1}});
        audit.succeed(1);
    });
    EXPECT_EQ(logger.getFailureCount(), 2u);
}

TEST_F(CallLoggerTest, ConcurrentAppendsProduceWholeLines) {
    auto options = optionsFor("concurrent.jsonl");
    CallLogger logger(options);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < 25; ++i) {
                AuditRecord record;
                record.method = "tools/call";
                record.ok = true;
                record.tool = "t" + std::to_string(t);
                logger.append(record);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(readJournal(options.path).size(), 100u);
}
