#include <gtest/gtest.h>
#include "tools/CoreTools.h"
#include "protocol/JsonRpc.h"
#include "tools/Sandbox.h"
#include "tools/ToolRegistry.h"
#include "core/LLMClient.h"
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace {
class ScriptedLLM : public LLMClient {
public:
    ScriptedLLM() : LLMClient("test-key", "http://127.0.0.1:9/v1", "scripted-model") {}

    std::string chat(const nlohmann::json& messages, double temperature, int maxTokens) override {
        lastMessages = messages;
        lastTemperature = temperature;
        lastMaxTokens = maxTokens;
        ++calls;
        if (fail) throw std::runtime_error("connection refused");
        return reply;
    }

    std::string reply = "  Five.  ";
    bool fail = false;
    int calls = 0;
    nlohmann::json lastMessages;
    double lastTemperature = 0.0;
    int lastMaxTokens = 0;
};

std::string ReadAll(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

const char* kTwoPagePdf =
    "%PDF-1.4\n"
    "1 0 obj\n<< /Type /Catalog /Pages 2 0 R >>\nendobj\n"
    "2 0 obj\n<< /Type /Pages /Kids [3 0 R 5 0 R] /Count 2 >>\nendobj\n"
    "3 0 obj\n<< /Type /Page /Parent 2 0 R /Contents 4 0 R >>\nendobj\n"
    "4 0 obj\n<< /Length 44 >>\nstream\n"
    "BT /F1 12 Tf 72 712 Td (Hello World) Tj ET\n"
    "endstream\nendobj\n"
    "5 0 obj\n<< /Type /Page /Parent 2 0 R /Contents [6 0 R] >>\nendobj\n"
    "6 0 obj\n<< /Length 40 >>\nstream\n"
    "BT [(Sec) 10 (ond) -300 (page)] TJ ET\n"
    "endstream\nendobj\n"
    "trailer\n<< /Root 1 0 R >>\n%%EOF\n";
} // namespace

class CoreToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::weakly_canonical(fs::temp_directory_path() / ("toolhost_tools_test_" + std::to_string(now)));
        dataDir = testDir / "data";
        fs::create_directories(dataDir);

        config.reportsDir = (testDir / "reports").string();
        config.llm.model = "scripted-model";
        config.llm.systemPrompt = "Configured prompt";
        sandbox = std::make_unique<Sandbox>(std::vector<std::string>{dataDir.string()}, 1024 * 1024);
        llm = std::make_shared<ScriptedLLM>();
        registerCoreTools(registry, config, *sandbox, llm);
        registry.freeze();
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    std::string writeData(const std::string& name, const std::string& content) {
        fs::path p = dataDir / name;
        std::ofstream(p, std::ios::binary) << content;
        return p.string();
    }

    fs::path testDir;
    fs::path dataDir;
    Config config;
    std::unique_ptr<Sandbox> sandbox;
    std::shared_ptr<ScriptedLLM> llm;
    ToolRegistry registry;
};

// ============================================================================
// Sandbox
// ============================================================================

TEST_F(CoreToolsTest, SandboxAllowsPathsUnderAllowedDirs) {
    std::string file = writeData("a.txt", "hello");
    EXPECT_EQ(sandbox->resolve(file).string(), file);
    EXPECT_EQ(sandbox->readFile(file), "hello");
    EXPECT_EQ(sandbox->resolve((dataDir / "sub" / ".." / "a.txt").string()).string(), file);
}

TEST_F(CoreToolsTest, SandboxRejectsEscapes) {
    writeData("a.txt", "hello");
    std::ofstream(testDir / "secret.txt") << "nope";

    EXPECT_THROW(sandbox->resolve((testDir / "secret.txt").string()), std::runtime_error);
    EXPECT_THROW(sandbox->readFile((dataDir / ".." / "secret.txt").string()), std::runtime_error);
    EXPECT_THROW(sandbox->resolve("/etc/passwd"), std::runtime_error);

    // A sibling sharing the prefix is not inside.
    fs::create_directories(testDir / "data2");
    std::ofstream(testDir / "data2" / "x.txt") << "x";
    EXPECT_THROW(sandbox->resolve((testDir / "data2" / "x.txt").string()), std::runtime_error);
}

TEST_F(CoreToolsTest, SandboxChecksExistenceAndSize) {
    EXPECT_THROW(sandbox->readFile((dataDir / "missing.csv").string()), std::runtime_error);

    Sandbox tiny({dataDir.string()}, 10);
    std::string file = writeData("big.txt", std::string(20, 'x'));
    try {
        tiny.readFile(file);
        FAIL() << "expected size rejection";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("too large"), std::string::npos);
    }
}

TEST_F(CoreToolsTest, SandboxExpandsHome) {
    const char* home = std::getenv("HOME");
    if (!home) GTEST_SKIP() << "HOME is not set";
    EXPECT_EQ(Sandbox::expandHome("~/datasets").string(), std::string(home) + "/datasets");
    EXPECT_EQ(Sandbox::expandHome("~").string(), std::string(home));
    EXPECT_EQ(Sandbox::expandHome("~other/x").string(), "~other/x");
    EXPECT_EQ(Sandbox::expandHome("/abs").string(), "/abs");
}

// ============================================================================
// CSV and data_profile
// ============================================================================

TEST(CsvTest, ParsesQuotedFields) {
    auto rows = parseCsv("a,b,c\r\n1,\"x, y\",\"say \"\"hi\"\"\"\n\n2,,\n");
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0], (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(rows[1], (std::vector<std::string>{"1", "x, y", "say \"hi\""}));
    EXPECT_EQ(rows[2], (std::vector<std::string>{"2", "", ""}));

    auto semi = parseCsv("a;b\n1;2", ';');
    ASSERT_EQ(semi.size(), 2u);
    EXPECT_EQ(semi[1], (std::vector<std::string>{"1", "2"}));
}

TEST_F(CoreToolsTest, DataProfileInfersTypesAndStats) {
    std::string path = writeData("sales.csv",
        "id,price,flag,name\n"
        "1,2.5,true,a\n"
        "2,NA,false,\"b, c\"\n"
        "3,4.5,TRUE,\n"
        "4,1,false,d,extra\n");

    auto result = registry.invoke("data_profile", {{"path", path}});

    EXPECT_EQ(result["meta"]["rows"], 3);
    EXPECT_EQ(result["meta"]["cols"], 4);
    EXPECT_EQ(result["meta"]["skipped_rows"], 1);
    EXPECT_EQ(result["columns"], nlohmann::json({"id", "price", "flag", "name"}));

    EXPECT_EQ(result["schema"]["id"], "integer");
    EXPECT_EQ(result["schema"]["price"], "number");
    EXPECT_EQ(result["schema"]["flag"], "boolean");
    EXPECT_EQ(result["schema"]["name"], "string");
    EXPECT_EQ(result["nulls"]["price"], 1);
    EXPECT_EQ(result["nulls"]["name"], 1);
    EXPECT_EQ(result["nulls"]["id"], 0);

    const auto& id = result["describe_numeric"]["id"];
    EXPECT_EQ(id["count"], 3);
    EXPECT_DOUBLE_EQ(id["mean"].get<double>(), 2.0);
    EXPECT_DOUBLE_EQ(id["std"].get<double>(), 1.0);
    EXPECT_DOUBLE_EQ(id["min"].get<double>(), 1.0);
    EXPECT_DOUBLE_EQ(id["max"].get<double>(), 3.0);
    EXPECT_NEAR(result["describe_numeric"]["price"]["std"].get<double>(), std::sqrt(2.0), 1e-9);
    EXPECT_FALSE(result["describe_numeric"].contains("flag"));

    ASSERT_EQ(result["preview"].size(), 3u);
    EXPECT_EQ(result["preview"][0]["id"], 1);
    EXPECT_EQ(result["preview"][0]["flag"], true);
    EXPECT_TRUE(result["preview"][1]["price"].is_null());
    EXPECT_EQ(result["preview"][1]["name"], "b, c");
}

TEST_F(CoreToolsTest, DataProfileSelectsColumnsAndLimitsRows) {
    std::string path = writeData("n.csv", "x,y\n1,a\n2,b\n3,c\n4,d\n");
    auto result = registry.invoke("data_profile", {{"path", path}, {"columns", {"x"}}, {"limit_rows", 2}});
    EXPECT_EQ(result["meta"]["rows"], 2);
    EXPECT_EQ(result["columns"], nlohmann::json::array({"x"}));
    EXPECT_FALSE(result["schema"].contains("y"));
    EXPECT_DOUBLE_EQ(result["describe_numeric"]["x"]["mean"].get<double>(), 1.5);

    try {
        registry.invoke("data_profile", {{"path", path}, {"columns", {"x", "nope", "zip"}}});
        FAIL() << "expected failure";
    } catch (const RpcError& e) {
        EXPECT_TRUE(e.is(RpcErrorCode::InternalError));
        EXPECT_NE(std::string(e.what()).find("Columns not found: nope, zip"), std::string::npos);
    }
}

TEST_F(CoreToolsTest, DataProfileSingleValueHasNullStd) {
    std::string path = writeData("one.csv", "v\n42\n");
    auto result = registry.invoke("data_profile", {{"path", path}});
    EXPECT_TRUE(result["describe_numeric"]["v"]["std"].is_null());
}

TEST_F(CoreToolsTest, DataProfileOutsideSandboxFails) {
    std::ofstream(testDir / "outside.csv") << "a\n1\n";
    EXPECT_THROW(registry.invoke("data_profile", {{"path", (testDir / "outside.csv").string()}}), RpcError);
}

// ============================================================================
// ts_forecast
// ============================================================================

TEST_F(CoreToolsTest, ForecastContinuesALinearTrend) {
    std::string csv = "t,value\n";
    for (int i = 1; i <= 10; ++i) csv += std::to_string(i) + "," + std::to_string(i) + "\n";
    std::string path = writeData("linear.csv", csv);

    auto result = registry.invoke("ts_forecast", {{"path", path}, {"column", "value"}, {"horizon", 3}});

    EXPECT_EQ(result["n_obs"], 10);
    EXPECT_EQ(result["model"]["type"], "holt");
    EXPECT_NEAR(result["model"]["sse"].get<double>(), 0.0, 1e-9);
    ASSERT_EQ(result["forecast"].size(), 3u);
    for (int h = 1; h <= 3; ++h) {
        EXPECT_EQ(result["forecast"][h - 1]["t"], 10 + h);
        EXPECT_NEAR(result["forecast"][h - 1]["yhat"].get<double>(), 10.0 + h, 1e-6);
    }
}

TEST_F(CoreToolsTest, ForecastOrdersByDateAndSkipsBadValues) {
    std::string path = writeData("dated.csv",
        "date,y\n"
        "2024-01-03,30\n"
        "2024-01-01,10\n"
        "2024-01-02,n/a\n"
        "2024-01-02,20\n"
        "2024-01-04,40\n");

    auto result = registry.invoke("ts_forecast",
                                  {{"path", path}, {"column", "y"}, {"horizon", 1}, {"date_col", "date"}});
    EXPECT_EQ(result["n_obs"], 4);
    EXPECT_EQ(result["meta"]["last_t"], "2024-01-04");
    EXPECT_NEAR(result["forecast"][0]["yhat"].get<double>(), 50.0, 1e-6);
}

TEST_F(CoreToolsTest, ForecastShortSeriesIsNaive) {
    std::string path = writeData("short.csv", "y\n5\n7\n");
    auto result = registry.invoke("ts_forecast", {{"path", path}, {"column", "y"}, {"horizon", 2}});
    EXPECT_EQ(result["model"]["type"], "naive");
    EXPECT_EQ(result["forecast"][1]["t"], 4);
    EXPECT_DOUBLE_EQ(result["forecast"][1]["yhat"].get<double>(), 7.0);
}

TEST_F(CoreToolsTest, ForecastRejectsBadInput) {
    std::string path = writeData("text.csv", "y\nabc\n");
    EXPECT_THROW(registry.invoke("ts_forecast", {{"path", path}, {"column", "y"}, {"horizon", 1}}), RpcError);
    EXPECT_THROW(registry.invoke("ts_forecast", {{"path", path}, {"column", "zzz"}, {"horizon", 1}}), RpcError);

    try {
        registry.invoke("ts_forecast", {{"path", path}, {"column", "y"}, {"horizon", 0}});
        FAIL() << "expected InvalidParams";
    } catch (const RpcError& e) {
        EXPECT_TRUE(e.is(RpcErrorCode::InvalidParams));
    }
}

TEST(HoltTest, NeedsTwoPoints) {
    EXPECT_THROW(TsForecastTool::fitHolt({1.0}), std::runtime_error);
    auto fit = TsForecastTool::fitHolt({2.0, 4.0, 6.0, 8.0});
    EXPECT_NEAR(fit.level, 8.0, 1e-9);
    EXPECT_NEAR(fit.trend, 2.0, 1e-9);
}

// ============================================================================
// pdf_extract
// ============================================================================

TEST(PdfTextTest, ExtractsTextOperators) {
    EXPECT_EQ(PdfExtractTool::extractStreamText("BT (Hello) Tj ET"), "Hello");
    EXPECT_EQ(PdfExtractTool::extractStreamText("BT (a\\(b\\)) Tj T* (next) Tj ET"), "a(b)\nnext");
    EXPECT_EQ(PdfExtractTool::extractStreamText("BT <48656C6C6F> Tj ET"), "Hello");
    EXPECT_EQ(PdfExtractTool::extractStreamText("BT [(W) 80 (orld) -400 (again)] TJ ET"), "World again");
}

TEST_F(CoreToolsTest, PdfExtractFollowsThePageTree) {
    std::string path = writeData("doc.pdf", kTwoPagePdf);

    auto result = registry.invoke("pdf_extract", {{"path", path}});
    EXPECT_EQ(result["meta"]["page_count"], 2);
    ASSERT_EQ(result["pages"].size(), 2u);
    EXPECT_EQ(result["pages"][0]["text"], "Hello World");
    EXPECT_EQ(result["pages"][1]["text"], "Second page");
    EXPECT_EQ(result["text"], "Hello World\nSecond page");

    auto second = registry.invoke("pdf_extract", {{"path", path}, {"pages", {2}}});
    ASSERT_EQ(second["pages"].size(), 1u);
    EXPECT_EQ(second["pages"][0]["page"], 2);
    EXPECT_EQ(second["text"], "Second page");
}

TEST_F(CoreToolsTest, PdfExtractRejectsBadInput) {
    std::string pdf = writeData("doc.pdf", kTwoPagePdf);
    std::string notPdf = writeData("plain.pdf", "just text");

    EXPECT_THROW(registry.invoke("pdf_extract", {{"path", pdf}, {"pages", {3}}}), RpcError);
    EXPECT_THROW(registry.invoke("pdf_extract", {{"path", notPdf}}), RpcError);
    try {
        registry.invoke("pdf_extract", {{"path", pdf}, {"pages", {0}}});
        FAIL() << "expected InvalidParams";
    } catch (const RpcError& e) {
        EXPECT_TRUE(e.is(RpcErrorCode::InvalidParams));
    }
}

// ============================================================================
// report_generate
// ============================================================================

TEST(ReportHelpersTest, SlugAndEscape) {
    EXPECT_EQ(ReportGenerateTool::slugify("Quarterly Sales: Q3 / 2024"), "quarterly-sales-q3-2024");
    EXPECT_EQ(ReportGenerateTool::slugify("!!!"), "report");
    EXPECT_EQ(ReportGenerateTool::escapeHtml("<a href=\"x\">&'"), "&lt;a href=&quot;x&quot;&gt;&amp;&#39;");
}

TEST_F(CoreToolsTest, ReportGenerateWritesHtmlIntoReportsDir) {
    nlohmann::json sections = nlohmann::json::array({
        "Plain <b>text</b>",
        {{"heading", "Summary"}, {"body", "line1\nline2"}},
        {{"type", "table"}, {"title", "Totals"}, {"records", {{{"region", "north"}, {"total", 10}},
                                                              {{"region", "south"}, {"total", 7}}}}},
        {{"other", 1}}
    });

    auto result = registry.invoke("report_generate",
                                  {{"title", "Weekly"}, {"sections", sections}, {"output", "../escape.html"}});

    fs::path out = fs::u8path(result["path"].get<std::string>());
    EXPECT_EQ(out.filename().string(), "escape.html");
    EXPECT_EQ(fs::weakly_canonical(out.parent_path()).string(), fs::weakly_canonical(config.reportsDir).string());
    EXPECT_EQ(result["format"], "html");

    std::string html = ReadAll(out);
    EXPECT_EQ(result["bytes"], html.size());
    EXPECT_NE(html.find("<title>Weekly</title>"), std::string::npos);
    EXPECT_NE(html.find("Plain &lt;b&gt;text&lt;/b&gt;"), std::string::npos);
    EXPECT_NE(html.find("<h2>Summary</h2><div>line1<br/>line2</div>"), std::string::npos);
    EXPECT_NE(html.find("<th>region</th><th>total</th>"), std::string::npos);
    EXPECT_NE(html.find("<td>south</td><td>7</td>"), std::string::npos);
    EXPECT_NE(html.find("<pre>"), std::string::npos);
}

TEST_F(CoreToolsTest, ReportGenerateDefaultName) {
    auto result = registry.invoke("report_generate", {{"title", "My Report"}, {"sections", nlohmann::json::array()}});
    std::string name = fs::u8path(result["path"].get<std::string>()).filename().u8string();
    EXPECT_EQ(name.rfind("my-report_", 0), 0u);
    EXPECT_EQ(fs::path(name).extension().string(), ".html");

    EXPECT_THROW(registry.invoke("report_generate", {{"title", ""}, {"sections", nlohmann::json::array()}}), RpcError);
    EXPECT_THROW(registry.invoke("report_generate", {{"title", "x"}, {"sections", {1, 2}}}), RpcError);
}

// ============================================================================
// project_scaffold
// ============================================================================

TEST_F(CoreToolsTest, ProjectScaffoldCreatesSkeleton) {
    fs::path dir = testDir / "proj";
    auto result = registry.invoke("project_scaffold", {
        {"dir", dir.string()}, {"name", "Demo"}, {"with_git", false},
        {"package_name", "demo"}, {"requirements", {"fmt", "nlohmann_json"}}
    });

    EXPECT_EQ(result["created"].size(), 4u);
    EXPECT_EQ(result["git"], nlohmann::json::object());
    EXPECT_TRUE(fs::is_directory(dir / "src"));
    EXPECT_TRUE(fs::is_directory(dir / "reports"));

    std::string cmake = ReadAll(dir / "CMakeLists.txt");
    EXPECT_NE(cmake.find("project(demo LANGUAGES CXX)"), std::string::npos);
    EXPECT_NE(cmake.find("find_package(fmt REQUIRED)"), std::string::npos);
    EXPECT_NE(cmake.find("add_executable(demo src/main.cpp)"), std::string::npos);
    EXPECT_NE(ReadAll(dir / "src" / "main.cpp").find("Hello from Demo!"), std::string::npos);
    EXPECT_NE(ReadAll(dir / "README.md").find("- nlohmann_json"), std::string::npos);
    EXPECT_TRUE(fs::exists(dir / ".gitignore"));
}

TEST_F(CoreToolsTest, ProjectScaffoldRejectsBadPackageName) {
    fs::path dir = testDir / "proj2";
    try {
        registry.invoke("project_scaffold", {{"dir", dir.string()}, {"name", "x"}, {"with_git", false},
                                             {"package_name", "bad-name"}});
        FAIL() << "expected failure";
    } catch (const RpcError& e) {
        EXPECT_TRUE(e.is(RpcErrorCode::InternalError));
    }
    EXPECT_FALSE(fs::exists(dir));
}

// ============================================================================
// llm_chat and sum
// ============================================================================

TEST_F(CoreToolsTest, LlmChatSendsSystemAndUserMessages) {
    auto result = registry.invoke("llm_chat", {
        {"prompt", "USER: What is 2+3?"}, {"temperature", 0.5}, {"max_tokens", 32},
        {"history", {{{"role", "user"}, {"content", "What is 2+3?"}}}}
    });

    EXPECT_EQ(result["provider"], "openai-compatible");
    EXPECT_EQ(result["model"], "scripted-model");
    EXPECT_EQ(result["text"], "  Five.  ");
    EXPECT_EQ(result["context_turns"], 1);
    EXPECT_TRUE(result["duration_ms"].is_number_integer());

    ASSERT_EQ(llm->lastMessages.size(), 2u);
    EXPECT_EQ(llm->lastMessages[0]["role"], "system");
    EXPECT_EQ(llm->lastMessages[1]["role"], "user");
    EXPECT_EQ(llm->lastMessages[1]["content"], "USER: What is 2+3?");
    EXPECT_DOUBLE_EQ(llm->lastTemperature, 0.5);
    EXPECT_EQ(llm->lastMaxTokens, 32);
}

TEST_F(CoreToolsTest, LlmChatUsesConfiguredDefaultsAndReportsFailures) {
    registry.invoke("llm_chat", {{"prompt", "hi"}});
    EXPECT_DOUBLE_EQ(llm->lastTemperature, config.llm.temperature);
    EXPECT_EQ(llm->lastMaxTokens, config.llm.maxTokens);

    EXPECT_THROW(registry.invoke("llm_chat", {{"temperature", 0.1}}), RpcError);
    EXPECT_THROW(registry.invoke("llm_chat", {{"prompt", "hi"}, {"temperature", 3}}), RpcError);

    llm->fail = true;
    try {
        registry.invoke("llm_chat", {{"prompt", "hi"}});
        FAIL() << "expected InternalError";
    } catch (const RpcError& e) {
        EXPECT_TRUE(e.is(RpcErrorCode::InternalError));
    }
}

TEST_F(CoreToolsTest, SystemPromptResolutionOrder) {
    LlmChatTool tool(llm, config.llm);
    EXPECT_EQ(tool.resolveSystemPrompt({{"system", "From args"}}), "From args");
    EXPECT_EQ(tool.resolveSystemPrompt(nlohmann::json::object()), "Configured prompt");

    Config::LLM withFile = config.llm;
    withFile.systemPromptPath = writeData("prompt.txt", "From file");
    LlmChatTool fileTool(llm, withFile);
    EXPECT_EQ(fileTool.resolveSystemPrompt(nlohmann::json::object()), "From file");
    EXPECT_EQ(fileTool.resolveSystemPrompt({{"system", "From args"}}), "From args");

    Config::LLM bare;
    bare.systemPrompt.clear();
    LlmChatTool bareTool(llm, bare);
    EXPECT_FALSE(bareTool.resolveSystemPrompt(nlohmann::json::object()).empty());
}

TEST_F(CoreToolsTest, LlmChatWithoutClientFails) {
    LlmChatTool tool(nullptr, config.llm);
    EXPECT_THROW(tool.execute({{"prompt", "hi"}}), std::runtime_error);
}

TEST_F(CoreToolsTest, SumAddsNumbers) {
    auto ints = registry.invoke("sum", {{"a", 2}, {"b", 3}});
    EXPECT_TRUE(ints.is_number_integer());
    EXPECT_EQ(ints, 5);
    EXPECT_DOUBLE_EQ(registry.invoke("sum", {{"a", 1.5}, {"b", 2}}).get<double>(), 3.5);
    EXPECT_THROW(registry.invoke("sum", {{"a", "2"}, {"b", 3}}), RpcError);
}

TEST_F(CoreToolsTest, SumFallsBackToDoubleOnInt64Overflow) {
    const long long big = std::numeric_limits<long long>::max();

    auto edge = registry.invoke("sum", {{"a", big - 1}, {"b", 1}});
    EXPECT_TRUE(edge.is_number_integer());
    EXPECT_EQ(edge.get<long long>(), big);

    auto over = registry.invoke("sum", {{"a", big}, {"b", 1}});
    ASSERT_TRUE(over.is_number_float());
    EXPECT_GT(over.get<double>(), 9.2e18);

    auto under = registry.invoke("sum", {{"a", std::numeric_limits<long long>::min()}, {"b", -1}});
    ASSERT_TRUE(under.is_number_float());
    EXPECT_LT(under.get<double>(), -9.2e18);

    auto wide = addNumbers(nlohmann::json(18446744073709551615ULL), nlohmann::json(1));
    ASSERT_TRUE(wide.is_number_float());
    EXPECT_GT(wide.get<double>(), 1.8e19);
}

TEST_F(CoreToolsTest, RegistersTheBuiltInToolSet) {
    auto tools = registry.listTools();
    std::vector<std::string> names;
    for (const auto& t : tools) names.push_back(t["name"].get<std::string>());
    EXPECT_EQ(names, (std::vector<std::string>{"data_profile", "llm_chat", "pdf_extract",
                                               "project_scaffold", "report_generate", "sum", "ts_forecast"}));
}
