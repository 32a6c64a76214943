#pragma once
#include "ITool.h"
#include "Sandbox.h"
#include "core/ConfigManager.h"
#include <memory>
#include <string>
#include <vector>

class LLMClient;
class ToolRegistry;

/**
 * @brief Extract text from a local PDF
 *
 * Works on uncompressed content streams only: text shown with the Tj, TJ,
 * ' and " operators is collected per page. Pages are 1-based.
 */
class PdfExtractTool : public ITool {
public:
    explicit PdfExtractTool(const Sandbox& sandbox);

    std::string getName() const override { return "pdf_extract"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

    // Text of every page, in page-tree order.
    static std::vector<std::string> extractPages(const std::string& pdf);

    // Text operators of one content stream.
    static std::string extractStreamText(const std::string& content);

private:
    const Sandbox& sandbox;
};

/**
 * @brief Profile a CSV file: per-column type, nulls and numeric summary
 */
class DataProfileTool : public ITool {
public:
    explicit DataProfileTool(const Sandbox& sandbox);

    std::string getName() const override { return "data_profile"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    const Sandbox& sandbox;
};

/**
 * @brief Forecast a numeric CSV column with Holt's linear smoothing
 *
 * alpha and beta are picked by grid search on one-step-ahead squared error.
 * Series shorter than three points fall back to repeating the last value.
 */
class TsForecastTool : public ITool {
public:
    explicit TsForecastTool(const Sandbox& sandbox);

    std::string getName() const override { return "ts_forecast"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

    struct HoltFit {
        double alpha = 0.0;
        double beta = 0.0;
        double sse = 0.0;
        double level = 0.0;
        double trend = 0.0;
    };

    static HoltFit fitHolt(const std::vector<double>& series);

private:
    const Sandbox& sandbox;
};

class ReportGenerateTool : public ITool {
public:
    explicit ReportGenerateTool(const std::string& reportsDir);

    std::string getName() const override { return "report_generate"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

    static std::string slugify(const std::string& title);
    static std::string escapeHtml(const std::string& text);

private:
    std::string reportsDir;
};

/**
 * @brief Single-shot chat completion against the configured endpoint
 *
 * Stateless: the caller passes the whole conversation in the prompt.
 */
class LlmChatTool : public ITool {
public:
    LlmChatTool(std::shared_ptr<LLMClient> client, const Config::LLM& settings);

    std::string getName() const override { return "llm_chat"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

    // arg, then system_prompt_path, then prompts/system_llm.txt, then configured text, then built-in.
    std::string resolveSystemPrompt(const nlohmann::json& args) const;

private:
    std::shared_ptr<LLMClient> client;
    Config::LLM settings;
};

class ProjectScaffoldTool : public ITool {
public:
    ProjectScaffoldTool() = default;

    std::string getName() const override { return "project_scaffold"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;
};

// RFC 4180 style: quoted fields, doubled quotes, CRLF tolerated.
std::vector<std::vector<std::string>> parseCsv(const std::string& text, char sep = ',');

// Exact int64 sum when it fits, double otherwise. Backs the `sum` tool.
nlohmann::json addNumbers(const nlohmann::json& a, const nlohmann::json& b);

/**
 * @brief Register the built-in tool set
 *
 * The sandbox must outlive the registry. Throws std::runtime_error on a
 * duplicate name.
 */
void registerCoreTools(ToolRegistry& registry, const Config& config,
                       const Sandbox& sandbox, std::shared_ptr<LLMClient> llmClient);
