#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Ordered, append-only sequence of chat turns owned by the router.
 *
 * Chat tools are stateless; the whole context travels in every call's
 * params. reset() is purely local and produces no protocol traffic.
 */
class ConversationContext {
public:
    struct Turn {
        std::string role;   // "user" or "assistant"
        std::string text;
    };

    explicit ConversationContext(size_t maxPromptChars = 4000);

    void append(const std::string& role, const std::string& text);
    void reset();

    const std::vector<Turn>& getTurns() const { return turns; }
    size_t size() const { return turns.size(); }
    bool empty() const { return turns.empty(); }

    /**
     * @brief "ROLE: text" lines for every turn, trimmed from the front to
     * maxPromptChars at a line boundary.
     */
    std::string buildPrompt() const;

    // [{"role": ..., "content": ...}, ...]
    nlohmann::json toJson() const;

    /**
     * @brief Write a Markdown transcript, creating parent directories.
     * @return The path written
     * @throws std::runtime_error when the file cannot be written
     */
    std::string saveTranscript(const std::string& path) const;

private:
    std::vector<Turn> turns;
    size_t maxPromptChars;
};
