#include "core/ConversationContext.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
    return s;
}

ConversationContext::ConversationContext(size_t maxPromptChars)
    : maxPromptChars(maxPromptChars) {}

void ConversationContext::append(const std::string& role, const std::string& text) {
    turns.push_back({role, text});
}

void ConversationContext::reset() {
    turns.clear();
}

std::string ConversationContext::buildPrompt() const {
    std::string prompt;
    for (size_t i = 0; i < turns.size(); ++i) {
        if (i > 0) prompt += "\n";
        prompt += upper(turns[i].role) + ": " + trim(turns[i].text);
    }
    if (maxPromptChars == 0 || prompt.size() <= maxPromptChars) {
        return prompt;
    }

    prompt = prompt.substr(prompt.size() - maxPromptChars);
    size_t nl = prompt.find('\n');
    if (nl != std::string::npos && nl > 0) {
        prompt = prompt.substr(nl + 1);
    }
    return prompt;
}

nlohmann::json ConversationContext::toJson() const {
    nlohmann::json history = nlohmann::json::array();
    for (const auto& turn : turns) {
        history.push_back({{"role", turn.role}, {"content", turn.text}});
    }
    return history;
}

std::string ConversationContext::saveTranscript(const std::string& pathStr) const {
    std::filesystem::path path = std::filesystem::u8path(pathStr);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot write transcript: " + pathStr);
    }

    std::time_t now = std::time(nullptr);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", std::localtime(&now));

    out << "# Transcript " << ts << "\n\n";
    for (const auto& turn : turns) {
        out << (turn.role == "user" ? "### User" : "### Assistant") << "\n\n";
        out << trim(turn.text) << "\n\n";
    }
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed writing transcript: " + pathStr);
    }
    return path.string();
}
