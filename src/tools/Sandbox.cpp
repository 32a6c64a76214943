#include "tools/Sandbox.h"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

Sandbox::Sandbox(const std::vector<std::string>& dirs, std::uintmax_t maxBytes)
    : maxBytes(maxBytes) {
    for (const auto& dir : dirs) {
        allowedDirs.push_back(canonical(dir));
    }
}

fs::path Sandbox::expandHome(const std::string& path) {
    if (path.empty() || path[0] != '~') return fs::u8path(path);
    if (path.size() > 1 && path[1] != '/') return fs::u8path(path);  // ~user is not supported

    const char* home = std::getenv("HOME");
    if (!home) return fs::u8path(path);
    return fs::u8path(std::string(home) + path.substr(1));
}

fs::path Sandbox::canonical(const std::string& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(expandHome(path), ec);
    if (ec) abs = expandHome(path);
    fs::path result = fs::weakly_canonical(abs, ec);
    if (ec) return abs.lexically_normal();
    return result;
}

bool Sandbox::isUnder(const fs::path& path, const fs::path& base) {
    auto p = path.begin();
    for (auto b = base.begin(); b != base.end(); ++b, ++p) {
        // A trailing separator shows up as an empty final element.
        if (b->empty()) continue;
        if (p == path.end() || *p != *b) return false;
    }
    return true;
}

fs::path Sandbox::resolve(const std::string& path) const {
    fs::path p = canonical(path);
    for (const auto& base : allowedDirs) {
        if (isUnder(p, base)) return p;
    }
    throw std::runtime_error("Path not allowed: " + p.u8string());
}

std::string Sandbox::readFile(const std::string& path) const {
    fs::path p = resolve(path);
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) {
        throw std::runtime_error("File not found: " + p.u8string());
    }
    std::uintmax_t size = fs::file_size(p, ec);
    if (ec) {
        throw std::runtime_error("Cannot stat " + p.u8string() + ": " + ec.message());
    }
    if (size > maxBytes) {
        throw std::runtime_error("File too large for this tool: " + p.u8string() +
                                 " (" + std::to_string(size) + " > " + std::to_string(maxBytes) + " bytes)");
    }

    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open " + p.u8string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}
