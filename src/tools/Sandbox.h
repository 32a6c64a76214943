#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

/**
 * @brief Restricts tool file access to a set of allowed directories.
 */
class Sandbox {
public:
    Sandbox(const std::vector<std::string>& allowedDirs, std::uintmax_t maxBytes);

    /**
     * @brief Canonicalise a user path and check it lies under an allowed dir.
     * @throws std::runtime_error("Path not allowed: ...")
     */
    fs::path resolve(const std::string& path) const;

    /**
     * @brief resolve() plus existence and size checks, then read the whole file.
     * @throws std::runtime_error when missing, too large or unreadable
     */
    std::string readFile(const std::string& path) const;

    const std::vector<fs::path>& getAllowedDirs() const { return allowedDirs; }
    std::uintmax_t getMaxBytes() const { return maxBytes; }

    // "~" and "~/..." expand against $HOME.
    static fs::path expandHome(const std::string& path);

private:
    std::vector<fs::path> allowedDirs;
    std::uintmax_t maxBytes;

    static fs::path canonical(const std::string& path);
    static bool isUnder(const fs::path& path, const fs::path& base);
};
