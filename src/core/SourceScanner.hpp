#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mcpify {

/**
 * @brief Options controlling which files a scan yields
 */
struct ScanOptions {
    /// Glob patterns matched against every path component (e.g. "venv", "test_*.py")
    std::vector<std::string> ignore_patterns = default_ignore_patterns();
    /// Files larger than this are skipped
    std::uintmax_t max_file_size = 1024 * 1024;

    static std::vector<std::string> default_ignore_patterns();
};

/**
 * @brief Finds the Python sources of a project
 *
 * Walks the project root recursively and returns every .py file that is
 * not excluded by an ignore pattern or the size ceiling.
 */
class SourceScanner {
public:
    explicit SourceScanner(ScanOptions options = {});

    /**
     * @brief Collect analysable source files under root
     *
     * @param root Project root directory
     * @return Sorted absolute paths
     * @throws DetectionError if root is missing or not a directory
     */
    std::vector<std::filesystem::path> scan(const std::filesystem::path& root) const;

    /**
     * @brief Check if a file or directory name matches a glob pattern
     *
     * Supports simple wildcards: *.py, test_*.py, etc.
     */
    static bool matches_pattern(const std::string& name, const std::string& pattern);

private:
    bool is_ignored(const std::filesystem::path& relative) const;

    ScanOptions options_;
};

} // namespace mcpify
