#include "core/SourceScanner.hpp"
#include "schema/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <regex>
#include <system_error>

namespace mcpify {

namespace fs = std::filesystem;

std::vector<std::string> ScanOptions::default_ignore_patterns() {
    return {
        ".git", ".hg", ".svn", "__pycache__", ".venv", "venv", "env",
        "node_modules", "build", "dist", ".tox", ".mypy_cache", ".pytest_cache",
        "site-packages", "*.egg-info",
        "test_*.py", "*_test.py", "conftest.py", "setup.py"
    };
}

SourceScanner::SourceScanner(ScanOptions options)
    : options_(std::move(options)) {}

bool SourceScanner::matches_pattern(const std::string& name, const std::string& pattern) {
    // Convert glob pattern to regex
    // Example: "test_*.py" -> "test_.*\.py"
    std::string escaped;
    for (char c : pattern) {
        if (c == '*') {
            escaped += ".*";
        } else if (c == '?') {
            escaped += ".";
        } else if (std::string_view(".+()[]{}^$|\\").find(c) != std::string_view::npos) {
            escaped += '\\';
            escaped += c;
        } else {
            escaped += c;
        }
    }

    std::regex re("^" + escaped + "$");
    return std::regex_match(name, re);
}

bool SourceScanner::is_ignored(const fs::path& relative) const {
    for (const auto& component : relative) {
        std::string name = component.string();
        for (const auto& pattern : options_.ignore_patterns) {
            if (matches_pattern(name, pattern)) {
                return true;
            }
        }
    }
    return false;
}

std::vector<fs::path> SourceScanner::scan(const fs::path& root) const {
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        throw DetectionError("Project root does not exist: " + root.string());
    }
    if (!fs::is_directory(root, ec)) {
        throw DetectionError("Project root is not a directory: " + root.string());
    }

    fs::path base = fs::canonical(root, ec);
    if (ec) {
        throw DetectionError("Cannot resolve project root " + root.string() + ": " + ec.message());
    }

    std::vector<fs::path> results;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw DetectionError("Cannot read project root " + base.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("Error scanning {}: {}", base.string(), ec.message());
            break;
        }

        const auto& entry = *it;
        fs::path relative = entry.path().lexically_relative(base);

        if (entry.is_directory(ec)) {
            if (is_ignored(relative)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".py") {
            continue;
        }
        if (is_ignored(relative)) {
            spdlog::debug("Ignoring {}", relative.string());
            continue;
        }

        auto size = entry.file_size(ec);
        if (ec || size > options_.max_file_size) {
            spdlog::debug("Skipping {} ({} bytes)", relative.string(), ec ? 0 : size);
            continue;
        }

        results.push_back(entry.path());
    }

    std::sort(results.begin(), results.end());
    spdlog::debug("Found {} source files under {}", results.size(), base.string());

    return results;
}

} // namespace mcpify
