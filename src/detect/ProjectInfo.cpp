#include "detect/ProjectInfo.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <regex>
#include <sstream>
#include <vector>

namespace mcpify {

namespace fs = std::filesystem;

namespace {

constexpr size_t kMinDescriptionLine = 20;
constexpr size_t kMaxDescriptionLength = 100;

std::optional<std::string> read_text(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::warn("Could not read {}", path.string());
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::optional<std::string> name_from(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    auto content = read_text(path);
    if (!content) {
        return std::nullopt;
    }
    static const std::regex name_re(R"(name\s*=\s*["']([^"']+)["'])");
    std::smatch m;
    if (std::regex_search(*content, m, name_re)) {
        return m[1].str();
    }
    return std::nullopt;
}

std::optional<fs::path> find_readme(const fs::path& root) {
    std::vector<fs::path> candidates;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        std::string filename = entry.path().filename().string();
        std::string lowered = filename;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered.rfind("readme", 0) == 0) {
            candidates.push_back(entry.path());
        }
    }
    if (candidates.empty()) {
        return std::nullopt;
    }
    std::sort(candidates.begin(), candidates.end());
    return candidates.front();
}

} // namespace

std::string ProjectInfo::description_from_readme(std::string_view readme) {
    std::istringstream in{std::string(readme)};
    std::string line;
    std::string description;
    bool found_title = false;

    while (std::getline(in, line)) {
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos) {
            continue;
        }
        auto last = line.find_last_not_of(" \t\r");
        line = line.substr(first, last - first + 1);

        if (line[0] == '#') {
            found_title = true;
            continue;
        }
        // badges and bare links
        if (line.find("[![") != std::string::npos || line.rfind("http", 0) == 0) {
            continue;
        }
        if (found_title && line.size() > kMinDescriptionLine) {
            if (!description.empty()) {
                description += " ";
            }
            description += line;
            if (description.size() > kMaxDescriptionLength) {
                break;
            }
        }
    }

    return description;
}

ProjectInfo ProjectInfo::read(const fs::path& root) {
    ProjectInfo info;

    auto declared = name_from(root / "pyproject.toml");
    if (!declared) {
        declared = name_from(root / "setup.py");
    }
    if (declared) {
        info.name = *declared;
    } else {
        std::error_code ec;
        fs::path absolute = fs::weakly_canonical(root, ec);
        info.name = (ec ? root : absolute).filename().string();
    }

    if (auto readme = find_readme(root)) {
        if (auto content = read_text(*readme)) {
            info.description = description_from_readme(*content);
        }
    }
    if (info.description.empty()) {
        info.description = "API for " + info.name;
    }

    return info;
}

} // namespace mcpify
