#pragma once

#include "core/TreeSitterParser.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>

namespace mcpify {

/**
 * @brief One parsed project file handed to the extractors
 */
struct SourceFile {
    std::filesystem::path path;      // absolute
    std::filesystem::path relative;  // relative to the project root
    std::string source;
    std::unique_ptr<Tree> tree;

    /**
     * @brief File name without extension ("tools/cli.py" -> "cli")
     */
    std::string stem() const { return path.stem().string(); }

    /**
     * @brief Dotted import name relative to the project root ("pkg/mod.py" -> "pkg.mod")
     *
     * A package's __init__.py maps to the package name.
     */
    std::string module_name() const {
        std::string dotted;
        std::filesystem::path without_ext = relative;
        without_ext.replace_extension();
        for (const auto& part : without_ext) {
            std::string piece = part.string();
            if (piece == "__init__" || piece == ".") {
                continue;
            }
            if (!dotted.empty()) {
                dotted += ".";
            }
            dotted += piece;
        }
        return dotted;
    }
};

/**
 * @brief Start bytes of function definitions already turned into tools
 *
 * Shared between extractors of one file so a function is claimed once.
 */
using ClaimedFunctions = std::set<uint32_t>;

} // namespace mcpify
