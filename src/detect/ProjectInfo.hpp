#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace mcpify {

/**
 * @brief Name and description of a project, read from its metadata files
 */
struct ProjectInfo {
    std::string name;
    std::string description;

    /**
     * @brief Read project metadata
     *
     * Name comes from pyproject.toml or setup.py (`name = "..."`), else the
     * directory name. Description comes from the first substantial README
     * paragraph after the title, else "API for <name>".
     */
    static ProjectInfo read(const std::filesystem::path& root);

    static std::string description_from_readme(std::string_view readme);
};

} // namespace mcpify
