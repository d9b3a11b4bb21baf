#pragma once

#include "schema/Configuration.hpp"
#include <filesystem>

namespace mcpify {

/**
 * @brief Converts between Configuration and its persisted JSON form
 *
 * Shape errors (wrong JSON types, missing backend) raise SchemaError.
 * Semantic problems such as unknown backend types or duplicate names are
 * loaded as-is and left to ConfigValidator.
 */
class ConfigLoader {
public:
    /**
     * @brief Build a Configuration from a parsed document
     * @throws SchemaError if the document has the wrong shape
     */
    static Configuration from_json(const json& document);

    /**
     * @brief Serialize a Configuration into its persisted form
     */
    static json to_json(const Configuration& config);

    /**
     * @brief Read and parse a Configuration file
     * @throws SchemaError if the file cannot be read, is not JSON or has the wrong shape
     */
    static Configuration load_file(const std::filesystem::path& filepath);

    /**
     * @brief Write a Configuration file (pretty-printed, trailing newline)
     * @throws std::runtime_error if the file cannot be written
     */
    static void save_file(const Configuration& config, const std::filesystem::path& filepath);
};

} // namespace mcpify
