#pragma once

#include <stdexcept>
#include <string>

namespace mcpify {

/**
 * @brief Raised when a project root cannot be analysed
 *
 * Covers unreadable roots and layouts with no analysable source file.
 */
class DetectionError : public std::runtime_error {
public:
    explicit DetectionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a persisted Configuration document has the wrong shape
 */
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace mcpify
