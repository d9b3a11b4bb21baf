#pragma once

#include "schema/Configuration.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace mcpify {

enum class Severity {
    Error,
    Warning
};

/**
 * @brief One validation finding
 */
struct Diagnostic {
    Severity severity;
    std::string location;  // e.g. "tools[1].parameters[0]"
    std::string message;

    bool operator==(const Diagnostic& other) const {
        return severity == other.severity && location == other.location &&
               message == other.message;
    }
};

struct ValidationReport {
    std::vector<Diagnostic> diagnostics;
    bool is_valid = true;

    size_t error_count() const;
    size_t warning_count() const;

    /**
     * @brief Serialize as {is_valid, diagnostics:[{severity, location, message}]}
     */
    json to_json() const;
};

/**
 * @brief Raised when a component is handed a Configuration that failed validation
 */
class InvalidConfigurationError : public std::runtime_error {
public:
    explicit InvalidConfigurationError(ValidationReport report);

    const ValidationReport& report() const { return report_; }

private:
    ValidationReport report_;
};

/**
 * @brief Checks a Configuration for internal consistency
 *
 * Never throws; every violation yields exactly one diagnostic. The result
 * depends only on the Configuration, so repeated runs are identical.
 */
class ConfigValidator {
public:
    static ValidationReport validate(const Configuration& config);
};

std::string_view to_string(Severity severity);

} // namespace mcpify
