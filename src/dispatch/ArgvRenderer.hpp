#pragma once

#include "dispatch/Invocation.hpp"
#include "schema/Configuration.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace mcpify {

/**
 * @brief Builds a process argument vector from a commandline template
 *
 * Placeholders are replaced by the string form of their values. A flag
 * literal followed by a token that is exactly one placeholder forms a
 * switch pair:
 *   - parameter omitted: both tokens are dropped
 *   - boolean: the flag alone when true, nothing when false
 *   - array: the flag followed by one token per element
 *   - otherwise: the flag and the value
 * Any other token that references an omitted parameter is dropped, and a
 * token that is exactly one array placeholder expands to one token per
 * element.
 */
class ArgvRenderer {
public:
    /**
     * @brief Base args followed by the rendered template (executable not included)
     */
    static std::vector<std::string> render(const CommandLineBackend& backend,
                                           const CommandLineInvocation& invocation,
                                           const ArgumentMap& values);

    static std::vector<std::string> render_template(const std::vector<std::string>& tokens,
                                                    const ArgumentMap& values);

    /**
     * @brief String form of a coerced value
     */
    static std::string to_text(const json& value);

    /**
     * @brief Replace every placeholder of a token; all must be bound
     */
    static std::string substitute(std::string_view token, const ArgumentMap& values);
};

} // namespace mcpify
