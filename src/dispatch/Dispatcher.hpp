#pragma once

#include "dispatch/Invocation.hpp"
#include "schema/Configuration.hpp"
#include "schema/Validator.hpp"
#include <string>

namespace mcpify {

/**
 * @brief Serves tool calls against one validated Configuration
 *
 * The configuration is validated once at construction and held read-only
 * afterwards. invoke() keeps all per-call state local, so concurrent calls
 * from several threads are safe.
 */
class Dispatcher {
public:
    /**
     * @throws InvalidConfigurationError if the configuration has errors
     */
    explicit Dispatcher(Configuration config);

    const Configuration& configuration() const { return config_; }

    /**
     * @brief Validation outcome, warnings included
     */
    const ValidationReport& report() const { return report_; }

    /**
     * @brief [{name, description, input_schema}] for every tool
     */
    json list_tools() const;

    /**
     * @brief JSON Schema of a tool's arguments
     */
    static json input_schema(const Tool& tool);

    /**
     * @brief Run one tool call
     *
     * Never throws for per-call problems: unknown tools, bad arguments,
     * timeouts and backend failures all come back as a Failure result.
     */
    InvocationResult invoke(const std::string& tool_name,
                            const json& arguments,
                            const InvocationOptions& options = {}) const;

private:
    InvocationResult run(const Tool& tool, const ArgumentMap& arguments, const CallContext& context) const;

    Configuration config_;
    ValidationReport report_;
};

} // namespace mcpify
