#pragma once

#include "dispatch/Invocation.hpp"
#include "dispatch/ProcessRunner.hpp"
#include "schema/Configuration.hpp"

namespace mcpify {

/**
 * @brief Executes commandline tools
 */
class CommandInvoker {
public:
    /**
     * @brief Spawn the backend executable with the rendered argument vector
     *
     * Success payload is the captured stdout; a non-zero exit becomes a
     * BackendError carrying exit code, stdout and stderr.
     *
     * @throws ProcessLaunchError if the executable cannot be started
     */
    static InvocationResult invoke(const CommandLineBackend& backend,
                                   const CommandLineInvocation& invocation,
                                   const ArgumentMap& arguments,
                                   const CallContext& context);

    /**
     * @brief Map a finished process to a result (Timeout, Cancelled, BackendError or Success)
     */
    static InvocationResult outcome(const ProcessResult& process, const CallContext& context);
};

} // namespace mcpify
