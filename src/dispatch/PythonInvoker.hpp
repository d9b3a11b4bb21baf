#pragma once

#include "dispatch/Invocation.hpp"
#include "schema/Configuration.hpp"
#include <string>
#include <string_view>

namespace mcpify {

/**
 * @brief Executes python-module tools in a fresh interpreter
 *
 * The interpreter runs a small bootstrap that loads the module (a file
 * path, or a directory put on sys.path with a dotted function name),
 * calls the function with keyword arguments read as JSON from stdin, and
 * prints one JSON line describing the outcome. Whatever the function
 * prints goes to stderr.
 */
class PythonInvoker {
public:
    static InvocationResult invoke(const PythonModuleBackend& backend,
                                   const PythonInvocation& invocation,
                                   const ArgumentMap& arguments,
                                   const CallContext& context);

    /**
     * @brief Interpret the bootstrap's stdout
     *
     * {"ok": true, "result": ...} becomes Success; {"ok": false, ...}
     * becomes RuntimeError with stage and traceback in details.
     */
    static InvocationResult parse_reply(std::string_view stdout_text, std::string_view stderr_text);

    static const char* bootstrap_script();
};

} // namespace mcpify
