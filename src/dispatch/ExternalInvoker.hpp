#pragma once

#include "dispatch/Invocation.hpp"
#include "schema/Configuration.hpp"
#include <string>
#include <string_view>

namespace mcpify {

/**
 * @brief Forwards tool calls to an external MCP server over stdio
 *
 * The server is launched per call and sent initialize,
 * notifications/initialized and tools/call before stdin is closed.
 */
class ExternalInvoker {
public:
    static InvocationResult invoke(const ExternalBackend& backend,
                                   const std::string& tool_name,
                                   const ArgumentMap& arguments,
                                   const CallContext& context);

    /**
     * @brief Newline-delimited JSON-RPC messages written to the server
     */
    static std::string session_script(const std::string& tool_name, const ArgumentMap& arguments);

    /**
     * @brief Find the tools/call response in the server's stdout
     *
     * A JSON-RPC error or a result with isError becomes BackendError.
     */
    static InvocationResult parse_reply(std::string_view stdout_text, std::string_view stderr_text);
};

} // namespace mcpify
