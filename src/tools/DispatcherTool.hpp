#pragma once

#include "dispatch/Dispatcher.hpp"
#include "mcp/MCPServer.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace mcpify {

/**
 * @brief MCP tool backed by one tool of a Dispatcher
 *
 * Translates tools/call arguments into Dispatcher::invoke and the
 * InvocationResult back into MCP text content.
 */
class DispatcherTool {
public:
    /**
     * @brief Construct tool bound to a configured tool name
     * @param dispatcher Shared dispatcher serving the configuration
     * @param tool_name Name of a tool in the dispatcher's configuration
     * @param timeout Per-call timeout override; backend timeout when nullopt
     */
    DispatcherTool(std::shared_ptr<const Dispatcher> dispatcher,
                   std::string tool_name,
                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Get tool metadata and JSON schema
     */
    ToolInfo get_info() const;

    /**
     * @brief Execute tool with arguments
     * @param args JSON object with the tool's parameters
     * @param cancel Raised when the client cancels the request
     */
    ToolOutput execute(const json& args, const CancelToken& cancel) const;

    /**
     * @brief Register every tool of the dispatcher with the server
     */
    static void register_all(MCPServer& server,
                             const std::shared_ptr<const Dispatcher>& dispatcher,
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt);

private:
    std::shared_ptr<const Dispatcher> dispatcher_;
    std::string tool_name_;
    std::optional<std::chrono::milliseconds> timeout_;
};

} // namespace mcpify
