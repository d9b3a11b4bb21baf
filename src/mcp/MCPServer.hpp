#pragma once

#include "ITransport.hpp"
#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpify {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief What a tool handler returns to the client
 */
struct ToolOutput {
    std::string text;
    bool is_error = false;
};

/**
 * @brief Flag raised when the client cancels a call
 */
using CancelToken = std::shared_ptr<std::atomic_bool>;

/**
 * @brief Function signature for tool execution
 * @param args JSON object with tool arguments
 * @param cancel Token raised by notifications/cancelled for this request
 */
using ToolHandler = std::function<ToolOutput(const json& args, const CancelToken& cancel)>;

/**
 * @brief Identity reported in the initialize response
 */
struct ServerInfo {
    std::string name = "mcpify";
    std::string version;
};

/**
 * @brief MCP Server implementing JSON-RPC 2.0 protocol
 *
 * Handles tool registration and request routing.
 * Supports methods: initialize, ping, tools/list, tools/call and the
 * notifications/initialized and notifications/cancelled notifications.
 *
 * Each tools/call runs on its own task so a slow tool does not block the
 * others; responses are written under a lock and may arrive in any order.
 */
class MCPServer {
public:
    /**
     * @brief Construct MCP server with transport
     * @param transport Unique pointer to transport implementation
     */
    explicit MCPServer(std::unique_ptr<ITransport> transport, ServerInfo info = {});

    ~MCPServer();

    /**
     * @brief Register a tool with handler
     * @param info Tool metadata with JSON schema
     * @param handler Function to execute when tool is called
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    /**
     * @brief Start server main loop
     *
     * Blocks until stop() is called or transport closes, then waits for
     * in-flight tool calls to finish. After stop() the in-flight calls are
     * cancelled instead of awaited.
     */
    void run();

    /**
     * @brief Signal server to stop gracefully
     *
     * Only stores an atomic flag, so it may be called from a signal handler.
     * The loop notices it before the next read.
     */
    void stop();

private:
    /**
     * @brief Handle incoming JSON-RPC request
     * @param request JSON-RPC request message
     * @return JSON-RPC response message, or null when none is due
     */
    json handle_request(const json& request);

    /**
     * @brief Handle tools/list method
     * @return JSON array of available tools with schemas
     */
    json handle_tools_list();

    /**
     * @brief Start a tools/call on a worker task; the response is written when it completes
     */
    void start_tools_call(const json& id, const json& params, bool is_notification);

    /**
     * @brief Run a tool and build the tools/call result
     */
    json call_tool(const std::string& tool_name, const json& arguments, const CancelToken& cancel);

    /**
     * @brief Handle initialize method (MCP handshake)
     * @param params Client capabilities and info
     * @return Server capabilities and info
     */
    json handle_initialize(const json& params);

    /**
     * @brief Raise the cancel token of an in-flight request
     */
    void handle_cancelled_notification(const json& params);

    void send(const json& message);

    /**
     * @brief Collect finished calls; with wait_all, block until none remain
     */
    void reap_finished_calls(bool wait_all);

    void cancel_in_flight();

    /**
     * @brief Create JSON-RPC error response
     * @param id Request ID (or null)
     * @param code Error code
     * @param message Error message
     * @return JSON-RPC error response
     */
    static json create_error_response(const json& id, int code, const std::string& message);

    std::unique_ptr<ITransport> transport_;
    ServerInfo info_;
    std::map<std::string, ToolInfo> tools_;
    std::map<std::string, ToolHandler> handlers_;
    std::vector<std::string> tool_order_;  // registration order, for tools/list
    std::atomic<bool> stop_requested_{false};
    bool initialized_{false};

    std::mutex write_mutex_;
    std::mutex calls_mutex_;
    std::map<std::string, CancelToken> in_flight_;  // keyed by request id dump
    std::size_t notification_calls_{0};
    std::vector<std::future<void>> calls_;
};

} // namespace mcpify
