#pragma once

#include "mcp/ITransport.hpp"
#include <mutex>
#include <queue>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpify {

/**
 * @brief Mock transport for testing MCP server
 *
 * Uses queues for simulating request/response flow without actual I/O.
 * Responses may be written from the server's worker threads.
 */
class MockTransport : public ITransport {
public:
    MockTransport() = default;

    json read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

    /**
     * @brief Add a request to the input queue
     * @param request JSON-RPC request
     */
    void push_request(const json& request);

    /**
     * @brief Get and remove response from output queue
     * @return JSON-RPC response
     */
    json pop_response();

    /**
     * @brief Check if there are pending responses
     * @return true if responses available
     */
    bool has_responses() const;

    /**
     * @brief Remove every pending response, in arrival order
     */
    std::vector<json> drain_responses();

    /**
     * @brief Close the transport (causes read_message to return empty)
     */
    void close();

private:
    mutable std::mutex mutex_;
    std::queue<json> requests_;
    std::queue<json> responses_;
    bool open_ = true;
};

} // namespace mcpify
