#include "MCPServer.hpp"
#include "Version.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

namespace mcpify {

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr auto kStopPollInterval = std::chrono::milliseconds(50);

json make_result(const json& id, json result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", std::move(result)}
    };
}

} // namespace

MCPServer::MCPServer(std::unique_ptr<ITransport> transport, ServerInfo info)
    : transport_(std::move(transport)), info_(std::move(info)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
    if (info_.version.empty()) {
        info_.version = MCPIFY_VERSION;
    }
    spdlog::debug("MCPServer initialized");
}

MCPServer::~MCPServer() {
    reap_finished_calls(true);
}

void MCPServer::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }

    if (tools_.find(info.name) == tools_.end()) {
        tool_order_.push_back(info.name);
    }
    tools_[info.name] = info;
    handlers_[info.name] = std::move(handler);
    spdlog::debug("Registered tool: {}", info.name);
}

void MCPServer::run() {
    spdlog::info("MCPServer starting main loop");

    while (!stop_requested_ && transport_->is_open()) {
        json request;
        try {
            request = transport_->read_message();
        } catch (const std::exception& e) {
            spdlog::error("Transport read failed: {}", e.what());
            break;
        }

        // Null indicates EOF or closed transport
        if (request.is_null()) {
            spdlog::info("Input closed, stopping server");
            break;
        }

        try {
            json response = handle_request(request);

            // Notifications and asynchronous calls return null
            if (!response.is_null()) {
                send(response);
            }
        } catch (const std::exception& e) {
            spdlog::error("Error in main loop: {}", e.what());
            try {
                if (request.is_object() && request.contains("id")) {
                    send(create_error_response(request["id"], -32603,
                                               std::string("Internal error: ") + e.what()));
                }
            } catch (const std::exception& write_error) {
                spdlog::error("Failed to send error response: {}", write_error.what());
            }
        }

        reap_finished_calls(false);
    }

    if (stop_requested_) {
        spdlog::info("MCPServer stop requested, cancelling {} in-flight call(s)", calls_.size());
    }
    reap_finished_calls(true);
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    stop_requested_ = true;
}

void MCPServer::cancel_in_flight() {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    for (auto& [id, token] : in_flight_) {
        token->store(true);
    }
}

void MCPServer::send(const json& message) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    transport_->write_message(message);
}

void MCPServer::reap_finished_calls(bool wait_all) {
    while (true) {
        // stop() may arrive while waiting, so it is polled here too
        if (wait_all && stop_requested_) {
            cancel_in_flight();
        }
        for (auto it = calls_.begin(); it != calls_.end();) {
            if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                it->get();
                it = calls_.erase(it);
            } else {
                ++it;
            }
        }
        if (!wait_all || calls_.empty()) {
            return;
        }
        calls_.front().wait_for(kStopPollInterval);
    }
}

json MCPServer::handle_request(const json& request) {
    // Validate JSON-RPC 2.0 format
    if (!request.is_object() || !request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        return create_error_response(json(), -32600, "Invalid Request: missing or invalid jsonrpc field");
    }

    json id = request.value("id", json());
    bool is_notification = !request.contains("id");

    if (!request.contains("method") || !request["method"].is_string()) {
        return create_error_response(id, -32600, "Invalid Request: missing method field");
    }

    std::string method = request["method"];
    json params = request.value("params", json::object());

    spdlog::debug("Handling request: method={}, id={}", method, id.dump());

    try {
        if (method == "initialize") {
            json result = handle_initialize(params);
            initialized_ = true;
            return make_result(id, result);
        } else if (method == "notifications/initialized") {
            spdlog::info("Client sent initialized notification, server is ready");
            return json();
        } else if (method == "notifications/cancelled") {
            handle_cancelled_notification(params);
            return json();
        } else if (method == "ping") {
            return make_result(id, json::object());
        } else if (method == "tools/list") {
            return make_result(id, handle_tools_list());
        } else if (method == "tools/call") {
            start_tools_call(id, params, is_notification);
            return json();
        } else if (is_notification) {
            spdlog::debug("Ignoring notification {}", method);
            return json();
        } else {
            return create_error_response(id, -32601, "Method not found: " + method);
        }
    } catch (const std::invalid_argument& e) {
        if (is_notification) {
            spdlog::warn("Notification {} rejected: {}", method, e.what());
            return json();
        }
        return create_error_response(id, -32602, std::string("Invalid params: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("Error handling method {}: {}", method, e.what());
        if (is_notification) {
            return json();
        }
        return create_error_response(id, -32603, std::string("Internal error: ") + e.what());
    }
}

json MCPServer::handle_tools_list() {
    json tools_array = json::array();

    for (const auto& name : tool_order_) {
        const ToolInfo& info = tools_.at(name);
        tools_array.push_back({
            {"name", info.name},
            {"description", info.description},
            {"inputSchema", info.input_schema}
        });
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

void MCPServer::start_tools_call(const json& id, const json& params, bool is_notification) {
    if (!params.contains("name") || !params["name"].is_string()) {
        throw std::invalid_argument("Missing required parameter: name");
    }
    if (handlers_.find(params["name"].get<std::string>()) == handlers_.end()) {
        throw std::invalid_argument("Unknown tool: " + params["name"].get<std::string>());
    }

    std::string tool_name = params["name"];
    json arguments = params.value("arguments", json::object());
    // No JSON dump starts with '#', so notification keys never collide with request ids
    std::string key = is_notification ? "#" + std::to_string(++notification_calls_) : id.dump();

    auto cancel = std::make_shared<std::atomic_bool>(false);
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        if (!in_flight_.emplace(key, cancel).second) {
            throw std::invalid_argument("Request id " + key + " is already in flight");
        }
    }

    spdlog::debug("Calling tool: {} with args: {}", tool_name, arguments.dump());

    calls_.push_back(std::async(std::launch::async,
                                [this, id, key, tool_name, arguments, cancel, is_notification]() {
        json response;
        try {
            response = make_result(id, call_tool(tool_name, arguments, cancel));
        } catch (const std::exception& e) {
            spdlog::error("Tool {} raised: {}", tool_name, e.what());
            response = create_error_response(id, -32603, std::string("Internal error: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(calls_mutex_);
            in_flight_.erase(key);
        }

        if (is_notification) {
            spdlog::debug("Tool {} called as a notification, no response sent", tool_name);
            return;
        }

        // A cancelled request gets no response
        if (cancel->load()) {
            spdlog::debug("Request {} cancelled, dropping response", key);
            return;
        }
        try {
            send(response);
        } catch (const std::exception& e) {
            spdlog::error("Failed to send response for {}: {}", key, e.what());
        }
    }));
}

json MCPServer::call_tool(const std::string& tool_name, const json& arguments, const CancelToken& cancel) {
    ToolOutput output = handlers_.at(tool_name)(arguments, cancel);

    return {
        {"content", json::array({
            {
                {"type", "text"},
                {"text", output.text}
            }
        })},
        {"isError", output.is_error}
    };
}

json MCPServer::handle_initialize(const json& params) {
    spdlog::info("Handling initialize request");

    // Extract client info if provided
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        std::string client_name = params["clientInfo"].value("name", "unknown");
        std::string client_version = params["clientInfo"].value("version", "unknown");
        spdlog::info("Client: {} version {}", client_name, client_version);
    }

    // Return server capabilities
    return {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", {
            {"tools", json::object()}
        }},
        {"serverInfo", {
            {"name", info_.name},
            {"version", info_.version}
        }}
    };
}

void MCPServer::handle_cancelled_notification(const json& params) {
    if (!params.contains("requestId")) {
        return;
    }
    std::string key = params["requestId"].dump();

    std::lock_guard<std::mutex> lock(calls_mutex_);
    auto it = in_flight_.find(key);
    if (it == in_flight_.end()) {
        spdlog::debug("Cancellation for unknown or finished request {}", key);
        return;
    }
    it->second->store(true);
    spdlog::info("Cancelling request {} ({})", key, params.value("reason", "no reason given"));
}

json MCPServer::create_error_response(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

} // namespace mcpify
