#pragma once

#include <httplib.h>
#include <chrono>
#include <string>
#include <thread>

namespace mcpify {

/**
 * @brief httplib::Server listening on an ephemeral loopback port for the
 * lifetime of the object
 *
 * Register handlers through server() before calling start().
 */
class LocalServer {
public:
    LocalServer() = default;

    ~LocalServer() { stop(); }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

    httplib::Server& server() { return server_; }

    /**
     * @return false if no port could be bound
     */
    bool start() {
        port_ = server_.bind_to_any_port("127.0.0.1");
        if (port_ <= 0) {
            return false;
        }
        thread_ = std::thread([this] { server_.listen_after_bind(); });
        for (int i = 0; i < 500 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        return server_.is_running();
    }

    void stop() {
        if (thread_.joinable()) {
            server_.stop();
            thread_.join();
        }
    }

    int port() const { return port_; }

    std::string url(const std::string& base_path = "") const {
        return "http://127.0.0.1:" + std::to_string(port_) + base_path;
    }

private:
    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;
};

} // namespace mcpify
