#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace httplib {
class Client;
}

namespace mcpify {

/**
 * @brief A base URL split into origin and path prefix
 */
struct HttpEndpoint {
    std::string scheme = "http";
    std::string host;
    int port = 80;
    std::string base_path;  // "" or "/api/v1", never with a trailing slash

    /**
     * @brief "scheme://host:port", as accepted by httplib::Client
     */
    std::string origin() const;

    /**
     * @brief Parse an http:// or https:// URL
     * @return nullopt for other schemes or a missing host
     */
    static std::optional<HttpEndpoint> parse(std::string_view url);
};

/**
 * @brief Join a base path and a request path with exactly one slash
 */
std::string join_path(std::string_view base, std::string_view path);

/**
 * @brief Percent-encode a path segment or query component (RFC 3986 unreserved kept)
 */
std::string percent_encode(std::string_view text);

/**
 * @brief True when this build can talk to the endpoint's scheme
 */
bool scheme_supported(const HttpEndpoint& endpoint);

/**
 * @brief Client for the endpoint's origin with connect/read/write timeouts applied
 */
std::unique_ptr<httplib::Client> make_client(const HttpEndpoint& endpoint, std::chrono::seconds timeout);

} // namespace mcpify
