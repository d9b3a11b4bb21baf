#include "net/HttpEndpoint.hpp"
#include <httplib.h>
#include <cctype>
#include <cstdio>

namespace mcpify {

namespace {

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string HttpEndpoint::origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

std::optional<HttpEndpoint> HttpEndpoint::parse(std::string_view url) {
    HttpEndpoint ep;
    std::string_view s = url;
    if (starts_with(s, "http://")) {
        ep.scheme = "http";
        ep.port = 80;
        s.remove_prefix(7);
    } else if (starts_with(s, "https://")) {
        ep.scheme = "https";
        ep.port = 443;
        s.remove_prefix(8);
    } else {
        return std::nullopt;
    }

    auto slash_pos = s.find('/');
    if (slash_pos != std::string_view::npos) {
        ep.base_path = std::string(s.substr(slash_pos));
        s = s.substr(0, slash_pos);
    }
    while (!ep.base_path.empty() && ep.base_path.back() == '/') {
        ep.base_path.pop_back();
    }

    auto colon_pos = s.rfind(':');
    if (colon_pos != std::string_view::npos && s.find(']', colon_pos) == std::string_view::npos) {
        std::string port(s.substr(colon_pos + 1));
        s = s.substr(0, colon_pos);
        if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        ep.port = std::stoi(port);
    }
    ep.host = std::string(s);
    if (ep.host.empty()) {
        return std::nullopt;
    }
    return ep;
}

std::string join_path(std::string_view base, std::string_view path) {
    std::string joined(base);
    if (joined.empty()) {
        return path.empty() || path.front() != '/' ? "/" + std::string(path) : std::string(path);
    }
    if (joined.back() == '/' && !path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    } else if (joined.back() != '/' && !path.empty() && path.front() != '/') {
        joined += '/';
    }
    joined += path;
    return joined;
}

std::string percent_encode(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

bool scheme_supported(const HttpEndpoint& endpoint) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    return endpoint.scheme == "http" || endpoint.scheme == "https";
#else
    return endpoint.scheme == "http";
#endif
}

std::unique_ptr<httplib::Client> make_client(const HttpEndpoint& endpoint, std::chrono::seconds timeout) {
    auto cli = std::make_unique<httplib::Client>(endpoint.origin());
    cli->set_connection_timeout(timeout);
    cli->set_read_timeout(timeout);
    cli->set_write_timeout(timeout);
    return cli;
}

} // namespace mcpify
