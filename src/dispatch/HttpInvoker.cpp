#include "dispatch/HttpInvoker.hpp"
#include "dispatch/ArgvRenderer.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <future>
#include <set>

namespace mcpify {

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(20);

bool has_body(const std::string& method) {
    return method == "POST" || method == "PUT" || method == "PATCH";
}

httplib::Result send(httplib::Client& cli, const HttpRequestPlan& plan) {
    const std::string content_type = "application/json";
    if (plan.method == "POST") {
        return cli.Post(plan.target, plan.body, content_type);
    }
    if (plan.method == "PUT") {
        return cli.Put(plan.target, plan.body, content_type);
    }
    if (plan.method == "PATCH") {
        return cli.Patch(plan.target, plan.body, content_type);
    }
    if (plan.method == "DELETE") {
        return cli.Delete(plan.target);
    }
    return cli.Get(plan.target);
}

json decode_body(const httplib::Response& res) {
    if (res.body.empty()) {
        return nullptr;
    }
    auto parsed = json::parse(res.body, nullptr, false);
    if (parsed.is_discarded()) {
        return res.body;
    }
    return parsed;
}

} // namespace

HttpRequestPlan HttpInvoker::plan(const HttpEndpoint& endpoint,
                                  const HttpInvocation& invocation,
                                  const ArgumentMap& arguments) {
    HttpRequestPlan plan;
    plan.method = invocation.method;

    std::set<std::string> in_path;
    for (const auto& name : extract_placeholders(invocation.endpoint)) {
        in_path.insert(name);
    }

    ArgumentMap path_values;
    for (const auto& name : in_path) {
        auto it = arguments.find(name);
        if (it != arguments.end()) {
            path_values[name] = percent_encode(ArgvRenderer::to_text(it->second));
        }
    }
    std::string path = ArgvRenderer::substitute(invocation.endpoint, path_values);
    plan.target = join_path(endpoint.base_path, path);

    if (has_body(plan.method)) {
        json body = json::object();
        for (const auto& [name, value] : arguments) {
            if (!in_path.count(name)) {
                body[name] = value;
            }
        }
        if (!body.empty()) {
            plan.body = body.dump();
        }
        return plan;
    }

    std::string query;
    auto add = [&](const std::string& name, const json& value) {
        query += query.empty() ? "" : "&";
        query += percent_encode(name) + "=" + percent_encode(ArgvRenderer::to_text(value));
    };
    for (const auto& [name, value] : arguments) {
        if (in_path.count(name)) {
            continue;
        }
        if (value.is_array()) {
            for (const auto& element : value) {
                add(name, element);
            }
        } else {
            add(name, value);
        }
    }
    if (!query.empty()) {
        plan.target += (plan.target.find('?') == std::string::npos ? "?" : "&") + query;
    }
    return plan;
}

InvocationResult HttpInvoker::invoke(const HttpBackend& backend,
                                     const HttpInvocation& invocation,
                                     const ArgumentMap& arguments,
                                     const CallContext& context) {
    auto endpoint = HttpEndpoint::parse(backend.base_url);
    if (!endpoint) {
        return InvocationResult::failure(FailureKind::RuntimeError,
                                         "invalid base URL '" + backend.base_url + "'");
    }
    if (!scheme_supported(*endpoint)) {
        return InvocationResult::failure(FailureKind::RuntimeError,
                                         endpoint->scheme + " is not supported by this build");
    }

    HttpRequestPlan request = plan(*endpoint, invocation, arguments);
    auto timeout_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        context.timeout + std::chrono::milliseconds(999));
    auto cli = make_client(*endpoint, timeout_seconds);
    if (!cli->is_valid()) {
        return InvocationResult::failure(FailureKind::RuntimeError,
                                         "cannot create HTTP client for " + endpoint->origin());
    }

    spdlog::debug("{} {}{}", request.method, endpoint->origin(), request.target);

    httplib::Client* client = cli.get();
    auto pending = std::async(std::launch::async, [client, &request]() {
        return send(*client, request);
    });

    const auto deadline = std::chrono::steady_clock::now() + context.timeout;
    bool timed_out = false;
    bool cancelled = false;
    while (pending.wait_for(kWaitSlice) != std::future_status::ready) {
        if (context.cancelled()) {
            cancelled = true;
        } else if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
        } else {
            continue;
        }
        client->stop();
        break;
    }

    // The worker references the client and plan; always join it.
    httplib::Result res = pending.get();

    if (cancelled) {
        return InvocationResult::failure(FailureKind::Cancelled, "call cancelled");
    }
    if (timed_out) {
        return InvocationResult::failure(
            FailureKind::Timeout,
            request.method + " " + request.target + " exceeded " +
                std::to_string(context.timeout.count()) + " ms");
    }
    if (!res) {
        return InvocationResult::failure(
            FailureKind::RuntimeError,
            "request to " + endpoint->origin() + " failed: " + httplib::to_string(res.error()));
    }

    json details = {{"status", res->status}};
    if (res->status < 200 || res->status >= 300) {
        details["body"] = res->body;
        return InvocationResult::failure(FailureKind::BackendError,
                                         "HTTP " + std::to_string(res->status), std::move(details));
    }
    return InvocationResult::success(decode_body(*res), std::move(details));
}

} // namespace mcpify
