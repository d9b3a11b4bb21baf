#include "dispatch/ExternalInvoker.hpp"
#include "Version.hpp"
#include "dispatch/ProcessRunner.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace mcpify {

namespace {

constexpr int kCallId = 2;

std::string content_text(const json& result) {
    std::string text;
    if (!result.contains("content") || !result["content"].is_array()) {
        return text;
    }
    for (const auto& item : result["content"]) {
        if (item.is_object() && item.value("type", "") == "text" && item.contains("text") &&
            item["text"].is_string()) {
            if (!text.empty()) {
                text += "\n";
            }
            text += item["text"].get<std::string>();
        }
    }
    return text;
}

} // namespace

std::string ExternalInvoker::session_script(const std::string& tool_name, const ArgumentMap& arguments) {
    json initialize = {
        {"jsonrpc", "2.0"},
        {"id", 1},
        {"method", "initialize"},
        {"params", {
            {"protocolVersion", "2024-11-05"},
            {"capabilities", json::object()},
            {"clientInfo", {{"name", "mcpify"}, {"version", MCPIFY_VERSION}}}
        }}
    };
    json initialized = {
        {"jsonrpc", "2.0"},
        {"method", "notifications/initialized"}
    };
    json call = {
        {"jsonrpc", "2.0"},
        {"id", kCallId},
        {"method", "tools/call"},
        {"params", {{"name", tool_name}, {"arguments", to_json(arguments)}}}
    };
    return initialize.dump() + "\n" + initialized.dump() + "\n" + call.dump() + "\n";
}

InvocationResult ExternalInvoker::parse_reply(std::string_view stdout_text, std::string_view stderr_text) {
    std::istringstream in{std::string(stdout_text)};
    std::string line;
    while (std::getline(in, line)) {
        auto message = json::parse(line, nullptr, false);
        if (message.is_discarded() || !message.is_object()) {
            continue;
        }
        if (!message.contains("id") || message["id"] != kCallId) {
            continue;
        }

        if (message.contains("error")) {
            const json& error = message["error"];
            std::string text = error.is_object() ? error.value("message", "error") : error.dump();
            return InvocationResult::failure(FailureKind::BackendError, text, {{"error", error}});
        }

        json result = message.value("result", json::object());
        if (result.is_object() && result.value("isError", false)) {
            std::string text = content_text(result);
            return InvocationResult::failure(FailureKind::BackendError,
                                             text.empty() ? "tool reported an error" : text,
                                             {{"result", result}});
        }
        return InvocationResult::success(result);
    }

    return InvocationResult::failure(FailureKind::RuntimeError,
                                     "external server returned no tools/call response",
                                     {{"stderr", std::string(stderr_text)}});
}

InvocationResult ExternalInvoker::invoke(const ExternalBackend& backend,
                                         const std::string& tool_name,
                                         const ArgumentMap& arguments,
                                         const CallContext& context) {
    ProcessRequest request;
    request.argv.push_back(backend.executable);
    request.argv.insert(request.argv.end(), backend.args.begin(), backend.args.end());
    request.input = session_script(tool_name, arguments);
    request.timeout = context.timeout;
    request.cancel = context.cancel;

    spdlog::debug("Forwarding {} to {}", tool_name, backend.executable);
    ProcessResult process = ProcessRunner::run(request);

    if (process.cancelled) {
        return InvocationResult::failure(FailureKind::Cancelled, "call cancelled");
    }
    if (process.timed_out) {
        return InvocationResult::failure(
            FailureKind::Timeout,
            tool_name + " exceeded " + std::to_string(context.timeout.count()) + " ms",
            {{"stderr", process.stderr_text}});
    }
    return parse_reply(process.stdout_text, process.stderr_text);
}

} // namespace mcpify
