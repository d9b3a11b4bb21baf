#include "dispatch/Dispatcher.hpp"
#include "dispatch/ArgumentCoercer.hpp"
#include "dispatch/CommandInvoker.hpp"
#include "dispatch/ExternalInvoker.hpp"
#include "dispatch/HttpInvoker.hpp"
#include "dispatch/ProcessRunner.hpp"
#include "dispatch/PythonInvoker.hpp"
#include <spdlog/spdlog.h>
#include <type_traits>

namespace mcpify {

namespace {

template <typename T>
const T& invocation_as(const Tool& tool) {
    const T* invocation = std::get_if<T>(&tool.invocation);
    if (!invocation) {
        throw DispatchError(FailureKind::RuntimeError,
                            "tool '" + tool.name + "' has no invocation for this backend");
    }
    return *invocation;
}

template <typename>
inline constexpr bool kAlwaysFalse = false;

} // namespace

Dispatcher::Dispatcher(Configuration config)
    : config_(std::move(config)), report_(ConfigValidator::validate(config_)) {
    if (!report_.is_valid) {
        throw InvalidConfigurationError(report_);
    }
    for (const auto& diagnostic : report_.diagnostics) {
        spdlog::warn("{}: {}", diagnostic.location, diagnostic.message);
    }
    spdlog::info("Serving {} tool(s) from '{}' ({} backend)", config_.tools.size(), config_.name,
                 to_string(backend_kind(config_.backend)));
}

json Dispatcher::input_schema(const Tool& tool) {
    json properties = json::object();
    json required = json::array();

    for (const auto& param : tool.parameters) {
        json property = {{"type", std::string(to_string(param.type))}};
        if (!param.description.empty()) {
            property["description"] = param.description;
        }
        if (param.default_value) {
            property["default"] = *param.default_value;
        }
        if (!param.allowed_values.empty()) {
            property["enum"] = param.allowed_values;
        }
        properties[param.name] = std::move(property);
        if (param.is_mandatory()) {
            required.push_back(param.name);
        }
    }

    return {
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

json Dispatcher::list_tools() const {
    json tools = json::array();
    for (const auto& tool : config_.tools) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"input_schema", input_schema(tool)}
        });
    }
    return tools;
}

InvocationResult Dispatcher::run(const Tool& tool, const ArgumentMap& arguments, const CallContext& context) const {
    return std::visit([&](const auto& backend) -> InvocationResult {
        using T = std::decay_t<decltype(backend)>;
        if constexpr (std::is_same_v<T, CommandLineBackend>) {
            return CommandInvoker::invoke(backend, invocation_as<CommandLineInvocation>(tool), arguments, context);
        } else if constexpr (std::is_same_v<T, HttpBackend>) {
            return HttpInvoker::invoke(backend, invocation_as<HttpInvocation>(tool), arguments, context);
        } else if constexpr (std::is_same_v<T, PythonModuleBackend>) {
            return PythonInvoker::invoke(backend, invocation_as<PythonInvocation>(tool), arguments, context);
        } else if constexpr (std::is_same_v<T, ExternalBackend>) {
            return ExternalInvoker::invoke(backend, tool.name, arguments, context);
        } else if constexpr (std::is_same_v<T, UnrecognizedBackend>) {
            throw DispatchError(FailureKind::RuntimeError, "unsupported backend type '" + backend.type + "'");
        } else {
            static_assert(kAlwaysFalse<T>, "unhandled backend kind");
        }
    }, config_.backend);
}

InvocationResult Dispatcher::invoke(const std::string& tool_name,
                                    const json& arguments,
                                    const InvocationOptions& options) const {
    const Tool* tool = config_.find_tool(tool_name);
    if (!tool) {
        spdlog::debug("Unknown tool {}", tool_name);
        return InvocationResult::failure(FailureKind::UnknownTool, "unknown tool '" + tool_name + "'");
    }

    const auto started = std::chrono::steady_clock::now();
    InvocationResult result;
    try {
        ArgumentMap bound = ArgumentCoercer::bind(*tool, arguments);
        if (options.cancelled()) {
            return InvocationResult::failure(FailureKind::Cancelled, "call cancelled");
        }

        CallContext context{
            options.timeout.value_or(std::chrono::seconds(backend_timeout_seconds(config_.backend))),
            options.cancel
        };
        result = run(*tool, bound, context);
    } catch (const DispatchError& e) {
        result = InvocationResult::failure(e.kind(), e.what(), e.details());
    } catch (const ProcessLaunchError& e) {
        result = InvocationResult::failure(FailureKind::RuntimeError, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Tool {} failed unexpectedly: {}", tool_name, e.what());
        result = InvocationResult::failure(FailureKind::RuntimeError, e.what());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    if (result.ok) {
        spdlog::debug("Tool {} succeeded in {} ms", tool_name, elapsed);
    } else {
        spdlog::debug("Tool {} failed in {} ms: {} {}", tool_name, elapsed, to_string(result.kind), result.message);
    }
    return result;
}

} // namespace mcpify
