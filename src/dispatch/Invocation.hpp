#pragma once

#include "schema/Configuration.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mcpify {

/**
 * @brief Why a tool call failed
 */
enum class FailureKind {
    UnknownTool,
    MissingArgument,
    TypeMismatch,
    Timeout,
    BackendError,   // backend ran and reported failure
    RuntimeError,   // backend could not run or raised
    Cancelled
};

std::string_view to_string(FailureKind kind);

/**
 * @brief Normalized outcome of one tool call: Success{payload} or Failure{kind, message}
 */
struct InvocationResult {
    bool ok = false;
    json payload;                               // success only
    FailureKind kind = FailureKind::RuntimeError;  // failure only
    std::string message;                        // failure only
    json details;                               // exit code, status, stderr... when known

    static InvocationResult success(json payload, json details = nullptr);
    static InvocationResult failure(FailureKind kind, std::string message, json details = nullptr);

    /**
     * @brief Human-readable rendering used for protocol text content
     */
    std::string text() const;

    json to_json() const;
};

/**
 * @brief Per-call knobs supplied by the caller
 */
struct InvocationOptions {
    std::optional<std::chrono::milliseconds> timeout;  // overrides the backend timeout
    std::shared_ptr<std::atomic_bool> cancel;          // set to true to abort the call

    bool cancelled() const { return cancel && cancel->load(); }
};

/**
 * @brief Settings resolved for one backend call
 */
struct CallContext {
    std::chrono::milliseconds timeout;
    std::shared_ptr<std::atomic_bool> cancel;

    bool cancelled() const { return cancel && cancel->load(); }
};

/**
 * @brief Coerced argument values by parameter name; omitted parameters are absent
 */
using ArgumentMap = std::map<std::string, json>;

json to_json(const ArgumentMap& arguments);

/**
 * @brief Per-call failure raised inside the dispatcher
 *
 * Caught at the call boundary and turned into a Failure result; never
 * escapes Dispatcher::invoke.
 */
class DispatchError : public std::runtime_error {
public:
    DispatchError(FailureKind kind, const std::string& message, json details = nullptr)
        : std::runtime_error(message), kind_(kind), details_(std::move(details)) {}

    FailureKind kind() const { return kind_; }
    const json& details() const { return details_; }

private:
    FailureKind kind_;
    json details_;
};

} // namespace mcpify
