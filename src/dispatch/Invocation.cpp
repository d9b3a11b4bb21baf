#include "dispatch/Invocation.hpp"

namespace mcpify {

std::string_view to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::UnknownTool: return "UnknownTool";
        case FailureKind::MissingArgument: return "MissingArgument";
        case FailureKind::TypeMismatch: return "TypeMismatch";
        case FailureKind::Timeout: return "Timeout";
        case FailureKind::BackendError: return "BackendError";
        case FailureKind::RuntimeError: return "RuntimeError";
        case FailureKind::Cancelled: return "Cancelled";
    }
    return "RuntimeError";
}

InvocationResult InvocationResult::success(json payload, json details) {
    InvocationResult result;
    result.ok = true;
    result.payload = std::move(payload);
    result.details = std::move(details);
    return result;
}

InvocationResult InvocationResult::failure(FailureKind kind, std::string message, json details) {
    InvocationResult result;
    result.ok = false;
    result.kind = kind;
    result.message = std::move(message);
    result.details = std::move(details);
    return result;
}

std::string InvocationResult::text() const {
    if (ok) {
        return payload.is_string() ? payload.get<std::string>() : payload.dump(2);
    }

    std::string out = std::string(to_string(kind)) + ": " + message;
    if (details.is_object()) {
        for (const char* key : {"stderr", "body"}) {
            auto it = details.find(key);
            if (it != details.end() && it->is_string() && !it->get<std::string>().empty()) {
                out += "\n" + it->get<std::string>();
            }
        }
    }
    return out;
}

json InvocationResult::to_json() const {
    json j;
    j["ok"] = ok;
    if (ok) {
        j["payload"] = payload;
    } else {
        j["kind"] = std::string(to_string(kind));
        j["message"] = message;
    }
    if (!details.is_null()) {
        j["details"] = details;
    }
    return j;
}

json to_json(const ArgumentMap& arguments) {
    json j = json::object();
    for (const auto& [name, value] : arguments) {
        j[name] = value;
    }
    return j;
}

} // namespace mcpify
