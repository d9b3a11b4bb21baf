#include "dispatch/ArgumentCoercer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace mcpify {

namespace {

[[noreturn]] void mismatch(const json& value, std::string_view expected) {
    std::string shown = value.dump();
    if (shown.size() > 80) {
        shown = shown.substr(0, 77) + "...";
    }
    throw DispatchError(FailureKind::TypeMismatch,
                        "expected " + std::string(expected) + ", got " + shown);
}

std::string trimmed(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

json ArgumentCoercer::to_string_value(const json& value) {
    if (value.is_string()) {
        return value;
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number()) {
        return value.dump();
    }
    mismatch(value, "string");
}

json ArgumentCoercer::to_integer(const json& value) {
    if (value.is_number_unsigned()) {
        if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            mismatch(value, "integer");
        }
        return json(value.get<std::int64_t>());
    }
    if (value.is_number_integer()) {
        return value;
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::isfinite(d) && std::floor(d) == d &&
            std::fabs(d) < 9.0e15) {
            return json(static_cast<std::int64_t>(d));
        }
        mismatch(value, "integer");
    }
    if (value.is_string()) {
        std::string text = trimmed(value.get<std::string>());
        if (!text.empty()) {
            errno = 0;
            char* end = nullptr;
            long long parsed = std::strtoll(text.c_str(), &end, 10);
            if (errno == 0 && end != text.c_str() && *end == '\0') {
                return json(static_cast<std::int64_t>(parsed));
            }
        }
    }
    mismatch(value, "integer");
}

json ArgumentCoercer::to_number(const json& value) {
    if (value.is_number()) {
        return value;
    }
    if (value.is_string()) {
        std::string text = trimmed(value.get<std::string>());
        if (!text.empty()) {
            char* end = nullptr;
            double parsed = std::strtod(text.c_str(), &end);
            if (end != text.c_str() && *end == '\0' && std::isfinite(parsed)) {
                return json(parsed);
            }
        }
    }
    mismatch(value, "number");
}

json ArgumentCoercer::to_boolean(const json& value) {
    if (value.is_boolean()) {
        return value;
    }
    if (value.is_number_integer() || value.is_number_unsigned()) {
        auto n = value.get<std::int64_t>();
        if (n == 0 || n == 1) {
            return json(n == 1);
        }
    }
    if (value.is_string()) {
        std::string text = trimmed(value.get<std::string>());
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (text == "true" || text == "yes" || text == "1") {
            return json(true);
        }
        if (text == "false" || text == "no" || text == "0") {
            return json(false);
        }
    }
    mismatch(value, "boolean");
}

json ArgumentCoercer::to_array(const json& value) {
    if (value.is_array()) {
        return value;
    }
    if (value.is_string()) {
        auto parsed = json::parse(value.get<std::string>(), nullptr, false);
        if (!parsed.is_discarded() && parsed.is_array()) {
            return parsed;
        }
    }
    mismatch(value, "array");
}

json ArgumentCoercer::coerce(const Parameter& param, const json& value) {
    json coerced;
    switch (param.type) {
        case ParamType::Integer: coerced = to_integer(value); break;
        case ParamType::Number: coerced = to_number(value); break;
        case ParamType::Boolean: coerced = to_boolean(value); break;
        case ParamType::Array: coerced = to_array(value); break;
        case ParamType::String:
        case ParamType::Invalid:
            coerced = to_string_value(value);
            break;
    }

    if (param.allowed_values.empty()) {
        return coerced;
    }

    auto allowed = [&](const json& item) {
        return std::find(param.allowed_values.begin(), param.allowed_values.end(), item) !=
               param.allowed_values.end();
    };
    bool ok = coerced.is_array()
        ? std::all_of(coerced.begin(), coerced.end(), allowed)
        : allowed(coerced);
    if (!ok) {
        throw DispatchError(FailureKind::TypeMismatch,
                            "value " + coerced.dump() + " is not one of " +
                            json(param.allowed_values).dump());
    }
    return coerced;
}

ArgumentMap ArgumentCoercer::bind(const Tool& tool, const json& arguments) {
    if (!arguments.is_null() && !arguments.is_object()) {
        throw DispatchError(FailureKind::TypeMismatch, "arguments must be a JSON object");
    }

    ArgumentMap bound;
    for (const auto& param : tool.parameters) {
        const json* supplied = nullptr;
        if (arguments.is_object()) {
            auto it = arguments.find(param.name);
            if (it != arguments.end() && !it->is_null()) {
                supplied = &*it;
            }
        }

        try {
            if (supplied) {
                bound[param.name] = coerce(param, *supplied);
            } else if (param.default_value && !param.default_value->is_null()) {
                bound[param.name] = coerce(param, *param.default_value);
            } else if (param.is_mandatory()) {
                throw DispatchError(FailureKind::MissingArgument,
                                    "missing required argument '" + param.name + "'");
            }
        } catch (const DispatchError& e) {
            if (e.kind() != FailureKind::TypeMismatch) {
                throw;
            }
            throw DispatchError(FailureKind::TypeMismatch,
                                "argument '" + param.name + "': " + e.what(),
                                {{"parameter", param.name}});
        }
    }

    if (arguments.is_object()) {
        for (auto it = arguments.begin(); it != arguments.end(); ++it) {
            if (!tool.find_parameter(it.key())) {
                spdlog::debug("Tool {}: ignoring undeclared argument '{}'", tool.name, it.key());
            }
        }
    }

    return bound;
}

} // namespace mcpify
