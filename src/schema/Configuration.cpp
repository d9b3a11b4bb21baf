#include "schema/Configuration.hpp"

#include <cctype>

namespace mcpify {

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

const Parameter* Tool::find_parameter(std::string_view param_name) const {
    for (const auto& param : parameters) {
        if (param.name == param_name) {
            return &param;
        }
    }
    return nullptr;
}

const Tool* Configuration::find_tool(std::string_view tool_name) const {
    for (const auto& tool : tools) {
        if (tool.name == tool_name) {
            return &tool;
        }
    }
    return nullptr;
}

std::string_view to_string(ParamType type) {
    switch (type) {
        case ParamType::String:
            return "string";
        case ParamType::Integer:
            return "integer";
        case ParamType::Number:
            return "number";
        case ParamType::Boolean:
            return "boolean";
        case ParamType::Array:
            return "array";
        case ParamType::Invalid:
        default:
            return "invalid";
    }
}

std::optional<ParamType> param_type_from_string(std::string_view name) {
    if (name == "string") return ParamType::String;
    if (name == "integer") return ParamType::Integer;
    if (name == "number") return ParamType::Number;
    if (name == "boolean") return ParamType::Boolean;
    if (name == "array") return ParamType::Array;
    return std::nullopt;
}

std::string_view to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::CommandLine:
            return "commandline";
        case BackendKind::Http:
            return "http";
        case BackendKind::PythonModule:
            return "python-module";
        case BackendKind::External:
            return "external";
        case BackendKind::Unrecognized:
        default:
            return "unrecognized";
    }
}

std::optional<BackendKind> backend_kind_from_string(std::string_view name) {
    if (name == "commandline") return BackendKind::CommandLine;
    // fastapi/flask services are plain http backends
    if (name == "http" || name == "fastapi" || name == "flask") return BackendKind::Http;
    if (name == "python-module" || name == "python") return BackendKind::PythonModule;
    if (name == "external") return BackendKind::External;
    return std::nullopt;
}

BackendKind backend_kind(const Backend& backend) {
    struct Visitor {
        BackendKind operator()(const CommandLineBackend&) const { return BackendKind::CommandLine; }
        BackendKind operator()(const HttpBackend&) const { return BackendKind::Http; }
        BackendKind operator()(const PythonModuleBackend&) const { return BackendKind::PythonModule; }
        BackendKind operator()(const ExternalBackend&) const { return BackendKind::External; }
        BackendKind operator()(const UnrecognizedBackend&) const { return BackendKind::Unrecognized; }
    };
    return std::visit(Visitor{}, backend);
}

BackendKind invocation_kind(const Invocation& invocation) {
    struct Visitor {
        BackendKind operator()(const std::monostate&) const { return BackendKind::External; }
        BackendKind operator()(const CommandLineInvocation&) const { return BackendKind::CommandLine; }
        BackendKind operator()(const HttpInvocation&) const { return BackendKind::Http; }
        BackendKind operator()(const PythonInvocation&) const { return BackendKind::PythonModule; }
    };
    return std::visit(Visitor{}, invocation);
}

int backend_timeout_seconds(const Backend& backend) {
    struct Visitor {
        int operator()(const CommandLineBackend& b) const { return b.timeout_seconds; }
        int operator()(const HttpBackend& b) const { return b.timeout_seconds; }
        int operator()(const PythonModuleBackend& b) const { return b.timeout_seconds; }
        int operator()(const ExternalBackend& b) const { return b.timeout_seconds; }
        int operator()(const UnrecognizedBackend&) const { return kDefaultTimeoutSeconds; }
    };
    return std::visit(Visitor{}, backend);
}

std::vector<std::string> extract_placeholders(std::string_view token) {
    std::vector<std::string> names;
    size_t pos = 0;
    while (pos < token.size()) {
        size_t open = token.find('{', pos);
        if (open == std::string_view::npos) {
            break;
        }
        size_t cursor = open + 1;
        if (cursor < token.size() && is_ident_start(token[cursor])) {
            while (cursor < token.size() && is_ident_char(token[cursor])) {
                ++cursor;
            }
            if (cursor < token.size() && token[cursor] == '}') {
                names.emplace_back(token.substr(open + 1, cursor - open - 1));
                pos = cursor + 1;
                continue;
            }
        }
        pos = open + 1;
    }
    return names;
}

std::optional<std::string> sole_placeholder(std::string_view token) {
    if (token.size() < 3 || token.front() != '{' || token.back() != '}') {
        return std::nullopt;
    }
    std::string_view inner = token.substr(1, token.size() - 2);
    if (!is_identifier(inner)) {
        return std::nullopt;
    }
    return std::string(inner);
}

bool is_identifier(std::string_view name) {
    if (name.empty() || !is_ident_start(name.front())) {
        return false;
    }
    for (char c : name) {
        if (!is_ident_char(c)) {
            return false;
        }
    }
    return true;
}

} // namespace mcpify
