#include "schema/ConfigLoader.hpp"
#include "schema/Errors.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace mcpify {

namespace {

std::string optional_string(const json& object, const char* key, const std::string& where,
                            const std::string& fallback = "") {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw SchemaError(where + "." + key + " must be a string");
    }
    return it->get<std::string>();
}

std::vector<std::string> string_array(const json& object, const char* key, const std::string& where) {
    std::vector<std::string> values;
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return values;
    }
    if (!it->is_array()) {
        throw SchemaError(where + "." + key + " must be an array of strings");
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            throw SchemaError(where + "." + key + " must contain only strings");
        }
        values.push_back(item.get<std::string>());
    }
    return values;
}

int timeout_field(const json& object, const std::string& where) {
    auto it = object.find("timeout");
    if (it == object.end() || it->is_null()) {
        return kDefaultTimeoutSeconds;
    }
    if (!it->is_number()) {
        throw SchemaError(where + ".timeout must be a number of seconds");
    }
    double seconds = it->get<double>();
    if (!std::isfinite(seconds) || std::floor(seconds) != seconds) {
        throw SchemaError(where + ".timeout must be a whole number of seconds");
    }
    if (seconds <= 0) {
        throw SchemaError(where + ".timeout must be positive");
    }
    if (seconds > static_cast<double>(std::numeric_limits<int>::max())) {
        throw SchemaError(where + ".timeout is out of range");
    }
    return static_cast<int>(seconds);
}

Backend parse_backend(const json& node) {
    if (!node.is_object()) {
        throw SchemaError("backend must be an object");
    }
    if (!node.contains("type") || !node["type"].is_string()) {
        throw SchemaError("backend.type must be a string");
    }
    std::string type = node["type"].get<std::string>();

    // Kind-specific fields live under "config"; flat fields are accepted too.
    json fields = node;
    if (node.contains("config")) {
        if (!node["config"].is_object()) {
            throw SchemaError("backend.config must be an object");
        }
        for (const auto& [key, value] : node["config"].items()) {
            fields[key] = value;
        }
    }

    auto kind = backend_kind_from_string(type);
    if (!kind) {
        spdlog::debug("Unrecognized backend type '{}'", type);
        return UnrecognizedBackend{type};
    }

    switch (*kind) {
        case BackendKind::CommandLine: {
            CommandLineBackend backend;
            backend.executable = optional_string(fields, "command", "backend");
            backend.base_args = string_array(fields, "args", "backend");
            backend.working_dir = optional_string(fields, "cwd", "backend");
            backend.timeout_seconds = timeout_field(fields, "backend");
            return backend;
        }
        case BackendKind::Http: {
            HttpBackend backend;
            backend.base_url = optional_string(fields, "base_url", "backend");
            backend.timeout_seconds = timeout_field(fields, "backend");
            return backend;
        }
        case BackendKind::PythonModule: {
            PythonModuleBackend backend;
            backend.module_path = optional_string(fields, "module", "backend");
            backend.interpreter = optional_string(fields, "python", "backend", "python3");
            backend.timeout_seconds = timeout_field(fields, "backend");
            return backend;
        }
        case BackendKind::External: {
            ExternalBackend backend;
            backend.executable = optional_string(fields, "command", "backend");
            backend.args = string_array(fields, "args", "backend");
            backend.timeout_seconds = timeout_field(fields, "backend");
            return backend;
        }
        case BackendKind::Unrecognized:
        default:
            return UnrecognizedBackend{type};
    }
}

Parameter parse_parameter(const json& node, const std::string& where) {
    if (!node.is_object()) {
        throw SchemaError(where + " must be an object");
    }

    Parameter param;
    param.name = optional_string(node, "name", where);
    param.description = optional_string(node, "description", where);

    std::string type = optional_string(node, "type", where, "string");
    if (auto parsed = param_type_from_string(type)) {
        param.type = *parsed;
    } else {
        param.type = ParamType::Invalid;
        param.declared_type = type;
    }

    if (node.contains("default") && !node["default"].is_null()) {
        param.default_value = node["default"];
    }

    // required defaults to true unless a default is present
    if (node.contains("required") && !node["required"].is_null()) {
        if (!node["required"].is_boolean()) {
            throw SchemaError(where + ".required must be a boolean");
        }
        param.required = node["required"].get<bool>();
    } else {
        param.required = !param.default_value.has_value();
    }

    if (node.contains("enum")) {
        if (!node["enum"].is_array()) {
            throw SchemaError(where + ".enum must be an array");
        }
        for (const auto& value : node["enum"]) {
            param.allowed_values.push_back(value);
        }
    }

    return param;
}

Tool parse_tool(const json& node, BackendKind kind, const std::string& where) {
    if (!node.is_object()) {
        throw SchemaError(where + " must be an object");
    }

    Tool tool;
    tool.name = optional_string(node, "name", where);
    tool.description = optional_string(node, "description", where);

    if (node.contains("parameters") && !node["parameters"].is_null()) {
        const auto& params = node["parameters"];
        if (!params.is_array()) {
            throw SchemaError(where + ".parameters must be an array");
        }
        for (size_t i = 0; i < params.size(); ++i) {
            tool.parameters.push_back(
                parse_parameter(params[i], where + ".parameters[" + std::to_string(i) + "]"));
        }
    }

    switch (kind) {
        case BackendKind::CommandLine:
            tool.invocation = CommandLineInvocation{string_array(node, "args", where)};
            break;
        case BackendKind::Http: {
            HttpInvocation http;
            http.endpoint = optional_string(node, "endpoint", where);
            http.method = optional_string(node, "method", where, "GET");
            tool.invocation = std::move(http);
            break;
        }
        case BackendKind::PythonModule:
            tool.invocation = PythonInvocation{optional_string(node, "function", where, tool.name)};
            break;
        case BackendKind::External:
        case BackendKind::Unrecognized:
        default:
            tool.invocation = std::monostate{};
            break;
    }

    return tool;
}

json backend_to_json(const Backend& backend) {
    struct Visitor {
        json operator()(const CommandLineBackend& b) const {
            return {{"type", "commandline"},
                    {"config", {{"command", b.executable},
                                {"args", b.base_args},
                                {"cwd", b.working_dir},
                                {"timeout", b.timeout_seconds}}}};
        }
        json operator()(const HttpBackend& b) const {
            return {{"type", "http"},
                    {"config", {{"base_url", b.base_url}, {"timeout", b.timeout_seconds}}}};
        }
        json operator()(const PythonModuleBackend& b) const {
            return {{"type", "python-module"},
                    {"config", {{"module", b.module_path},
                                {"python", b.interpreter},
                                {"timeout", b.timeout_seconds}}}};
        }
        json operator()(const ExternalBackend& b) const {
            return {{"type", "external"},
                    {"config", {{"command", b.executable},
                                {"args", b.args},
                                {"timeout", b.timeout_seconds}}}};
        }
        json operator()(const UnrecognizedBackend& b) const {
            return {{"type", b.type}};
        }
    };
    return std::visit(Visitor{}, backend);
}

json parameter_to_json(const Parameter& param) {
    json node = {
        {"name", param.name},
        {"type", param.type == ParamType::Invalid ? param.declared_type
                                                  : std::string(to_string(param.type))},
        {"description", param.description},
        {"required", param.required}
    };
    if (param.default_value) {
        node["default"] = *param.default_value;
    }
    if (!param.allowed_values.empty()) {
        node["enum"] = param.allowed_values;
    }
    return node;
}

} // namespace

Configuration ConfigLoader::from_json(const json& document) {
    if (!document.is_object()) {
        throw SchemaError("Configuration must be a JSON object");
    }
    if (!document.contains("backend")) {
        throw SchemaError("Configuration is missing the backend object");
    }

    Configuration config;
    config.name = optional_string(document, "name", "configuration");
    config.description = optional_string(document, "description", "configuration");
    config.backend = parse_backend(document["backend"]);

    BackendKind kind = backend_kind(config.backend);
    if (document.contains("tools") && !document["tools"].is_null()) {
        const auto& tools = document["tools"];
        if (!tools.is_array()) {
            throw SchemaError("tools must be an array");
        }
        for (size_t i = 0; i < tools.size(); ++i) {
            config.tools.push_back(parse_tool(tools[i], kind, "tools[" + std::to_string(i) + "]"));
        }
    }

    spdlog::debug("Loaded configuration '{}' with {} tools ({} backend)",
                  config.name, config.tools.size(), to_string(kind));
    return config;
}

json ConfigLoader::to_json(const Configuration& config) {
    json tools = json::array();
    for (const auto& tool : config.tools) {
        json params = json::array();
        for (const auto& param : tool.parameters) {
            params.push_back(parameter_to_json(param));
        }

        json node = {
            {"name", tool.name},
            {"description", tool.description},
            {"parameters", params}
        };

        if (auto* cli = std::get_if<CommandLineInvocation>(&tool.invocation)) {
            node["args"] = cli->args;
        } else if (auto* http = std::get_if<HttpInvocation>(&tool.invocation)) {
            node["endpoint"] = http->endpoint;
            node["method"] = http->method;
        } else if (auto* py = std::get_if<PythonInvocation>(&tool.invocation)) {
            node["function"] = py->function;
        }

        tools.push_back(std::move(node));
    }

    return {
        {"name", config.name},
        {"description", config.description},
        {"backend", backend_to_json(config.backend)},
        {"tools", tools}
    };
}

Configuration ConfigLoader::load_file(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw SchemaError("Failed to open configuration file: " + filepath.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        throw SchemaError("Configuration file is not valid JSON: " + filepath.string());
    }

    spdlog::debug("Parsing configuration file: {}", filepath.string());
    return from_json(document);
}

void ConfigLoader::save_file(const Configuration& config, const std::filesystem::path& filepath) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open file for writing: " + filepath.string());
    }
    file << to_json(config).dump(2) << "\n";
    if (!file) {
        throw std::runtime_error("Failed to write configuration file: " + filepath.string());
    }
}

} // namespace mcpify
