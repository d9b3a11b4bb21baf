#include "schema/Validator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <set>

namespace mcpify {

namespace {

constexpr std::array<std::string_view, 5> kHttpMethods = {"GET", "POST", "PUT", "PATCH", "DELETE"};

class ReportBuilder {
public:
    void error(std::string location, std::string message) {
        report_.diagnostics.push_back({Severity::Error, std::move(location), std::move(message)});
        report_.is_valid = false;
    }

    void warning(std::string location, std::string message) {
        report_.diagnostics.push_back({Severity::Warning, std::move(location), std::move(message)});
    }

    ValidationReport finish() { return std::move(report_); }

private:
    ValidationReport report_;
};

std::string tool_location(size_t index) {
    return "tools[" + std::to_string(index) + "]";
}

void check_backend(const Backend& backend, ReportBuilder& out) {
    if (auto* unknown = std::get_if<UnrecognizedBackend>(&backend)) {
        out.error("backend.type", "Unknown backend type '" + unknown->type +
                                  "' (expected commandline, http, python-module or external)");
        return;
    }
    if (auto* cli = std::get_if<CommandLineBackend>(&backend)) {
        if (cli->executable.empty()) {
            out.error("backend.command", "commandline backend requires an executable");
        }
    } else if (auto* http = std::get_if<HttpBackend>(&backend)) {
        if (http->base_url.rfind("http://", 0) != 0 && http->base_url.rfind("https://", 0) != 0) {
            out.error("backend.base_url", "http backend requires an http:// or https:// base URL");
        }
    } else if (auto* py = std::get_if<PythonModuleBackend>(&backend)) {
        if (py->module_path.empty()) {
            out.error("backend.module", "python-module backend requires a module path");
        }
    } else if (auto* ext = std::get_if<ExternalBackend>(&backend)) {
        if (ext->executable.empty()) {
            out.error("backend.command", "external backend requires a server command");
        }
    }
}

void check_parameters(const Tool& tool, const std::string& where, ReportBuilder& out) {
    std::set<std::string> seen;
    for (size_t i = 0; i < tool.parameters.size(); ++i) {
        const auto& param = tool.parameters[i];
        std::string location = where + ".parameters[" + std::to_string(i) + "]";

        if (!is_identifier(param.name)) {
            out.error(location, "Parameter name '" + param.name + "' of tool '" + tool.name +
                                "' is not a valid identifier");
        } else if (!seen.insert(param.name).second) {
            out.error(location, "Duplicate parameter '" + param.name + "' in tool '" + tool.name + "'");
        }

        if (param.type == ParamType::Invalid) {
            out.error(location + ".type", "Parameter '" + param.name + "' has unknown type '" +
                                          param.declared_type + "'");
        }
    }
}

/**
 * @brief Placeholders must name declared parameters
 * @return Set of referenced parameter names
 */
std::set<std::string> check_placeholders(const Tool& tool,
                                         const std::vector<std::string>& tokens,
                                         const std::string& where,
                                         ReportBuilder& out) {
    std::set<std::string> referenced;
    for (size_t i = 0; i < tokens.size(); ++i) {
        for (const auto& name : extract_placeholders(tokens[i])) {
            referenced.insert(name);
            if (!tool.find_parameter(name)) {
                out.error(where + "[" + std::to_string(i) + "]",
                          "Placeholder {" + name + "} in tool '" + tool.name +
                          "' does not name a declared parameter");
            }
        }
    }
    return referenced;
}

void check_invocation(const Tool& tool, BackendKind kind, const std::string& where, ReportBuilder& out) {
    BackendKind template_kind = invocation_kind(tool.invocation);
    if (kind != BackendKind::Unrecognized && template_kind != kind) {
        out.error(where, "Tool '" + tool.name + "' has a " + std::string(to_string(template_kind)) +
                         " invocation template but the backend is " + std::string(to_string(kind)));
        return;
    }

    if (auto* cli = std::get_if<CommandLineInvocation>(&tool.invocation)) {
        auto referenced = check_placeholders(tool, cli->args, where + ".args", out);
        for (size_t i = 0; i < tool.parameters.size(); ++i) {
            const auto& param = tool.parameters[i];
            if (referenced.count(param.name)) {
                continue;
            }
            std::string location = where + ".parameters[" + std::to_string(i) + "]";
            if (param.is_mandatory()) {
                out.error(location, "Required parameter '" + param.name + "' of tool '" + tool.name +
                                    "' is never referenced by the argument template");
            } else {
                out.warning(location, "Optional parameter '" + param.name + "' of tool '" + tool.name +
                                      "' is never referenced by the argument template");
            }
        }
    } else if (auto* http = std::get_if<HttpInvocation>(&tool.invocation)) {
        if (http->endpoint.empty() || http->endpoint.front() != '/') {
            out.error(where + ".endpoint", "Tool '" + tool.name + "' needs an endpoint path starting with '/'");
        }
        // Parameters outside the path travel as query or body fields, so none is orphaned.
        check_placeholders(tool, {http->endpoint}, where + ".endpoint", out);
        if (std::find(kHttpMethods.begin(), kHttpMethods.end(), http->method) == kHttpMethods.end()) {
            out.error(where + ".method", "Tool '" + tool.name + "' uses unsupported HTTP method '" +
                                         http->method + "'");
        }
    } else if (auto* py = std::get_if<PythonInvocation>(&tool.invocation)) {
        // Every parameter is passed by keyword, so none can be orphaned.
        if (py->function.empty()) {
            out.error(where + ".function", "Tool '" + tool.name + "' does not name a callable");
        }
    }
}

} // namespace

size_t ValidationReport::error_count() const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const Diagnostic& d) { return d.severity == Severity::Error; }));
}

size_t ValidationReport::warning_count() const {
    return diagnostics.size() - error_count();
}

json ValidationReport::to_json() const {
    json items = json::array();
    for (const auto& d : diagnostics) {
        items.push_back({
            {"severity", std::string(to_string(d.severity))},
            {"location", d.location},
            {"message", d.message}
        });
    }
    return {{"is_valid", is_valid}, {"diagnostics", items}};
}

InvalidConfigurationError::InvalidConfigurationError(ValidationReport report)
    : std::runtime_error("Configuration failed validation with " +
                         std::to_string(report.error_count()) + " error(s)"),
      report_(std::move(report)) {}

std::string_view to_string(Severity severity) {
    return severity == Severity::Error ? "error" : "warning";
}

ValidationReport ConfigValidator::validate(const Configuration& config) {
    ReportBuilder out;

    check_backend(config.backend, out);
    BackendKind kind = backend_kind(config.backend);

    std::set<std::string> tool_names;
    for (size_t i = 0; i < config.tools.size(); ++i) {
        const auto& tool = config.tools[i];
        std::string where = tool_location(i);

        if (tool.name.empty()) {
            out.error(where + ".name", "Tool name must not be empty");
        } else if (!is_identifier(tool.name)) {
            out.error(where + ".name", "Tool name '" + tool.name + "' is not a valid identifier");
        } else if (!tool_names.insert(tool.name).second) {
            out.error(where + ".name", "Duplicate tool name '" + tool.name + "'");
        }

        if (tool.description.empty()) {
            out.warning(where + ".description", "Tool '" + tool.name + "' has no description");
        }

        check_parameters(tool, where, out);
        check_invocation(tool, kind, where, out);
    }

    ValidationReport report = out.finish();
    spdlog::debug("Validated configuration '{}': {} error(s), {} warning(s)",
                  config.name, report.error_count(), report.warning_count());
    return report;
}

} // namespace mcpify
