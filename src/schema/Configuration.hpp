#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mcpify {

using json = nlohmann::json;

/**
 * @brief Declared type of a tool parameter
 *
 * Invalid keeps documents with an unrecognized type loadable so the
 * validator can report them.
 */
enum class ParamType {
    String,
    Integer,
    Number,
    Boolean,
    Array,
    Invalid
};

/**
 * @brief Backend kind tag, one per Backend alternative
 */
enum class BackendKind {
    CommandLine,
    Http,
    PythonModule,
    External,
    Unrecognized
};

constexpr int kDefaultTimeoutSeconds = 30;

struct Parameter {
    std::string name;
    ParamType type = ParamType::String;
    std::string declared_type;  // raw text when type == Invalid
    std::string description;
    bool required = true;
    std::optional<json> default_value;
    std::vector<json> allowed_values;  // "enum" in the persisted form

    /**
     * @brief True when the caller must supply a value
     */
    bool is_mandatory() const { return required && !default_value.has_value(); }
};

struct CommandLineBackend {
    std::string executable;
    std::vector<std::string> base_args;
    std::string working_dir;
    int timeout_seconds = kDefaultTimeoutSeconds;
};

struct HttpBackend {
    std::string base_url;
    int timeout_seconds = kDefaultTimeoutSeconds;
};

struct PythonModuleBackend {
    std::string module_path;
    std::string interpreter = "python3";
    int timeout_seconds = kDefaultTimeoutSeconds;
};

/**
 * @brief Tools served by an external MCP server launched per call
 */
struct ExternalBackend {
    std::string executable;
    std::vector<std::string> args;
    int timeout_seconds = kDefaultTimeoutSeconds;
};

struct UnrecognizedBackend {
    std::string type;
};

using Backend = std::variant<CommandLineBackend,
                             HttpBackend,
                             PythonModuleBackend,
                             ExternalBackend,
                             UnrecognizedBackend>;

struct CommandLineInvocation {
    std::vector<std::string> args;
};

struct HttpInvocation {
    std::string endpoint;
    std::string method = "GET";
};

struct PythonInvocation {
    std::string function;
};

/**
 * @brief Backend-specific invocation template of a Tool
 *
 * std::monostate is used by tools of an external backend, which forward
 * the call by tool name.
 */
using Invocation = std::variant<std::monostate,
                                CommandLineInvocation,
                                HttpInvocation,
                                PythonInvocation>;

struct Tool {
    std::string name;
    std::string description;
    std::vector<Parameter> parameters;
    Invocation invocation;

    const Parameter* find_parameter(std::string_view param_name) const;
};

/**
 * @brief A complete tool schema for one project
 *
 * Owned by whichever component loaded it; immutable once validated.
 */
struct Configuration {
    std::string name;
    std::string description;
    Backend backend;
    std::vector<Tool> tools;

    const Tool* find_tool(std::string_view tool_name) const;
};

// ---------------------------------------------------------------------------
// Type and kind helpers
// ---------------------------------------------------------------------------

std::string_view to_string(ParamType type);
std::optional<ParamType> param_type_from_string(std::string_view name);

std::string_view to_string(BackendKind kind);
std::optional<BackendKind> backend_kind_from_string(std::string_view name);

BackendKind backend_kind(const Backend& backend);

/**
 * @brief Kind the invocation template belongs to
 * @return External for std::monostate
 */
BackendKind invocation_kind(const Invocation& invocation);

/**
 * @brief Per-call timeout configured on the backend, in seconds
 */
int backend_timeout_seconds(const Backend& backend);

/**
 * @brief Placeholder names referenced by a template token, in order
 *
 * Placeholders have the form {identifier}; other braces are literal.
 */
std::vector<std::string> extract_placeholders(std::string_view token);

/**
 * @brief True when the token consists of exactly one placeholder
 */
std::optional<std::string> sole_placeholder(std::string_view token);

/**
 * @brief Identifier test used for tool and parameter names
 */
bool is_identifier(std::string_view name);

} // namespace mcpify
