#pragma once

#include "schema/Configuration.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

extern "C" {
    #include <tree_sitter/api.h>
}

namespace mcpify::python {

/**
 * @brief One formal parameter of a function definition
 */
struct FormalParameter {
    std::string name;
    std::optional<std::string> annotation;
    bool has_default = false;
    TSNode default_node{};
};

/**
 * @brief Value of a string literal node (string or concatenated_string)
 * @return Unquoted contents, or nullopt for f-strings and non-string nodes
 */
std::optional<std::string> string_literal(TSNode node, std::string_view source);

/**
 * @brief Evaluate a constant expression
 *
 * Handles numbers, strings, booleans, None (as JSON null), unary minus and
 * list/tuple/set displays of constants.
 *
 * @return JSON value, or nullopt if the expression is not a constant
 */
std::optional<json> literal_value(TSNode node, std::string_view source);

/**
 * @brief Parameter type of a constant value (string when unsure)
 */
ParamType type_of_literal(const json& value);

/**
 * @brief Map a type annotation (int, Optional[str], list[int], ...) to a parameter type
 */
std::optional<ParamType> type_from_annotation(std::string_view annotation);

/**
 * @brief Map a converter/type name (int, float, str, bool, path, uuid) to a parameter type
 */
std::optional<ParamType> type_from_name(std::string_view name);

/**
 * @brief Positional arguments of an argument_list node
 */
std::vector<TSNode> positional_arguments(TSNode argument_list);

/**
 * @brief Keyword arguments of an argument_list node, in source order
 */
std::vector<std::pair<std::string, TSNode>> keyword_arguments(TSNode argument_list, std::string_view source);

/**
 * @brief Find a keyword argument value by name
 */
std::optional<TSNode> keyword_argument(TSNode argument_list, std::string_view name, std::string_view source);

/**
 * @brief Formal parameters of a function_definition, excluding self/cls and variadics
 */
std::vector<FormalParameter> formal_parameters(TSNode function_definition, std::string_view source);

/**
 * @brief Cleaned docstring of a function_definition, or empty
 */
std::string docstring(TSNode function_definition, std::string_view source);

/**
 * @brief Contiguous '#' comment block directly above a definition, or empty
 */
std::string leading_comment(TSNode definition, std::string_view source);

/**
 * @brief Documentation for a definition: docstring first, then leading comment
 */
std::string documentation(TSNode function_definition, std::string_view source);

/**
 * @brief First paragraph of a docstring, joined into one line
 */
std::string summary(std::string_view doc);

/**
 * @brief Per-parameter descriptions from Google "Args:" or Sphinx ":param x:" sections
 */
std::map<std::string, std::string> parameter_docs(std::string_view doc);

/**
 * @brief Human-readable description from an identifier ("process_data" -> "Process data")
 */
std::string humanize(std::string_view identifier);

/**
 * @brief Turn arbitrary text into an identifier ("add-user" -> "add_user")
 */
std::string sanitize_identifier(std::string_view text);

} // namespace mcpify::python
