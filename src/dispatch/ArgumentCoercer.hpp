#pragma once

#include "dispatch/Invocation.hpp"
#include "schema/Configuration.hpp"

namespace mcpify {

/**
 * @brief Converts caller-supplied values to the declared parameter types
 *
 * Each type has its own conversion; nothing is inferred from the runtime
 * type of a value alone. Failures raise DispatchError with TypeMismatch or
 * MissingArgument.
 */
class ArgumentCoercer {
public:
    /**
     * @brief Coerce one value to the parameter's type and check its enum
     * @throws DispatchError (TypeMismatch)
     */
    static json coerce(const Parameter& param, const json& value);

    /**
     * @brief Bind call arguments to a tool's parameters
     *
     * Present values are coerced; absent optional parameters get their
     * default or are omitted; null counts as absent. Undeclared arguments
     * are ignored.
     *
     * @param arguments JSON object (or null for no arguments)
     * @throws DispatchError (MissingArgument, TypeMismatch)
     */
    static ArgumentMap bind(const Tool& tool, const json& arguments);

    static json to_string_value(const json& value);
    static json to_integer(const json& value);
    static json to_number(const json& value);
    static json to_boolean(const json& value);
    static json to_array(const json& value);
};

} // namespace mcpify
