#pragma once

#include "core/QueryEngine.hpp"
#include "detect/SourceFile.hpp"
#include "schema/Configuration.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace mcpify {

/**
 * @brief A path template with converters stripped
 */
struct RoutePath {
    std::string endpoint;             // "/users/{id}"
    std::vector<Parameter> parameters;  // one per braced or angled segment
};

/**
 * @brief Recovers HTTP endpoints from route decorators
 *
 * Handles FastAPI-style verb decorators (`@app.get("/x")`) and Flask-style
 * `@app.route("/x", methods=[...])`. Path segments become required
 * parameters; other function parameters become optional query parameters.
 */
class RouteExtractor {
public:
    explicit RouteExtractor(QueryEngine& engine);

    /**
     * @brief Extract http tools from one file
     * @param claimed Receives every routed function
     */
    std::vector<Tool> extract(const SourceFile& file, ClaimedFunctions& claimed);

    /**
     * @brief Normalize a route path
     *
     * Accepts `{name}`, `{name:conv}` and `<conv:name>` segments. int and
     * float converters set the parameter type; anything else is a string.
     */
    static RoutePath parse_path(std::string_view path);

private:
    QueryEngine& engine_;
};

} // namespace mcpify
