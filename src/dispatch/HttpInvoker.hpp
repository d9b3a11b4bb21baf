#pragma once

#include "dispatch/Invocation.hpp"
#include "net/HttpEndpoint.hpp"
#include "schema/Configuration.hpp"
#include <string>

namespace mcpify {

/**
 * @brief A fully rendered HTTP request
 */
struct HttpRequestPlan {
    std::string method;
    std::string target;  // base path + endpoint + query string
    std::string body;    // JSON; empty when the method carries none
};

/**
 * @brief Executes http tools
 */
class HttpInvoker {
public:
    /**
     * @brief Render method, target and body
     *
     * Path placeholders are percent-encoded; values not consumed by the
     * path go into a JSON body for POST/PUT/PATCH or the query string for
     * GET/DELETE (arrays as repeated keys).
     */
    static HttpRequestPlan plan(const HttpEndpoint& endpoint,
                                const HttpInvocation& invocation,
                                const ArgumentMap& arguments);

    /**
     * @brief Issue the request; abort it when the deadline passes or the call is cancelled
     */
    static InvocationResult invoke(const HttpBackend& backend,
                                   const HttpInvocation& invocation,
                                   const ArgumentMap& arguments,
                                   const CallContext& context);
};

} // namespace mcpify
