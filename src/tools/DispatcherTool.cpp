#include "DispatcherTool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpify {

DispatcherTool::DispatcherTool(std::shared_ptr<const Dispatcher> dispatcher,
                               std::string tool_name,
                               std::optional<std::chrono::milliseconds> timeout)
    : dispatcher_(std::move(dispatcher)), tool_name_(std::move(tool_name)), timeout_(timeout) {
    if (!dispatcher_) {
        throw std::invalid_argument("Dispatcher cannot be null");
    }
    if (!dispatcher_->configuration().find_tool(tool_name_)) {
        throw std::invalid_argument("Unknown tool: " + tool_name_);
    }
}

ToolInfo DispatcherTool::get_info() const {
    const Tool* tool = dispatcher_->configuration().find_tool(tool_name_);
    return {
        tool->name,
        tool->description,
        Dispatcher::input_schema(*tool)
    };
}

ToolOutput DispatcherTool::execute(const json& args, const CancelToken& cancel) const {
    InvocationOptions options;
    options.timeout = timeout_;
    options.cancel = cancel;

    InvocationResult result = dispatcher_->invoke(tool_name_, args, options);
    if (!result.ok) {
        spdlog::warn("Tool {} failed: {} {}", tool_name_, to_string(result.kind), result.message);
    }
    return {result.text(), !result.ok};
}

void DispatcherTool::register_all(MCPServer& server,
                                  const std::shared_ptr<const Dispatcher>& dispatcher,
                                  std::optional<std::chrono::milliseconds> timeout) {
    for (const auto& tool : dispatcher->configuration().tools) {
        auto handler = std::make_shared<DispatcherTool>(dispatcher, tool.name, timeout);
        server.register_tool(
            handler->get_info(),
            [handler](const json& args, const CancelToken& cancel) {
                return handler->execute(args, cancel);
            }
        );
    }
}

} // namespace mcpify
