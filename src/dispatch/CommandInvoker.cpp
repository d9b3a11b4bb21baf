#include "dispatch/CommandInvoker.hpp"
#include "dispatch/ArgvRenderer.hpp"
#include <spdlog/spdlog.h>

namespace mcpify {

InvocationResult CommandInvoker::outcome(const ProcessResult& process, const CallContext& context) {
    if (process.cancelled) {
        return InvocationResult::failure(FailureKind::Cancelled, "call cancelled");
    }

    json details = {
        {"exit_code", process.exit_code},
        {"stdout", process.stdout_text},
        {"stderr", process.stderr_text}
    };

    if (process.timed_out) {
        return InvocationResult::failure(
            FailureKind::Timeout,
            "process exceeded " + std::to_string(context.timeout.count()) + " ms and was killed",
            std::move(details));
    }
    if (process.exit_code != 0) {
        return InvocationResult::failure(
            FailureKind::BackendError,
            "process exited with code " + std::to_string(process.exit_code),
            std::move(details));
    }

    json extra = nullptr;
    if (!process.stderr_text.empty()) {
        extra = {{"stderr", process.stderr_text}};
    }
    return InvocationResult::success(process.stdout_text, std::move(extra));
}

InvocationResult CommandInvoker::invoke(const CommandLineBackend& backend,
                                        const CommandLineInvocation& invocation,
                                        const ArgumentMap& arguments,
                                        const CallContext& context) {
    ProcessRequest request;
    request.argv.push_back(backend.executable);
    auto args = ArgvRenderer::render(backend, invocation, arguments);
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.working_dir = backend.working_dir;
    request.timeout = context.timeout;
    request.cancel = context.cancel;

    if (spdlog::default_logger()->should_log(spdlog::level::debug)) {
        json shown = request.argv;
        spdlog::debug("Running {}", shown.dump());
    }

    return outcome(ProcessRunner::run(request), context);
}

} // namespace mcpify
