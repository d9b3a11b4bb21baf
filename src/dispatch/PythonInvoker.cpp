#include "dispatch/PythonInvoker.hpp"
#include "dispatch/ProcessRunner.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace mcpify {

namespace {

constexpr const char* kBootstrap = R"PY(
import asyncio, importlib, importlib.util, inspect, json, os, sys, traceback

_out = sys.stdout
sys.stdout = sys.stderr


def _emit(payload):
    _out.write(json.dumps(payload, default=repr) + "\n")
    _out.flush()


def _fail(stage, exc):
    _emit({"ok": False, "stage": stage, "error_type": type(exc).__name__,
           "message": str(exc), "traceback": traceback.format_exc()})
    sys.exit(0)


target, name = sys.argv[1], sys.argv[2]
try:
    kwargs = json.loads(sys.stdin.read() or "{}")
    if os.path.isdir(target):
        sys.path.insert(0, os.path.abspath(target))
        module_name, _, attr = name.rpartition(".")
        if not module_name:
            raise ImportError("function %r must be qualified with its module" % name)
        module = importlib.import_module(module_name)
    else:
        sys.path.insert(0, os.path.dirname(os.path.abspath(target)))
        spec = importlib.util.spec_from_file_location("_mcpify_target", target)
        if spec is None or spec.loader is None:
            raise ImportError("cannot load %r" % target)
        module = importlib.util.module_from_spec(spec)
        spec.loader.exec_module(module)
        attr = name
except BaseException as exc:
    _fail("load", exc)

try:
    func = module
    for part in attr.split("."):
        func = getattr(func, part)
    if not callable(func):
        raise TypeError("%r is not callable" % name)
except BaseException as exc:
    _fail("resolve", exc)

try:
    result = func(**kwargs)
    if inspect.isawaitable(result):
        async def _wait(awaitable):
            return await awaitable
        result = asyncio.run(_wait(result))
except BaseException as exc:
    _fail("call", exc)

_emit({"ok": True, "result": result})
)PY";

} // namespace

const char* PythonInvoker::bootstrap_script() {
    return kBootstrap;
}

InvocationResult PythonInvoker::parse_reply(std::string_view stdout_text, std::string_view stderr_text) {
    // The reply is the last non-empty line
    json reply;
    std::istringstream in{std::string(stdout_text)};
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto parsed = json::parse(line, nullptr, false);
        if (!parsed.is_discarded()) {
            reply = std::move(parsed);
        }
    }

    if (!reply.is_object() || !reply.contains("ok") || !reply["ok"].is_boolean()) {
        return InvocationResult::failure(FailureKind::RuntimeError,
                                         "python interpreter produced no result",
                                         {{"stderr", std::string(stderr_text)}});
    }

    if (reply["ok"].get<bool>()) {
        json details = nullptr;
        if (!stderr_text.empty()) {
            details = {{"stderr", std::string(stderr_text)}};
        }
        return InvocationResult::success(reply.value("result", json()), std::move(details));
    }

    std::string error_type = reply.value("error_type", "Exception");
    std::string message = reply.value("message", "");
    json details = {
        {"stage", reply.value("stage", "call")},
        {"error_type", error_type},
        {"traceback", reply.value("traceback", "")},
        {"stderr", std::string(stderr_text)}
    };
    return InvocationResult::failure(FailureKind::RuntimeError,
                                     message.empty() ? error_type : error_type + ": " + message,
                                     std::move(details));
}

InvocationResult PythonInvoker::invoke(const PythonModuleBackend& backend,
                                       const PythonInvocation& invocation,
                                       const ArgumentMap& arguments,
                                       const CallContext& context) {
    ProcessRequest request;
    request.argv = {backend.interpreter, "-c", kBootstrap, backend.module_path, invocation.function};
    request.input = to_json(arguments).dump();
    request.timeout = context.timeout;
    request.cancel = context.cancel;

    spdlog::debug("Calling {} from {}", invocation.function, backend.module_path);
    ProcessResult process = ProcessRunner::run(request);

    if (process.cancelled) {
        return InvocationResult::failure(FailureKind::Cancelled, "call cancelled");
    }
    if (process.timed_out) {
        return InvocationResult::failure(
            FailureKind::Timeout,
            invocation.function + " exceeded " + std::to_string(context.timeout.count()) + " ms",
            {{"stderr", process.stderr_text}});
    }

    InvocationResult result = parse_reply(process.stdout_text, process.stderr_text);
    if (!result.ok && process.exit_code != 0 && result.details.is_object()) {
        result.details["exit_code"] = process.exit_code;
    }
    return result;
}

} // namespace mcpify
