#include <gtest/gtest.h>
#include "dispatch/CommandInvoker.hpp"
#include "dispatch/ExternalInvoker.hpp"
#include "dispatch/HttpInvoker.hpp"
#include "dispatch/PythonInvoker.hpp"
#include <sstream>

using namespace mcpify;

TEST(HttpInvokerTest, QueryForGet) {
    auto endpoint = HttpEndpoint::parse("http://localhost:8000/api/");
    ASSERT_TRUE(endpoint.has_value());

    HttpInvocation invocation{"/users/{user_id}", "GET"};
    ArgumentMap arguments = {
        {"user_id", "a b"},
        {"verbose", true},
        {"tags", json::array({"x", "y&z"})}
    };

    HttpRequestPlan plan = HttpInvoker::plan(*endpoint, invocation, arguments);

    EXPECT_EQ(plan.method, "GET");
    EXPECT_EQ(plan.target, "/api/users/a%20b?tags=x&tags=y%26z&verbose=true");
    EXPECT_TRUE(plan.body.empty());
}

TEST(HttpInvokerTest, JsonBodyForPost) {
    auto endpoint = HttpEndpoint::parse("http://localhost:8000");
    ASSERT_TRUE(endpoint.has_value());

    HttpInvocation invocation{"/items/{item_id}", "POST"};
    HttpRequestPlan plan = HttpInvoker::plan(*endpoint, invocation,
                                             {{"item_id", 7}, {"name", "lamp"}, {"price", 9.5}});

    EXPECT_EQ(plan.target, "/items/7");
    EXPECT_EQ(json::parse(plan.body), (json{{"name", "lamp"}, {"price", 9.5}}));

    HttpRequestPlan bare = HttpInvoker::plan(*endpoint, {"/ping", "POST"}, {});
    EXPECT_EQ(bare.target, "/ping");
    EXPECT_TRUE(bare.body.empty());
}

TEST(HttpInvokerTest, InvalidBaseUrl) {
    HttpBackend backend;
    backend.base_url = "not a url";
    CallContext context{std::chrono::milliseconds(1000), nullptr};

    InvocationResult result = HttpInvoker::invoke(backend, {"/ping", "GET"}, {}, context);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, FailureKind::RuntimeError);
}

TEST(PythonInvokerTest, SuccessReply) {
    InvocationResult result = PythonInvoker::parse_reply(
        "{\"ok\": true, \"result\": {\"sum\": 3}}\n", "");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payload, (json{{"sum", 3}}));
    EXPECT_TRUE(result.details.is_null());
}

TEST(PythonInvokerTest, ErrorReply) {
    json reply = {
        {"ok", false},
        {"stage", "call"},
        {"error_type", "ZeroDivisionError"},
        {"message", "division by zero"},
        {"traceback", "Traceback (most recent call last): ..."}
    };

    InvocationResult result = PythonInvoker::parse_reply(reply.dump() + "\n", "warning: noisy\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, FailureKind::RuntimeError);
    EXPECT_EQ(result.message, "ZeroDivisionError: division by zero");
    EXPECT_EQ(result.details["stage"], "call");
    EXPECT_EQ(result.details["stderr"], "warning: noisy\n");
}

TEST(PythonInvokerTest, MissingReply) {
    InvocationResult result = PythonInvoker::parse_reply("", "python3: can't open file\n");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, FailureKind::RuntimeError);
    EXPECT_EQ(result.details["stderr"], "python3: can't open file\n");
}

TEST(PythonInvokerTest, BootstrapKeepsStdoutForReply) {
    std::string script = PythonInvoker::bootstrap_script();
    EXPECT_NE(script.find("sys.stdout = sys.stderr"), std::string::npos);
    EXPECT_NE(script.find("asyncio.run"), std::string::npos);
}

TEST(ExternalInvokerTest, SessionScript) {
    std::string script = ExternalInvoker::session_script("search", {{"query", "cats"}});

    std::istringstream in(script);
    std::string line;
    std::vector<json> messages;
    while (std::getline(in, line)) {
        messages.push_back(json::parse(line));
    }

    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0]["method"], "initialize");
    EXPECT_EQ(messages[0]["id"], 1);
    EXPECT_EQ(messages[1]["method"], "notifications/initialized");
    EXPECT_FALSE(messages[1].contains("id"));
    EXPECT_EQ(messages[2]["method"], "tools/call");
    EXPECT_EQ(messages[2]["params"]["name"], "search");
    EXPECT_EQ(messages[2]["params"]["arguments"], (json{{"query", "cats"}}));
}

TEST(ExternalInvokerTest, ParseReply) {
    std::string transcript =
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{\"protocolVersion\":\"2024-11-05\"}}\n"
        "not json at all\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{\"content\":[{\"type\":\"text\",\"text\":\"42\"}]}}\n";

    InvocationResult result = ExternalInvoker::parse_reply(transcript, "");

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payload["content"][0]["text"], "42");
}

TEST(ExternalInvokerTest, ParseErrors) {
    InvocationResult rpc_error = ExternalInvoker::parse_reply(
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"error\":{\"code\":-32602,\"message\":\"Unknown tool\"}}\n", "");
    EXPECT_FALSE(rpc_error.ok);
    EXPECT_EQ(rpc_error.kind, FailureKind::BackendError);
    EXPECT_EQ(rpc_error.message, "Unknown tool");

    InvocationResult tool_error = ExternalInvoker::parse_reply(
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{\"isError\":true,"
        "\"content\":[{\"type\":\"text\",\"text\":\"disk full\"}]}}\n", "");
    EXPECT_FALSE(tool_error.ok);
    EXPECT_EQ(tool_error.kind, FailureKind::BackendError);
    EXPECT_EQ(tool_error.message, "disk full");

    InvocationResult silent = ExternalInvoker::parse_reply("", "crashed\n");
    EXPECT_FALSE(silent.ok);
    EXPECT_EQ(silent.kind, FailureKind::RuntimeError);
}

TEST(CommandInvokerTest, Outcomes) {
    CallContext context{std::chrono::milliseconds(500), nullptr};

    ProcessResult finished;
    finished.exit_code = 0;
    finished.stdout_text = "hello\n";
    InvocationResult success = CommandInvoker::outcome(finished, context);
    ASSERT_TRUE(success.ok);
    EXPECT_EQ(success.payload, "hello\n");

    ProcessResult failed;
    failed.exit_code = 2;
    failed.stderr_text = "usage: tool";
    InvocationResult backend_error = CommandInvoker::outcome(failed, context);
    EXPECT_EQ(backend_error.kind, FailureKind::BackendError);
    EXPECT_EQ(backend_error.details["exit_code"], 2);
    EXPECT_EQ(backend_error.details["stderr"], "usage: tool");

    ProcessResult slow;
    slow.timed_out = true;
    slow.exit_code = 137;
    EXPECT_EQ(CommandInvoker::outcome(slow, context).kind, FailureKind::Timeout);

    ProcessResult stopped;
    stopped.cancelled = true;
    EXPECT_EQ(CommandInvoker::outcome(stopped, context).kind, FailureKind::Cancelled);
}

TEST(InvocationResultTest, TextAndJson) {
    InvocationResult success = InvocationResult::success(json{{"a", 1}});
    EXPECT_EQ(success.text(), json({{"a", 1}}).dump(2));
    EXPECT_EQ(success.to_json(), (json{{"ok", true}, {"payload", {{"a", 1}}}}));

    InvocationResult failure = InvocationResult::failure(
        FailureKind::BackendError, "process exited with code 1", {{"stderr", "boom"}});
    EXPECT_EQ(failure.text(), "BackendError: process exited with code 1\nboom");
    json serialized = failure.to_json();
    EXPECT_EQ(serialized["ok"], false);
    EXPECT_EQ(serialized["kind"], "BackendError");
    EXPECT_EQ(serialized["details"]["stderr"], "boom");
}
