#include <gtest/gtest.h>
#include "dispatch/Dispatcher.hpp"
#include "support/Interpreter.hpp"
#include "support/LocalServer.hpp"
#include <filesystem>
#include <thread>

using namespace mcpify;
namespace fs = std::filesystem;

namespace {

Parameter make_param(const std::string& name, ParamType type, bool required = true) {
    Parameter param;
    param.name = name;
    param.type = type;
    param.required = required;
    param.description = name;
    return param;
}

Tool command_tool(const std::string& name, std::vector<Parameter> params, std::vector<std::string> args) {
    Tool tool;
    tool.name = name;
    tool.description = "Runs " + name;
    tool.parameters = std::move(params);
    tool.invocation = CommandLineInvocation{std::move(args)};
    return tool;
}

Configuration shell_config() {
    Configuration config;
    config.name = "shell";
    config.description = "Shell commands";
    CommandLineBackend backend;
    backend.executable = "sh";
    backend.timeout_seconds = 10;
    config.backend = backend;

    config.tools.push_back(command_tool("say", {make_param("message", ParamType::String)},
                                        {"-c", "echo \"$0\"", "{message}"}));
    config.tools.push_back(command_tool("fail", {}, {"-c", "echo bad >&2; exit 4"}));
    config.tools.push_back(command_tool("nap", {make_param("seconds", ParamType::Integer)},
                                        {"-c", "sleep \"$0\"", "{seconds}"}));
    return config;
}

Tool http_tool(const std::string& name, const std::string& method, const std::string& endpoint,
               std::vector<Parameter> params = {}) {
    Tool tool;
    tool.name = name;
    tool.description = method + " " + endpoint;
    tool.parameters = std::move(params);
    tool.invocation = HttpInvocation{endpoint, method};
    return tool;
}

} // namespace

TEST(DispatcherTest, RejectsInvalidConfiguration) {
    Configuration config = shell_config();
    config.tools[0].invocation = CommandLineInvocation{{"-c", "echo"}};

    try {
        Dispatcher dispatcher(config);
        FAIL() << "expected InvalidConfigurationError";
    } catch (const InvalidConfigurationError& e) {
        EXPECT_FALSE(e.report().is_valid);
        EXPECT_EQ(e.report().diagnostics[0].location, "tools[0].parameters[0]");
    }
}

TEST(DispatcherTest, ListsToolsWithSchemas) {
    Configuration config = shell_config();
    Parameter count = make_param("count", ParamType::Integer, false);
    count.default_value = 3;
    count.allowed_values = {1, 3, 5};
    config.tools.push_back(command_tool("repeat", {count}, {"-c", "true", "{count}"}));

    Dispatcher dispatcher(config);
    json tools = dispatcher.list_tools();

    ASSERT_EQ(tools.size(), 4u);
    EXPECT_EQ(tools[0]["name"], "say");
    EXPECT_EQ(tools[0]["input_schema"]["required"], json::array({"message"}));
    EXPECT_EQ(tools[0]["input_schema"]["properties"]["message"]["type"], "string");

    const json& repeat = tools[3]["input_schema"];
    EXPECT_EQ(repeat["required"], json::array());
    EXPECT_EQ(repeat["properties"]["count"]["type"], "integer");
    EXPECT_EQ(repeat["properties"]["count"]["default"], 3);
    EXPECT_EQ(repeat["properties"]["count"]["enum"], json::array({1, 3, 5}));
}

TEST(DispatcherTest, RunsCommand) {
    Dispatcher dispatcher(shell_config());

    InvocationResult result = dispatcher.invoke("say", {{"message", "hello; rm -rf /"}});

    ASSERT_TRUE(result.ok) << result.text();
    EXPECT_EQ(result.payload, "hello; rm -rf /\n");
}

TEST(DispatcherTest, PerCallFailures) {
    Dispatcher dispatcher(shell_config());

    EXPECT_EQ(dispatcher.invoke("shout", json::object()).kind, FailureKind::UnknownTool);
    EXPECT_EQ(dispatcher.invoke("say", json::object()).kind, FailureKind::MissingArgument);
    EXPECT_EQ(dispatcher.invoke("nap", {{"seconds", "soon"}}).kind, FailureKind::TypeMismatch);

    InvocationResult failed = dispatcher.invoke("fail", json::object());
    EXPECT_FALSE(failed.ok);
    EXPECT_EQ(failed.kind, FailureKind::BackendError);
    EXPECT_EQ(failed.details["exit_code"], 4);
    EXPECT_EQ(failed.details["stderr"], "bad\n");
}

TEST(DispatcherTest, TimeoutOverride) {
    Dispatcher dispatcher(shell_config());
    InvocationOptions options;
    options.timeout = std::chrono::milliseconds(200);

    auto started = std::chrono::steady_clock::now();
    InvocationResult result = dispatcher.invoke("nap", {{"seconds", 5}}, options);

    EXPECT_EQ(result.kind, FailureKind::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(4));
}

TEST(DispatcherTest, Cancellation) {
    Dispatcher dispatcher(shell_config());

    InvocationOptions already;
    already.cancel = std::make_shared<std::atomic_bool>(true);
    EXPECT_EQ(dispatcher.invoke("say", {{"message", "x"}}, already).kind, FailureKind::Cancelled);

    InvocationOptions later;
    later.cancel = std::make_shared<std::atomic_bool>(false);
    std::thread canceller([flag = later.cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        flag->store(true);
    });
    InvocationResult result = dispatcher.invoke("nap", {{"seconds", 5}}, later);
    canceller.join();

    EXPECT_EQ(result.kind, FailureKind::Cancelled);
}

TEST(DispatcherTest, MissingExecutable) {
    Configuration config = shell_config();
    std::get<CommandLineBackend>(config.backend).executable = "mcpify-no-such-program";
    Dispatcher dispatcher(config);

    InvocationResult result = dispatcher.invoke("say", {{"message", "x"}});

    EXPECT_EQ(result.kind, FailureKind::RuntimeError);
}

TEST(DispatcherTest, ConcurrentCalls) {
    Dispatcher dispatcher(shell_config());
    std::vector<std::thread> threads;
    std::vector<std::string> outputs(8);

    for (size_t i = 0; i < outputs.size(); ++i) {
        threads.emplace_back([&, i] {
            outputs[i] = dispatcher.invoke("say", {{"message", "call " + std::to_string(i)}}).text();
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (size_t i = 0; i < outputs.size(); ++i) {
        EXPECT_EQ(outputs[i], "call " + std::to_string(i) + "\n");
    }
}

TEST(DispatcherTest, ExternalServer) {
    Configuration config;
    config.name = "external";
    config.description = "Forwarded tools";
    ExternalBackend backend;
    backend.executable = "sh";
    backend.args = {
        "-c",
        "cat > /dev/null; "
        "echo '{\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}'; "
        "echo '{\"jsonrpc\":\"2.0\",\"id\":2,\"result\":{\"content\":[{\"type\":\"text\",\"text\":\"pong\"}]}}'"
    };
    config.backend = backend;
    Tool ping;
    ping.name = "ping";
    ping.description = "Ping the server";
    config.tools.push_back(ping);

    Dispatcher dispatcher(config);
    InvocationResult result = dispatcher.invoke("ping", json::object());

    ASSERT_TRUE(result.ok) << result.text();
    EXPECT_EQ(result.payload["content"][0]["text"], "pong");
}

class DispatcherHttpTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& server = local.server();
        server.Get(R"(/api/users/(\w+))", [](const httplib::Request& req, httplib::Response& res) {
            json body = {{"id", req.matches[1].str()}, {"verbose", req.get_param_value("verbose")}};
            res.set_content(body.dump(), "application/json");
        });
        server.Post("/api/users", [](const httplib::Request& req, httplib::Response& res) {
            res.status = 201;
            res.set_content(req.body, "application/json");
        });
        server.Get("/api/missing", [](const httplib::Request&, httplib::Response& res) {
            res.status = 404;
            res.set_content("no such thing", "text/plain");
        });
        server.Get("/api/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            res.set_content("late", "text/plain");
        });
        ASSERT_TRUE(local.start());

        config.name = "users";
        config.description = "Users API";
        HttpBackend backend;
        backend.base_url = local.url("/api");
        backend.timeout_seconds = 5;
        config.backend = backend;

        Parameter age = make_param("age", ParamType::Integer, false);
        age.default_value = 18;
        config.tools.push_back(http_tool("get_user", "GET", "/users/{user_id}",
                                         {make_param("user_id", ParamType::String),
                                          make_param("verbose", ParamType::Boolean, false)}));
        config.tools.push_back(http_tool("create_user", "POST", "/users",
                                         {make_param("name", ParamType::String), age}));
        config.tools.push_back(http_tool("missing", "GET", "/missing"));
        config.tools.push_back(http_tool("slow", "GET", "/slow"));
    }

    LocalServer local;
    Configuration config;
};

TEST_F(DispatcherHttpTest, GetWithPathAndQuery) {
    Dispatcher dispatcher(config);

    InvocationResult result = dispatcher.invoke("get_user", {{"user_id", "u1"}, {"verbose", "yes"}});

    ASSERT_TRUE(result.ok) << result.text();
    EXPECT_EQ(result.payload, (json{{"id", "u1"}, {"verbose", "true"}}));
    EXPECT_EQ(result.details["status"], 200);
}

TEST_F(DispatcherHttpTest, PostSendsJsonBody) {
    Dispatcher dispatcher(config);

    InvocationResult result = dispatcher.invoke("create_user", {{"name", "ann"}});

    ASSERT_TRUE(result.ok) << result.text();
    EXPECT_EQ(result.payload, (json{{"name", "ann"}, {"age", 18}}));
    EXPECT_EQ(result.details["status"], 201);
}

TEST_F(DispatcherHttpTest, ErrorStatus) {
    Dispatcher dispatcher(config);

    InvocationResult result = dispatcher.invoke("missing", json::object());

    EXPECT_EQ(result.kind, FailureKind::BackendError);
    EXPECT_EQ(result.details["status"], 404);
    EXPECT_EQ(result.details["body"], "no such thing");
}

TEST_F(DispatcherHttpTest, Timeout) {
    Dispatcher dispatcher(config);
    InvocationOptions options;
    options.timeout = std::chrono::milliseconds(200);

    InvocationResult result = dispatcher.invoke("slow", json::object(), options);

    EXPECT_EQ(result.kind, FailureKind::Timeout);
}

TEST_F(DispatcherHttpTest, ConnectionRefused) {
    local.stop();
    Dispatcher dispatcher(config);

    InvocationResult result = dispatcher.invoke("missing", json::object());

    EXPECT_EQ(result.kind, FailureKind::RuntimeError);
}

class DispatcherPythonTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!python3_available()) {
            GTEST_SKIP() << "python3 not available";
        }
        fixture_dir = fs::canonical(fs::path(__FILE__).parent_path() / ".." / "fixtures" / "calculator");

        config.name = "calculator";
        config.description = "Calculator";
        PythonModuleBackend backend;
        backend.module_path = (fixture_dir / "calculator.py").string();
        backend.timeout_seconds = 20;
        config.backend = backend;

        Tool add;
        add.name = "add";
        add.description = "Add two integers.";
        add.parameters = {make_param("a", ParamType::Integer), make_param("b", ParamType::Integer)};
        add.invocation = PythonInvocation{"add"};
        config.tools.push_back(add);

        Tool divide;
        divide.name = "divide";
        divide.description = "Divide one number by another.";
        Parameter b = make_param("b", ParamType::Number, false);
        b.default_value = 1.0;
        divide.parameters = {make_param("a", ParamType::Number), b};
        divide.invocation = PythonInvocation{"divide"};
        config.tools.push_back(divide);

        Tool join;
        join.name = "join";
        join.description = "Join words with a separator.";
        join.parameters = {make_param("words", ParamType::Array)};
        join.invocation = PythonInvocation{"join"};
        config.tools.push_back(join);
    }

    fs::path fixture_dir;
    Configuration config;
};

TEST_F(DispatcherPythonTest, CallsFunctionFromFile) {
    Dispatcher dispatcher(config);

    InvocationResult sum = dispatcher.invoke("add", {{"a", 2}, {"b", "3"}});
    ASSERT_TRUE(sum.ok) << sum.text();
    EXPECT_EQ(sum.payload, 5);

    InvocationResult joined = dispatcher.invoke("join", {{"words", json::array({"a", "b"})}});
    ASSERT_TRUE(joined.ok) << joined.text();
    EXPECT_EQ(joined.payload, "a b");
}

TEST_F(DispatcherPythonTest, FunctionErrorsAreReported) {
    Dispatcher dispatcher(config);

    InvocationResult result = dispatcher.invoke("divide", {{"a", 1}, {"b", 0}});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.kind, FailureKind::RuntimeError);
    EXPECT_EQ(result.details["error_type"], "ZeroDivisionError");
    EXPECT_EQ(result.details["stage"], "call");
}

TEST_F(DispatcherPythonTest, DottedNameFromDirectory) {
    std::get<PythonModuleBackend>(config.backend).module_path = fixture_dir.string();
    config.tools[0].invocation = PythonInvocation{"calculator.add"};
    Dispatcher dispatcher(config);

    InvocationResult result = dispatcher.invoke("add", {{"a", 40}, {"b", 2}});

    ASSERT_TRUE(result.ok) << result.text();
    EXPECT_EQ(result.payload, 42);
}

TEST_F(DispatcherPythonTest, MissingFunction) {
    config.tools[0].invocation = PythonInvocation{"no_such_function"};
    Dispatcher dispatcher(config);

    InvocationResult result = dispatcher.invoke("add", {{"a", 1}, {"b", 2}});

    EXPECT_EQ(result.kind, FailureKind::RuntimeError);
    EXPECT_EQ(result.details["stage"], "resolve");
}
