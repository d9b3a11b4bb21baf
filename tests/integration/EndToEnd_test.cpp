#include "detect/StrategySelector.hpp"
#include "dispatch/Dispatcher.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "schema/ConfigLoader.hpp"
#include "support/Interpreter.hpp"
#include "tools/DispatcherTool.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <sstream>

using namespace mcpify;
using json = nlohmann::json;
namespace fs = std::filesystem;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Determine fixtures path
        fs::path test_dir = fs::path(__FILE__).parent_path();
        fixtures_dir = fs::canonical(test_dir / ".." / "fixtures");
        ASSERT_TRUE(fs::exists(fixtures_dir)) << "Fixtures directory not found";
    }

    /**
     * @brief Detect a fixture project with the structural strategy only
     */
    Configuration detect(const std::string& project) {
        DetectorRegistry registry = DetectorRegistry::with_defaults(DetectorOptions{});
        StrategySelector selector(registry);
        DetectorHandle detector = selector.select({"auto", false});
        EXPECT_EQ(detector.name(), "structural");
        return detector.detect(fixtures_dir / project).configuration;
    }

    /**
     * @brief Feed newline-delimited requests through a stdio server and collect responses by id
     */
    std::vector<json> Serve(const std::shared_ptr<const Dispatcher>& dispatcher,
                            const std::vector<json>& requests) {
        std::string script;
        for (const auto& request : requests) {
            script += request.dump() + "\n";
        }
        std::istringstream input(script);
        std::ostringstream output;

        MCPServer server(std::make_unique<StdioTransport>(input, output),
                         ServerInfo{dispatcher->configuration().name, "test"});
        DispatcherTool::register_all(server, dispatcher);
        server.run();

        std::vector<json> responses;
        std::istringstream lines(output.str());
        std::string line;
        while (std::getline(lines, line)) {
            responses.push_back(json::parse(line));
        }
        std::sort(responses.begin(), responses.end(), [](const json& a, const json& b) {
            return a["id"].dump() < b["id"].dump();
        });
        return responses;
    }

    static json Call(int id, const std::string& tool, const json& arguments) {
        return {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", "tools/call"},
            {"params", {{"name", tool}, {"arguments", arguments}}}
        };
    }

    fs::path fixtures_dir;
};

TEST_F(EndToEndTest, DetectedConfigurationsSurviveSaveAndLoad) {
    fs::path out = fs::temp_directory_path() / "mcpify_end_to_end_config.json";

    for (const char* project : {"calculator", "cli_tool", "web_api"}) {
        Configuration detected = detect(project);
        ConfigLoader::save_file(detected, out);
        Configuration loaded = ConfigLoader::load_file(out);

        EXPECT_EQ(ConfigLoader::to_json(loaded), ConfigLoader::to_json(detected)) << project;
        EXPECT_TRUE(ConfigValidator::validate(loaded).is_valid) << project;
    }

    fs::remove(out);
}

TEST_F(EndToEndTest, HandwrittenConfigurationOverStdio) {
    json document = {
        {"name", "echo-tools"},
        {"description", "Echo helpers"},
        {"backend", {{"type", "commandline"}, {"config", {{"command", "echo"}}}}},
        {"tools", json::array({
            {
                {"name", "say"},
                {"description", "Echo a message"},
                {"parameters", json::array({
                    {{"name", "message"}, {"type", "string"}, {"description", "Text to print"}}
                })},
                {"args", json::array({"{message}"})}
            },
            {
                {"name", "count"},
                {"description", "Echo a number"},
                {"parameters", json::array({
                    {{"name", "n"}, {"type", "integer"}, {"description", "Number"}}
                })},
                {"args", json::array({"n={n}"})}
            }
        })}
    };
    auto dispatcher = std::make_shared<const Dispatcher>(ConfigLoader::from_json(document));

    auto responses = Serve(dispatcher, {
        {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}, {"params", json::object()}},
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}},
        {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}},
        Call(3, "say", {{"message", "hello"}}),
        Call(4, "count", {{"n", "forty"}}),
        Call(5, "shout", json::object())
    });

    ASSERT_EQ(responses.size(), 5u);
    EXPECT_EQ(responses[0]["result"]["serverInfo"]["name"], "echo-tools");

    json tools = responses[1]["result"]["tools"];
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["name"], "say");
    EXPECT_EQ(tools[1]["inputSchema"]["properties"]["n"]["type"], "integer");

    EXPECT_EQ(responses[2]["result"]["content"][0]["text"], "hello\n");
    EXPECT_EQ(responses[2]["result"]["isError"], false);

    EXPECT_EQ(responses[3]["result"]["isError"], true);
    auto mismatch = responses[3]["result"]["content"][0]["text"].get<std::string>();
    EXPECT_EQ(mismatch.rfind("TypeMismatch", 0), 0u);

    EXPECT_EQ(responses[4]["error"]["code"], -32602);
}

TEST_F(EndToEndTest, DetectedCommandLineProject) {
    if (!python3_available()) {
        GTEST_SKIP() << "python3 not available";
    }
    auto dispatcher = std::make_shared<const Dispatcher>(detect("cli_tool"));

    auto responses = Serve(dispatcher, {
        Call(1, "add", {{"text", "milk"}, {"priority", 2}}),
        Call(2, "add", {{"text", "eggs"}, {"priority", 7}}),
        Call(3, "list", json::object())
    });

    ASSERT_EQ(responses.size(), 3u);
    EXPECT_EQ(responses[0]["result"]["content"][0]["text"], "added milk with priority 2\n");
    EXPECT_EQ(responses[1]["result"]["isError"], true);
    EXPECT_EQ(responses[2]["result"]["content"][0]["text"], "listing all notes\n");
}

TEST_F(EndToEndTest, DetectedPythonModuleProject) {
    if (!python3_available()) {
        GTEST_SKIP() << "python3 not available";
    }
    Dispatcher dispatcher(detect("calculator"));

    InvocationResult sum = dispatcher.invoke("add", {{"a", 19}, {"b", 23}});
    ASSERT_TRUE(sum.ok) << sum.text();
    EXPECT_EQ(sum.payload, 42);

    InvocationResult quotient = dispatcher.invoke("divide", {{"a", 9}});
    ASSERT_TRUE(quotient.ok) << quotient.text();
    EXPECT_EQ(quotient.payload, 9.0);

    InvocationResult joined = dispatcher.invoke("join", {{"words", json::array({"x", "y"})}, {"sep", "-"}});
    ASSERT_TRUE(joined.ok) << joined.text();
    EXPECT_EQ(joined.payload, "x-y");

    InvocationResult failed = dispatcher.invoke("divide", {{"a", 1}, {"b", 0}});
    EXPECT_FALSE(failed.ok);
    EXPECT_EQ(failed.details["error_type"], "ZeroDivisionError");
}
