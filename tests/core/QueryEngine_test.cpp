#include <gtest/gtest.h>
#include "core/QueryEngine.hpp"
#include "core/TreeSitterParser.hpp"
#include <algorithm>
#include <filesystem>

using namespace mcpify;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> captured(const std::vector<QueryMatch>& matches, std::string_view name) {
    std::vector<std::string> texts;
    for (const auto& match : matches) {
        if (const QueryCapture* capture = match.find(name)) {
            texts.push_back(capture->text);
        }
    }
    return texts;
}

} // namespace

// Test 1: CompileValidQuery - compile "(function_definition) @function"
TEST(QueryEngineTest, CompileValidQuery) {
    QueryEngine engine;

    auto query = engine.compile_query("(function_definition) @function");

    ASSERT_NE(query, nullptr) << "Should successfully compile a valid query";
    EXPECT_GT(query->pattern_count(), 0u) << "Query should have at least one pattern";
    EXPECT_GT(query->capture_count(), 0u) << "Query should have at least one capture";
    EXPECT_EQ(query->capture_name(0), "function");
}

// Test 2: CompileInvalidQuery - expect nullptr on "invalid ((("
TEST(QueryEngineTest, CompileInvalidQuery) {
    QueryEngine engine;

    auto query = engine.compile_query("invalid (((");

    EXPECT_EQ(query, nullptr) << "Should return nullptr for invalid query syntax";
}

// Test 3: PredefinedQueriesCompile - every predefined pattern is valid for the grammar
TEST(QueryEngineTest, PredefinedQueriesCompile) {
    QueryEngine engine;
    for (QueryType type : {QueryType::ROUTE_DECORATORS, QueryType::MODULE_FUNCTIONS, QueryType::CALLS}) {
        EXPECT_NE(engine.compile_query(QueryEngine::get_predefined_query(type)), nullptr)
            << QueryEngine::get_predefined_query(type);
    }
}

// Test 4: ModuleFunctions - top-level functions only, decorated or not
TEST(QueryEngineTest, ModuleFunctions) {
    TreeSitterParser parser;
    QueryEngine engine;
    std::string source = R"(
def first():
    def inner():
        pass

@cache
def second(x):
    return x

class Service:
    def method(self):
        pass
)";

    auto tree = parser.parse_string(source);
    ASSERT_NE(tree, nullptr);

    auto matches = engine.execute(*tree, QueryType::MODULE_FUNCTIONS, parser.last_source());
    auto names = captured(matches, "name");
    std::sort(names.begin(), names.end());

    EXPECT_EQ(names, (std::vector<std::string>{"first", "second"}));
}

// Test 5: RouteDecorators - router object, verb and decorated function
TEST(QueryEngineTest, RouteDecorators) {
    TreeSitterParser parser;
    QueryEngine engine;
    std::string source = R"(
@router.post("/items")
def create_item(name: str):
    pass

@staticmethod
def not_a_route():
    pass
)";

    auto tree = parser.parse_string(source);
    ASSERT_NE(tree, nullptr);

    auto matches = engine.execute(*tree, QueryType::ROUTE_DECORATORS, parser.last_source());

    ASSERT_EQ(matches.size(), 1u) << "Only the call-style decorator should match";
    ASSERT_NE(matches[0].find("router"), nullptr);
    EXPECT_EQ(matches[0].find("router")->text, "router");
    EXPECT_EQ(matches[0].find("verb")->text, "post");
    EXPECT_EQ(matches[0].find("name")->text, "create_item");
    EXPECT_EQ(matches[0].find("name")->line, 2u);
}

// Test 6: CallsInFixture - argparse calls in the notes fixture
TEST(QueryEngineTest, CallsInFixture) {
    TreeSitterParser parser;
    QueryEngine engine;
    fs::path fixture_path = fs::path(__FILE__).parent_path() / ".." / "fixtures" / "cli_tool" / "notes.py";

    ASSERT_TRUE(fs::exists(fixture_path))
        << "Fixture file should exist at " << fixture_path;

    auto tree = parser.parse_file(fixture_path);
    ASSERT_NE(tree, nullptr);
    ASSERT_FALSE(tree->has_error());

    auto matches = engine.execute(*tree, QueryType::CALLS, parser.last_source());
    auto callees = captured(matches, "callee");

    EXPECT_EQ(std::count(callees.begin(), callees.end(), "argparse.ArgumentParser"), 1);
    EXPECT_GE(std::count(callees.begin(), callees.end(), "add.add_argument"), 2);
}

// Test 7: CachedPredefinedQuery - repeated execution gives the same result
TEST(QueryEngineTest, CachedPredefinedQuery) {
    TreeSitterParser parser;
    QueryEngine engine;
    auto tree = parser.parse_string("print(len('abc'))\n");
    ASSERT_NE(tree, nullptr);

    auto first = engine.execute(*tree, QueryType::CALLS, parser.last_source());
    auto second = engine.execute(*tree, QueryType::CALLS, parser.last_source());

    EXPECT_EQ(first.size(), 2u);
    EXPECT_EQ(captured(first, "callee"), captured(second, "callee"));
}
