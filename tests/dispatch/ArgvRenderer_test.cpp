#include <gtest/gtest.h>
#include "dispatch/ArgvRenderer.hpp"

using namespace mcpify;

using Argv = std::vector<std::string>;

TEST(ArgvRendererTest, SubstitutesPlaceholders) {
    ArgumentMap values = {{"message", "hi"}};
    EXPECT_EQ(ArgvRenderer::render_template({"--echo", "{message}"}, values),
              (Argv{"--echo", "hi"}));
    EXPECT_EQ(ArgvRenderer::render_template({"--msg={message}!"}, values),
              (Argv{"--msg=hi!"}));
}

TEST(ArgvRendererTest, ValueTextForms) {
    EXPECT_EQ(ArgvRenderer::to_text("plain"), "plain");
    EXPECT_EQ(ArgvRenderer::to_text(7), "7");
    EXPECT_EQ(ArgvRenderer::to_text(2.5), "2.5");
    EXPECT_EQ(ArgvRenderer::to_text(false), "false");
}

TEST(ArgvRendererTest, BooleanSwitches) {
    Argv tokens = {"run", "--verbose", "{verbose}"};
    EXPECT_EQ(ArgvRenderer::render_template(tokens, {{"verbose", true}}),
              (Argv{"run", "--verbose"}));
    EXPECT_EQ(ArgvRenderer::render_template(tokens, {{"verbose", false}}),
              (Argv{"run"}));
}

TEST(ArgvRendererTest, ArraysExpand) {
    ArgumentMap values = {{"tags", json::array({"a", "b"})}, {"files", json::array({"x.txt", "y.txt"})}};
    EXPECT_EQ(ArgvRenderer::render_template({"--tags", "{tags}", "{files}"}, values),
              (Argv{"--tags", "a", "b", "x.txt", "y.txt"}));

    ArgumentMap empty = {{"tags", json::array()}};
    EXPECT_EQ(ArgvRenderer::render_template({"--tags", "{tags}"}, empty), Argv{});
}

TEST(ArgvRendererTest, OmittedParametersDropTokens) {
    Argv tokens = {"{input}", "--limit", "{limit}", "--name={name}"};
    EXPECT_EQ(ArgvRenderer::render_template(tokens, {{"input", "in.txt"}}),
              (Argv{"in.txt"}));
    EXPECT_EQ(ArgvRenderer::render_template(tokens, {{"input", "in.txt"}, {"limit", 5}, {"name", "n"}}),
              (Argv{"in.txt", "--limit", "5", "--name=n"}));
}

TEST(ArgvRendererTest, LiteralBracesAreKept) {
    EXPECT_EQ(ArgvRenderer::render_template({"{}", "{not valid}", "x{"}, {}),
              (Argv{"{}", "{not valid}", "x{"}));
}

TEST(ArgvRendererTest, BaseArgsComeFirst) {
    CommandLineBackend backend;
    backend.executable = "python3";
    backend.base_args = {"notes.py"};
    CommandLineInvocation invocation{{"add", "{text}"}};

    EXPECT_EQ(ArgvRenderer::render(backend, invocation, {{"text", "buy milk"}}),
              (Argv{"notes.py", "add", "buy milk"}));
}
