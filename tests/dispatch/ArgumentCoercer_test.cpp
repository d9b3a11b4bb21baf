#include <gtest/gtest.h>
#include "dispatch/ArgumentCoercer.hpp"

using namespace mcpify;

namespace {

Parameter make_param(const std::string& name, ParamType type, bool required = true) {
    Parameter param;
    param.name = name;
    param.type = type;
    param.required = required;
    return param;
}

FailureKind failure_of(const Parameter& param, const json& value) {
    try {
        ArgumentCoercer::coerce(param, value);
    } catch (const DispatchError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "no error for " << value.dump();
    return FailureKind::RuntimeError;
}

} // namespace

TEST(ArgumentCoercerTest, Integers) {
    EXPECT_EQ(ArgumentCoercer::to_integer(42), json(42));
    EXPECT_EQ(ArgumentCoercer::to_integer("17"), json(17));
    EXPECT_EQ(ArgumentCoercer::to_integer(" -3 "), json(-3));
    EXPECT_EQ(ArgumentCoercer::to_integer(4.0), json(4));

    Parameter count = make_param("count", ParamType::Integer);
    EXPECT_EQ(failure_of(count, "abc"), FailureKind::TypeMismatch);
    EXPECT_EQ(failure_of(count, "12abc"), FailureKind::TypeMismatch);
    EXPECT_EQ(failure_of(count, 2.5), FailureKind::TypeMismatch);
    EXPECT_EQ(failure_of(count, true), FailureKind::TypeMismatch);
    EXPECT_EQ(failure_of(count, json::array({1})), FailureKind::TypeMismatch);
}

TEST(ArgumentCoercerTest, Numbers) {
    EXPECT_EQ(ArgumentCoercer::to_number(2.5), json(2.5));
    EXPECT_EQ(ArgumentCoercer::to_number(3), json(3));
    EXPECT_EQ(ArgumentCoercer::to_number("1.25"), json(1.25));

    Parameter ratio = make_param("ratio", ParamType::Number);
    EXPECT_EQ(failure_of(ratio, "fast"), FailureKind::TypeMismatch);
    EXPECT_EQ(failure_of(ratio, false), FailureKind::TypeMismatch);
}

TEST(ArgumentCoercerTest, Booleans) {
    EXPECT_EQ(ArgumentCoercer::to_boolean(true), json(true));
    EXPECT_EQ(ArgumentCoercer::to_boolean("Yes"), json(true));
    EXPECT_EQ(ArgumentCoercer::to_boolean("false"), json(false));
    EXPECT_EQ(ArgumentCoercer::to_boolean(0), json(false));
    EXPECT_EQ(ArgumentCoercer::to_boolean(1), json(true));

    Parameter flag = make_param("flag", ParamType::Boolean);
    EXPECT_EQ(failure_of(flag, "maybe"), FailureKind::TypeMismatch);
    EXPECT_EQ(failure_of(flag, 2), FailureKind::TypeMismatch);
}

TEST(ArgumentCoercerTest, StringsAndArrays) {
    EXPECT_EQ(ArgumentCoercer::to_string_value("text"), json("text"));
    EXPECT_EQ(ArgumentCoercer::to_string_value(5), json("5"));
    EXPECT_EQ(ArgumentCoercer::to_string_value(true), json("true"));

    EXPECT_EQ(ArgumentCoercer::to_array(json::array({1, 2})), json::array({1, 2}));
    EXPECT_EQ(ArgumentCoercer::to_array("[\"a\", \"b\"]"), json::array({"a", "b"}));

    EXPECT_EQ(failure_of(make_param("name", ParamType::String), json::object()),
              FailureKind::TypeMismatch);
    EXPECT_EQ(failure_of(make_param("items", ParamType::Array), "a,b"),
              FailureKind::TypeMismatch);
}

TEST(ArgumentCoercerTest, EnumConstraint) {
    Parameter priority = make_param("priority", ParamType::Integer);
    priority.allowed_values = {1, 2, 3};

    EXPECT_EQ(ArgumentCoercer::coerce(priority, "2"), json(2));
    EXPECT_EQ(failure_of(priority, 5), FailureKind::TypeMismatch);

    Parameter colors = make_param("colors", ParamType::Array);
    colors.allowed_values = {"red", "green"};
    EXPECT_EQ(ArgumentCoercer::coerce(colors, json::array({"red"})), json::array({"red"}));
    EXPECT_EQ(failure_of(colors, json::array({"red", "blue"})), FailureKind::TypeMismatch);
}

TEST(ArgumentCoercerTest, BindAppliesDefaultsAndOmissions) {
    Tool tool;
    tool.name = "divide";
    tool.parameters.push_back(make_param("a", ParamType::Number));
    Parameter b = make_param("b", ParamType::Number, false);
    b.default_value = 1.0;
    tool.parameters.push_back(b);
    tool.parameters.push_back(make_param("note", ParamType::String, false));

    ArgumentMap bound = ArgumentCoercer::bind(tool, {{"a", "6"}, {"extra", 1}});
    EXPECT_EQ(bound.at("a"), json(6.0));
    EXPECT_EQ(bound.at("b"), json(1.0));
    EXPECT_EQ(bound.count("note"), 0u);
    EXPECT_EQ(bound.count("extra"), 0u);

    // null counts as absent
    bound = ArgumentCoercer::bind(tool, {{"a", 1}, {"b", nullptr}, {"note", "hi"}});
    EXPECT_EQ(bound.at("b"), json(1.0));
    EXPECT_EQ(bound.at("note"), json("hi"));
}

TEST(ArgumentCoercerTest, BindFailures) {
    Tool tool;
    tool.name = "add";
    tool.parameters.push_back(make_param("a", ParamType::Integer));

    try {
        ArgumentCoercer::bind(tool, json::object());
        FAIL() << "expected MissingArgument";
    } catch (const DispatchError& e) {
        EXPECT_EQ(e.kind(), FailureKind::MissingArgument);
        EXPECT_NE(std::string(e.what()).find("'a'"), std::string::npos);
    }

    try {
        ArgumentCoercer::bind(tool, {{"a", "abc"}});
        FAIL() << "expected TypeMismatch";
    } catch (const DispatchError& e) {
        EXPECT_EQ(e.kind(), FailureKind::TypeMismatch);
        EXPECT_EQ(e.details()["parameter"], "a");
    }

    EXPECT_THROW(ArgumentCoercer::bind(tool, json::array()), DispatchError);
    EXPECT_THROW(ArgumentCoercer::bind(tool, nullptr), DispatchError);
}
