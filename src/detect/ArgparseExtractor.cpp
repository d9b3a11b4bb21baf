#include "detect/ArgparseExtractor.hpp"
#include "core/SyntaxNode.hpp"
#include "detect/PythonSyntax.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <optional>
#include <set>

namespace mcpify {

namespace {

struct ArgumentSpec {
    Parameter parameter;
    std::vector<std::string> tokens;
};

struct ParserState {
    std::string command;  // empty for a top-level parser
    std::string description;
    std::vector<ArgumentSpec> arguments;
    std::vector<size_t> children;
};

struct Binding {
    enum class Kind { Parser, Subparsers };
    Kind kind;
    size_t parser;
};

bool is_group_method(std::string_view method) {
    return method == "add_argument_group" || method == "add_mutually_exclusive_group";
}

bool is_parser_constructor(std::string_view callee) {
    constexpr std::string_view name = "ArgumentParser";
    if (callee == name) {
        return true;
    }
    return callee.size() > name.size() &&
           callee.substr(callee.size() - name.size()) == name &&
           callee[callee.size() - name.size() - 1] == '.';
}

std::optional<std::string> assigned_name(TSNode call, std::string_view source) {
    TSNode assignment = syntax::parent(call);
    if (!syntax::is(assignment, "assignment")) {
        return std::nullopt;
    }
    if (!syntax::same(syntax::field(assignment, "right"), call)) {
        return std::nullopt;
    }
    return syntax::text(syntax::field(assignment, "left"), source);
}

TSNode enclosing_function(TSNode node) {
    TSNode current = syntax::parent(node);
    while (!syntax::is_null(current)) {
        if (syntax::is(current, "function_definition")) {
            return current;
        }
        current = syntax::parent(current);
    }
    return current;
}

std::string dest_from_flag(std::string_view flag) {
    size_t start = flag.find_first_not_of('-');
    std::string dest(start == std::string_view::npos ? "" : flag.substr(start));
    std::replace(dest.begin(), dest.end(), '-', '_');
    return python::sanitize_identifier(dest);
}

std::optional<std::string> string_keyword(TSNode args, std::string_view name, std::string_view source) {
    auto value = python::keyword_argument(args, name, source);
    if (!value) {
        return std::nullopt;
    }
    return python::string_literal(*value, source);
}

std::string describe_command(TSNode args, std::string_view source) {
    for (const char* key : {"help", "description"}) {
        if (auto text = string_keyword(args, key, source)) {
            return python::summary(*text);
        }
    }
    return "";
}

/**
 * @brief Turn one add_argument(...) call into a parameter and its template tokens
 * @return nullopt for arguments that take no part in a call (help, version)
 */
std::optional<ArgumentSpec> parse_argument(TSNode args, std::string_view source) {
    std::vector<std::string> flags;
    for (TSNode node : python::positional_arguments(args)) {
        if (auto flag = python::string_literal(node, source)) {
            flags.push_back(*flag);
        }
    }
    if (flags.empty()) {
        return std::nullopt;
    }

    bool positional = flags.front().rfind('-', 0) != 0;
    std::string action = string_keyword(args, "action", source).value_or("store");
    if (action == "help" || action == "version") {
        return std::nullopt;
    }

    ArgumentSpec spec;
    Parameter& param = spec.parameter;

    std::string display_flag = flags.front();
    for (const auto& flag : flags) {
        if (flag.rfind("--", 0) == 0) {
            display_flag = flag;
            break;
        }
    }

    // A store_false flag clears its dest, so the parameter takes the flag's name
    // to keep "true" meaning "pass the flag".
    auto dest = string_keyword(args, "dest", source);
    if (dest && !positional && action != "store_false") {
        param.name = python::sanitize_identifier(*dest);
    } else {
        param.name = dest_from_flag(positional ? flags.front() : display_flag);
    }

    if (auto help = string_keyword(args, "help", source)) {
        param.description = python::summary(*help);
    }
    if (param.description.empty()) {
        param.description = python::humanize(param.name);
    }

    std::optional<json> default_value;
    if (auto node = python::keyword_argument(args, "default", source)) {
        default_value = python::literal_value(*node, source);
        if (default_value && default_value->is_null()) {
            default_value.reset();
        }
    }

    if (auto node = python::keyword_argument(args, "choices", source)) {
        auto choices = python::literal_value(*node, source);
        if (choices && choices->is_array()) {
            param.allowed_values.assign(choices->begin(), choices->end());
        }
    }

    std::string nargs;
    if (auto node = python::keyword_argument(args, "nargs", source)) {
        auto value = python::literal_value(*node, source);
        if (value && value->is_string()) {
            nargs = value->get<std::string>();
        } else if (value && value->is_number_integer() && value->get<long long>() > 1) {
            nargs = "N";
        }
    }

    bool is_flag = action == "store_true" || action == "store_false" ||
                   action == "store_const" || action == "append_const" || action == "count";

    if (is_flag) {
        param.type = ParamType::Boolean;
        param.required = false;
        param.default_value = false;
        param.allowed_values.clear();
        spec.tokens = {display_flag, "{" + param.name + "}"};
        return spec;
    }

    std::optional<ParamType> type;
    if (auto node = python::keyword_argument(args, "type", source)) {
        type = python::type_from_name(syntax::text(*node, source)).value_or(ParamType::String);
    } else if (default_value) {
        type = python::type_of_literal(*default_value);
    } else if (!param.allowed_values.empty()) {
        type = python::type_of_literal(param.allowed_values.front());
    }
    param.type = type.value_or(ParamType::String);

    if (nargs == "+" || nargs == "*" || nargs == "N") {
        param.type = ParamType::Array;
        param.allowed_values.clear();
    }

    param.default_value = default_value;
    if (param.type == ParamType::Array && param.default_value && !param.default_value->is_array()) {
        param.default_value.reset();
    }

    if (positional) {
        param.required = nargs != "?" && nargs != "*";
        spec.tokens = {"{" + param.name + "}"};
    } else {
        std::optional<json> required;
        if (auto node = python::keyword_argument(args, "required", source)) {
            required = python::literal_value(*node, source);
        }
        param.required = required && required->is_boolean() && required->get<bool>();
        spec.tokens = {display_flag, "{" + param.name + "}"};
    }

    return spec;
}

/**
 * @brief Follows parser variables through the calls of one file
 */
class ParserTracker {
public:
    ParserTracker(std::string_view source, ClaimedFunctions& claimed)
        : source_(source), claimed_(claimed) {}

    void visit(const QueryMatch& match) {
        const QueryCapture* callee = match.find("callee");
        const QueryCapture* args = match.find("args");
        const QueryCapture* call = match.find("call");
        if (!callee || !args || !call) {
            return;
        }

        if (is_parser_constructor(callee->text)) {
            on_parser(call->node, args->node);
            return;
        }
        if (!syntax::is(callee->node, "attribute")) {
            return;
        }

        std::string method = syntax::text(syntax::field(callee->node, "attribute"), source_);
        auto target = resolve(syntax::field(callee->node, "object"));
        if (!target) {
            return;
        }

        if (method == "add_argument" && target->kind == Binding::Kind::Parser) {
            if (auto spec = parse_argument(args->node, source_)) {
                parsers_[target->parser].arguments.push_back(std::move(*spec));
            }
        } else if (method == "add_subparsers" && target->kind == Binding::Kind::Parser) {
            bind(call->node, {Binding::Kind::Subparsers, target->parser});
        } else if (method == "add_parser" && target->kind == Binding::Kind::Subparsers) {
            on_subcommand(call->node, args->node, target->parser);
        } else if (is_group_method(method) && target->kind == Binding::Kind::Parser) {
            bind(call->node, *target);
        }
    }

    const std::vector<ParserState>& parsers() const { return parsers_; }
    const std::vector<size_t>& roots() const { return roots_; }

private:
    void on_parser(TSNode call, TSNode args) {
        auto variable = assigned_name(call, source_);
        if (!variable) {
            spdlog::debug("Ignoring unbound ArgumentParser at line {}", ts_node_start_point(call).row + 1);
            return;
        }

        ParserState state;
        state.description = describe_command(args, source_);

        TSNode function = enclosing_function(call);
        if (!syntax::is_null(function)) {
            claimed_.insert(ts_node_start_byte(function));
            if (state.description.empty()) {
                state.description = python::summary(python::documentation(function, source_));
            }
        }

        parsers_.push_back(std::move(state));
        roots_.push_back(parsers_.size() - 1);
        bindings_[*variable] = {Binding::Kind::Parser, parsers_.size() - 1};
    }

    void on_subcommand(TSNode call, TSNode args, size_t parent) {
        auto positional = python::positional_arguments(args);
        std::optional<std::string> command;
        if (!positional.empty()) {
            command = python::string_literal(positional.front(), source_);
        }
        if (!command || command->empty()) {
            return;
        }

        ParserState state;
        state.command = *command;
        state.description = describe_command(args, source_);
        parsers_.push_back(std::move(state));
        size_t index = parsers_.size() - 1;
        parsers_[parent].children.push_back(index);

        bind(call, {Binding::Kind::Parser, index});
    }

    void bind(TSNode call, Binding binding) {
        if (auto variable = assigned_name(call, source_)) {
            bindings_[*variable] = binding;
        }
    }

    std::optional<Binding> resolve(TSNode object) const {
        auto it = bindings_.find(syntax::text(object, source_));
        if (it != bindings_.end()) {
            return it->second;
        }
        // parser.add_argument_group("x").add_argument(...)
        if (syntax::is(object, "call")) {
            TSNode function = syntax::field(object, "function");
            if (syntax::is(function, "attribute") &&
                is_group_method(syntax::text(syntax::field(function, "attribute"), source_))) {
                return resolve(syntax::field(function, "object"));
            }
        }
        return std::nullopt;
    }

    std::string_view source_;
    ClaimedFunctions& claimed_;
    std::vector<ParserState> parsers_;
    std::vector<size_t> roots_;
    std::map<std::string, Binding> bindings_;
};

void append_arguments(const ParserState& parser, CliCommand& command, std::set<std::string>& seen) {
    for (const auto& spec : parser.arguments) {
        if (!seen.insert(spec.parameter.name).second) {
            spdlog::debug("Duplicate argument '{}' in command {}", spec.parameter.name, command.name);
            continue;
        }
        command.parameters.push_back(spec.parameter);
        command.args.insert(command.args.end(), spec.tokens.begin(), spec.tokens.end());
    }
}

void collect_subcommands(const std::vector<ParserState>& parsers, size_t index,
                         const CliCommand& inherited, const std::set<std::string>& seen,
                         std::vector<CliCommand>& out) {
    const ParserState& parser = parsers[index];

    CliCommand command = inherited;
    std::set<std::string> names = seen;
    std::string own = parser.command;
    std::replace(own.begin(), own.end(), '-', '_');
    command.name = inherited.name.empty() ? own : inherited.name + "_" + own;
    command.name = python::sanitize_identifier(command.name);
    command.description = parser.description.empty()
        ? python::humanize(parser.command)
        : parser.description;
    command.args.push_back(parser.command);
    append_arguments(parser, command, names);

    if (parser.children.empty()) {
        out.push_back(std::move(command));
        return;
    }
    for (size_t child : parser.children) {
        collect_subcommands(parsers, child, command, names, out);
    }
}

} // namespace

ArgparseExtractor::ArgparseExtractor(QueryEngine& engine)
    : engine_(engine) {}

std::vector<CliCommand> ArgparseExtractor::extract(const SourceFile& file, ClaimedFunctions& claimed) {
    auto matches = engine_.execute(*file.tree, QueryType::CALLS, file.source);
    std::stable_sort(matches.begin(), matches.end(), [](const QueryMatch& a, const QueryMatch& b) {
        const QueryCapture* ca = a.find("call");
        const QueryCapture* cb = b.find("call");
        uint32_t sa = ca ? ts_node_start_byte(ca->node) : 0;
        uint32_t sb = cb ? ts_node_start_byte(cb->node) : 0;
        return sa < sb;
    });

    ParserTracker tracker(file.source, claimed);
    for (const auto& match : matches) {
        tracker.visit(match);
    }

    std::vector<CliCommand> commands;
    const auto& parsers = tracker.parsers();
    for (size_t root : tracker.roots()) {
        const ParserState& parser = parsers[root];

        CliCommand base;
        std::set<std::string> seen;
        append_arguments(parser, base, seen);

        if (parser.children.empty()) {
            base.name = python::sanitize_identifier(file.stem());
            base.description = parser.description.empty()
                ? python::humanize(file.stem())
                : parser.description;
            commands.push_back(std::move(base));
            continue;
        }

        for (size_t child : parser.children) {
            collect_subcommands(parsers, child, base, seen, commands);
        }
    }

    spdlog::debug("{}: {} argparse command(s)", file.relative.string(), commands.size());
    return commands;
}

} // namespace mcpify
