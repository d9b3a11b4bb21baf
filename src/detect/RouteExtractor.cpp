#include "detect/RouteExtractor.hpp"
#include "core/SyntaxNode.hpp"
#include "detect/PythonSyntax.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <set>

namespace mcpify {

namespace {

const std::set<std::string> kVerbs = {"get", "post", "put", "patch", "delete"};
const std::set<std::string> kRouteDecorators = {"route", "api_route"};
const std::set<std::string> kMethods = {"GET", "POST", "PUT", "PATCH", "DELETE"};

// Framework-injected parameters that are not part of the request surface
const std::set<std::string> kInjectedTypes = {
    "Request", "Response", "BackgroundTasks", "WebSocket", "HTTPConnection", "Session"
};
const std::set<std::string> kDependencyMarkers = {"Depends", "Security"};
const std::set<std::string> kParamMarkers = {"Query", "Path", "Body", "Form", "Header", "Cookie", "File"};

std::string last_component(std::string_view dotted) {
    size_t dot = dotted.rfind('.');
    return std::string(dot == std::string_view::npos ? dotted : dotted.substr(dot + 1));
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

ParamType converter_type(std::string_view converter) {
    if (converter == "int") return ParamType::Integer;
    if (converter == "float") return ParamType::Number;
    return ParamType::String;
}

std::optional<std::string> route_path(TSNode args, std::string_view source) {
    auto positional = python::positional_arguments(args);
    if (!positional.empty()) {
        return python::string_literal(positional.front(), source);
    }
    for (const char* key : {"path", "rule"}) {
        if (auto node = python::keyword_argument(args, key, source)) {
            return python::string_literal(*node, source);
        }
    }
    return std::nullopt;
}

std::vector<std::string> route_methods(const std::string& verb, TSNode args, std::string_view source) {
    if (kVerbs.count(verb)) {
        return {upper(verb)};
    }

    std::vector<std::string> methods;
    if (auto node = python::keyword_argument(args, "methods", source)) {
        auto value = python::literal_value(*node, source);
        if (value && value->is_array()) {
            for (const auto& item : *value) {
                if (!item.is_string()) {
                    continue;
                }
                std::string method = upper(item.get<std::string>());
                if (kMethods.count(method) &&
                    std::find(methods.begin(), methods.end(), method) == methods.end()) {
                    methods.push_back(method);
                }
            }
        }
        return methods;
    }
    return {"GET"};
}

struct QueryDefault {
    bool skip = false;  // framework-injected dependency
    std::optional<json> value;
};

// Default of a query parameter with Query(...)-style markers unwrapped.
QueryDefault query_default(const python::FormalParameter& formal, std::string_view source) {
    QueryDefault result;
    if (!formal.has_default) {
        return result;
    }

    TSNode node = formal.default_node;
    if (syntax::is(node, "call")) {
        std::string marker = last_component(syntax::text(syntax::field(node, "function"), source));
        if (kDependencyMarkers.count(marker)) {
            result.skip = true;
            return result;
        }
        if (!kParamMarkers.count(marker)) {
            return result;
        }
        TSNode args = syntax::field(node, "arguments");
        auto positional = python::positional_arguments(args);
        if (!positional.empty()) {
            node = positional.front();
        } else if (auto keyword = python::keyword_argument(args, "default", source)) {
            node = *keyword;
        } else {
            return result;
        }
    }

    auto value = python::literal_value(node, source);
    if (value && !value->is_null()) {
        result.value = value;
    }
    return result;
}

} // namespace

RouteExtractor::RouteExtractor(QueryEngine& engine)
    : engine_(engine) {}

RoutePath RouteExtractor::parse_path(std::string_view path) {
    RoutePath result;

    for (size_t i = 0; i < path.size(); ++i) {
        char open = path[i];
        char close = open == '{' ? '}' : (open == '<' ? '>' : '\0');
        size_t end = close ? path.find(close, i + 1) : std::string_view::npos;
        if (end == std::string_view::npos) {
            result.endpoint.push_back(open);
            continue;
        }

        std::string_view segment = path.substr(i + 1, end - i - 1);
        std::string_view name = segment;
        std::string_view converter;
        size_t colon = segment.find(':');
        if (colon != std::string_view::npos) {
            // {name:conv} vs <conv:name>
            if (open == '{') {
                name = segment.substr(0, colon);
                converter = segment.substr(colon + 1);
            } else {
                converter = segment.substr(0, colon);
                name = segment.substr(colon + 1);
            }
        }

        if (name.empty()) {
            result.endpoint += std::string(path.substr(i, end - i + 1));
            i = end;
            continue;
        }

        Parameter param;
        param.name = std::string(name);
        param.type = converter_type(converter);
        param.required = true;
        param.description = python::humanize(param.name);
        result.parameters.push_back(std::move(param));

        result.endpoint += "{" + std::string(name) + "}";
        i = end;
    }

    return result;
}

std::vector<Tool> RouteExtractor::extract(const SourceFile& file, ClaimedFunctions& claimed) {
    std::vector<Tool> tools;
    auto matches = engine_.execute(*file.tree, QueryType::ROUTE_DECORATORS, file.source);

    for (const auto& match : matches) {
        const QueryCapture* verb = match.find("verb");
        const QueryCapture* args = match.find("args");
        const QueryCapture* function = match.find("function");
        const QueryCapture* name = match.find("name");
        if (!verb || !args || !function || !name) {
            continue;
        }
        if (!kVerbs.count(verb->text) && !kRouteDecorators.count(verb->text)) {
            continue;
        }

        auto path = route_path(args->node, file.source);
        if (!path) {
            spdlog::debug("{}:{}: route without a literal path", file.relative.string(), verb->line + 1);
            continue;
        }
        auto methods = route_methods(verb->text, args->node, file.source);
        if (methods.empty()) {
            continue;
        }

        claimed.insert(ts_node_start_byte(function->node));

        RoutePath route = parse_path(*path);
        std::string doc = python::documentation(function->node, file.source);
        auto param_docs = python::parameter_docs(doc);

        std::vector<Parameter> parameters = route.parameters;
        for (auto& param : parameters) {
            auto it = param_docs.find(param.name);
            if (it != param_docs.end() && !it->second.empty()) {
                param.description = it->second;
            }
        }

        for (const auto& formal : python::formal_parameters(function->node, file.source)) {
            bool in_path = std::any_of(parameters.begin(), parameters.end(),
                                       [&](const Parameter& p) { return p.name == formal.name; });
            if (in_path) {
                continue;
            }
            if (formal.annotation && kInjectedTypes.count(last_component(*formal.annotation))) {
                continue;
            }
            QueryDefault def = query_default(formal, file.source);
            if (def.skip) {
                continue;
            }

            Parameter param;
            param.name = formal.name;
            param.required = false;
            param.default_value = def.value;
            if (formal.annotation) {
                param.type = python::type_from_annotation(*formal.annotation).value_or(ParamType::String);
            } else if (def.value) {
                param.type = python::type_of_literal(*def.value);
            }
            auto it = param_docs.find(param.name);
            param.description = it != param_docs.end() && !it->second.empty()
                ? it->second
                : python::humanize(param.name);
            parameters.push_back(std::move(param));
        }

        std::string summary = python::summary(doc);
        for (const auto& method : methods) {
            Tool tool;
            tool.name = methods.size() > 1 ? name->text + "_" + lower(method) : name->text;
            tool.name = python::sanitize_identifier(tool.name);
            tool.description = summary.empty() ? python::humanize(name->text) : summary;
            tool.parameters = parameters;
            tool.invocation = HttpInvocation{route.endpoint, method};
            tools.push_back(std::move(tool));
        }
    }

    spdlog::debug("{}: {} route(s)", file.relative.string(), tools.size());
    return tools;
}

} // namespace mcpify
