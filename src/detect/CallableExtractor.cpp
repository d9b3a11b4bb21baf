#include "detect/CallableExtractor.hpp"
#include "detect/PythonSyntax.hpp"
#include <spdlog/spdlog.h>

namespace mcpify {

CallableExtractor::CallableExtractor(QueryEngine& engine)
    : engine_(engine) {}

std::vector<Tool> CallableExtractor::extract(const SourceFile& file, const ClaimedFunctions& claimed) {
    std::vector<Tool> tools;
    auto matches = engine_.execute(*file.tree, QueryType::MODULE_FUNCTIONS, file.source);

    for (const auto& match : matches) {
        const QueryCapture* function = match.find("function");
        const QueryCapture* name = match.find("name");
        if (!function || !name) {
            continue;
        }
        if (name->text.empty() || name->text[0] == '_') {
            continue;
        }
        if (claimed.count(ts_node_start_byte(function->node))) {
            continue;
        }

        std::string doc = python::documentation(function->node, file.source);
        auto param_docs = python::parameter_docs(doc);

        Tool tool;
        tool.name = name->text;
        tool.description = python::summary(doc);
        if (tool.description.empty()) {
            tool.description = python::humanize(name->text);
        }

        for (const auto& formal : python::formal_parameters(function->node, file.source)) {
            Parameter param;
            param.name = formal.name;
            if (formal.annotation) {
                param.type = python::type_from_annotation(*formal.annotation).value_or(ParamType::String);
            }
            param.required = !formal.has_default;
            if (formal.has_default) {
                auto value = python::literal_value(formal.default_node, file.source);
                if (value && !value->is_null()) {
                    param.default_value = value;
                }
            }
            auto it = param_docs.find(param.name);
            param.description = it != param_docs.end() && !it->second.empty()
                ? it->second
                : python::humanize(param.name);
            tool.parameters.push_back(std::move(param));
        }

        tool.invocation = PythonInvocation{name->text};
        tools.push_back(std::move(tool));
    }

    spdlog::debug("{}: {} callable(s)", file.relative.string(), tools.size());
    return tools;
}

} // namespace mcpify
