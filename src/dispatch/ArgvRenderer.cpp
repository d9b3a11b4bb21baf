#include "dispatch/ArgvRenderer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace mcpify {

namespace {

bool is_flag_literal(const std::string& token) {
    return token.size() > 1 && token[0] == '-' && extract_placeholders(token).empty();
}

void append_elements(const json& array, std::vector<std::string>& out) {
    for (const auto& element : array) {
        out.push_back(ArgvRenderer::to_text(element));
    }
}

} // namespace

std::string ArgvRenderer::to_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

std::string ArgvRenderer::substitute(std::string_view token, const ArgumentMap& values) {
    std::string out;
    size_t pos = 0;
    while (pos < token.size()) {
        size_t open = token.find('{', pos);
        if (open == std::string_view::npos) {
            break;
        }
        size_t close = token.find('}', open + 1);
        if (close == std::string_view::npos) {
            break;
        }
        std::string_view name = token.substr(open + 1, close - open - 1);
        auto it = values.find(std::string(name));
        if (!is_identifier(name) || it == values.end()) {
            // Not a placeholder, or unbound: keep the brace literally
            out.append(token.substr(pos, open - pos + 1));
            pos = open + 1;
            continue;
        }
        out.append(token.substr(pos, open - pos));
        out += to_text(it->second);
        pos = close + 1;
    }
    out.append(token.substr(pos));
    return out;
}

std::vector<std::string> ArgvRenderer::render_template(const std::vector<std::string>& tokens,
                                                       const ArgumentMap& values) {
    std::vector<std::string> argv;

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& token = tokens[i];

        if (is_flag_literal(token) && i + 1 < tokens.size()) {
            if (auto name = sole_placeholder(tokens[i + 1])) {
                ++i;
                auto it = values.find(*name);
                if (it == values.end()) {
                    continue;
                }
                const json& value = it->second;
                if (value.is_boolean()) {
                    if (value.get<bool>()) {
                        argv.push_back(token);
                    }
                } else if (value.is_array()) {
                    if (!value.empty()) {
                        argv.push_back(token);
                        append_elements(value, argv);
                    }
                } else {
                    argv.push_back(token);
                    argv.push_back(to_text(value));
                }
                continue;
            }
        }

        auto names = extract_placeholders(token);
        if (names.empty()) {
            argv.push_back(token);
            continue;
        }

        bool all_bound = std::all_of(names.begin(), names.end(),
                                     [&](const std::string& n) { return values.count(n) > 0; });
        if (!all_bound) {
            spdlog::trace("Dropping template token '{}' (parameter omitted)", token);
            continue;
        }

        if (auto name = sole_placeholder(token)) {
            const json& value = values.at(*name);
            if (value.is_array()) {
                append_elements(value, argv);
                continue;
            }
        }
        argv.push_back(substitute(token, values));
    }

    return argv;
}

std::vector<std::string> ArgvRenderer::render(const CommandLineBackend& backend,
                                              const CommandLineInvocation& invocation,
                                              const ArgumentMap& values) {
    std::vector<std::string> argv = backend.base_args;
    auto rendered = render_template(invocation.args, values);
    argv.insert(argv.end(), rendered.begin(), rendered.end());
    return argv;
}

} // namespace mcpify
