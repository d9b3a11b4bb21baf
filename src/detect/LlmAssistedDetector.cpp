#include "detect/LlmAssistedDetector.hpp"
#include "net/HttpEndpoint.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace mcpify {

namespace {

constexpr const char* kSystemPrompt =
    "You document command-line tools, HTTP endpoints and Python functions for "
    "use by an AI assistant. Given a JSON list of tools, write a concise, "
    "accurate one-sentence description for every tool and every parameter. "
    "Do not rename anything and do not add or remove tools or parameters. "
    "Reply with JSON only: {\"tools\": [{\"name\": str, \"description\": str, "
    "\"parameters\": {<parameter name>: <description>}}]}.";

std::string env_or(const char* name, std::string fallback) {
    const char* value = std::getenv(name);
    return value && *value ? std::string(value) : std::move(fallback);
}

json describe_tools(const Configuration& config) {
    json tools = json::array();
    for (const auto& tool : config.tools) {
        json params = json::array();
        for (const auto& param : tool.parameters) {
            params.push_back({
                {"name", param.name},
                {"type", std::string(to_string(param.type))},
                {"description", param.description}
            });
        }
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"parameters", params}
        });
    }
    return {
        {"project", config.name},
        {"project_description", config.description},
        {"backend", std::string(to_string(backend_kind(config.backend)))},
        {"tools", tools}
    };
}

// Models sometimes wrap JSON in a fenced code block.
std::string strip_code_fence(std::string content) {
    auto open = content.find("```");
    if (open == std::string::npos) {
        return content;
    }
    auto body_start = content.find('\n', open);
    auto close = content.rfind("```");
    if (body_start == std::string::npos || close <= body_start) {
        return content;
    }
    return content.substr(body_start + 1, close - body_start - 1);
}

} // namespace

LlmSettings LlmSettings::from_environment() {
    LlmSettings settings;
    settings.api_key = env_or("OPENAI_API_KEY", "");
    settings.base_url = env_or("OPENAI_BASE_URL", settings.base_url);
    settings.model = env_or("MCPIFY_LLM_MODEL", settings.model);
    return settings;
}

LlmAssistedDetector::LlmAssistedDetector(DetectorOptions options, LlmSettings settings)
    : structural_(std::move(options)), settings_(std::move(settings)) {}

bool LlmAssistedDetector::is_available() const {
    if (settings_.api_key.empty()) {
        return false;
    }
    auto endpoint = HttpEndpoint::parse(settings_.base_url);
    if (!endpoint || !scheme_supported(*endpoint)) {
        spdlog::debug("LLM endpoint {} not usable in this build", settings_.base_url);
        return false;
    }
    return true;
}

json LlmAssistedDetector::request_suggestions(const Configuration& config) const {
    auto endpoint = HttpEndpoint::parse(settings_.base_url);
    if (!endpoint) {
        throw std::runtime_error("invalid endpoint " + settings_.base_url);
    }

    auto cli = make_client(*endpoint, std::chrono::seconds(settings_.timeout_seconds));
    httplib::Headers headers = {{"Authorization", "Bearer " + settings_.api_key}};

    json request = {
        {"model", settings_.model},
        {"temperature", 0},
        {"response_format", {{"type", "json_object"}}},
        {"messages", json::array({
            {{"role", "system"}, {"content", kSystemPrompt}},
            {{"role", "user"}, {"content", describe_tools(config).dump(2)}}
        })}
    };

    auto res = cli->Post(join_path(endpoint->base_path, "/chat/completions"), headers,
                         request.dump(), "application/json");
    if (!res) {
        throw std::runtime_error("request failed: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        throw std::runtime_error("/chat/completions returned HTTP " + std::to_string(res->status));
    }

    auto body = json::parse(res->body, nullptr, false);
    if (body.is_discarded() || !body.contains("choices") || !body["choices"].is_array() ||
        body["choices"].empty() || !body["choices"][0].contains("message") ||
        !body["choices"][0]["message"].contains("content") ||
        !body["choices"][0]["message"]["content"].is_string()) {
        throw std::runtime_error("unexpected completion payload");
    }

    auto content = strip_code_fence(body["choices"][0]["message"]["content"].get<std::string>());
    auto suggestions = json::parse(content, nullptr, false);
    if (suggestions.is_discarded() || !suggestions.is_object()) {
        throw std::runtime_error("model reply is not a JSON object");
    }
    return suggestions;
}

void LlmAssistedDetector::merge_descriptions(Configuration& config, const json& suggestions) {
    if (!suggestions.contains("tools") || !suggestions["tools"].is_array()) {
        return;
    }

    for (const auto& suggestion : suggestions["tools"]) {
        if (!suggestion.is_object() || !suggestion.contains("name") || !suggestion["name"].is_string()) {
            continue;
        }
        auto name = suggestion["name"].get<std::string>();
        auto it = std::find_if(config.tools.begin(), config.tools.end(),
                               [&](const Tool& t) { return t.name == name; });
        if (it == config.tools.end()) {
            spdlog::debug("Ignoring suggestion for unknown tool {}", name);
            continue;
        }

        if (suggestion.contains("description") && suggestion["description"].is_string()) {
            auto text = suggestion["description"].get<std::string>();
            if (!text.empty()) {
                it->description = text;
            }
        }

        if (!suggestion.contains("parameters") || !suggestion["parameters"].is_object()) {
            continue;
        }
        for (auto& param : it->parameters) {
            auto p = suggestion["parameters"].find(param.name);
            if (p != suggestion["parameters"].end() && p->is_string() && !p->get<std::string>().empty()) {
                param.description = p->get<std::string>();
            }
        }
    }
}

DetectionResult LlmAssistedDetector::detect(const std::filesystem::path& root) const {
    DetectionResult result = structural_.detect(root);
    if (result.configuration.tools.empty()) {
        return result;
    }

    try {
        json suggestions = request_suggestions(result.configuration);
        merge_descriptions(result.configuration, suggestions);
        result.strategy = name();
        spdlog::info("Descriptions enhanced by {}", settings_.model);
    } catch (const std::exception& e) {
        spdlog::warn("LLM enhancement failed, keeping structural result: {}", e.what());
    }

    return result;
}

} // namespace mcpify
