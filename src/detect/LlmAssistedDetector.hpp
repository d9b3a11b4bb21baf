#pragma once

#include "detect/IDetector.hpp"
#include "detect/StructuralDetector.hpp"
#include <string>

namespace mcpify {

/**
 * @brief Connection settings for an OpenAI-compatible chat endpoint
 */
struct LlmSettings {
    std::string api_key;
    std::string base_url = "https://api.openai.com/v1";
    std::string model = "gpt-4o-mini";
    int timeout_seconds = 60;

    /**
     * @brief Read OPENAI_API_KEY, OPENAI_BASE_URL and MCPIFY_LLM_MODEL
     */
    static LlmSettings from_environment();
};

/**
 * @brief Structural detection with model-written descriptions
 *
 * Runs the structural strategy, then asks a chat model to improve tool and
 * parameter descriptions. Names, parameters and invocation templates are
 * never changed. If the model call fails the structural result is returned
 * and reported as "structural".
 */
class LlmAssistedDetector : public IDetector {
public:
    LlmAssistedDetector(DetectorOptions options, LlmSettings settings);

    std::string name() const override { return "llm"; }

    /**
     * @brief Available when an API key is set and the endpoint scheme is supported by this build
     */
    bool is_available() const override;

    DetectionResult detect(const std::filesystem::path& root) const override;

    /**
     * @brief Apply suggested descriptions to matching tools and parameters
     *
     * @param suggestions {"tools": [{"name", "description", "parameters": {name: text}}]}
     */
    static void merge_descriptions(Configuration& config, const json& suggestions);

private:
    json request_suggestions(const Configuration& config) const;

    StructuralDetector structural_;
    LlmSettings settings_;
};

} // namespace mcpify
