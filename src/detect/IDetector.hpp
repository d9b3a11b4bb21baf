#pragma once

#include "schema/Configuration.hpp"
#include <filesystem>
#include <string>

namespace mcpify {

/**
 * @brief Outcome of a detection run
 */
struct DetectionResult {
    Configuration configuration;
    std::string strategy;  // name of the strategy that produced the configuration
};

/**
 * @brief Abstract detection strategy
 *
 * Implementations infer a Configuration from a project directory without
 * executing any of its code.
 */
class IDetector {
public:
    virtual ~IDetector() = default;

    /**
     * @brief Stable strategy name ("structural", "llm", ...)
     */
    virtual std::string name() const = 0;

    /**
     * @brief Check whether the strategy's prerequisites are present
     */
    virtual bool is_available() const = 0;

    /**
     * @brief Analyse a project
     * @throws DetectionError if the project cannot be analysed
     */
    virtual DetectionResult detect(const std::filesystem::path& root) const = 0;
};

} // namespace mcpify
