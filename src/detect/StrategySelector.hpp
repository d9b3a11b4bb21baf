#pragma once

#include "detect/IDetector.hpp"
#include "detect/StructuralDetector.hpp"
#include <memory>
#include <string>
#include <vector>

namespace mcpify {

/**
 * @brief Ordered set of detection strategies, richest first
 *
 * Built explicitly at startup and handed to a StrategySelector; there is
 * no process-wide registry.
 */
class DetectorRegistry {
public:
    void add(std::unique_ptr<IDetector> detector);

    const std::vector<std::unique_ptr<IDetector>>& detectors() const { return detectors_; }

    const IDetector* find(const std::string& name) const;

    /**
     * @brief LLM-assisted strategy followed by the structural one
     */
    static DetectorRegistry with_defaults(const DetectorOptions& options);

private:
    std::vector<std::unique_ptr<IDetector>> detectors_;
};

/**
 * @brief Caller preferences for strategy selection
 */
struct StrategyPreferences {
    std::string strategy = "auto";  // "auto" or a strategy name
    bool allow_external = true;     // false skips strategies that call remote services
};

/**
 * @brief The strategy chosen by a StrategySelector
 *
 * Non-owning; valid while the registry lives.
 */
class DetectorHandle {
public:
    explicit DetectorHandle(const IDetector& detector) : detector_(&detector) {}

    std::string name() const { return detector_->name(); }

    DetectionResult detect(const std::filesystem::path& root) const { return detector_->detect(root); }

private:
    const IDetector* detector_;
};

/**
 * @brief Picks a detection strategy by preference and availability
 *
 * "auto" walks the registry in order and returns the first available
 * strategy; a strategy that is not "structural" counts as external.
 */
class StrategySelector {
public:
    explicit StrategySelector(const DetectorRegistry& registry);

    /**
     * @throws std::invalid_argument for an unknown strategy name
     * @throws DetectionError if the named strategy is unavailable or none is available
     */
    DetectorHandle select(const StrategyPreferences& preferences) const;

private:
    const DetectorRegistry& registry_;
};

} // namespace mcpify
