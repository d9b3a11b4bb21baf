#include "detect/StrategySelector.hpp"
#include "detect/LlmAssistedDetector.hpp"
#include "schema/Errors.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpify {

namespace {

constexpr const char* kStructural = "structural";

} // namespace

void DetectorRegistry::add(std::unique_ptr<IDetector> detector) {
    detectors_.push_back(std::move(detector));
}

const IDetector* DetectorRegistry::find(const std::string& name) const {
    for (const auto& detector : detectors_) {
        if (detector->name() == name) {
            return detector.get();
        }
    }
    return nullptr;
}

DetectorRegistry DetectorRegistry::with_defaults(const DetectorOptions& options) {
    DetectorRegistry registry;
    registry.add(std::make_unique<LlmAssistedDetector>(options, LlmSettings::from_environment()));
    registry.add(std::make_unique<StructuralDetector>(options));
    return registry;
}

StrategySelector::StrategySelector(const DetectorRegistry& registry)
    : registry_(registry) {}

DetectorHandle StrategySelector::select(const StrategyPreferences& preferences) const {
    if (preferences.strategy != "auto") {
        const IDetector* detector = registry_.find(preferences.strategy);
        if (!detector) {
            throw std::invalid_argument("Unknown detection strategy: " + preferences.strategy);
        }
        if (!detector->is_available()) {
            throw DetectionError("Detection strategy '" + preferences.strategy + "' is not available");
        }
        spdlog::debug("Using requested strategy {}", detector->name());
        return DetectorHandle(*detector);
    }

    for (const auto& detector : registry_.detectors()) {
        if (!preferences.allow_external && detector->name() != kStructural) {
            spdlog::debug("Skipping external strategy {}", detector->name());
            continue;
        }
        if (!detector->is_available()) {
            spdlog::debug("Strategy {} unavailable", detector->name());
            continue;
        }
        spdlog::debug("Selected strategy {}", detector->name());
        return DetectorHandle(*detector);
    }

    throw DetectionError("No detection strategy is available");
}

} // namespace mcpify
