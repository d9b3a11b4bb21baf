#pragma once

#include "core/SourceScanner.hpp"
#include "detect/IDetector.hpp"
#include <string>

namespace mcpify {

/**
 * @brief Settings shared by the detection strategies
 */
struct DetectorOptions {
    ScanOptions scan;
    std::string http_base_url = "http://localhost:8000";
    std::string python_interpreter = "python3";
    int timeout_seconds = kDefaultTimeoutSeconds;
};

/**
 * @brief Detection by tree-sitter pattern matching over Python sources
 *
 * Runs the argparse, route and plain-callable extractors over every
 * scanned file, then keeps the backend kind with the most tools (ties:
 * commandline, http, python-module). Output depends only on file contents,
 * so repeated runs on an unchanged tree produce identical configurations.
 */
class StructuralDetector : public IDetector {
public:
    explicit StructuralDetector(DetectorOptions options = {});

    std::string name() const override { return "structural"; }

    bool is_available() const override { return true; }

    DetectionResult detect(const std::filesystem::path& root) const override;

private:
    DetectorOptions options_;
};

} // namespace mcpify
