#pragma once

#include "core/QueryEngine.hpp"
#include "detect/SourceFile.hpp"
#include "schema/Configuration.hpp"
#include <vector>

namespace mcpify {

/**
 * @brief Turns public module-level functions into python-module tools
 *
 * Functions claimed by another extractor and private functions (leading
 * underscore) are skipped. The invocation carries the bare function name.
 */
class CallableExtractor {
public:
    explicit CallableExtractor(QueryEngine& engine);

    std::vector<Tool> extract(const SourceFile& file, const ClaimedFunctions& claimed);

private:
    QueryEngine& engine_;
};

} // namespace mcpify
