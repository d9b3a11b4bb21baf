#pragma once

#include "dispatch/ProcessRunner.hpp"

namespace mcpify {

/**
 * @brief True when a python3 interpreter can be launched from PATH
 */
inline bool python3_available() {
    ProcessRequest request;
    request.argv = {"python3", "--version"};
    request.timeout = std::chrono::milliseconds(10000);
    try {
        return ProcessRunner::run(request).exit_code == 0;
    } catch (const ProcessLaunchError&) {
        return false;
    }
}

} // namespace mcpify
