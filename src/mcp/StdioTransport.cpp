#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace mcpify {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    spdlog::debug("StdioTransport initialized");
}

json StdioTransport::read_message() {
    std::string line;

    // Blank lines between messages are skipped; EOF ends the session.
    while (std::getline(in_, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        json message = json::parse(line, nullptr, false);
        if (message.is_discarded()) {
            spdlog::error("JSON parse error in line: {}", line);
            return json::object();  // answered as an invalid request
        }
        spdlog::trace("Read message: {}", line);
        return message;
    }

    if (in_.eof()) {
        spdlog::debug("Reached end of input stream");
    } else {
        spdlog::error("Error reading from input stream");
    }
    return json();
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump();
    out_ << serialized << std::endl;  // std::endl flushes automatically
    spdlog::trace("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace mcpify
