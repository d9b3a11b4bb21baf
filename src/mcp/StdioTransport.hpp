#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace mcpify {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads JSON messages line-by-line from stdin
 * Writes JSON messages line-by-line to stdout with flush
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    json read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace mcpify
