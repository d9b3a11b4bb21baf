#pragma once

#include "core/QueryEngine.hpp"
#include "detect/SourceFile.hpp"
#include "schema/Configuration.hpp"
#include <string>
#include <vector>

namespace mcpify {

/**
 * @brief A command recovered from argparse declarations
 *
 * The argument template does not include the script path; the detector
 * decides whether it goes into the backend base args or each template.
 */
struct CliCommand {
    std::string name;
    std::string description;
    std::vector<Parameter> parameters;
    std::vector<std::string> args;
};

/**
 * @brief Recovers command-line surfaces from argparse usage
 *
 * Tracks ArgumentParser variables, argument groups, subparser groups and
 * their add_parser() subcommands through the calls of a file, in source
 * order. Each top-level parser becomes one command, or one command per
 * subcommand when subparsers are declared.
 */
class ArgparseExtractor {
public:
    explicit ArgparseExtractor(QueryEngine& engine);

    /**
     * @brief Extract commands from one file
     * @param file Parsed source file
     * @param claimed Receives the functions that build a parser
     */
    std::vector<CliCommand> extract(const SourceFile& file, ClaimedFunctions& claimed);

private:
    QueryEngine& engine_;
};

} // namespace mcpify
