#include "detect/StructuralDetector.hpp"
#include "core/QueryEngine.hpp"
#include "core/TreeSitterParser.hpp"
#include "detect/ArgparseExtractor.hpp"
#include "detect/CallableExtractor.hpp"
#include "detect/ProjectInfo.hpp"
#include "detect/PythonSyntax.hpp"
#include "detect/RouteExtractor.hpp"
#include "schema/Errors.hpp"
#include <spdlog/spdlog.h>
#include <map>
#include <set>

namespace mcpify {

namespace fs = std::filesystem;

namespace {

struct Candidate {
    Tool tool;
    std::string stem;         // file stem, used to disambiguate names
    std::string module_name;  // dotted module of the defining file
    fs::path file;
};

struct ScriptCommands {
    fs::path relative;
    std::vector<CliCommand> commands;
};

/**
 * @brief Make tool names unique across files
 *
 * A name defined in more than one file gets its file stem as a prefix;
 * anything still colliding gets a numeric suffix.
 */
void assign_unique_names(std::vector<Candidate>& candidates) {
    std::map<std::string, int> counts;
    for (const auto& candidate : candidates) {
        ++counts[candidate.tool.name];
    }

    std::set<std::string> used;
    for (auto& candidate : candidates) {
        std::string name = candidate.tool.name;
        if (counts[name] > 1) {
            name = python::sanitize_identifier(candidate.stem + "_" + name);
        }
        std::string unique = name;
        for (int n = 2; !used.insert(unique).second; ++n) {
            unique = name + "_" + std::to_string(n);
        }
        if (unique != candidate.tool.name) {
            spdlog::debug("Renamed tool {} to {}", candidate.tool.name, unique);
        }
        candidate.tool.name = unique;
    }
}

std::vector<Tool> take_tools(std::vector<Candidate>& candidates) {
    assign_unique_names(candidates);
    std::vector<Tool> tools;
    tools.reserve(candidates.size());
    for (auto& candidate : candidates) {
        tools.push_back(std::move(candidate.tool));
    }
    return tools;
}

} // namespace

StructuralDetector::StructuralDetector(DetectorOptions options)
    : options_(std::move(options)) {}

DetectionResult StructuralDetector::detect(const fs::path& root) const {
    SourceScanner scanner(options_.scan);
    auto files = scanner.scan(root);
    if (files.empty()) {
        throw DetectionError("No Python source files found under " + root.string());
    }
    const fs::path base = fs::canonical(root);

    TreeSitterParser parser;
    QueryEngine engine;
    ArgparseExtractor argparse(engine);
    RouteExtractor routes(engine);
    CallableExtractor callables(engine);

    std::vector<ScriptCommands> scripts;
    std::vector<Candidate> http_tools;
    std::vector<Candidate> python_tools;
    size_t command_count = 0;
    size_t parsed = 0;

    for (const auto& path : files) {
        SourceFile file;
        file.path = path;
        file.relative = path.lexically_relative(base);

        try {
            file.tree = parser.parse_file(path);
        } catch (const std::runtime_error& e) {
            spdlog::warn("Skipping {}: {}", file.relative.string(), e.what());
            continue;
        }
        if (!file.tree) {
            spdlog::warn("Skipping {}: parse failed", file.relative.string());
            continue;
        }
        file.source = parser.last_source();
        if (file.tree->has_error()) {
            spdlog::debug("{} contains syntax errors, analysing the rest", file.relative.string());
        }
        ++parsed;

        ClaimedFunctions claimed;
        auto commands = argparse.extract(file, claimed);
        if (!commands.empty()) {
            command_count += commands.size();
            scripts.push_back({file.relative, std::move(commands)});
        }
        for (auto& tool : routes.extract(file, claimed)) {
            http_tools.push_back({std::move(tool), file.stem(), file.module_name(), file.path});
        }
        for (auto& tool : callables.extract(file, claimed)) {
            python_tools.push_back({std::move(tool), file.stem(), file.module_name(), file.path});
        }
    }

    if (parsed == 0) {
        throw DetectionError("None of the source files under " + root.string() + " could be parsed");
    }

    ProjectInfo info = ProjectInfo::read(base);
    Configuration config;
    config.name = info.name;
    config.description = info.description;

    spdlog::debug("Candidates: {} command(s), {} route(s), {} callable(s)",
                  command_count, http_tools.size(), python_tools.size());

    if (command_count > 0 && command_count >= http_tools.size() && command_count >= python_tools.size()) {
        CommandLineBackend backend;
        backend.executable = options_.python_interpreter;
        backend.working_dir = base.string();
        backend.timeout_seconds = options_.timeout_seconds;

        bool single_script = scripts.size() == 1;
        if (single_script) {
            backend.base_args = {scripts.front().relative.generic_string()};
        }

        std::vector<Candidate> candidates;
        for (auto& script : scripts) {
            std::string script_path = script.relative.generic_string();
            for (auto& command : script.commands) {
                Candidate candidate;
                candidate.tool.name = command.name;
                candidate.tool.description = command.description;
                candidate.tool.parameters = std::move(command.parameters);
                CommandLineInvocation invocation{std::move(command.args)};
                if (!single_script) {
                    invocation.args.insert(invocation.args.begin(), script_path);
                }
                candidate.tool.invocation = std::move(invocation);
                candidate.stem = script.relative.stem().string();
                candidates.push_back(std::move(candidate));
            }
        }

        config.backend = std::move(backend);
        config.tools = take_tools(candidates);
    } else if (!http_tools.empty() && http_tools.size() >= python_tools.size()) {
        HttpBackend backend;
        backend.base_url = options_.http_base_url;
        backend.timeout_seconds = options_.timeout_seconds;

        config.backend = std::move(backend);
        config.tools = take_tools(http_tools);
    } else {
        PythonModuleBackend backend;
        backend.interpreter = options_.python_interpreter;
        backend.timeout_seconds = options_.timeout_seconds;

        std::set<std::string> modules;
        for (const auto& candidate : python_tools) {
            modules.insert(candidate.module_name);
        }

        if (modules.size() == 1) {
            // Single file: import it by path, call by bare name
            backend.module_path = python_tools.front().file.string();
        } else {
            backend.module_path = base.string();
            for (auto& candidate : python_tools) {
                auto& invocation = std::get<PythonInvocation>(candidate.tool.invocation);
                if (!candidate.module_name.empty()) {
                    invocation.function = candidate.module_name + "." + invocation.function;
                }
            }
        }

        config.backend = std::move(backend);
        config.tools = take_tools(python_tools);
    }

    spdlog::info("Detected {} tool(s) in {} ({} backend)", config.tools.size(),
                 base.string(), to_string(backend_kind(config.backend)));

    return {std::move(config), name()};
}

} // namespace mcpify
