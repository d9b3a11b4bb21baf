#include "Version.hpp"
#include "detect/StrategySelector.hpp"
#include "dispatch/Dispatcher.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "schema/ConfigLoader.hpp"
#include "schema/Errors.hpp"
#include "schema/Validator.hpp"
#include "tools/DispatcherTool.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>

namespace {
    std::atomic<bool> shutdown_requested{false};
    std::atomic<mcpify::MCPServer*> global_server{nullptr};

    // Only lock-free atomic stores happen here; MCPServer::stop() is one.
    void signal_handler(int signal) {
        shutdown_requested = true;
        if (mcpify::MCPServer* server = global_server.load()) {
            server->stop();
        }
        static_cast<void>(signal);
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }

    bool configure_logging(const std::string& log_level) {
        // stdout carries protocol traffic and command output
        spdlog::set_default_logger(spdlog::stderr_color_mt("mcpify"));

        auto level = spdlog::level::from_str(log_level);
        if (level == spdlog::level::off && log_level != "off") {
            std::cerr << "Invalid log level: " << log_level << std::endl;
            return false;
        }
        spdlog::set_level(level);
        return true;
    }

    void print_report(const mcpify::ValidationReport& report) {
        for (const auto& d : report.diagnostics) {
            std::cerr << mcpify::to_string(d.severity) << ": " << d.location << ": " << d.message << "\n";
        }
    }

    void print_overview(const mcpify::Configuration& config) {
        using namespace mcpify;
        std::cout << config.name << "\n";
        if (!config.description.empty()) {
            std::cout << "  " << config.description << "\n";
        }
        std::cout << "backend: " << to_string(backend_kind(config.backend)) << "\n";
        std::cout << "tools (" << config.tools.size() << "):\n";
        for (const auto& tool : config.tools) {
            std::cout << "  " << tool.name;
            if (!tool.description.empty()) {
                std::cout << " - " << tool.description;
            }
            std::cout << "\n";
            for (const auto& param : tool.parameters) {
                std::cout << "      " << param.name << ": " << to_string(param.type)
                          << (param.is_mandatory() ? "" : " (optional)");
                if (param.default_value) {
                    std::cout << " = " << param.default_value->dump();
                }
                if (!param.description.empty()) {
                    std::cout << "  " << param.description;
                }
                std::cout << "\n";
            }
        }
    }

    std::optional<std::chrono::milliseconds> timeout_override(int seconds) {
        if (seconds <= 0) {
            return std::nullopt;
        }
        return std::chrono::seconds(seconds);
    }
}

int main(int argc, char** argv) {
    CLI::App app{"mcpify - expose existing projects as MCP tools"};
    app.require_subcommand(0, 1);

    std::string log_level = "info";
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error, critical)")
        ->default_val("info");

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    // detect
    auto* detect_cmd = app.add_subcommand("detect", "Detect the tools a project exposes");
    std::string project_dir;
    std::string output_file;
    mcpify::StrategyPreferences preferences;
    bool no_external = false;
    mcpify::DetectorOptions detector_options;
    std::vector<std::string> extra_ignores;
    detect_cmd->add_option("project", project_dir, "Project root directory")->required()->check(CLI::ExistingDirectory);
    detect_cmd->add_option("-o,--output", output_file, "Write the configuration to this file instead of stdout");
    detect_cmd->add_option("--strategy", preferences.strategy, "Detection strategy: auto, structural or llm")
        ->default_val("auto");
    detect_cmd->add_flag("--no-external", no_external, "Never use strategies that call remote services");
    detect_cmd->add_option("--ignore", extra_ignores, "Additional ignore patterns (glob, matched per path component)");
    detect_cmd->add_option("--max-file-size", detector_options.scan.max_file_size, "Skip source files larger than this (bytes)")
        ->default_val(detector_options.scan.max_file_size);
    detect_cmd->add_option("--base-url", detector_options.http_base_url, "Base URL recorded for detected web services")
        ->default_val(detector_options.http_base_url);
    detect_cmd->add_option("--python", detector_options.python_interpreter, "Python interpreter recorded in the configuration")
        ->default_val(detector_options.python_interpreter);
    detect_cmd->add_option("--timeout", detector_options.timeout_seconds, "Per-call timeout recorded in the configuration (seconds)")
        ->default_val(detector_options.timeout_seconds);

    // view
    auto* view_cmd = app.add_subcommand("view", "Summarize a configuration file");
    std::string config_file;
    view_cmd->add_option("config", config_file, "Configuration file")->required()->check(CLI::ExistingFile);

    // validate
    auto* validate_cmd = app.add_subcommand("validate", "Check a configuration file for consistency");
    validate_cmd->add_option("config", config_file, "Configuration file")->required()->check(CLI::ExistingFile);

    // serve
    auto* serve_cmd = app.add_subcommand("serve", "Serve a configuration as an MCP server over stdio");
    serve_cmd->alias("start");
    int serve_timeout = 0;
    serve_cmd->add_option("config", config_file, "Configuration file")->required()->check(CLI::ExistingFile);
    serve_cmd->add_option("--timeout", serve_timeout, "Override the per-call timeout (seconds)");

    // call
    auto* call_cmd = app.add_subcommand("call", "Invoke one tool and print the result");
    std::string tool_name;
    std::string call_args = "{}";
    int call_timeout = 0;
    call_cmd->add_option("config", config_file, "Configuration file")->required()->check(CLI::ExistingFile);
    call_cmd->add_option("tool", tool_name, "Tool name")->required();
    call_cmd->add_option("-a,--args", call_args, "Arguments as a JSON object");
    call_cmd->add_option("--timeout", call_timeout, "Override the per-call timeout (seconds)");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << "mcpify version " << MCPIFY_VERSION << std::endl;
        return 0;
    }

    if (!configure_logging(log_level)) {
        return 1;
    }

    try {
        if (*detect_cmd) {
            auto& ignores = detector_options.scan.ignore_patterns;
            ignores.insert(ignores.end(), extra_ignores.begin(), extra_ignores.end());
            preferences.allow_external = !no_external;

            auto registry = mcpify::DetectorRegistry::with_defaults(detector_options);
            mcpify::StrategySelector selector(registry);
            auto detector = selector.select(preferences);
            spdlog::info("Detecting {} with the {} strategy", project_dir, detector.name());

            auto result = detector.detect(project_dir);
            spdlog::info("Strategy used: {}", result.strategy);

            auto report = mcpify::ConfigValidator::validate(result.configuration);
            print_report(report);

            if (output_file.empty()) {
                std::cout << mcpify::ConfigLoader::to_json(result.configuration).dump(2) << std::endl;
            } else {
                mcpify::ConfigLoader::save_file(result.configuration, output_file);
                spdlog::info("Configuration written to {}", output_file);
            }
            return report.is_valid ? 0 : 1;
        }

        if (*view_cmd) {
            auto config = mcpify::ConfigLoader::load_file(config_file);
            print_overview(config);
            return 0;
        }

        if (*validate_cmd) {
            auto config = mcpify::ConfigLoader::load_file(config_file);
            auto report = mcpify::ConfigValidator::validate(config);
            std::cout << report.to_json().dump(2) << std::endl;
            return report.is_valid ? 0 : 1;
        }

        if (*serve_cmd) {
            setup_signal_handlers();

            auto dispatcher = std::make_shared<const mcpify::Dispatcher>(
                mcpify::ConfigLoader::load_file(config_file));
            auto transport = std::make_unique<mcpify::StdioTransport>();
            auto server = std::make_unique<mcpify::MCPServer>(
                std::move(transport),
                mcpify::ServerInfo{dispatcher->configuration().name, MCPIFY_VERSION});

            // Store global reference for signal handler
            global_server = server.get();

            mcpify::DispatcherTool::register_all(*server, dispatcher, timeout_override(serve_timeout));
            spdlog::info("All tools registered, starting server");

            // Run server (blocks until stopped)
            server->run();

            global_server = nullptr;
            if (shutdown_requested) {
                spdlog::info("Shutdown requested by signal");
            }
            spdlog::info("Server stopped cleanly");
            return 0;
        }

        if (*call_cmd) {
            auto arguments = nlohmann::json::parse(call_args, nullptr, false);
            if (arguments.is_discarded()) {
                std::cerr << "--args is not valid JSON" << std::endl;
                return 2;
            }

            mcpify::Dispatcher dispatcher(mcpify::ConfigLoader::load_file(config_file));
            mcpify::InvocationOptions options;
            options.timeout = timeout_override(call_timeout);

            auto result = dispatcher.invoke(tool_name, arguments, options);
            std::cout << result.to_json().dump(2) << std::endl;
            return result.ok ? 0 : 1;
        }

        std::cout << app.help() << std::endl;
        return 0;

    } catch (const mcpify::InvalidConfigurationError& e) {
        spdlog::error("{}", e.what());
        print_report(e.report());
        return 1;
    } catch (const mcpify::SchemaError& e) {
        spdlog::error("Malformed configuration: {}", e.what());
        return 1;
    } catch (const mcpify::DetectionError& e) {
        spdlog::error("Detection failed: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
