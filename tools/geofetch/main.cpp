#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

#include <CLI/CLI.hpp>

#include <geofetch/cli/commands.h>

namespace {
std::atomic<bool> g_interrupted{false};

void signalHandler(int) {
    g_interrupted = true;
}
} // namespace

int main(int argc, char* argv[]) {
    // Logs go to stderr so stdout stays clean for outcome lines and --json
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("geofetch", console_sink);
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    CLI::App app{"geofetch - provider-aware downloader for remote geospatial products"};
    app.require_subcommand(1);

    auto state = std::make_shared<geofetch::cli::CliState>();
    state->interrupted = &g_interrupted;

    // Option callbacks run while parsing, before any subcommand callback
    app.add_option_function<std::string>(
           "-l,--log-level",
           [](const std::string& level) { spdlog::set_level(spdlog::level::from_str(level)); },
           "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    app.add_option_function<std::string>(
        "--log-file",
        [](const std::string& path) {
            auto file_sink =
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 10 * 1024 * 1024, 3);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            spdlog::default_logger()->sinks().push_back(file_sink);
        },
        "Log file path (optional)");
    app.add_option("-c,--config", state->configPath,
                   "Provider configuration (default: $GEOFETCH_CONFIG or "
                   "$XDG_CONFIG_HOME/geofetch/providers.json)");

    geofetch::cli::registerDownloadCommand(app, state);
    geofetch::cli::registerProvidersCommand(app, state);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
    return state->exitCode;
}
