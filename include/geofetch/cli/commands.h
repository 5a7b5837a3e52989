#pragma once

#include <atomic>
#include <memory>
#include <string>

namespace CLI {
class App;
}

namespace geofetch::cli {

// State shared by the subcommands of one invocation
struct CliState {
    std::string configPath;           // --config, empty = default lookup
    int exitCode{0};                  // set by the subcommand callback
    std::atomic<bool>* interrupted{}; // raised by SIGINT/SIGTERM
};

void registerDownloadCommand(CLI::App& app, std::shared_ptr<CliState> state);
void registerProvidersCommand(CLI::App& app, std::shared_ptr<CliState> state);

} // namespace geofetch::cli
