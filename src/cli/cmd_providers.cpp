/*
 * geofetch/src/cli/cmd_providers.cpp
 *
 * `geofetch providers`: load the provider configuration eagerly (every credential reference
 * resolved) and list the resulting profiles. Secrets are never printed.
 */

#include <geofetch/cli/commands.h>
#include <geofetch/config/config_helpers.h>
#include <geofetch/config/provider_config.h>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace geofetch::cli {

using json = nlohmann::json;
using namespace geofetch::downloader;

namespace {

std::string describe_limit(std::uint32_t limit) {
    return limit == 0 ? std::string("unlimited") : std::to_string(limit);
}

} // namespace

void registerProvidersCommand(CLI::App& app, std::shared_ptr<CliState> state) {
    auto* sub = app.add_subcommand(
        "providers", "Validate the provider configuration and list the resolved profiles.");

    auto emitJson = std::make_shared<bool>(false);
    sub->add_flag("--json", *emitJson, "Emit profiles as JSON.");

    sub->callback([state, emitJson]() {
        const auto path = config::get_config_path(state->configPath);
        CredentialResolver resolver;
        auto loaded = config::load_provider_config(path, resolver);
        if (!loaded.ok()) {
            spdlog::error("{} ({}): {}", path.string(), errorCodeName(loaded.error().code),
                          loaded.error().message);
            state->exitCode = 2;
            return;
        }

        const auto& registry = *loaded.value().registry;
        if (*emitJson) {
            json arr = json::array();
            for (const auto& p : registry.profiles()) {
                json codes = json::object();
                for (const auto& [code, reason] : p->softFailureCodes)
                    codes[std::to_string(code)] = reason;
                json params = json::array();
                for (const auto& [name, _] : p->requestParameters)
                    params.push_back(name);
                const std::string auth(authTypeName(p->authType()));
                arr.push_back({{"match", p->match},
                               {"authentication_type", auth},
                               {"max_parallel_downloads", p->maxParallelDownloads},
                               {"invalid_status_codes", codes},
                               {"request_parameters", params}});
            }
            fmt::print("{}\n", arr.dump(2));
        } else {
            fmt::print("Configuration: {}\n", path.string());
            fmt::print("Unmatched URLs: {} (limit {})\n",
                       unmatchedUrlPolicyName(registry.options().unmatched),
                       describe_limit(registry.options().unmatchedMaxParallel));
            for (const auto& p : registry.profiles()) {
                fmt::print("  {}\n", config::sanitize_for_terminal(p->match));
                fmt::print("    auth: {}, max parallel: {}\n", authTypeName(p->authType()),
                           describe_limit(p->maxParallelDownloads));
                for (const auto& [code, reason] : p->softFailureCodes)
                    fmt::print("    retry on {}: {}\n", code, reason);
            }
        }
        state->exitCode = 0;
    });
}

} // namespace geofetch::cli
