#pragma once

/*
 * Provider configuration loader.
 *
 * Parses the JSON provider document, resolves every credential reference through the
 * CredentialResolver and builds the immutable ProviderRegistry together with the orchestrator
 * settings. Loading is atomic: every problem found is reported in a single error and no
 * registry is returned.
 */

#include <geofetch/downloader/credential_resolver.hpp>
#include <geofetch/downloader/downloader.hpp>
#include <geofetch/downloader/orchestrator.hpp>
#include <geofetch/downloader/provider_registry.hpp>

#include <filesystem>
#include <memory>
#include <string_view>

namespace geofetch::config {

struct LoadedConfig {
    std::shared_ptr<const downloader::ProviderRegistry> registry;
    downloader::OrchestratorConfig orchestrator;
};

downloader::Expected<LoadedConfig>
parse_provider_config(std::string_view document, const downloader::CredentialResolver& resolver);

downloader::Expected<LoadedConfig>
load_provider_config(const std::filesystem::path& path,
                     const downloader::CredentialResolver& resolver);

} // namespace geofetch::config
