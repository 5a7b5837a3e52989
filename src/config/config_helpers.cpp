#include <geofetch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace geofetch::config {

std::filesystem::path get_config_dir() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    if (xdgConfigHome && *xdgConfigHome) {
        return std::filesystem::path(xdgConfigHome) / "geofetch";
    }
    if (homeEnv && *homeEnv) {
        return std::filesystem::path(homeEnv) / ".config" / "geofetch";
    }
    return expand_tilde("~/.config") / "geofetch";
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("GEOFETCH_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "providers.json";
}

std::vector<std::string> read_url_list(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("cannot open URL list: " + path.string());
    }

    std::vector<std::string> urls;
    std::string line;
    while (std::getline(file, line)) {
        trim(line);
        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }
        urls.push_back(line);
    }
    spdlog::debug("Read {} URL(s) from {}", urls.size(), path.string());
    return urls;
}

} // namespace geofetch::config
