#include <geofetch/downloader/credential_resolver.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>

namespace geofetch::downloader {

std::optional<std::string> ProcessEnvironment::lookup(std::string_view name) const {
    const std::string key(name);
    if (const char* v = std::getenv(key.c_str()); v != nullptr) {
        return std::string(v);
    }
    return std::nullopt;
}

std::optional<std::string> MapEnvironment::lookup(std::string_view name) const {
    auto it = vars_.find(name);
    if (it == vars_.end())
        return std::nullopt;
    return it->second;
}

CredentialResolver::CredentialResolver(std::shared_ptr<const IEnvironment> env)
    : env_(std::move(env)) {
    if (!env_)
        env_ = std::make_shared<ProcessEnvironment>();
}

Expected<std::string> CredentialResolver::resolve(const SecretRef& ref) const {
    if (!ref.isEnvironment()) {
        return ref.value;
    }
    if (ref.value.empty()) {
        return Error{ErrorCode::ConfigurationError, "empty environment variable name"};
    }
    auto value = env_->lookup(ref.value);
    if (!value) {
        return Error{ErrorCode::MissingCredential,
                     "environment variable '" + ref.value + "' is not set"};
    }
    spdlog::debug("Resolved credential from environment variable {}", ref.value);
    return std::move(*value);
}

} // namespace geofetch::downloader
