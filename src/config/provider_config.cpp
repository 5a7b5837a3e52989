#include <geofetch/config/config_helpers.h>
#include <geofetch/config/provider_config.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <type_traits>

namespace geofetch::config {

using json = nlohmann::json;
using namespace geofetch::downloader;

namespace {

// Accumulates every problem of a document so loading can fail once, with all of them
struct Problems {
    std::vector<std::string> messages;
    bool onlyMissingCredentials{true};

    void config(std::string msg) {
        onlyMissingCredentials = false;
        messages.push_back(std::move(msg));
    }
    void missing(std::string msg) { messages.push_back(std::move(msg)); }

    [[nodiscard]] bool empty() const noexcept { return messages.empty(); }

    [[nodiscard]] Error toError() const {
        std::string joined;
        for (const auto& m : messages) {
            if (!joined.empty())
                joined += "; ";
            joined += m;
        }
        return Error{onlyMissingCredentials ? ErrorCode::MissingCredential
                                            : ErrorCode::ConfigurationError,
                     joined};
    }
};

const std::set<std::string> kProviderKeys = {
    "username",       "password",  "client_secret",          "client_id",
    "token_url",      "scope",     "authentication_type",    "max_parallel_downloads",
    "invalid_status_codes",        "request_parameters"};

std::optional<SecretRef> readSecretRef(const json& v, const std::string& where,
                                       Problems& problems) {
    if (v.is_string()) {
        return SecretRef::literal(v.get<std::string>());
    }
    if (v.is_object() && v.size() == 1 && v.contains("env") && v["env"].is_string()) {
        return SecretRef::env(v["env"].get<std::string>());
    }
    problems.config(where + " must be a string or {\"env\": \"NAME\"}");
    return std::nullopt;
}

std::optional<std::string> readSecret(const json& obj, const char* key, const std::string& owner,
                                      const CredentialResolver& resolver, Problems& problems) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return std::nullopt;
    auto ref = readSecretRef(*it, owner + "." + key, problems);
    if (!ref)
        return std::nullopt;
    auto resolved = resolver.resolve(*ref);
    if (!resolved.ok()) {
        if (resolved.error().code == ErrorCode::MissingCredential)
            problems.missing(owner + "." + key + ": " + resolved.error().message);
        else
            problems.config(owner + "." + key + ": " + resolved.error().message);
        return std::nullopt;
    }
    return std::move(resolved).value();
}

std::optional<std::string> readString(const json& obj, const char* key, const std::string& owner,
                                      Problems& problems) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string()) {
        problems.config(owner + "." + key + " must be a string");
        return std::nullopt;
    }
    return it->get<std::string>();
}

template <typename T>
T readNumber(const json& obj, const char* key, T fallback, const std::string& owner,
             Problems& problems, bool allowZero = true) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null())
        return fallback;
    if constexpr (std::is_floating_point_v<T>) {
        if (!it->is_number()) {
            problems.config(owner + key + " must be a number");
            return fallback;
        }
        return it->get<T>();
    } else {
        const bool negative = it->is_number_integer() && !it->is_number_unsigned() &&
                              it->get<std::int64_t>() < 0;
        if (!it->is_number_integer() || negative ||
            (!allowZero && it->get<std::uint64_t>() == 0)) {
            problems.config(owner + key + " must be a " +
                            (allowZero ? "non-negative" : "positive") + " integer");
            return fallback;
        }
        const auto value = it->get<std::uint64_t>();
        const auto limit = static_cast<std::uint64_t>(std::numeric_limits<T>::max());
        if (value > limit) {
            problems.config(owner + key + " must be at most " + std::to_string(limit));
            return fallback;
        }
        return static_cast<T>(value);
    }
}

std::optional<ProviderProfile> parseProvider(const std::string& prefix, const json& p,
                                             const CredentialResolver& resolver,
                                             Problems& problems) {
    const std::string owner = "providers['" + prefix + "']";
    if (!p.is_object()) {
        problems.config(owner + " must be an object");
        return std::nullopt;
    }
    for (const auto& [key, _] : p.items()) {
        if (!kProviderKeys.count(key))
            spdlog::warn("Ignoring unknown key '{}' in {}", key, owner);
    }

    const auto before = problems.messages.size();
    ProviderProfile profile;
    profile.match = prefix;

    auto username = readSecret(p, "username", owner, resolver, problems);
    auto password = readSecret(p, "password", owner, resolver, problems);
    auto clientSecret = readSecret(p, "client_secret", owner, resolver, problems);

    AuthType type = (p.contains("username")) ? AuthType::Basic : AuthType::None;
    if (auto typeName = readString(p, "authentication_type", owner, problems)) {
        if (auto parsed = parseAuthType(*typeName)) {
            type = *parsed;
        } else {
            problems.config(owner + ".authentication_type '" + *typeName + "' is not supported");
        }
    }

    switch (type) {
        case AuthType::None:
            profile.credentials = NoCredentials{};
            break;
        case AuthType::Basic:
            if (!p.contains("username") || !p.contains("password")) {
                problems.config(owner + ": basic authentication requires username and password");
            }
            profile.credentials = BasicCredentials{username.value_or(""), password.value_or("")};
            break;
        case AuthType::OAuth2ClientCredentials: {
            OAuth2Credentials oauth;
            auto tokenUrl = readString(p, "token_url", owner, problems);
            auto clientId = readString(p, "client_id", owner, problems);
            if (!tokenUrl || tokenUrl->empty())
                problems.config(owner + ": oauth2 requires token_url");
            if (!clientId || clientId->empty())
                problems.config(owner + ": oauth2 requires client_id");
            if (!p.contains("username") && !p.contains("client_secret"))
                problems.config(owner +
                                ": oauth2 requires client_secret or username and password");
            oauth.tokenUrl = tokenUrl.value_or("");
            oauth.clientId = clientId.value_or("");
            oauth.clientSecret = std::move(clientSecret);
            oauth.username = std::move(username);
            oauth.password = std::move(password);
            oauth.scope = readString(p, "scope", owner, problems);
            profile.credentials = std::move(oauth);
            break;
        }
    }

    profile.maxParallelDownloads =
        readNumber<std::uint32_t>(p, "max_parallel_downloads", 1, owner + ".", problems, false);

    if (auto it = p.find("invalid_status_codes"); it != p.end() && !it->is_null()) {
        if (!it->is_object()) {
            problems.config(owner + ".invalid_status_codes must be an object");
        } else {
            for (const auto& [code, reason] : it->items()) {
                long status = 0;
                auto [ptr, ec] = std::from_chars(code.data(), code.data() + code.size(), status);
                if (ec != std::errc() || ptr != code.data() + code.size() || status <= 0) {
                    problems.config(owner + ".invalid_status_codes key '" + code +
                                    "' is not a status code");
                    continue;
                }
                if (!reason.is_string()) {
                    problems.config(owner + ".invalid_status_codes['" + code +
                                    "'] must be a string");
                    continue;
                }
                profile.softFailureCodes[status] = reason.get<std::string>();
            }
        }
    }

    if (auto it = p.find("request_parameters"); it != p.end() && !it->is_null()) {
        if (!it->is_object()) {
            problems.config(owner + ".request_parameters must be an object");
        } else {
            for (const auto& [name, value] : it->items()) {
                const auto where = owner + ".request_parameters['" + name + "']";
                auto ref = readSecretRef(value, where, problems);
                if (!ref)
                    continue;
                auto resolved = resolver.resolve(*ref);
                if (!resolved.ok()) {
                    if (resolved.error().code == ErrorCode::MissingCredential)
                        problems.missing(where + ": " + resolved.error().message);
                    else
                        problems.config(where + ": " + resolved.error().message);
                    continue;
                }
                profile.requestParameters.emplace_back(name, std::move(resolved).value());
            }
        }
    }

    if (problems.messages.size() != before)
        return std::nullopt;
    return profile;
}

} // namespace

Expected<LoadedConfig> parse_provider_config(std::string_view document,
                                             const CredentialResolver& resolver) {
    json doc;
    try {
        doc = json::parse(document.begin(), document.end(), nullptr, true, true);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::ConfigurationError,
                     std::string("provider configuration is not valid JSON: ") + e.what()};
    }
    if (!doc.is_object()) {
        return Error{ErrorCode::ConfigurationError, "provider configuration must be an object"};
    }

    Problems problems;
    LoadedConfig loaded;
    auto& oc = loaded.orchestrator;

    ProviderRegistry::Options options;
    if (auto policy = readString(doc, "unmatched_urls", "", problems)) {
        if (auto parsed = parseUnmatchedUrlPolicy(*policy))
            options.unmatched = *parsed;
        else
            problems.config("unmatched_urls must be 'reject' or 'anonymous'");
    }
    options.unmatchedMaxParallel =
        readNumber<std::uint32_t>(doc, "unmatched_max_parallel_downloads", 0, "", problems);
    oc.maxConcurrentTransfers =
        readNumber<std::uint32_t>(doc, "max_concurrent_transfers", 0, "", problems);
    oc.maxBatchWorkers =
        readNumber<std::uint32_t>(doc, "max_batch_workers", oc.maxBatchWorkers, "", problems);
    oc.transfer.timeout = std::chrono::milliseconds(
        readNumber<std::int64_t>(doc, "timeout_ms", oc.transfer.timeout.count(), "", problems,
                                 false));

    if (auto it = doc.find("retry"); it != doc.end()) {
        if (!it->is_object()) {
            problems.config("retry must be an object");
        } else {
            auto& r = oc.retry;
            r.maxAttempts = readNumber<int>(*it, "max_attempts", r.maxAttempts, "retry.", problems,
                                            false);
            r.initialBackoff = std::chrono::milliseconds(readNumber<std::int64_t>(
                *it, "initial_backoff_ms", r.initialBackoff.count(), "retry.", problems));
            r.multiplier = readNumber<double>(*it, "multiplier", r.multiplier, "retry.", problems);
            r.maxBackoff = std::chrono::milliseconds(readNumber<std::int64_t>(
                *it, "max_backoff_ms", r.maxBackoff.count(), "retry.", problems));
            r.jitter = readNumber<double>(*it, "jitter", r.jitter, "retry.", problems);
            r.maxRetryAfter = std::chrono::milliseconds(readNumber<std::int64_t>(
                *it, "max_retry_after_ms", r.maxRetryAfter.count(), "retry.", problems));
            if (r.multiplier < 1.0)
                problems.config("retry.multiplier must be >= 1");
            if (r.jitter < 0.0 || r.jitter >= 1.0)
                problems.config("retry.jitter must be in [0, 1)");
        }
    }

    if (auto it = doc.find("token"); it != doc.end()) {
        if (!it->is_object()) {
            problems.config("token must be an object");
        } else {
            auto& a = oc.auth;
            a.tokenMaxAttempts = readNumber<int>(*it, "max_attempts", a.tokenMaxAttempts,
                                                 "token.", problems, false);
            a.tokenBackoff = std::chrono::milliseconds(readNumber<std::int64_t>(
                *it, "backoff_ms", a.tokenBackoff.count(), "token.", problems));
            a.safetyMargin = std::chrono::seconds(readNumber<std::int64_t>(
                *it, "safety_margin_s", a.safetyMargin.count(), "token.", problems));
            a.defaultLifetime = std::chrono::seconds(readNumber<std::int64_t>(
                *it, "default_lifetime_s", a.defaultLifetime.count(), "token.", problems, false));
        }
    }

    if (auto it = doc.find("tls"); it != doc.end()) {
        if (!it->is_object()) {
            problems.config("tls must be an object");
        } else {
            if (auto ins = it->find("insecure"); ins != it->end()) {
                if (ins->is_boolean())
                    oc.transfer.tls.insecure = ins->get<bool>();
                else
                    problems.config("tls.insecure must be a boolean");
            }
            oc.transfer.tls.caPath = expand_tilde(
                                         readString(*it, "ca_path", "tls", problems).value_or(""))
                                         .string();
        }
    }
    if (auto proxy = readString(doc, "proxy", "", problems); proxy && !proxy->empty()) {
        oc.transfer.proxy = proxy;
    }
    oc.auth.tls = oc.transfer.tls;
    oc.auth.proxy = oc.transfer.proxy;

    std::vector<ProviderProfile> profiles;
    std::set<std::string> seen;
    if (auto it = doc.find("providers"); it != doc.end() && !it->is_null()) {
        if (!it->is_object()) {
            problems.config("providers must be an object keyed by URL prefix");
        } else {
            for (const auto& [prefix, p] : it->items()) {
                const auto normalized = normalizePrefix(prefix);
                if (normalized.empty()) {
                    problems.config("provider prefix must not be empty");
                    continue;
                }
                if (!seen.insert(normalized).second) {
                    problems.config("ambiguous provider configuration: prefix '" + normalized +
                                    "' is defined more than once");
                    continue;
                }
                if (auto profile = parseProvider(prefix, p, resolver, problems))
                    profiles.push_back(std::move(*profile));
            }
        }
    }

    if (!problems.empty()) {
        auto err = problems.toError();
        spdlog::error("Provider configuration rejected: {}", err.message);
        return err;
    }

    auto registry = ProviderRegistry::create(std::move(profiles), options);
    if (!registry.ok()) {
        return registry.error();
    }
    loaded.registry = std::move(registry).value();
    return loaded;
}

Expected<LoadedConfig> load_provider_config(const std::filesystem::path& path,
                                            const CredentialResolver& resolver) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::ConfigurationError,
                     "cannot read provider configuration: " + path.string()};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    spdlog::debug("Loading provider configuration from {}", path.string());
    return parse_provider_config(buf.str(), resolver);
}

} // namespace geofetch::config
