/*
 * geofetch/src/downloader/provider_registry.cpp
 *
 * Immutable prefix registry:
 * - Prefixes are normalized (scheme/host lower-cased, trailing '/' dropped) before comparison
 * - Resolution walks profiles longest-prefix first and requires a boundary after the prefix
 * - Unmatched URLs are rejected or mapped to the anonymous default profile, per policy
 */

#include <geofetch/downloader/provider_registry.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <string>

namespace geofetch::downloader {

std::string_view authTypeName(AuthType t) noexcept {
    switch (t) {
        case AuthType::None:
            return "none";
        case AuthType::Basic:
            return "basic";
        case AuthType::OAuth2ClientCredentials:
            return "oauth2_client_credentials";
    }
    return "none";
}

std::optional<AuthType> parseAuthType(std::string_view s) noexcept {
    if (s == "none")
        return AuthType::None;
    if (s == "basic")
        return AuthType::Basic;
    if (s == "oauth2" || s == "oauth2_client_credentials")
        return AuthType::OAuth2ClientCredentials;
    return std::nullopt;
}

std::string_view unmatchedUrlPolicyName(UnmatchedUrlPolicy p) noexcept {
    return p == UnmatchedUrlPolicy::Reject ? "reject" : "anonymous";
}

std::optional<UnmatchedUrlPolicy> parseUnmatchedUrlPolicy(std::string_view s) noexcept {
    if (s == "reject")
        return UnmatchedUrlPolicy::Reject;
    if (s == "anonymous" || s == "allow")
        return UnmatchedUrlPolicy::AllowAnonymous;
    return std::nullopt;
}

AuthType ProviderProfile::authType() const noexcept {
    struct Visitor {
        AuthType operator()(const NoCredentials&) const noexcept { return AuthType::None; }
        AuthType operator()(const BasicCredentials&) const noexcept { return AuthType::Basic; }
        AuthType operator()(const OAuth2Credentials&) const noexcept {
            return AuthType::OAuth2ClientCredentials;
        }
    };
    return std::visit(Visitor{}, credentials);
}

std::optional<std::string> ProviderProfile::softFailureReason(long status) const {
    auto it = softFailureCodes.find(status);
    if (it == softFailureCodes.end())
        return std::nullopt;
    return it->second;
}

namespace {

// Lower-case "scheme://host[:port]" and leave the path untouched
std::string lowerAuthority(std::string_view in) {
    std::string out(in);
    auto schemeEnd = out.find("://");
    std::size_t authorityEnd = out.size();
    if (schemeEnd != std::string::npos) {
        authorityEnd = out.find_first_of("/?#", schemeEnd + 3);
        if (authorityEnd == std::string::npos)
            authorityEnd = out.size();
    }
    for (std::size_t i = 0; i < authorityEnd; ++i) {
        out[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[i])));
    }
    return out;
}

bool isBoundary(std::string_view url, std::size_t at) {
    if (at >= url.size())
        return true;
    const char c = url[at];
    return c == '/' || c == '?' || c == '#' || c == ':';
}

} // namespace

std::string normalizePrefix(std::string_view prefix) {
    auto out = lowerAuthority(prefix);
    while (!out.empty() && out.back() == '/')
        out.pop_back();
    return out;
}

ProviderRegistry::ProviderRegistry(std::vector<std::shared_ptr<const ProviderProfile>> profiles,
                                   Options options)
    : profiles_(std::move(profiles)), options_(options) {
    auto fallback = std::make_shared<ProviderProfile>();
    fallback->isDefault = true;
    fallback->maxParallelDownloads = options_.unmatchedMaxParallel;
    defaultProfile_ = std::move(fallback);
}

Expected<std::shared_ptr<const ProviderRegistry>>
ProviderRegistry::create(std::vector<ProviderProfile> profiles, Options options) {
    std::set<std::string> seen;
    std::vector<std::shared_ptr<const ProviderProfile>> frozen;
    frozen.reserve(profiles.size());

    for (auto& p : profiles) {
        p.match = normalizePrefix(p.match);
        if (p.match.empty()) {
            return Error{ErrorCode::ConfigurationError, "provider prefix must not be empty"};
        }
        if (p.maxParallelDownloads == 0) {
            return Error{ErrorCode::ConfigurationError,
                         "max_parallel_downloads must be positive for '" + p.match + "'"};
        }
        if (!seen.insert(p.match).second) {
            return Error{ErrorCode::ConfigurationError,
                         "ambiguous provider configuration: prefix '" + p.match +
                             "' is defined more than once"};
        }
        p.isDefault = false;
        frozen.push_back(std::make_shared<const ProviderProfile>(std::move(p)));
    }

    std::stable_sort(frozen.begin(), frozen.end(), [](const auto& a, const auto& b) {
        return a->match.size() > b->match.size();
    });

    spdlog::debug("Provider registry loaded with {} profile(s), unmatched URLs: {}", frozen.size(),
                  unmatchedUrlPolicyName(options.unmatched));

    return std::shared_ptr<const ProviderRegistry>(
        new ProviderRegistry(std::move(frozen), options));
}

Expected<std::shared_ptr<const ProviderProfile>>
ProviderRegistry::resolve(std::string_view url) const {
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty URL"};
    }
    const auto normalized = lowerAuthority(url);
    for (const auto& p : profiles_) {
        if (normalized.size() >= p->match.size() &&
            std::string_view(normalized).substr(0, p->match.size()) == p->match &&
            isBoundary(normalized, p->match.size())) {
            return p;
        }
    }

    if (options_.unmatched == UnmatchedUrlPolicy::AllowAnonymous) {
        spdlog::debug("No provider prefix matches {}; using anonymous default profile", url);
        return defaultProfile_;
    }
    return Error{ErrorCode::UnknownProvider, "no provider configured for URL: " + std::string(url)};
}

} // namespace geofetch::downloader
