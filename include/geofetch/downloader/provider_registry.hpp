#pragma once

/*
 * Provider profiles and the prefix registry that selects them.
 *
 * A profile is the resolved configuration of one remote data source: how to authenticate,
 * how many transfers may run against it at once, and which transport statuses mean
 * "temporarily unavailable". Profiles are immutable once the registry is built.
 */

#include <geofetch/downloader/downloader.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace geofetch::downloader {

enum class AuthType { None, Basic, OAuth2ClientCredentials };

[[nodiscard]] std::string_view authTypeName(AuthType t) noexcept;
[[nodiscard]] std::optional<AuthType> parseAuthType(std::string_view s) noexcept;

// Resolved credential material, one alternative per authentication strategy.
struct NoCredentials {};

struct BasicCredentials {
    std::string username;
    std::string password;
};

struct OAuth2Credentials {
    std::string tokenUrl;
    std::string clientId;
    std::optional<std::string> clientSecret;
    // Resource-owner credentials; when present the password grant is used
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> scope;
};

using Credentials = std::variant<NoCredentials, BasicCredentials, OAuth2Credentials>;

struct ProviderProfile {
    std::string match; // normalized prefix; empty for the anonymous default profile
    Credentials credentials{NoCredentials{}};
    std::uint32_t maxParallelDownloads{1}; // 0 only for the unlimited default profile
    std::map<long, std::string> softFailureCodes;
    std::vector<std::pair<std::string, std::string>> requestParameters;
    bool isDefault{false};

    [[nodiscard]] AuthType authType() const noexcept;
    [[nodiscard]] std::optional<std::string> softFailureReason(long status) const;
};

/// What happens to a URL that no configured prefix matches
enum class UnmatchedUrlPolicy { Reject, AllowAnonymous };

[[nodiscard]] std::string_view unmatchedUrlPolicyName(UnmatchedUrlPolicy p) noexcept;
[[nodiscard]] std::optional<UnmatchedUrlPolicy> parseUnmatchedUrlPolicy(std::string_view s) noexcept;

/// Lower-case scheme and host, drop a trailing '/'.
[[nodiscard]] std::string normalizePrefix(std::string_view prefix);

class ProviderRegistry {
public:
    struct Options {
        UnmatchedUrlPolicy unmatched{UnmatchedUrlPolicy::Reject};
        std::uint32_t unmatchedMaxParallel{0}; // 0 = unlimited
    };

    /// Validate and freeze a profile set. Duplicate prefixes (after normalization), empty
    /// prefixes and zero parallel limits fail with ErrorCode::ConfigurationError.
    static Expected<std::shared_ptr<const ProviderRegistry>> create(std::vector<ProviderProfile> profiles,
                                                                    Options options);

    /// Longest-prefix match. Unmatched URLs fail with ErrorCode::UnknownProvider under the
    /// Reject policy and resolve to the anonymous default profile under AllowAnonymous.
    [[nodiscard]] Expected<std::shared_ptr<const ProviderProfile>> resolve(std::string_view url) const;

    [[nodiscard]] const std::vector<std::shared_ptr<const ProviderProfile>>& profiles() const noexcept {
        return profiles_;
    }
    [[nodiscard]] const Options& options() const noexcept { return options_; }

private:
    ProviderRegistry(std::vector<std::shared_ptr<const ProviderProfile>> profiles, Options options);

    std::vector<std::shared_ptr<const ProviderProfile>> profiles_; // sorted by prefix length desc
    std::shared_ptr<const ProviderProfile> defaultProfile_;
    Options options_;
};

} // namespace geofetch::downloader
