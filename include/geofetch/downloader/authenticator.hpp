#pragma once

// Authenticator
// -------------
// One authenticator per provider profile, created from the profile's credential variant.
//
// - none:   empty context
// - basic:  static username/password, never refreshed
// - oauth2: cached bearer token, renewed before expiry (safety margin) or after a 401/403.
//           Renewal is single-flight per profile: the first caller performs the exchange,
//           concurrent callers block on the same mutex and reuse its result.

#include <geofetch/downloader/downloader.hpp>
#include <geofetch/downloader/provider_registry.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace geofetch::downloader {

struct OAuth2Token {
    std::string accessToken;
    std::chrono::system_clock::time_point expiresAt{};
    // Renewal lead time: the configured safety margin, at most half the token lifetime
    std::chrono::seconds margin{0};
    std::uint64_t generation{0};
};

struct AuthenticatorOptions {
    int tokenMaxAttempts{3};
    std::chrono::milliseconds tokenBackoff{500};
    std::chrono::seconds safetyMargin{30};
    std::chrono::seconds defaultLifetime{3600}; // for token responses without expires_in
    std::chrono::milliseconds tokenTimeout{30000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    std::function<std::chrono::system_clock::time_point()> clock; // defaults to system_clock
};

class IAuthenticator {
public:
    virtual ~IAuthenticator() = default;

    [[nodiscard]] virtual AuthType type() const noexcept = 0;

    /// Context to attach to the next transfer.
    virtual Expected<AuthContext> prepare() = 0;

    /// Whether a 401/403 answer warrants a refresh and one retry.
    [[nodiscard]] virtual bool refreshable() const noexcept { return false; }

    /// Renew credentials after `rejected` was refused by the resource endpoint.
    /// Returns a context carrying different credentials, or AuthenticationError.
    virtual Expected<AuthContext> refresh(const AuthContext& rejected);
};

class OAuth2Authenticator final : public IAuthenticator {
public:
    OAuth2Authenticator(OAuth2Credentials credentials,
                        std::vector<std::pair<std::string, std::string>> queryParameters,
                        std::shared_ptr<ITokenEndpoint> endpoint, AuthenticatorOptions options);

    [[nodiscard]] AuthType type() const noexcept override {
        return AuthType::OAuth2ClientCredentials;
    }
    Expected<AuthContext> prepare() override;
    [[nodiscard]] bool refreshable() const noexcept override { return true; }
    Expected<AuthContext> refresh(const AuthContext& rejected) override;

    /// Current cached token, if any (observability/tests)
    [[nodiscard]] std::optional<OAuth2Token> currentToken() const;

private:
    [[nodiscard]] std::chrono::system_clock::time_point now() const;
    [[nodiscard]] bool usableUnlocked(std::chrono::system_clock::time_point at) const;
    Expected<OAuth2Token> exchangeUnlocked();
    [[nodiscard]] AuthContext contextFor(const OAuth2Token& token) const;

    OAuth2Credentials credentials_;
    std::vector<std::pair<std::string, std::string>> queryParameters_;
    std::shared_ptr<ITokenEndpoint> endpoint_;
    AuthenticatorOptions options_;

    // Token state is only touched with tokenMutex_ held; the exchange runs under it too
    mutable std::mutex tokenMutex_;
    std::optional<OAuth2Token> token_;
    std::uint64_t generation_{0};
};

/// Build the authenticator matching the profile's credential alternative.
std::unique_ptr<IAuthenticator> makeAuthenticator(const ProviderProfile& profile,
                                                  std::shared_ptr<ITokenEndpoint> endpoint,
                                                  const AuthenticatorOptions& options);

/// Lazily created, per-profile authenticators that live as long as the registry.
class AuthenticatorRegistry {
public:
    AuthenticatorRegistry(std::shared_ptr<ITokenEndpoint> endpoint, AuthenticatorOptions options);

    IAuthenticator& authenticatorFor(const ProviderProfile& profile);

private:
    std::shared_ptr<ITokenEndpoint> endpoint_;
    AuthenticatorOptions options_;
    std::mutex mutex_;
    std::unordered_map<const ProviderProfile*, std::unique_ptr<IAuthenticator>> authenticators_;
};

} // namespace geofetch::downloader
