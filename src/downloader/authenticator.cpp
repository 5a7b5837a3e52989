/*
 * geofetch/src/downloader/authenticator.cpp
 *
 * Authentication strategies per provider profile.
 * - NoAuthenticator / BasicAuthenticator: static contexts
 * - OAuth2Authenticator: token cache with expiry margin, bounded exchange retries and
 *   single-flight renewal (the exchange runs with the token mutex held)
 */

#include <geofetch/downloader/authenticator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>
#include <variant>

namespace geofetch::downloader {

Expected<AuthContext> IAuthenticator::refresh(const AuthContext&) {
    return Error{ErrorCode::AuthenticationError,
                 std::string("credentials of type '") + std::string(authTypeName(type())) +
                     "' cannot be refreshed"};
}

namespace {

class NoAuthenticator final : public IAuthenticator {
public:
    explicit NoAuthenticator(std::vector<std::pair<std::string, std::string>> queryParameters)
        : queryParameters_(std::move(queryParameters)) {}

    [[nodiscard]] AuthType type() const noexcept override { return AuthType::None; }

    Expected<AuthContext> prepare() override {
        AuthContext ctx;
        ctx.queryParameters = queryParameters_;
        return ctx;
    }

private:
    std::vector<std::pair<std::string, std::string>> queryParameters_;
};

class BasicAuthenticator final : public IAuthenticator {
public:
    BasicAuthenticator(BasicCredentials credentials,
                       std::vector<std::pair<std::string, std::string>> queryParameters)
        : credentials_(std::move(credentials)), queryParameters_(std::move(queryParameters)) {}

    [[nodiscard]] AuthType type() const noexcept override { return AuthType::Basic; }

    Expected<AuthContext> prepare() override {
        AuthContext ctx;
        ctx.username = credentials_.username;
        ctx.password = credentials_.password;
        ctx.queryParameters = queryParameters_;
        return ctx;
    }

private:
    BasicCredentials credentials_;
    std::vector<std::pair<std::string, std::string>> queryParameters_;
};

} // namespace

OAuth2Authenticator::OAuth2Authenticator(
    OAuth2Credentials credentials, std::vector<std::pair<std::string, std::string>> queryParameters,
    std::shared_ptr<ITokenEndpoint> endpoint, AuthenticatorOptions options)
    : credentials_(std::move(credentials)), queryParameters_(std::move(queryParameters)),
      endpoint_(std::move(endpoint)), options_(std::move(options)) {
    if (options_.tokenMaxAttempts < 1)
        options_.tokenMaxAttempts = 1;
}

std::chrono::system_clock::time_point OAuth2Authenticator::now() const {
    return options_.clock ? options_.clock() : std::chrono::system_clock::now();
}

bool OAuth2Authenticator::usableUnlocked(std::chrono::system_clock::time_point at) const {
    return token_.has_value() && !token_->accessToken.empty() &&
           at + token_->margin < token_->expiresAt;
}

AuthContext OAuth2Authenticator::contextFor(const OAuth2Token& token) const {
    AuthContext ctx;
    ctx.bearerToken = token.accessToken;
    ctx.queryParameters = queryParameters_;
    return ctx;
}

Expected<OAuth2Token> OAuth2Authenticator::exchangeUnlocked() {
    if (!endpoint_) {
        return Error{ErrorCode::AuthenticationError, "no token endpoint available"};
    }

    TokenRequest req;
    req.tokenUrl = credentials_.tokenUrl;
    req.timeout = options_.tokenTimeout;
    req.tls = options_.tls;
    req.proxy = options_.proxy;
    if (credentials_.username && credentials_.password) {
        req.form.emplace_back("grant_type", "password");
        req.form.emplace_back("username", *credentials_.username);
        req.form.emplace_back("password", *credentials_.password);
    } else {
        req.form.emplace_back("grant_type", "client_credentials");
    }
    req.form.emplace_back("client_id", credentials_.clientId);
    if (credentials_.clientSecret)
        req.form.emplace_back("client_secret", *credentials_.clientSecret);
    if (credentials_.scope)
        req.form.emplace_back("scope", *credentials_.scope);

    Error last{ErrorCode::AuthenticationError, "token exchange was not attempted"};
    for (int attempt = 1; attempt <= options_.tokenMaxAttempts; ++attempt) {
        auto res = endpoint_->exchange(req);
        if (res.ok()) {
            const auto& tr = res.value();
            const auto lifetime = tr.expiresIn.value_or(options_.defaultLifetime);
            OAuth2Token token;
            token.accessToken = tr.accessToken;
            token.expiresAt = now() + lifetime;
            token.margin = std::min(options_.safetyMargin, lifetime / 2);
            token.generation = ++generation_;
            if (token.margin < options_.safetyMargin) {
                spdlog::debug("oauth2: token from {} lives {}s; renewal margin reduced to {}s",
                              credentials_.tokenUrl, lifetime.count(), token.margin.count());
            }
            spdlog::debug("oauth2: obtained token generation {} from {} (expires in {}s)",
                          token.generation, credentials_.tokenUrl, lifetime.count());
            return token;
        }
        last = res.error();
        spdlog::warn("oauth2: token exchange with {} failed (attempt {}/{}): {}",
                     credentials_.tokenUrl, attempt, options_.tokenMaxAttempts, last.message);
        if (attempt < options_.tokenMaxAttempts && options_.tokenBackoff.count() > 0) {
            std::this_thread::sleep_for(options_.tokenBackoff * attempt);
        }
    }

    return Error{ErrorCode::AuthenticationError,
                 "token exchange with " + credentials_.tokenUrl + " failed after " +
                     std::to_string(options_.tokenMaxAttempts) + " attempt(s): " + last.message};
}

Expected<AuthContext> OAuth2Authenticator::prepare() {
    std::lock_guard<std::mutex> lock(tokenMutex_);
    if (usableUnlocked(now())) {
        return contextFor(*token_);
    }
    auto token = exchangeUnlocked();
    if (!token.ok()) {
        token_.reset();
        return token.error();
    }
    token_ = std::move(token).value();
    return contextFor(*token_);
}

Expected<AuthContext> OAuth2Authenticator::refresh(const AuthContext& rejected) {
    std::lock_guard<std::mutex> lock(tokenMutex_);
    // Another caller may already have renewed the token that was rejected
    if (usableUnlocked(now()) && rejected.bearerToken &&
        token_->accessToken != *rejected.bearerToken) {
        return contextFor(*token_);
    }
    token_.reset();
    auto token = exchangeUnlocked();
    if (!token.ok()) {
        return token.error();
    }
    token_ = std::move(token).value();
    return contextFor(*token_);
}

std::optional<OAuth2Token> OAuth2Authenticator::currentToken() const {
    std::lock_guard<std::mutex> lock(tokenMutex_);
    return token_;
}

std::unique_ptr<IAuthenticator> makeAuthenticator(const ProviderProfile& profile,
                                                  std::shared_ptr<ITokenEndpoint> endpoint,
                                                  const AuthenticatorOptions& options) {
    struct Factory {
        const ProviderProfile& profile;
        std::shared_ptr<ITokenEndpoint>& endpoint;
        const AuthenticatorOptions& options;

        std::unique_ptr<IAuthenticator> operator()(const NoCredentials&) const {
            return std::make_unique<NoAuthenticator>(profile.requestParameters);
        }
        std::unique_ptr<IAuthenticator> operator()(const BasicCredentials& c) const {
            return std::make_unique<BasicAuthenticator>(c, profile.requestParameters);
        }
        std::unique_ptr<IAuthenticator> operator()(const OAuth2Credentials& c) const {
            return std::make_unique<OAuth2Authenticator>(c, profile.requestParameters,
                                                         std::move(endpoint), options);
        }
    };
    return std::visit(Factory{profile, endpoint, options}, profile.credentials);
}

AuthenticatorRegistry::AuthenticatorRegistry(std::shared_ptr<ITokenEndpoint> endpoint,
                                             AuthenticatorOptions options)
    : endpoint_(std::move(endpoint)), options_(std::move(options)) {}

IAuthenticator& AuthenticatorRegistry::authenticatorFor(const ProviderProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& auth = authenticators_[&profile];
    if (!auth) {
        auth = makeAuthenticator(profile, endpoint_, options_);
        spdlog::debug("authenticator for '{}': {}", profile.isDefault ? "<unmatched>" : profile.match,
                      authTypeName(auth->type()));
    }
    return *auth;
}

} // namespace geofetch::downloader
