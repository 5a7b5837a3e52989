#pragma once

// Credential resolution
// ---------------------
// Provider configuration refers to secrets either literally or through an environment
// variable. Resolution happens once, eagerly, while the provider registry is loaded; the
// resulting values are immutable and only ever read by authenticators.

#include <geofetch/downloader/downloader.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace geofetch::downloader {

/// Symbolic reference to a secret as written in configuration
struct SecretRef {
    enum class Kind { Literal, Environment };

    Kind kind{Kind::Literal};
    std::string value; // literal text, or the environment variable name

    static SecretRef literal(std::string text) { return {Kind::Literal, std::move(text)}; }
    static SecretRef env(std::string name) { return {Kind::Environment, std::move(name)}; }

    [[nodiscard]] bool isEnvironment() const noexcept { return kind == Kind::Environment; }
};

/// Source of environment variables (process environment in production, a map in tests)
class IEnvironment {
public:
    virtual ~IEnvironment() = default;
    [[nodiscard]] virtual std::optional<std::string> lookup(std::string_view name) const = 0;
};

/// Reads the process environment via std::getenv
class ProcessEnvironment final : public IEnvironment {
public:
    [[nodiscard]] std::optional<std::string> lookup(std::string_view name) const override;
};

/// Fixed variable table
class MapEnvironment final : public IEnvironment {
public:
    MapEnvironment() = default;
    explicit MapEnvironment(std::map<std::string, std::string, std::less<>> vars)
        : vars_(std::move(vars)) {}

    void set(std::string name, std::string value) { vars_[std::move(name)] = std::move(value); }

    [[nodiscard]] std::optional<std::string> lookup(std::string_view name) const override;

private:
    std::map<std::string, std::string, std::less<>> vars_;
};

class CredentialResolver {
public:
    explicit CredentialResolver(std::shared_ptr<const IEnvironment> env = nullptr);

    /// Resolve a reference. Environment references whose variable is unset fail with
    /// ErrorCode::MissingCredential naming the variable. Literals never touch the environment.
    [[nodiscard]] Expected<std::string> resolve(const SecretRef& ref) const;

private:
    std::shared_ptr<const IEnvironment> env_;
};

} // namespace geofetch::downloader
