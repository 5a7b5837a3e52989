#pragma once

/*
 * geofetch Downloader - Public Types and Service Interfaces (C++20)
 *
 * This header defines the data types shared by the download orchestration core and the
 * abstract interfaces of its network and disk collaborators. It contains no implementation.
 *
 * Design principles:
 * - One Outcome per request, always; per-request errors never escape as exceptions
 * - Artifacts are staged beside their destination and renamed into place on success only
 * - Clear separation of concerns (transport adapter, token endpoint, disk writer, integrity)
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace geofetch::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Hash algorithms supported for integrity verification.
 */
enum class HashAlgo { Sha256 };

/**
 * Canonical error codes for downloader operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,

    // Configuration-time (fatal at load)
    ConfigurationError,
    MissingCredential,

    // Per-request, policy dependent
    UnknownProvider,

    // Hard after bounded retry against the token endpoint only
    AuthenticationError,

    // Soft, retried per policy
    TransientProviderError,

    // Hard transfer failures
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,
    IoError,
    ChecksumMismatch,

    Cancelled,
    Unknown
};

[[nodiscard]] std::string_view errorCodeName(ErrorCode code) noexcept;

[[nodiscard]] constexpr bool isConfigurationError(ErrorCode code) noexcept {
    return code == ErrorCode::ConfigurationError || code == ErrorCode::MissingCredential;
}

[[nodiscard]] constexpr bool isTransferError(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::TlsVerificationFailed:
        case ErrorCode::ServerError:
        case ErrorCode::IoError:
        case ErrorCode::ChecksumMismatch:
            return true;
        default:
            return false;
    }
}

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Checksum descriptor (algorithm + hex digest).
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex; // lower-case hex
};

/**
 * Soft-failure retry/backoff policy.
 * maxAttempts counts transfer attempts, including the first one.
 */
struct RetryPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{2000};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{300000};
    double jitter{0.2}; // +/- fraction applied to the exponential backoff
    std::chrono::milliseconds maxRetryAfter{3600000};
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ==========================
// Requests and outcomes
// ==========================

/**
 * One externally supplied unit of work.
 * destination is either a file path or a directory (existing, or ending with a separator);
 * for a directory the file name comes from Content-Disposition or the URL path.
 * cancel may be wired to a caller-owned std::stop_source to cancel this request alone.
 */
struct DownloadRequest {
    std::string url;
    std::filesystem::path destination;
    std::vector<Header> headers;
    std::optional<Checksum> checksum;
    std::stop_token cancel;
};

/**
 * Classification of a transfer attempt.
 */
enum class OutcomeStatus { Success, SoftFailure, HardFailure };

/**
 * Per-request state machine:
 * Pending -> InFlight -> {Succeeded | SoftFailed -> (InFlight | Abandoned) | Failed}
 */
enum class RequestState { Pending, InFlight, SoftFailed, Succeeded, Failed, Abandoned };

[[nodiscard]] std::string_view outcomeStatusName(OutcomeStatus s) noexcept;
[[nodiscard]] std::string_view requestStateName(RequestState s) noexcept;

/**
 * Terminal result for one Download Request.
 */
struct DownloadOutcome {
    std::string url;
    std::filesystem::path destination;
    std::string provider; // match prefix of the resolved profile; empty if unresolved

    RequestState state{RequestState::Pending};
    OutcomeStatus status{OutcomeStatus::HardFailure}; // classification of the last attempt

    std::optional<std::string> softFailureReason;
    std::optional<std::chrono::seconds> retryAfter;
    std::optional<Error> error; // hard failure cause (or exhausted soft failure)

    // Success only
    std::optional<std::filesystem::path> artifact;
    std::string hash; // "sha256:<hex>"
    std::uint64_t sizeBytes{0};

    std::optional<long> transportStatus;
    int attempts{0};
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool succeeded() const noexcept { return state == RequestState::Succeeded; }
};

// ===================
// Callback signatures
// ===================

using OutcomeCallback = std::function<void(const DownloadOutcome&)>;

// ==========================
// Authentication context
// ==========================

/**
 * Per-request credentials attachable to an outgoing transfer.
 * An empty context performs the transfer anonymously.
 */
struct AuthContext {
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> bearerToken;
    std::vector<std::pair<std::string, std::string>> queryParameters;

    [[nodiscard]] bool empty() const noexcept {
        return !username && !password && !bearerToken && queryParameters.empty();
    }
};

// ==========================
// Service interface classes
// ==========================

/**
 * Response head observed before the first body byte (final response after redirects).
 */
struct ResponseHead {
    long status{0};
    std::optional<std::uint64_t> contentLength;
    std::optional<std::string> contentDisposition;
    std::optional<std::string> retryAfter;
    std::optional<std::string> etag;
};

/**
 * Result of a completed transport exchange. Non-2xx statuses are reported here, not as errors;
 * errors are reserved for connection failures, timeouts, TLS problems and aborted transfers.
 */
struct TransportResponse {
    ResponseHead head;
    std::uint64_t bodyBytes{0};
};

/**
 * A single GET/RETR against a resource URL.
 */
struct TransferSpec {
    std::string url; // query parameters already applied
    std::vector<Header> headers;
    AuthContext auth;
    std::chrono::milliseconds timeout{600000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
};

/**
 * Transport adapter abstraction (libcurl-based implementation satisfies this).
 *
 * onResponse is invoked once, before any body byte, with the final response head. When it
 * returns false the body is drained without being handed to the sink. The sink may be called
 * many times on the calling thread; a sink error aborts the transfer.
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    virtual Expected<TransportResponse>
    fetch(const TransferSpec& spec, const std::function<bool(const ResponseHead&)>& onResponse,
          const std::function<Expected<void>(std::span<const std::byte>)>& sink,
          std::stop_token cancel) = 0;
};

/**
 * Form exchange against an OAuth2 token endpoint.
 */
struct TokenRequest {
    std::string tokenUrl;
    std::vector<std::pair<std::string, std::string>> form; // x-www-form-urlencoded fields
    std::chrono::milliseconds timeout{30000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
};

struct TokenResponse {
    std::string accessToken;
    std::optional<std::chrono::seconds> expiresIn; // absent when the endpoint omits expires_in
    std::optional<std::string> tokenType;
};

class ITokenEndpoint {
public:
    virtual ~ITokenEndpoint() = default;

    /**
     * Perform one token exchange. Non-2xx answers and malformed bodies are
     * ErrorCode::AuthenticationError; network problems keep their transport code.
     */
    virtual Expected<TokenResponse> exchange(const TokenRequest& request) = 0;
};

/**
 * Parse a token endpoint JSON body ({"access_token": ..., "expires_in": ...}).
 */
Expected<TokenResponse> parseTokenResponse(std::string_view body);

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset(HashAlgo algo) = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual Checksum finalize() = 0;
};

/**
 * Staged artifact being written for one transfer attempt.
 * Destroying a sink that was not committed discards everything written.
 */
class IArtifactSink {
public:
    virtual ~IArtifactSink() = default;

    virtual Expected<void> write(std::span<const std::byte> data) = 0;

    /**
     * Flush, fsync and atomically move the staged bytes onto the destination.
     */
    virtual Expected<std::filesystem::path> commit() = 0;

    /**
     * Remove the staged bytes. Safe to call more than once.
     */
    virtual void discard() noexcept = 0;

    [[nodiscard]] virtual const std::filesystem::path& destination() const noexcept = 0;
    /// Private to this sink; two sinks never share a staging file.
    [[nodiscard]] virtual const std::filesystem::path& stagingPath() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t bytesWritten() const noexcept = 0;
};

/**
 * Disk writer for staged artifacts.
 * Implementations must stage on the destination's filesystem so commit can rename atomically.
 */
class IDiskWriter {
public:
    virtual ~IDiskWriter() = default;

    virtual Expected<std::unique_ptr<IArtifactSink>>
    open(const std::filesystem::path& destination) = 0;
};

// ======================
// Utility helpers
// ======================

/**
 * Build canonical "sha256:<hex>" string for a digest.
 */
[[nodiscard]] inline std::string makeSha256Id(std::string_view hexDigest) {
    std::string id("sha256:");
    id.append(hexDigest);
    return id;
}

/**
 * Append URL-encoded query parameters to url, honoring an existing query string and fragment.
 */
[[nodiscard]] std::string
appendQueryParameters(std::string_view url,
                      const std::vector<std::pair<std::string, std::string>>& params);

/// URL without its query string and fragment, for log lines (queries may carry secrets).
[[nodiscard]] std::string_view withoutQuery(std::string_view url) noexcept;

/**
 * Extract the file name from a Content-Disposition header value, if any.
 */
[[nodiscard]] std::optional<std::string> filenameFromContentDisposition(std::string_view value);

/**
 * Last non-empty path segment of a URL (query and fragment stripped), percent-decoded.
 */
[[nodiscard]] std::optional<std::string> filenameFromUrl(std::string_view url);

/**
 * Parse a Retry-After value (delta-seconds or IMF-fixdate) relative to now.
 */
[[nodiscard]] std::optional<std::chrono::seconds>
parseRetryAfter(std::string_view value,
                std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

// ======================
// Factories
// ======================

std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter();
std::shared_ptr<ITokenEndpoint> makeCurlTokenEndpoint();
std::shared_ptr<IDiskWriter> makeDiskWriter();
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifierSha256();

} // namespace geofetch::downloader
