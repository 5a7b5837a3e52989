#pragma once

/*
 * TransferExecutor: one fetch of one resource.
 *
 * Streams the body into a staged artifact beside the destination while hashing it, then
 * classifies the attempt:
 *   2xx                                  -> Success, artifact committed
 *   status in profile soft-failure codes -> SoftFailure(reason, Retry-After)
 *   401/403 on a refreshable profile     -> one credential refresh and a single retry
 *   anything else                        -> HardFailure(cause)
 * Nothing is left at the destination unless the attempt succeeded. A destination file is
 * claimed while a transfer writes it; a second concurrent transfer resolving to the same
 * file fails with InvalidArgument instead of racing the first one.
 */

#include <geofetch/downloader/authenticator.hpp>
#include <geofetch/downloader/downloader.hpp>
#include <geofetch/downloader/provider_registry.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <string_view>

namespace geofetch::downloader {

struct TransferOptions {
    std::chrono::milliseconds timeout{600000};
    TlsConfig tls{};
    std::optional<std::string> proxy;
    bool followRedirects{true};
};

struct TransferResult {
    OutcomeStatus status{OutcomeStatus::HardFailure};
    std::optional<std::string> softFailureReason;
    std::optional<std::chrono::seconds> retryAfter;
    std::optional<Error> error;

    std::optional<std::filesystem::path> artifact;
    std::string hash;
    std::uint64_t sizeBytes{0};
    std::optional<long> transportStatus;
};

class TransferExecutor {
public:
    TransferExecutor(std::shared_ptr<IHttpAdapter> http, std::shared_ptr<IDiskWriter> disk,
                     TransferOptions options);

    TransferResult fetch(const DownloadRequest& request, const ProviderProfile& profile,
                         IAuthenticator& auth, std::stop_token cancel = {});

private:
    struct Attempt;
    class DestinationClaim;

    Attempt runOnce(const DownloadRequest& request, const ProviderProfile& profile,
                    const AuthContext& auth, std::stop_token cancel);

    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<IDiskWriter> disk_;
    TransferOptions options_;

    std::mutex claimsMutex_;
    std::set<std::filesystem::path> claimed_;
};

/// Resolve the file an artifact should land in (directory destinations get a derived name).
[[nodiscard]] std::filesystem::path resolveDestination(const std::filesystem::path& destination,
                                                       std::string_view url,
                                                       const ResponseHead& head);

} // namespace geofetch::downloader
