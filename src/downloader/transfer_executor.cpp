#include <geofetch/downloader/transfer_executor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace geofetch::downloader {

namespace fs = std::filesystem;

namespace {

bool isSuccessStatus(long status) {
    return status >= 200 && status < 300;
}

bool isAuthRejection(long status) {
    return status == 401 || status == 403;
}

std::string lowerHex(std::string hex) {
    std::transform(hex.begin(), hex.end(), hex.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return hex;
}

bool looksLikeDirectory(const fs::path& p) {
    const auto& native = p.native();
    if (!native.empty() && native.back() == fs::path::preferred_separator)
        return true;
    std::error_code ec;
    return fs::is_directory(p, ec);
}

} // namespace

fs::path resolveDestination(const fs::path& destination, std::string_view url,
                            const ResponseHead& head) {
    if (!looksLikeDirectory(destination))
        return destination;

    std::optional<std::string> name;
    if (head.contentDisposition)
        name = filenameFromContentDisposition(*head.contentDisposition);
    if (!name)
        name = filenameFromUrl(url);
    return destination / name.value_or("download");
}

// Exclusive hold on a destination file for the lifetime of one attempt.
class TransferExecutor::DestinationClaim {
public:
    DestinationClaim() = default;
    DestinationClaim(const DestinationClaim&) = delete;
    DestinationClaim& operator=(const DestinationClaim&) = delete;
    ~DestinationClaim() { release(); }

    bool acquire(TransferExecutor& owner, const fs::path& target) {
        std::error_code ec;
        auto key = fs::absolute(target, ec);
        if (ec)
            key = target;
        key = key.lexically_normal();
        if (owner_)
            return key == key_;
        std::lock_guard<std::mutex> lock(owner.claimsMutex_);
        if (!owner.claimed_.insert(key).second)
            return false;
        owner_ = &owner;
        key_ = std::move(key);
        return true;
    }

    void release() noexcept {
        if (!owner_)
            return;
        std::lock_guard<std::mutex> lock(owner_->claimsMutex_);
        owner_->claimed_.erase(key_);
        owner_ = nullptr;
    }

private:
    TransferExecutor* owner_{nullptr};
    fs::path key_;
};

struct TransferExecutor::Attempt {
    std::optional<Error> error;
    std::optional<ResponseHead> head;
    std::optional<fs::path> artifact;
    std::string hash;
    std::uint64_t sizeBytes{0};
};

TransferExecutor::TransferExecutor(std::shared_ptr<IHttpAdapter> http,
                                   std::shared_ptr<IDiskWriter> disk, TransferOptions options)
    : http_(std::move(http)), disk_(std::move(disk)), options_(std::move(options)) {}

TransferExecutor::Attempt TransferExecutor::runOnce(const DownloadRequest& request,
                                                    const ProviderProfile& profile,
                                                    const AuthContext& auth,
                                                    std::stop_token cancel) {
    Attempt attempt;

    TransferSpec spec;
    spec.url = appendQueryParameters(request.url, auth.queryParameters);
    spec.headers = request.headers;
    spec.auth = auth;
    spec.timeout = options_.timeout;
    spec.tls = options_.tls;
    spec.proxy = options_.proxy;
    spec.followRedirects = options_.followRedirects;

    // Declared before the sink so the claim outlives the discard of an uncommitted sink
    DestinationClaim claim;
    std::unique_ptr<IArtifactSink> sink;
    std::optional<Error> openError;
    auto verifier = makeIntegrityVerifierSha256();

    auto onResponse = [&](const ResponseHead& head) {
        if (!isSuccessStatus(head.status) || profile.softFailureReason(head.status))
            return false;
        const auto target = resolveDestination(request.destination, request.url, head);
        if (!claim.acquire(*this, target)) {
            openError = Error{ErrorCode::InvalidArgument,
                              "destination is being written by another transfer: " +
                                  target.string()};
            return true;
        }
        auto opened = disk_->open(target);
        if (!opened.ok()) {
            // Keep accepting the body so the sink callback can abort the transfer
            openError = opened.error();
            return true;
        }
        sink = std::move(opened).value();
        return true;
    };

    auto onData = [&](std::span<const std::byte> data) -> Expected<void> {
        if (!sink)
            return openError.value_or(Error{ErrorCode::IoError, "no artifact open"});
        verifier->update(data);
        return sink->write(data);
    };

    auto res = http_->fetch(spec, onResponse, onData, cancel);
    if (!res.ok()) {
        attempt.error = res.error();
        return attempt;
    }
    attempt.head = res.value().head;

    const long status = attempt.head->status;
    if (!isSuccessStatus(status) || profile.softFailureReason(status))
        return attempt;

    if (openError) {
        attempt.error = openError;
        return attempt;
    }
    if (!sink) {
        attempt.error = Error{ErrorCode::IoError, "response completed without an artifact"};
        return attempt;
    }

    const auto digest = verifier->finalize();
    if (digest.hex.empty()) {
        attempt.error = Error{ErrorCode::IoError, "SHA-256 computation failed"};
        return attempt;
    }
    if (request.checksum && lowerHex(request.checksum->hex) != digest.hex) {
        attempt.error = Error{ErrorCode::ChecksumMismatch,
                              "checksum mismatch: expected " + lowerHex(request.checksum->hex) +
                                  ", got " + digest.hex};
        return attempt;
    }

    auto committed = sink->commit();
    if (!committed.ok()) {
        attempt.error = committed.error();
        return attempt;
    }
    attempt.artifact = committed.value();
    attempt.hash = makeSha256Id(digest.hex);
    attempt.sizeBytes = sink->bytesWritten();
    return attempt;
}

TransferResult TransferExecutor::fetch(const DownloadRequest& request,
                                       const ProviderProfile& profile, IAuthenticator& auth,
                                       std::stop_token cancel) {
    TransferResult result;

    auto ctx = auth.prepare();
    if (!ctx.ok()) {
        result.status = OutcomeStatus::HardFailure;
        result.error = Error{ErrorCode::AuthenticationError, ctx.error().message};
        return result;
    }

    auto attempt = runOnce(request, profile, ctx.value(), cancel);

    auto rejected = [&](const Attempt& a) {
        return !a.error && a.head && isAuthRejection(a.head->status) &&
               !profile.softFailureReason(a.head->status);
    };

    if (rejected(attempt) && auth.refreshable()) {
        spdlog::debug("{} answered {}; renewing credentials", request.url, attempt.head->status);
        auto renewed = auth.refresh(ctx.value());
        if (!renewed.ok()) {
            result.status = OutcomeStatus::HardFailure;
            result.transportStatus = attempt.head->status;
            result.error = Error{ErrorCode::AuthenticationError, renewed.error().message};
            return result;
        }
        attempt = runOnce(request, profile, renewed.value(), cancel);
    }

    if (attempt.head)
        result.transportStatus = attempt.head->status;

    if (attempt.error) {
        result.status = OutcomeStatus::HardFailure;
        result.error = std::move(attempt.error);
        if (cancel.stop_requested())
            result.error->code = ErrorCode::Cancelled;
        return result;
    }

    const auto& head = *attempt.head;
    if (auto reason = profile.softFailureReason(head.status)) {
        result.status = OutcomeStatus::SoftFailure;
        result.softFailureReason = std::move(reason);
        if (head.retryAfter)
            result.retryAfter = parseRetryAfter(*head.retryAfter);
        return result;
    }

    if (isSuccessStatus(head.status)) {
        result.status = OutcomeStatus::Success;
        result.artifact = std::move(attempt.artifact);
        result.hash = std::move(attempt.hash);
        result.sizeBytes = attempt.sizeBytes;
        return result;
    }

    result.status = OutcomeStatus::HardFailure;
    if (isAuthRejection(head.status)) {
        result.error = Error{ErrorCode::AuthenticationError,
                             "credentials rejected with status " + std::to_string(head.status)};
    } else {
        result.error =
            Error{ErrorCode::ServerError, "server returned status " + std::to_string(head.status)};
    }
    return result;
}

} // namespace geofetch::downloader
