#pragma once

/*
 * Orchestrator - top-level driver of the download core.
 *
 * For every request: resolve its provider profile, wait for a slot on that profile's
 * concurrency gate (and the optional global ceiling), run the transfer, and retry soft
 * failures with Retry-After or exponential backoff with jitter.
 *
 * A batch runs on a bounded pool: one worker per transfer that can be in flight at once
 * (the sum of the batch's profile limits, capped by the global ceiling and maxBatchWorkers).
 * Workers only pick requests whose profile has a free lane, so a saturated profile never
 * holds a worker, and a request waiting to retry is parked in the queue, not on a thread.
 *
 * Every submitted request yields exactly one terminal DownloadOutcome. Per-request errors are
 * recorded in that outcome and never abort sibling requests.
 */

#include <geofetch/downloader/authenticator.hpp>
#include <geofetch/downloader/concurrency_gate.hpp>
#include <geofetch/downloader/downloader.hpp>
#include <geofetch/downloader/provider_registry.hpp>
#include <geofetch/downloader/transfer_executor.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stop_token>
#include <string_view>
#include <vector>

namespace geofetch::downloader {

struct OrchestratorConfig {
    RetryPolicy retry{};
    std::uint32_t maxConcurrentTransfers{0}; // global ceiling, 0 = none
    std::uint32_t maxBatchWorkers{64};       // downloadMany threads, 0 = sized by limits only
    TransferOptions transfer{};
    AuthenticatorOptions auth{};
};

class Orchestrator {
public:
    /// Null collaborators are replaced by the libcurl adapter/token endpoint and disk writer.
    Orchestrator(std::shared_ptr<const ProviderRegistry> registry, OrchestratorConfig config,
                 std::shared_ptr<IHttpAdapter> http = nullptr,
                 std::shared_ptr<ITokenEndpoint> tokens = nullptr,
                 std::shared_ptr<IDiskWriter> disk = nullptr);

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Process one request on the calling thread.
    DownloadOutcome download(const DownloadRequest& request, std::stop_token stop = {});

    /// Process a batch concurrently on a bounded worker pool (the calling thread included).
    /// Results are in request order; onOutcome is called once per request as it reaches a
    /// terminal state, from whichever worker finished it.
    std::vector<DownloadOutcome> downloadMany(const std::vector<DownloadRequest>& requests,
                                              std::stop_token stop = {},
                                              const OutcomeCallback& onOutcome = {});

    [[nodiscard]] std::optional<GateMetrics> gateMetrics(std::string_view match) const {
        return gates_.metricsFor(match);
    }
    [[nodiscard]] const OrchestratorConfig& config() const noexcept { return config_; }

    /// Backoff before retry `attempt` (1-based count of completed attempts), without jitter
    /// when the policy's jitter is zero.
    [[nodiscard]] std::chrono::milliseconds backoffFor(int attempt);

private:
    struct Job;

    void start(const DownloadRequest& request, Job& job) const;
    // One transfer attempt. Leaves the job terminal, or SoftFailed with its retry delay set.
    void attempt(Job& job, std::stop_token stop);
    void attemptGuarded(Job& job, std::stop_token stop);
    void fail(Job& job, Error error) const;
    void cancel(Job& job) const;
    void complete(Job& job) const;

    std::shared_ptr<const ProviderRegistry> registry_;
    OrchestratorConfig config_;
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<ITokenEndpoint> tokens_;
    std::shared_ptr<IDiskWriter> disk_;

    ConcurrencyGateRegistry gates_;
    AuthenticatorRegistry authenticators_;
    TransferExecutor executor_;
    std::unique_ptr<ConcurrencyGate> globalGate_;

    std::mutex rngMutex_;
    std::mt19937_64 rng_;
};

} // namespace geofetch::downloader
