/*
 * geofetch/src/downloader/orchestrator.cpp
 *
 * Request lifecycle:
 *   Pending -> InFlight -> Succeeded
 *                       -> Failed                  (hard failure, or soft failures exhausted)
 *                       -> SoftFailed -> InFlight  (after Retry-After / backoff)
 *                                     -> Abandoned (cancelled while waiting)
 *
 * Slots are always taken profile gate first, then the global gate, and both are released
 * before any backoff wait.
 */

#include <geofetch/downloader/orchestrator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace geofetch::downloader {

struct Orchestrator::Job {
    const DownloadRequest* request{nullptr};
    std::shared_ptr<const ProviderProfile> profile;
    DownloadOutcome out;
    std::chrono::steady_clock::time_point started{};
    std::chrono::steady_clock::time_point readyAt{};
    std::chrono::milliseconds retryDelay{0};
    bool done{false};
};

namespace {

std::string_view providerLabel(const ProviderProfile& profile) {
    return profile.isDefault ? std::string_view("<unmatched>") : std::string_view(profile.match);
}

// Sleep for `delay` or until stop is requested. Returns false when interrupted.
bool interruptibleWait(std::chrono::milliseconds delay, std::stop_token stop) {
    if (delay.count() <= 0)
        return !stop.stop_requested();
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

// Stop token raised by either the batch or the request's own token.
class LinkedStop {
public:
    LinkedStop(std::stop_token batch, std::stop_token request)
        : onBatch_(std::move(batch), [this] { source_.request_stop(); }),
          onRequest_(std::move(request), [this] { source_.request_stop(); }) {}

    [[nodiscard]] std::stop_token token() const noexcept { return source_.get_token(); }

private:
    std::stop_source source_;
    std::stop_callback<std::function<void()>> onBatch_;
    std::stop_callback<std::function<void()>> onRequest_;
};

} // namespace

Orchestrator::Orchestrator(std::shared_ptr<const ProviderRegistry> registry,
                           OrchestratorConfig config, std::shared_ptr<IHttpAdapter> http,
                           std::shared_ptr<ITokenEndpoint> tokens,
                           std::shared_ptr<IDiskWriter> disk)
    : registry_(std::move(registry)), config_(std::move(config)),
      http_(http ? std::move(http) : makeCurlHttpAdapter()),
      tokens_(tokens ? std::move(tokens) : makeCurlTokenEndpoint()),
      disk_(disk ? std::move(disk) : makeDiskWriter()), authenticators_(tokens_, config_.auth),
      executor_(http_, disk_, config_.transfer), rng_(std::random_device{}()) {
    if (config_.maxConcurrentTransfers > 0) {
        globalGate_ = std::make_unique<ConcurrencyGate>("<global>", config_.maxConcurrentTransfers);
    }
}

std::chrono::milliseconds Orchestrator::backoffFor(int attempt) {
    const auto& p = config_.retry;
    const double exponent = static_cast<double>(std::max(0, attempt - 1));
    double ms = static_cast<double>(p.initialBackoff.count()) * std::pow(p.multiplier, exponent);
    const double cap = static_cast<double>(p.maxBackoff.count());
    ms = std::min(ms, cap);

    if (p.jitter > 0.0) {
        std::uniform_real_distribution<double> dist(1.0 - p.jitter, 1.0 + p.jitter);
        std::lock_guard<std::mutex> lock(rngMutex_);
        ms *= dist(rng_);
    }
    ms = std::clamp(ms, 0.0, cap);
    return std::chrono::milliseconds(static_cast<std::int64_t>(ms));
}

void Orchestrator::complete(Job& job) const {
    job.out.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - job.started);
    job.done = true;
}

void Orchestrator::fail(Job& job, Error error) const {
    job.out.state = RequestState::Failed;
    job.out.status = OutcomeStatus::HardFailure;
    spdlog::error("Download of {} failed ({}): {}", job.out.url, errorCodeName(error.code),
                  error.message);
    job.out.error = std::move(error);
    complete(job);
}

void Orchestrator::cancel(Job& job) const {
    if (job.out.state == RequestState::SoftFailed) {
        job.out.state = RequestState::Abandoned;
        job.out.error = Error{ErrorCode::Cancelled, "cancelled while waiting to retry"};
        spdlog::info("Download of {} abandoned while waiting to retry", job.out.url);
        complete(job);
        return;
    }
    fail(job, Error{ErrorCode::Cancelled, "cancelled before transfer"});
}

void Orchestrator::start(const DownloadRequest& request, Job& job) const {
    job.request = &request;
    job.started = std::chrono::steady_clock::now();
    job.out.url = request.url;
    job.out.destination = request.destination;
    job.out.state = RequestState::Pending;

    auto resolved = registry_->resolve(request.url);
    if (!resolved.ok()) {
        fail(job, resolved.error());
        return;
    }
    job.profile = std::move(resolved).value();
    job.out.provider = job.profile->match;
}

void Orchestrator::attempt(Job& job, std::stop_token stop) {
    const DownloadRequest& request = *job.request;
    const ProviderProfile& profile = *job.profile;
    auto& out = job.out;
    const int maxAttempts = std::max(1, config_.retry.maxAttempts);
    const int number = out.attempts + 1;

    if (stop.stop_requested()) {
        cancel(job);
        return;
    }

    auto& gate = gates_.gateFor(profile);
    auto& auth = authenticators_.authenticatorFor(profile);

    auto slot = gate.acquire(stop);
    if (!slot.ok()) {
        fail(job, slot.error());
        return;
    }
    ConcurrencyGate::Slot globalSlot;
    if (globalGate_) {
        auto g = globalGate_->acquire(stop);
        if (!g.ok()) {
            fail(job, g.error());
            return;
        }
        globalSlot = std::move(g).value();
    }

    out.state = RequestState::InFlight;
    out.attempts = number;
    spdlog::debug("{} -> in_flight (provider '{}', attempt {}/{})", request.url,
                  providerLabel(profile), number, maxAttempts);

    auto result = executor_.fetch(request, profile, auth, stop);

    globalSlot.release();
    slot.value().release();

    out.status = result.status;
    out.transportStatus = result.transportStatus;

    switch (result.status) {
        case OutcomeStatus::Success:
            out.state = RequestState::Succeeded;
            out.artifact = std::move(result.artifact);
            out.hash = std::move(result.hash);
            out.sizeBytes = result.sizeBytes;
            out.error.reset();
            spdlog::info("Downloaded {} -> {} ({} bytes, {})", request.url,
                         out.artifact ? out.artifact->string() : std::string{}, out.sizeBytes,
                         out.hash);
            complete(job);
            return;

        case OutcomeStatus::HardFailure:
            fail(job, result.error.value_or(Error{ErrorCode::Unknown, "transfer failed"}));
            return;

        case OutcomeStatus::SoftFailure:
            break;
    }

    const std::string reason = result.softFailureReason.value_or("temporarily unavailable");
    out.softFailureReason = reason;
    out.retryAfter = result.retryAfter;

    if (number >= maxAttempts) {
        out.state = RequestState::Failed;
        out.error = Error{ErrorCode::TransientProviderError,
                          reason + " (gave up after " + std::to_string(number) + " attempt(s))"};
        spdlog::error("Download of {} failed: provider still unavailable after {} attempt(s): {}",
                      request.url, number, reason);
        complete(job);
        return;
    }

    std::chrono::milliseconds delay = backoffFor(number);
    if (result.retryAfter) {
        delay = std::min<std::chrono::milliseconds>(
            std::chrono::duration_cast<std::chrono::milliseconds>(*result.retryAfter),
            config_.retry.maxRetryAfter);
    }

    out.state = RequestState::SoftFailed;
    job.retryDelay = delay;
    spdlog::warn("{} soft failure (status {}): {}; retrying in {} ms", request.url,
                 result.transportStatus.value_or(0), reason, delay.count());
}

void Orchestrator::attemptGuarded(Job& job, std::stop_token stop) {
    try {
        attempt(job, stop);
    } catch (const std::exception& e) {
        spdlog::error("Download of {} aborted by exception: {}", job.out.url, e.what());
        fail(job, Error{ErrorCode::Unknown, e.what()});
    }
}

DownloadOutcome Orchestrator::download(const DownloadRequest& request, std::stop_token stop) {
    Job job;
    start(request, job);
    LinkedStop link(stop, request.cancel);
    while (!job.done) {
        attemptGuarded(job, link.token());
        if (!job.done && !interruptibleWait(job.retryDelay, link.token())) {
            cancel(job);
        }
    }
    return std::move(job.out);
}

std::vector<DownloadOutcome> Orchestrator::downloadMany(const std::vector<DownloadRequest>& requests,
                                                        std::stop_token stop,
                                                        const OutcomeCallback& onOutcome) {
    std::vector<DownloadOutcome> results(requests.size());
    if (requests.empty())
        return results;

    spdlog::info("Starting batch of {} download(s)", requests.size());
    const auto started = std::chrono::steady_clock::now();

    std::vector<Job> jobs(requests.size());
    std::mutex callbackMutex;
    auto publish = [&](const Job& job) {
        if (!onOutcome)
            return;
        std::lock_guard<std::mutex> lock(callbackMutex);
        try {
            onOutcome(job.out);
        } catch (const std::exception& e) {
            spdlog::warn("Outcome callback for {} threw: {}", job.out.url, e.what());
        }
    };

    // Scheduler state, guarded by `mutex`
    std::mutex mutex;
    std::condition_variable_any cv;
    std::uint64_t generation = 0;
    std::deque<std::size_t> queue;
    std::unordered_map<const ProviderProfile*, std::uint32_t> lanes;
    std::unordered_map<const ProviderProfile*, std::uint32_t> busy;
    std::size_t remaining = 0;

    for (std::size_t i = 0; i < requests.size(); ++i) {
        start(requests[i], jobs[i]);
        if (jobs[i].done) {
            publish(jobs[i]);
            continue;
        }
        ++lanes[jobs[i].profile.get()];
        queue.push_back(i);
        ++remaining;
    }

    // A profile gets at most its limit of lanes; the pool has one worker per lane
    std::size_t workerCount = 0;
    for (auto& [profile, lane] : lanes) {
        if (profile->maxParallelDownloads > 0)
            lane = std::min(lane, profile->maxParallelDownloads);
        workerCount += lane;
    }
    if (config_.maxConcurrentTransfers > 0)
        workerCount = std::min<std::size_t>(workerCount, config_.maxConcurrentTransfers);
    if (config_.maxBatchWorkers > 0)
        workerCount = std::min<std::size_t>(workerCount, config_.maxBatchWorkers);
    workerCount = std::max<std::size_t>(workerCount, 1);

    auto wake = [&] {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++generation;
        }
        cv.notify_all();
    };
    // Per-request cancellation must reach workers parked on the queue
    std::vector<std::unique_ptr<std::stop_callback<std::function<void()>>>> cancelHooks;
    for (const auto& r : requests) {
        if (r.cancel.stop_possible())
            cancelHooks.push_back(
                std::make_unique<std::stop_callback<std::function<void()>>>(r.cancel, wake));
    }

    auto worker = [&] {
        std::unique_lock<std::mutex> lock(mutex);
        while (remaining > 0) {
            const auto now = std::chrono::steady_clock::now();
            const bool stopping = stop.stop_requested();
            std::optional<std::chrono::steady_clock::time_point> nextReady;
            auto pick = queue.end();
            for (auto it = queue.begin(); it != queue.end(); ++it) {
                const Job& job = jobs[*it];
                if (stopping || job.request->cancel.stop_requested()) {
                    pick = it;
                    break;
                }
                if (job.readyAt > now) {
                    nextReady = nextReady ? std::min(*nextReady, job.readyAt) : job.readyAt;
                    continue;
                }
                const auto* profile = job.profile.get();
                if (busy[profile] < lanes[profile]) {
                    pick = it;
                    break;
                }
            }

            if (pick == queue.end()) {
                const auto seen = generation;
                auto changed = [&] { return generation != seen; };
                if (stopping)
                    cv.wait(lock, changed);
                else if (nextReady)
                    cv.wait_until(lock, stop, *nextReady, changed);
                else
                    cv.wait(lock, stop, changed);
                continue;
            }

            const std::size_t index = *pick;
            queue.erase(pick);
            Job& job = jobs[index];
            const auto* profile = job.profile.get();
            const bool cancelled = stop.stop_requested() || job.request->cancel.stop_requested();
            if (!cancelled)
                ++busy[profile];
            lock.unlock();

            if (cancelled) {
                cancel(job);
            } else {
                LinkedStop link(stop, job.request->cancel);
                attemptGuarded(job, link.token());
            }
            if (job.done)
                publish(job);

            lock.lock();
            if (!cancelled)
                --busy[profile];
            if (job.done) {
                --remaining;
            } else {
                job.readyAt = std::chrono::steady_clock::now() + job.retryDelay;
                queue.push_back(index);
            }
            ++generation;
            cv.notify_all();
        }
    };

    if (remaining > 0) {
        spdlog::debug("Batch of {} queued request(s) on up to {} worker(s)", remaining,
                      workerCount);
        std::vector<std::jthread> pool;
        for (std::size_t w = 1; w < workerCount; ++w) {
            try {
                pool.emplace_back(worker);
            } catch (const std::system_error& e) {
                spdlog::warn("Batch running on {} of {} worker(s): {}", w, workerCount, e.what());
                break;
            }
        }
        worker();
    } // join

    for (std::size_t i = 0; i < jobs.size(); ++i)
        results[i] = std::move(jobs[i].out);

    const auto succeeded = static_cast<std::size_t>(std::count_if(
        results.begin(), results.end(), [](const DownloadOutcome& o) { return o.succeeded(); }));
    spdlog::info("Batch finished: {} succeeded, {} not succeeded in {} ms", succeeded,
                 results.size() - succeeded,
                 std::chrono::duration_cast<std::chrono::milliseconds>(
                     std::chrono::steady_clock::now() - started)
                     .count());
    return results;
}

} // namespace geofetch::downloader
