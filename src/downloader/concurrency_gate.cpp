#include <geofetch/downloader/concurrency_gate.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace geofetch::downloader {

void ConcurrencyGate::Slot::release() noexcept {
    if (auto* gate = std::exchange(gate_, nullptr); gate != nullptr) {
        gate->releaseOne();
    }
}

ConcurrencyGate::ConcurrencyGate(std::string name, std::uint32_t limit)
    : name_(std::move(name)), limit_(limit) {}

Expected<ConcurrencyGate::Slot> ConcurrencyGate::acquire(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto ticket = nextTicket_++;
    queue_.push_back(ticket);

    const bool admitted = cv_.wait(lock, stop, [this, ticket] {
        return !queue_.empty() && queue_.front() == ticket && hasCapacityUnlocked();
    });

    if (!admitted) {
        // Stop requested while waiting; leave the queue so the next ticket can move up
        queue_.erase(std::remove(queue_.begin(), queue_.end(), ticket), queue_.end());
        lock.unlock();
        cv_.notify_all();
        spdlog::debug("gate '{}': wait cancelled", name_);
        return Error{ErrorCode::Cancelled, "cancelled while waiting for a transfer slot"};
    }

    queue_.pop_front();
    ++inFlight_;
    ++admitted_;
    peakInFlight_ = std::max(peakInFlight_, inFlight_);
    const bool moreRoom = !queue_.empty() && hasCapacityUnlocked();
    lock.unlock();
    if (moreRoom) {
        // Head of the queue may be admissible as well
        cv_.notify_all();
    }
    return Slot{this};
}

void ConcurrencyGate::releaseOne() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (inFlight_ > 0)
            --inFlight_;
    }
    cv_.notify_all();
}

GateMetrics ConcurrencyGate::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    GateMetrics m;
    m.limit = limit_;
    m.inFlight = inFlight_;
    m.waiting = static_cast<std::uint32_t>(queue_.size());
    m.peakInFlight = peakInFlight_;
    m.admitted = admitted_;
    return m;
}

ConcurrencyGate& ConcurrencyGateRegistry::gateFor(const ProviderProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& gate = gates_[&profile];
    if (!gate) {
        const std::string name = profile.isDefault ? std::string("<unmatched>") : profile.match;
        gate = std::make_unique<ConcurrencyGate>(name, profile.maxParallelDownloads);
        spdlog::debug("gate '{}' created with limit {}", name, profile.maxParallelDownloads);
    }
    return *gate;
}

std::optional<GateMetrics> ConcurrencyGateRegistry::metricsFor(std::string_view match) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [profile, gate] : gates_) {
        if (profile->match == match)
            return gate->metrics();
    }
    return std::nullopt;
}

} // namespace geofetch::downloader
