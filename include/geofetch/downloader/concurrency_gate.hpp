#pragma once

// ConcurrencyGate
// ---------------
// Bounded admission slot pool for one provider profile.
//
// - acquire() blocks on a condition variable (no polling) until a slot is free
// - Waiters are admitted in arrival order (ticket queue)
// - A stop request on the caller's token removes it from the queue without disturbing others
// - RAII Slot: released exactly once, on destruction or explicit release()

#include <geofetch/downloader/downloader.hpp>
#include <geofetch/downloader/provider_registry.hpp>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace geofetch::downloader {

struct GateMetrics {
    std::uint32_t limit{0}; // 0 = unlimited
    std::uint32_t inFlight{0};
    std::uint32_t waiting{0};
    std::uint32_t peakInFlight{0};
    std::uint64_t admitted{0};
};

class ConcurrencyGate {
public:
    ConcurrencyGate(std::string name, std::uint32_t limit);

    ConcurrencyGate(const ConcurrencyGate&) = delete;
    ConcurrencyGate& operator=(const ConcurrencyGate&) = delete;

    class Slot {
    public:
        Slot() = default;
        ~Slot() { release(); }

        Slot(Slot&& other) noexcept : gate_(std::exchange(other.gate_, nullptr)) {}
        Slot& operator=(Slot&& other) noexcept {
            if (this != &other) {
                release();
                gate_ = std::exchange(other.gate_, nullptr);
            }
            return *this;
        }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        /// Return the slot to its gate; later calls are no-ops
        void release() noexcept;

        [[nodiscard]] bool held() const noexcept { return gate_ != nullptr; }
        explicit operator bool() const noexcept { return held(); }

    private:
        friend class ConcurrencyGate;
        explicit Slot(ConcurrencyGate* gate) : gate_(gate) {}
        ConcurrencyGate* gate_{nullptr};
    };

    /// Block until admitted. Fails with ErrorCode::Cancelled when stop is requested first.
    Expected<Slot> acquire(std::stop_token stop = {});

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::uint32_t limit() const noexcept { return limit_; }
    [[nodiscard]] GateMetrics metrics() const;

private:
    void releaseOne() noexcept;
    [[nodiscard]] bool hasCapacityUnlocked() const noexcept {
        return limit_ == 0 || inFlight_ < limit_;
    }

    const std::string name_;
    const std::uint32_t limit_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::uint64_t> queue_;
    std::uint64_t nextTicket_{0};
    std::uint32_t inFlight_{0};
    std::uint32_t peakInFlight_{0};
    std::uint64_t admitted_{0};
};

/// One gate per provider profile, created on first reference and kept for the registry's life.
class ConcurrencyGateRegistry {
public:
    ConcurrencyGate& gateFor(const ProviderProfile& profile);

    /// Metrics for the gate of a profile match prefix, if it was ever created
    [[nodiscard]] std::optional<GateMetrics> metricsFor(std::string_view match) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<const ProviderProfile*, std::unique_ptr<ConcurrencyGate>> gates_;
};

} // namespace geofetch::downloader
