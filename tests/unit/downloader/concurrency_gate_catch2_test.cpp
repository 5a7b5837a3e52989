// ConcurrencyGate: bounded admission, arrival order, cancellation and slot lifetime

#include <catch2/catch_test_macros.hpp>

#include <geofetch/downloader/concurrency_gate.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

using namespace geofetch::downloader;
using namespace std::chrono_literals;

namespace {

// Spin until pred holds or a generous deadline passes
template <typename Pred> bool eventually(Pred pred, std::chrono::milliseconds limit = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

} // namespace

TEST_CASE("ConcurrencyGate: never exceeds its limit", "[downloader][gate][concurrency]") {
    ConcurrencyGate gate("https://scihub.example", 3);
    std::atomic<int> inside{0};
    std::atomic<int> maxInside{0};
    std::atomic<int> failures{0};

    {
        std::vector<std::jthread> workers;
        for (int i = 0; i < 24; ++i) {
            workers.emplace_back([&] {
                auto slot = gate.acquire();
                if (!slot.ok()) {
                    ++failures;
                    return;
                }
                const int now = ++inside;
                int seen = maxInside.load();
                while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(5ms);
                --inside;
            });
        }
    }

    CHECK(failures.load() == 0);
    CHECK(maxInside.load() <= 3);
    const auto m = gate.metrics();
    CHECK(m.limit == 3);
    CHECK(m.inFlight == 0);
    CHECK(m.waiting == 0);
    CHECK(m.admitted == 24);
    CHECK(m.peakInFlight <= 3);
    CHECK(m.peakInFlight >= 1);
}

TEST_CASE("ConcurrencyGate: waiters are admitted in arrival order", "[downloader][gate]") {
    ConcurrencyGate gate("fifo", 1);
    auto holder = gate.acquire();
    REQUIRE(holder.ok());

    std::mutex orderMutex;
    std::vector<int> order;
    std::vector<std::jthread> waiters;
    constexpr int kWaiters = 6;
    for (int i = 0; i < kWaiters; ++i) {
        waiters.emplace_back([&, i] {
            auto slot = gate.acquire();
            std::lock_guard<std::mutex> lock(orderMutex);
            order.push_back(slot.ok() ? i : -1);
        });
        // Make arrival order deterministic
        REQUIRE(eventually([&] { return gate.metrics().waiting == static_cast<std::uint32_t>(i + 1); }));
    }

    holder.value().release();
    waiters.clear();

    REQUIRE(order.size() == kWaiters);
    for (int i = 0; i < kWaiters; ++i) {
        CHECK(order[i] == i);
    }
}

TEST_CASE("ConcurrencyGate: cancelled waiters leave the queue", "[downloader][gate]") {
    ConcurrencyGate gate("cancel", 1);
    auto holder = gate.acquire();
    REQUIRE(holder.ok());

    SECTION("Stop request wakes the waiter with Cancelled") {
        std::stop_source stop;
        Expected<ConcurrencyGate::Slot> result;
        std::jthread waiter([&] { result = gate.acquire(stop.get_token()); });
        REQUIRE(eventually([&] { return gate.metrics().waiting == 1; }));

        stop.request_stop();
        waiter.join();

        REQUIRE_FALSE(result.ok());
        CHECK(result.error().code == ErrorCode::Cancelled);
        CHECK(gate.metrics().waiting == 0);
        CHECK(gate.metrics().inFlight == 1);
    }

    SECTION("Cancelling one waiter does not disturb the one behind it") {
        std::stop_source stopFirst;
        Expected<ConcurrencyGate::Slot> first;
        std::atomic<bool> secondAdmitted{false};

        std::jthread a([&] { first = gate.acquire(stopFirst.get_token()); });
        REQUIRE(eventually([&] { return gate.metrics().waiting == 1; }));
        std::jthread b([&] {
            auto slot = gate.acquire();
            secondAdmitted = slot.ok();
        });
        REQUIRE(eventually([&] { return gate.metrics().waiting == 2; }));

        stopFirst.request_stop();
        a.join();
        CHECK_FALSE(first.ok());
        CHECK_FALSE(secondAdmitted.load());

        holder.value().release();
        b.join();
        CHECK(secondAdmitted.load());
    }

    SECTION("Already-stopped token fails without waiting") {
        std::stop_source stop;
        stop.request_stop();
        auto r = gate.acquire(stop.get_token());
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().code == ErrorCode::Cancelled);
    }
}

TEST_CASE("ConcurrencyGate: slots release exactly once", "[downloader][gate]") {
    ConcurrencyGate gate("slots", 2);

    SECTION("Explicit release is idempotent") {
        auto a = gate.acquire();
        auto b = gate.acquire();
        REQUIRE(a.ok());
        REQUIRE(b.ok());
        CHECK(gate.metrics().inFlight == 2);

        a.value().release();
        a.value().release();
        CHECK_FALSE(a.value().held());
        CHECK(gate.metrics().inFlight == 1);
    }

    SECTION("Moved-from slot does not release") {
        auto a = gate.acquire();
        REQUIRE(a.ok());
        ConcurrencyGate::Slot moved = std::move(a).value();
        CHECK(moved.held());
        CHECK(gate.metrics().inFlight == 1);
        moved.release();
        CHECK(gate.metrics().inFlight == 0);
    }

    SECTION("Destruction releases") {
        {
            auto a = gate.acquire();
            REQUIRE(a.ok());
            CHECK(gate.metrics().inFlight == 1);
        }
        CHECK(gate.metrics().inFlight == 0);
    }
}

TEST_CASE("ConcurrencyGate: zero limit is unlimited", "[downloader][gate]") {
    ConcurrencyGate gate("<unmatched>", 0);
    std::vector<ConcurrencyGate::Slot> held;
    for (int i = 0; i < 50; ++i) {
        auto s = gate.acquire();
        REQUIRE(s.ok());
        held.push_back(std::move(s).value());
    }
    CHECK(gate.metrics().inFlight == 50);
}

TEST_CASE("ConcurrencyGateRegistry: gates are per profile and independent",
          "[downloader][gate]") {
    ConcurrencyGateRegistry registry;
    ProviderProfile a;
    a.match = "https://a.example";
    a.maxParallelDownloads = 1;
    ProviderProfile b;
    b.match = "https://b.example";
    b.maxParallelDownloads = 1;

    auto& gateA = registry.gateFor(a);
    CHECK(&registry.gateFor(a) == &gateA);
    auto& gateB = registry.gateFor(b);

    auto slotA = gateA.acquire();
    REQUIRE(slotA.ok());

    // A saturated gate does not block another profile
    std::stop_source stop;
    std::jthread watchdog([&stop](std::stop_token done) {
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (!done.stop_requested() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(1ms);
        stop.request_stop();
    });
    auto slotB = gateB.acquire(stop.get_token());
    CHECK(slotB.ok());
    watchdog.request_stop();

    auto m = registry.metricsFor("https://a.example");
    REQUIRE(m.has_value());
    CHECK(m->inFlight == 1);
    CHECK_FALSE(registry.metricsFor("https://c.example").has_value());
}
