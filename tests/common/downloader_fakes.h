#pragma once

// In-process stand-ins for the network collaborators of the download core.

#include <geofetch/downloader/credential_resolver.hpp>
#include <geofetch/downloader/downloader.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace geofetch::test {

using namespace geofetch::downloader;

struct ScriptedResponse {
    long status{200};
    std::string body{"payload"};
    std::optional<std::string> retryAfter;
    std::optional<std::string> contentDisposition;
    std::optional<Error> error;         // transport failure instead of a response
    std::chrono::milliseconds delay{0}; // time spent "on the wire", cancellable
    std::chrono::milliseconds chunkDelay{0}; // pause after each body chunk

    static ScriptedResponse ok(std::string body) {
        ScriptedResponse r;
        r.body = std::move(body);
        return r;
    }
    static ScriptedResponse status_only(long status) {
        ScriptedResponse r;
        r.status = status;
        r.body.clear();
        return r;
    }
    static ScriptedResponse failure(ErrorCode code, std::string message) {
        ScriptedResponse r;
        r.error = Error{code, std::move(message)};
        return r;
    }
};

struct RecordedCall {
    std::string url; // as sent, query parameters included
    AuthContext auth;
    std::vector<Header> headers;
};

// Answers fetches from per-URL queues (exact URL as requested, before query parameters), or
// from a handler, or with the fallback response. Tracks concurrency per scheme://host.
class ScriptedHttpAdapter final : public IHttpAdapter {
public:
    using Handler = std::function<std::optional<ScriptedResponse>(const TransferSpec&)>;

    void enqueue(const std::string& url, ScriptedResponse response) {
        std::lock_guard<std::mutex> lock(mutex_);
        queues_[url].push_back(std::move(response));
    }

    void setHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    void setFallback(ScriptedResponse response) {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_ = std::move(response);
    }

    Expected<TransportResponse>
    fetch(const TransferSpec& spec, const std::function<bool(const ResponseHead&)>& onResponse,
          const std::function<Expected<void>(std::span<const std::byte>)>& sink,
          std::stop_token cancel) override {
        const auto host = authorityOf(spec.url);
        ScriptedResponse response;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(RecordedCall{spec.url, spec.auth, spec.headers});
            response = pickUnlocked(spec);
            auto& n = inFlight_[host];
            ++n;
            peak_[host] = std::max(peak_[host], n);
            ++totalInFlight_;
            totalPeak_ = std::max(totalPeak_, totalInFlight_);
        }

        auto result = play(response, onResponse, sink, cancel);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --inFlight_[host];
            --totalInFlight_;
        }
        return result;
    }

    std::vector<RecordedCall> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::size_t callCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    std::size_t callsTo(const std::string& urlPrefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(
            std::count_if(calls_.begin(), calls_.end(), [&](const RecordedCall& c) {
                return c.url.rfind(urlPrefix, 0) == 0;
            }));
    }

    int peakInFlight(const std::string& authority) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = peak_.find(authority);
        return it == peak_.end() ? 0 : it->second;
    }

    int totalPeakInFlight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return totalPeak_;
    }

    static std::string authorityOf(const std::string& url) {
        auto scheme = url.find("://");
        if (scheme == std::string::npos)
            return url;
        auto end = url.find_first_of("/?#", scheme + 3);
        return url.substr(0, end);
    }

private:
    static std::string stripQuery(const std::string& url) {
        return url.substr(0, url.find('?'));
    }

    ScriptedResponse pickUnlocked(const TransferSpec& spec) {
        for (const auto& key : {spec.url, stripQuery(spec.url)}) {
            auto it = queues_.find(key);
            if (it != queues_.end() && !it->second.empty()) {
                auto r = std::move(it->second.front());
                it->second.pop_front();
                return r;
            }
        }
        if (handler_) {
            if (auto r = handler_(spec))
                return *r;
        }
        return fallback_;
    }

    static Expected<TransportResponse>
    play(const ScriptedResponse& response,
         const std::function<bool(const ResponseHead&)>& onResponse,
         const std::function<Expected<void>(std::span<const std::byte>)>& sink,
         std::stop_token cancel) {
        const auto until = std::chrono::steady_clock::now() + response.delay;
        while (std::chrono::steady_clock::now() < until) {
            if (cancel.stop_requested())
                return Error{ErrorCode::Cancelled, "Transfer cancelled"};
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        if (cancel.stop_requested())
            return Error{ErrorCode::Cancelled, "Transfer cancelled"};
        if (response.error)
            return *response.error;

        ResponseHead head;
        head.status = response.status;
        head.contentLength = response.body.size();
        head.retryAfter = response.retryAfter;
        head.contentDisposition = response.contentDisposition;

        const bool wanted = onResponse ? onResponse(head) : true;
        TransportResponse out{head, 0};
        if (!wanted || response.status < 200 || response.status >= 300)
            return out;

        // Deliver in small chunks to exercise streaming
        const auto* bytes = reinterpret_cast<const std::byte*>(response.body.data());
        std::size_t offset = 0;
        while (offset < response.body.size()) {
            const auto n = std::min<std::size_t>(4, response.body.size() - offset);
            auto r = sink(std::span<const std::byte>(bytes + offset, n));
            if (!r.ok())
                return r.error();
            offset += n;
            out.bodyBytes += n;
            if (response.chunkDelay.count() > 0)
                std::this_thread::sleep_for(response.chunkDelay);
        }
        return out;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<ScriptedResponse>> queues_;
    Handler handler_;
    ScriptedResponse fallback_{};
    std::vector<RecordedCall> calls_;
    std::map<std::string, int> inFlight_;
    std::map<std::string, int> peak_;
    int totalInFlight_{0};
    int totalPeak_{0};
};

// Token endpoint issuing "token-<n>" and counting exchanges.
class CountingTokenEndpoint final : public ITokenEndpoint {
public:
    std::optional<std::chrono::seconds> expiresIn{std::chrono::seconds(3600)};
    std::chrono::milliseconds delay{0};
    int failuresBeforeSuccess{0}; // first N exchanges fail
    bool alwaysFail{false};
    std::optional<std::string> malformedBody; // parsed with parseTokenResponse when set

    Expected<TokenResponse> exchange(const TokenRequest& request) override {
        const int n = ++calls_;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
        if (malformedBody)
            return parseTokenResponse(*malformedBody);
        if (alwaysFail || n <= failuresBeforeSuccess)
            return Error{ErrorCode::AuthenticationError, "token endpoint answered HTTP 401"};
        TokenResponse r;
        r.accessToken = "token-" + std::to_string(n);
        r.expiresIn = expiresIn;
        r.tokenType = "Bearer";
        return r;
    }

    int calls() const { return calls_.load(); }

    std::vector<TokenRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    std::atomic<int> calls_{0};
    mutable std::mutex mutex_;
    std::vector<TokenRequest> requests_;
};

// Variable table that records every lookup.
class RecordingEnvironment final : public IEnvironment {
public:
    explicit RecordingEnvironment(std::map<std::string, std::string, std::less<>> vars = {})
        : vars_(std::move(vars)) {}

    std::optional<std::string> lookup(std::string_view name) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        lookups_.emplace_back(name);
        auto it = vars_.find(name);
        if (it == vars_.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<std::string> lookups() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookups_;
    }

private:
    std::map<std::string, std::string, std::less<>> vars_;
    mutable std::mutex mutex_;
    mutable std::vector<std::string> lookups_;
};

} // namespace geofetch::test
