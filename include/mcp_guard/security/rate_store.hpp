#pragma once

#include <mcp_guard/core/clock.hpp>
#include <mcp_guard/core/result.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace mcp_guard {

// ---------------------------------------------------------------------------
// WindowDecision - outcome of one sliding-window check.
// ---------------------------------------------------------------------------
struct WindowDecision {
    bool allowed = true;
    std::int64_t limit = 0;
    std::int64_t current = 0;     // weight in the window after this call
    std::int64_t remaining = 0;
    TimestampMs reset_time_ms = 0;
    std::int64_t retry_after_s = 0;  // 0 when allowed
};

// ---------------------------------------------------------------------------
// IRateStore - sliding-window counters keyed by string.
//
// Hit() prunes entries at or before now - window_ms, then admits and records
// `increment` iff current + increment <= limit. The prune/check/record
// sequence is atomic per key. increment == 0 only inspects the window.
// ---------------------------------------------------------------------------
class IRateStore {
public:
    virtual ~IRateStore() = default;

    [[nodiscard]] virtual Result<WindowDecision, Error> Hit(
        const std::string& key, std::int64_t limit, std::int64_t increment,
        std::int64_t window_ms, TimestampMs now_ms) = 0;

    // Record weight without a limit check (actual token usage).
    [[nodiscard]] virtual Result<void, Error> Add(
        const std::string& key, std::int64_t weight, std::int64_t window_ms,
        TimestampMs now_ms) = 0;

    virtual void Erase(const std::string& key) = 0;

    // Drop all entries older than now - max_window_ms; returns removed keys.
    virtual std::size_t Cleanup(std::int64_t max_window_ms, TimestampMs now_ms) = 0;

    [[nodiscard]] virtual std::string_view Name() const = 0;
};

// ---------------------------------------------------------------------------
// LocalRateStore - in-process windows behind one mutex.
// ---------------------------------------------------------------------------
class LocalRateStore : public IRateStore {
public:
    [[nodiscard]] Result<WindowDecision, Error> Hit(
        const std::string& key, std::int64_t limit, std::int64_t increment,
        std::int64_t window_ms, TimestampMs now_ms) override;

    [[nodiscard]] Result<void, Error> Add(
        const std::string& key, std::int64_t weight, std::int64_t window_ms,
        TimestampMs now_ms) override;

    void Erase(const std::string& key) override;
    std::size_t Cleanup(std::int64_t max_window_ms, TimestampMs now_ms) override;

    [[nodiscard]] std::string_view Name() const override { return "local"; }

    [[nodiscard]] std::size_t KeyCount() const;

private:
    struct Entry {
        TimestampMs at;
        std::int64_t weight;
    };
    using Window = std::deque<Entry>;

    static std::int64_t Prune(Window& window, TimestampMs cutoff);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Window> windows_;
};

// ---------------------------------------------------------------------------
// ICounterBackend - shared counter store reachable over the network.
//
// SlidingWindowHit must run as one atomic operation on the backend
// (read window, conditionally add, set expiry). Implementations report
// connectivity problems as ErrorCategory::Store.
// ---------------------------------------------------------------------------
class ICounterBackend {
public:
    virtual ~ICounterBackend() = default;

    [[nodiscard]] virtual Result<WindowDecision, Error> SlidingWindowHit(
        const std::string& key, std::int64_t limit, std::int64_t increment,
        std::int64_t window_ms, TimestampMs now_ms) = 0;

    [[nodiscard]] virtual Result<void, Error> Delete(const std::string& key) = 0;

    [[nodiscard]] virtual std::string_view Name() const = 0;
};

// ---------------------------------------------------------------------------
// SharedRateStore - counters in an ICounterBackend, degrading to an
// in-process LocalRateStore whenever the backend fails. Each call retries
// the backend first, so the store recovers on its own.
// ---------------------------------------------------------------------------
class SharedRateStore : public IRateStore {
public:
    explicit SharedRateStore(std::unique_ptr<ICounterBackend> backend);

    [[nodiscard]] Result<WindowDecision, Error> Hit(
        const std::string& key, std::int64_t limit, std::int64_t increment,
        std::int64_t window_ms, TimestampMs now_ms) override;

    [[nodiscard]] Result<void, Error> Add(
        const std::string& key, std::int64_t weight, std::int64_t window_ms,
        TimestampMs now_ms) override;

    void Erase(const std::string& key) override;
    std::size_t Cleanup(std::int64_t max_window_ms, TimestampMs now_ms) override;

    [[nodiscard]] std::string_view Name() const override { return "shared"; }

    [[nodiscard]] bool Degraded() const noexcept { return degraded_.load(); }

private:
    void MarkDegraded(const Error& error);
    void MarkRecovered();

    std::unique_ptr<ICounterBackend> backend_;
    LocalRateStore fallback_;
    std::atomic<bool> degraded_{false};
};

} // namespace mcp_guard
