#include <mcp_guard/security/rate_store.hpp>

#include <mcp_guard/core/log.hpp>

#include <algorithm>
#include <limits>

namespace mcp_guard {

namespace {

std::int64_t CeilDiv(std::int64_t num, std::int64_t den) {
    return (num + den - 1) / den;
}

} // anonymous namespace

// ===========================================================================
// LocalRateStore
// ===========================================================================

std::int64_t LocalRateStore::Prune(Window& window, TimestampMs cutoff) {
    while (!window.empty() && window.front().at <= cutoff) {
        window.pop_front();
    }
    std::int64_t total = 0;
    for (const auto& e : window) {
        total += e.weight;
    }
    return total;
}

Result<WindowDecision, Error> LocalRateStore::Hit(
    const std::string& key, std::int64_t limit, std::int64_t increment,
    std::int64_t window_ms, TimestampMs now_ms) {
    if (window_ms <= 0) {
        return Result<WindowDecision, Error>::Err(Error{
            "RateStore::Hit", "window must be positive", ErrorCategory::Validation});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& window = windows_[key];
    const auto current = Prune(window, now_ms - window_ms);

    WindowDecision d;
    d.limit = limit;
    d.reset_time_ms = now_ms + window_ms;

    if (current + increment > limit) {
        d.allowed = false;
        d.current = current;
        d.remaining = std::max<std::int64_t>(0, limit - current);
        // Earliest moment enough weight has expired to fit the increment.
        std::int64_t to_free = current + increment - limit;
        TimestampMs free_at = now_ms + window_ms;
        for (const auto& e : window) {
            to_free -= e.weight;
            if (to_free <= 0) {
                free_at = e.at + window_ms;
                break;
            }
        }
        if (!window.empty()) {
            d.reset_time_ms = window.front().at + window_ms;
        }
        d.retry_after_s = std::max<std::int64_t>(1, CeilDiv(free_at - now_ms, 1000));
        return Result<WindowDecision, Error>::Ok(d);
    }

    if (increment > 0) {
        window.push_back(Entry{now_ms, increment});
    }
    d.current = current + increment;
    d.remaining = limit - d.current;
    if (!window.empty()) {
        d.reset_time_ms = window.front().at + window_ms;
    } else {
        windows_.erase(key);
    }
    return Result<WindowDecision, Error>::Ok(d);
}

Result<void, Error> LocalRateStore::Add(const std::string& key, std::int64_t weight,
                                        std::int64_t window_ms, TimestampMs now_ms) {
    if (weight <= 0) {
        return Result<void, Error>::Ok();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& window = windows_[key];
    Prune(window, now_ms - window_ms);
    window.push_back(Entry{now_ms, weight});
    return Result<void, Error>::Ok();
}

void LocalRateStore::Erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.erase(key);
}

std::size_t LocalRateStore::Cleanup(std::int64_t max_window_ms, TimestampMs now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = windows_.begin(); it != windows_.end();) {
        Prune(it->second, now_ms - max_window_ms);
        if (it->second.empty()) {
            it = windows_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t LocalRateStore::KeyCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return windows_.size();
}

// ===========================================================================
// SharedRateStore
// ===========================================================================

SharedRateStore::SharedRateStore(std::unique_ptr<ICounterBackend> backend)
    : backend_(std::move(backend)) {}

void SharedRateStore::MarkDegraded(const Error& error) {
    if (!degraded_.exchange(true)) {
        LogWarn("rate_store", "Counter backend '" + std::string(backend_->Name()) +
                                  "' unavailable, using in-process windows: " +
                                  error.ToString());
    }
}

void SharedRateStore::MarkRecovered() {
    if (degraded_.exchange(false)) {
        LogInfo("rate_store", "Counter backend '" + std::string(backend_->Name()) +
                                  "' recovered");
    }
}

Result<WindowDecision, Error> SharedRateStore::Hit(
    const std::string& key, std::int64_t limit, std::int64_t increment,
    std::int64_t window_ms, TimestampMs now_ms) {
    auto result = backend_->SlidingWindowHit(key, limit, increment, window_ms, now_ms);
    if (result.IsOk()) {
        MarkRecovered();
        return result;
    }
    MarkDegraded(result.Error());
    return fallback_.Hit(key, limit, increment, window_ms, now_ms);
}

Result<void, Error> SharedRateStore::Add(const std::string& key, std::int64_t weight,
                                         std::int64_t window_ms, TimestampMs now_ms) {
    if (weight <= 0) {
        return Result<void, Error>::Ok();
    }
    // An unbounded hit records without rejecting.
    auto result = backend_->SlidingWindowHit(
        key, std::numeric_limits<std::int64_t>::max() / 2, weight, window_ms, now_ms);
    if (result.IsOk()) {
        MarkRecovered();
        return Result<void, Error>::Ok();
    }
    MarkDegraded(result.Error());
    return fallback_.Add(key, weight, window_ms, now_ms);
}

void SharedRateStore::Erase(const std::string& key) {
    auto result = backend_->Delete(key);
    if (result.IsErr()) {
        MarkDegraded(result.Error());
    }
    fallback_.Erase(key);
}

std::size_t SharedRateStore::Cleanup(std::int64_t max_window_ms, TimestampMs now_ms) {
    // Backend keys expire on their own.
    return fallback_.Cleanup(max_window_ms, now_ms);
}

} // namespace mcp_guard
