#pragma once

#include <mcp_guard/security/rate_store.hpp>

#include <memory>
#include <string>
#include <vector>

namespace mcp_guard {
namespace testing {

// Switches and call log shared between a test and its backend.
struct BackendState {
    bool fail = false;
    int hits = 0;
    std::vector<std::string> deleted;
};

// ---------------------------------------------------------------------------
// FakeCounterBackend - an in-memory stand-in for a shared counter store.
//
// Windows are kept in a LocalRateStore. Setting state->fail makes every
// call return an ErrorCategory::Store error, as an unreachable backend
// would.
// ---------------------------------------------------------------------------
class FakeCounterBackend : public ICounterBackend {
public:
    explicit FakeCounterBackend(std::shared_ptr<BackendState> state)
        : state_(std::move(state)) {}

    [[nodiscard]] Result<WindowDecision, Error> SlidingWindowHit(
        const std::string& key, std::int64_t limit, std::int64_t increment,
        std::int64_t window_ms, TimestampMs now_ms) override {
        ++state_->hits;
        if (state_->fail) {
            return Result<WindowDecision, Error>::Err(Unreachable("SlidingWindowHit"));
        }
        return windows_.Hit(key, limit, increment, window_ms, now_ms);
    }

    [[nodiscard]] Result<void, Error> Delete(const std::string& key) override {
        if (state_->fail) {
            return Result<void, Error>::Err(Unreachable("Delete"));
        }
        state_->deleted.push_back(key);
        windows_.Erase(key);
        return Result<void, Error>::Ok();
    }

    [[nodiscard]] std::string_view Name() const override { return "fake"; }

private:
    static Error Unreachable(const std::string& op) {
        return Error{"FakeCounterBackend::" + op, "connection refused", ErrorCategory::Store};
    }

    std::shared_ptr<BackendState> state_;
    LocalRateStore windows_;
};

} // namespace testing
} // namespace mcp_guard
