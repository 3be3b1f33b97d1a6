#pragma once

#include <mcp_guard/core/clock.hpp>
#include <mcp_guard/core/result.hpp>
#include <mcp_guard/security/caller_identity.hpp>
#include <mcp_guard/security/load_sampler.hpp>
#include <mcp_guard/security/rate_store.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcp_guard {

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

struct TierLimits {
    std::int64_t requests_per_minute = 0;
    std::int64_t tokens_per_minute = 0;
    std::int64_t concurrent = 0;
    std::int64_t requests_per_tier_window = 0;
};

struct ToolLimit {
    std::int64_t max_requests = 0;
    std::int64_t window_ms = 60000;
};

struct BurstConfig {
    bool enabled = true;
    std::int64_t max_requests = 50;
    std::int64_t window_ms = 60000;
};

struct AdaptiveConfig {
    bool enabled = true;
    LoadThresholds thresholds;
    std::int64_t interval_ms = 30000;
    std::array<double, 4> multipliers{{1.0, 0.8, 0.6, 0.4}};
};

struct RateLimitConfig {
    bool enabled = true;
    std::int64_t window_ms = 60000;          // rpm / tpm window
    std::int64_t tier_window_ms = 900000;    // long-window tier budget
    TierLimits anonymous{20, 2000, 2, 100};
    TierLimits authenticated{100, 10000, 10, 500};
    TierLimits admin{1000, 100000, 50, 2000};
    std::map<std::string, ToolLimit> tool_limits{
        {"echo", {100, 60000}},
        {"greeting", {60, 60000}},
    };
    BurstConfig burst;
    AdaptiveConfig adaptive;

    [[nodiscard]] const TierLimits& ForTier(CallerTier tier) const;
};

// ---------------------------------------------------------------------------
// RateDecision - which budget (if any) rejected a request.
// ---------------------------------------------------------------------------
enum class LimitScope {
    Burst,
    Tool,
    Tier,
    Requests,
    Tokens,
    Concurrency,
};

[[nodiscard]] const char* LimitScopeName(LimitScope scope);

struct RateDecision {
    bool allowed = true;
    LimitScope scope = LimitScope::Requests;
    WindowDecision window;

    // "Rate limit exceeded ..." message for the -32000 error.
    [[nodiscard]] std::string Message() const;

    // {retryAfter, limit, current, remaining, resetTime, scope}
    [[nodiscard]] nlohmann::json ErrorData() const;
};

// ---------------------------------------------------------------------------
// ConcurrencyLease - holds one in-flight slot; releases it on destruction.
// ---------------------------------------------------------------------------
class ConcurrencyCounters;

class ConcurrencyLease {
public:
    ConcurrencyLease() = default;
    ConcurrencyLease(std::shared_ptr<ConcurrencyCounters> counters, std::string key);
    ~ConcurrencyLease();

    ConcurrencyLease(ConcurrencyLease&& other) noexcept;
    ConcurrencyLease& operator=(ConcurrencyLease&& other) noexcept;
    ConcurrencyLease(const ConcurrencyLease&) = delete;
    ConcurrencyLease& operator=(const ConcurrencyLease&) = delete;

    [[nodiscard]] bool Held() const noexcept { return counters_ != nullptr; }
    void Release();

private:
    std::shared_ptr<ConcurrencyCounters> counters_;
    std::string key_;
};

// In-flight counts per caller key.
class ConcurrencyCounters {
public:
    // Increment iff below limit; `count` receives the in-flight count
    // after the attempt.
    bool TryAcquire(const std::string& key, std::int64_t limit, std::int64_t& count);
    void Release(const std::string& key);
    [[nodiscard]] std::int64_t Count(const std::string& key) const;
    void Erase(const std::string& key);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::int64_t> counts_;
};

// ---------------------------------------------------------------------------
// RateLimiter - layered sliding-window budgets per caller.
//
// Admit() checks, in order: burst, per-tool (scaled by load level), tier
// window, requests/minute, then takes a concurrency slot. The first
// exhausted budget rejects. Token budgets are checked with an estimate
// before the call and topped up with the actual usage afterwards.
// ---------------------------------------------------------------------------
class RateLimiter {
public:
    RateLimiter(RateLimitConfig config, IRateStore& store, const IClock& clock,
                const LoadSampler* sampler = nullptr);

    struct Admission {
        RateDecision decision;
        ConcurrencyLease lease;  // held only when admitted
    };

    [[nodiscard]] Result<Admission, Error> Admit(
        const CallerIdentity& caller, const std::optional<std::string>& tool);

    [[nodiscard]] Result<RateDecision, Error> CheckTokens(
        const CallerIdentity& caller, std::int64_t estimated_tokens);

    // Record the part of actual usage that the estimate did not cover.
    [[nodiscard]] Result<void, Error> RecordTokens(const CallerIdentity& caller,
                                                   std::int64_t actual_tokens,
                                                   std::int64_t estimated_tokens);

    // Per-tool budget after adaptive scaling at the current load level.
    // nullopt when the tool has no configured limit.
    [[nodiscard]] std::optional<std::int64_t> EffectiveToolBudget(
        const std::string& tool) const;

    // floor(base * multipliers[level]), never below 1.
    [[nodiscard]] static std::int64_t ThrottledBudget(
        std::int64_t base, LoadLevel level, const std::array<double, 4>& multipliers);

    // Usage without consuming budget.
    [[nodiscard]] Result<nlohmann::json, Error> Status(const CallerIdentity& caller);

    // Clear every window and in-flight count of a caller.
    void Reset(const CallerIdentity& caller);

    // Drop expired windows; returns removed key count.
    std::size_t Cleanup();

    // {cpu, memory, level, status, thresholds, adaptive}
    [[nodiscard]] nlohmann::json LoadStatus() const;

    [[nodiscard]] const RateLimitConfig& Config() const noexcept { return config_; }

private:
    [[nodiscard]] LoadLevel CurrentLevel() const;
    [[nodiscard]] Result<RateDecision, Error> Check(LimitScope scope, const std::string& key,
                                                    std::int64_t limit,
                                                    std::int64_t increment,
                                                    std::int64_t window_ms,
                                                    TimestampMs now);

    RateLimitConfig config_;
    IRateStore& store_;
    const IClock& clock_;
    const LoadSampler* sampler_;
    std::shared_ptr<ConcurrencyCounters> concurrency_;
};

} // namespace mcp_guard
