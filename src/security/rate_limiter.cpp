#include <mcp_guard/security/rate_limiter.hpp>

#include <mcp_guard/core/log.hpp>

#include <algorithm>
#include <cmath>

namespace mcp_guard {

namespace {

std::string RpmKey(const std::string& id) { return "rpm:" + id; }
std::string TpmKey(const std::string& id) { return "tpm:" + id; }
std::string BurstKey(const std::string& id) { return "burst:" + id; }
std::string ToolKey(const std::string& tool, const std::string& id) {
    return "tool:" + tool + ":" + id;
}
std::string TierKey(CallerTier tier, const std::string& id) {
    return std::string("tier:") + TierName(tier) + ":" + id;
}

nlohmann::json UsageJson(const WindowDecision& w) {
    return {
        {"limit", w.limit},
        {"current", w.current},
        {"remaining", w.remaining},
        {"resetTime", w.reset_time_ms},
    };
}

} // anonymous namespace

const TierLimits& RateLimitConfig::ForTier(CallerTier tier) const {
    switch (tier) {
        case CallerTier::Admin:         return admin;
        case CallerTier::Authenticated: return authenticated;
        case CallerTier::Anonymous:     return anonymous;
    }
    return anonymous;
}

const char* LimitScopeName(LimitScope scope) {
    switch (scope) {
        case LimitScope::Burst:       return "burst";
        case LimitScope::Tool:        return "tool";
        case LimitScope::Tier:        return "tier";
        case LimitScope::Requests:    return "requests";
        case LimitScope::Tokens:      return "tokens";
        case LimitScope::Concurrency: return "concurrency";
    }
    return "requests";
}

// ===========================================================================
// RateDecision
// ===========================================================================

std::string RateDecision::Message() const {
    switch (scope) {
        case LimitScope::Burst:
            return "Rate limit exceeded: too many requests in a short period";
        case LimitScope::Tool:
            return "Rate limit exceeded for this tool";
        case LimitScope::Tokens:
            return "Rate limit exceeded: token budget exhausted";
        case LimitScope::Concurrency:
            return "Rate limit exceeded: too many concurrent requests";
        case LimitScope::Tier:
        case LimitScope::Requests:
            break;
    }
    return "Rate limit exceeded. Please try again later.";
}

nlohmann::json RateDecision::ErrorData() const {
    return {
        {"retryAfter", window.retry_after_s},
        {"limit", window.limit},
        {"current", window.current},
        {"remaining", window.remaining},
        {"resetTime", window.reset_time_ms},
        {"scope", LimitScopeName(scope)},
    };
}

// ===========================================================================
// ConcurrencyCounters / ConcurrencyLease
// ===========================================================================

bool ConcurrencyCounters::TryAcquire(const std::string& key, std::int64_t limit,
                                     std::int64_t& count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& current = counts_[key];
    if (current >= limit) {
        count = current;
        return false;
    }
    count = ++current;
    return true;
}

void ConcurrencyCounters::Release(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(key);
    if (it == counts_.end()) {
        return;
    }
    if (--it->second <= 0) {
        counts_.erase(it);
    }
}

std::int64_t ConcurrencyCounters::Count(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counts_.find(key);
    return it == counts_.end() ? 0 : it->second;
}

void ConcurrencyCounters::Erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    counts_.erase(key);
}

ConcurrencyLease::ConcurrencyLease(std::shared_ptr<ConcurrencyCounters> counters,
                                   std::string key)
    : counters_(std::move(counters)), key_(std::move(key)) {}

ConcurrencyLease::~ConcurrencyLease() {
    Release();
}

ConcurrencyLease::ConcurrencyLease(ConcurrencyLease&& other) noexcept
    : counters_(std::move(other.counters_)), key_(std::move(other.key_)) {
    other.counters_.reset();
}

ConcurrencyLease& ConcurrencyLease::operator=(ConcurrencyLease&& other) noexcept {
    if (this != &other) {
        Release();
        counters_ = std::move(other.counters_);
        key_ = std::move(other.key_);
        other.counters_.reset();
    }
    return *this;
}

void ConcurrencyLease::Release() {
    if (counters_) {
        counters_->Release(key_);
        counters_.reset();
    }
}

// ===========================================================================
// RateLimiter
// ===========================================================================

RateLimiter::RateLimiter(RateLimitConfig config, IRateStore& store, const IClock& clock,
                         const LoadSampler* sampler)
    : config_(std::move(config)),
      store_(store),
      clock_(clock),
      sampler_(sampler),
      concurrency_(std::make_shared<ConcurrencyCounters>()) {}

LoadLevel RateLimiter::CurrentLevel() const {
    if (!config_.adaptive.enabled || sampler_ == nullptr) {
        return 0;
    }
    return sampler_->Level();
}

std::int64_t RateLimiter::ThrottledBudget(std::int64_t base, LoadLevel level,
                                          const std::array<double, 4>& multipliers) {
    const auto idx = static_cast<std::size_t>(std::clamp(level, 0, kMaxLoadLevel));
    const auto scaled = static_cast<std::int64_t>(
        std::floor(static_cast<double>(base) * multipliers[idx]));
    return std::max<std::int64_t>(1, scaled);
}

std::optional<std::int64_t> RateLimiter::EffectiveToolBudget(const std::string& tool) const {
    auto it = config_.tool_limits.find(tool);
    if (it == config_.tool_limits.end()) {
        return std::nullopt;
    }
    return ThrottledBudget(it->second.max_requests, CurrentLevel(),
                           config_.adaptive.multipliers);
}

Result<RateDecision, Error> RateLimiter::Check(LimitScope scope, const std::string& key,
                                               std::int64_t limit, std::int64_t increment,
                                               std::int64_t window_ms, TimestampMs now) {
    auto hit = store_.Hit(key, limit, increment, window_ms, now);
    if (hit.IsErr()) {
        return Result<RateDecision, Error>::Err(std::move(hit).Error());
    }
    RateDecision decision;
    decision.scope = scope;
    decision.window = std::move(hit).Value();
    decision.allowed = decision.window.allowed;
    return Result<RateDecision, Error>::Ok(std::move(decision));
}

Result<RateLimiter::Admission, Error> RateLimiter::Admit(
    const CallerIdentity& caller, const std::optional<std::string>& tool) {
    Admission admission;
    if (!config_.enabled) {
        return Result<Admission, Error>::Ok(std::move(admission));
    }

    const auto id = caller.RateKey();
    const auto tier = TierOf(caller);
    const auto& limits = config_.ForTier(tier);
    const auto now = clock_.NowMs();

    auto reject = [&](RateDecision decision) {
        LogInfo("rate_limit", std::string("Rejected ") + LimitScopeName(decision.scope) +
                                  " budget for " + id);
        admission.decision = std::move(decision);
        return Result<Admission, Error>::Ok(std::move(admission));
    };

    if (config_.burst.enabled) {
        auto r = Check(LimitScope::Burst, BurstKey(id), config_.burst.max_requests, 1,
                       config_.burst.window_ms, now);
        if (r.IsErr()) return Result<Admission, Error>::Err(std::move(r).Error());
        if (!r.Value().allowed) return reject(std::move(r).Value());
    }

    if (tool) {
        auto it = config_.tool_limits.find(*tool);
        if (it != config_.tool_limits.end()) {
            const auto budget = ThrottledBudget(it->second.max_requests, CurrentLevel(),
                                                config_.adaptive.multipliers);
            auto r = Check(LimitScope::Tool, ToolKey(*tool, id), budget, 1,
                           it->second.window_ms, now);
            if (r.IsErr()) return Result<Admission, Error>::Err(std::move(r).Error());
            if (!r.Value().allowed) return reject(std::move(r).Value());
        }
    }

    {
        auto r = Check(LimitScope::Tier, TierKey(tier, id), limits.requests_per_tier_window,
                       1, config_.tier_window_ms, now);
        if (r.IsErr()) return Result<Admission, Error>::Err(std::move(r).Error());
        if (!r.Value().allowed) return reject(std::move(r).Value());
    }

    {
        auto r = Check(LimitScope::Requests, RpmKey(id), limits.requests_per_minute, 1,
                       config_.window_ms, now);
        if (r.IsErr()) return Result<Admission, Error>::Err(std::move(r).Error());
        if (!r.Value().allowed) return reject(std::move(r).Value());
        admission.decision = std::move(r).Value();
    }

    std::int64_t in_flight = 0;
    if (!concurrency_->TryAcquire(id, limits.concurrent, in_flight)) {
        RateDecision decision;
        decision.allowed = false;
        decision.scope = LimitScope::Concurrency;
        decision.window.allowed = false;
        decision.window.limit = limits.concurrent;
        decision.window.current = in_flight;
        decision.window.remaining = 0;
        decision.window.reset_time_ms = now + 1000;
        decision.window.retry_after_s = 1;
        return reject(std::move(decision));
    }
    admission.lease = ConcurrencyLease(concurrency_, id);
    return Result<Admission, Error>::Ok(std::move(admission));
}

Result<RateDecision, Error> RateLimiter::CheckTokens(const CallerIdentity& caller,
                                                     std::int64_t estimated_tokens) {
    if (!config_.enabled) {
        return Result<RateDecision, Error>::Ok(RateDecision{});
    }
    const auto& limits = config_.ForTier(TierOf(caller));
    return Check(LimitScope::Tokens, TpmKey(caller.RateKey()), limits.tokens_per_minute,
                 std::max<std::int64_t>(0, estimated_tokens), config_.window_ms,
                 clock_.NowMs());
}

Result<void, Error> RateLimiter::RecordTokens(const CallerIdentity& caller,
                                              std::int64_t actual_tokens,
                                              std::int64_t estimated_tokens) {
    if (!config_.enabled) {
        return Result<void, Error>::Ok();
    }
    const auto extra = actual_tokens - estimated_tokens;
    return store_.Add(TpmKey(caller.RateKey()), extra, config_.window_ms, clock_.NowMs());
}

Result<nlohmann::json, Error> RateLimiter::Status(const CallerIdentity& caller) {
    const auto id = caller.RateKey();
    const auto tier = TierOf(caller);
    const auto& limits = config_.ForTier(tier);
    const auto now = clock_.NowMs();

    auto rpm = store_.Hit(RpmKey(id), limits.requests_per_minute, 0, config_.window_ms, now);
    if (rpm.IsErr()) return Result<nlohmann::json, Error>::Err(std::move(rpm).Error());
    auto tpm = store_.Hit(TpmKey(id), limits.tokens_per_minute, 0, config_.window_ms, now);
    if (tpm.IsErr()) return Result<nlohmann::json, Error>::Err(std::move(tpm).Error());
    auto tier_window = store_.Hit(TierKey(tier, id), limits.requests_per_tier_window, 0,
                                  config_.tier_window_ms, now);
    if (tier_window.IsErr()) {
        return Result<nlohmann::json, Error>::Err(std::move(tier_window).Error());
    }

    nlohmann::json status = {
        {"identity", id},
        {"tier", TierName(tier)},
        {"requests", UsageJson(rpm.Value())},
        {"tokens", UsageJson(tpm.Value())},
        {"tierWindow", UsageJson(tier_window.Value())},
        {"concurrent", {{"limit", limits.concurrent},
                        {"current", concurrency_->Count(id)}}},
        {"store", std::string(store_.Name())},
    };
    return Result<nlohmann::json, Error>::Ok(std::move(status));
}

void RateLimiter::Reset(const CallerIdentity& caller) {
    const auto id = caller.RateKey();
    store_.Erase(RpmKey(id));
    store_.Erase(TpmKey(id));
    store_.Erase(BurstKey(id));
    for (auto tier : {CallerTier::Anonymous, CallerTier::Authenticated, CallerTier::Admin}) {
        store_.Erase(TierKey(tier, id));
    }
    for (const auto& [tool, limit] : config_.tool_limits) {
        store_.Erase(ToolKey(tool, id));
    }
    concurrency_->Erase(id);
    LogInfo("rate_limit", "Reset rate limits for " + id);
}

std::size_t RateLimiter::Cleanup() {
    std::int64_t max_window = std::max({config_.window_ms, config_.tier_window_ms,
                                        config_.burst.window_ms});
    for (const auto& [tool, limit] : config_.tool_limits) {
        max_window = std::max(max_window, limit.window_ms);
    }
    const auto removed = store_.Cleanup(max_window, clock_.NowMs());
    if (removed > 0) {
        LogDebug("rate_limit", "Cleaned up " + std::to_string(removed) + " expired windows");
    }
    return removed;
}

nlohmann::json RateLimiter::LoadStatus() const {
    SystemLoadSample sample;
    if (sampler_ != nullptr) {
        sample = *sampler_->Current();
    }
    const auto level = CurrentLevel();
    return {
        {"cpu", sample.cpu_percent},
        {"memory", sample.memory_percent},
        {"sampledAt", sample.sampled_at},
        {"level", level},
        {"status", LoadLevelName(level)},
        {"multiplier", config_.adaptive.multipliers[static_cast<std::size_t>(level)]},
        {"adaptive", config_.adaptive.enabled},
        {"thresholds", {{"cpu", config_.adaptive.thresholds.cpu_percent},
                        {"memory", config_.adaptive.thresholds.memory_percent}}},
    };
}

} // namespace mcp_guard
