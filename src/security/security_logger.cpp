#include <mcp_guard/security/security_logger.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace mcp_guard {

namespace {

constexpr std::int64_t kHourMs = 60LL * 60 * 1000;
constexpr std::int64_t kMinuteMs = 60LL * 1000;

std::string OneDecimal(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}

// Injection scanners. Each runs in linear time without recursion.

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool IsWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool IsLineBreak(char c) {
    return c == '\n' || c == '\r';
}

std::size_t SkipSpace(std::string_view text, std::size_t pos) {
    while (pos < text.size() && IsSpace(text[pos])) ++pos;
    return pos;
}

// `open` followed by `close` later on the same line.
bool PairOnOneLine(std::string_view text, std::string_view open, std::string_view close) {
    std::size_t pos = text.find(open);
    while (pos != std::string_view::npos) {
        std::size_t i = pos + open.size();
        for (; i < text.size() && !IsLineBreak(text[i]); ++i) {
            if (text.compare(i, close.size(), close) == 0) return true;
        }
        pos = text.find(open, i);
    }
    return false;
}

// `$(` followed later by `)`.
bool CommandSubstitution(std::string_view text) {
    const auto pos = text.find("$(");
    return pos != std::string_view::npos && text.find(')', pos + 2) != std::string_view::npos;
}

bool Backticks(std::string_view text) {
    const auto first = text.find('`');
    return first != std::string_view::npos && text.find('`', first + 1) != std::string_view::npos;
}

// `op`, optional whitespace, then a word character.
bool OperatorThenWord(std::string_view text, std::string_view op) {
    for (auto pos = text.find(op); pos != std::string_view::npos; pos = text.find(op, pos + 1)) {
        const auto next = SkipSpace(text, pos + op.size());
        if (next < text.size() && IsWordChar(text[next])) return true;
    }
    return false;
}

bool Semicolon(std::string_view text) { return OperatorThenWord(text, ";"); }
bool Pipe(std::string_view text) { return OperatorThenWord(text, "|"); }
bool AndAnd(std::string_view text) { return OperatorThenWord(text, "&&"); }

bool DoubleBrace(std::string_view text) { return PairOnOneLine(text, "{{", "}}"); }
bool DollarBrace(std::string_view text) { return PairOnOneLine(text, "${", "}"); }
bool HashBrace(std::string_view text) { return PairOnOneLine(text, "#{", "}"); }

// The system override scanners receive lower-cased text.
bool SystemColon(std::string_view lower) {
    for (auto pos = lower.find("system"); pos != std::string_view::npos;
         pos = lower.find("system", pos + 1)) {
        const auto next = SkipSpace(lower, pos + 6);
        if (next < lower.size() && lower[next] == ':') return true;
    }
    return false;
}

// "ignore", at least one whitespace, then "previous" before the line ends.
bool IgnorePrevious(std::string_view lower) {
    std::size_t pos = lower.find("ignore");
    while (pos != std::string_view::npos) {
        const auto after = pos + 6;
        const auto next = SkipSpace(lower, after);
        if (next == after) {
            pos = lower.find("ignore", after);
            continue;
        }
        std::size_t i = next;
        for (; i < lower.size() && !IsLineBreak(lower[i]); ++i) {
            if (lower.compare(i, 8, "previous") == 0) return true;
        }
        pos = lower.find("ignore", i);
    }
    return false;
}

bool InstructionOverride(std::string_view lower) {
    return lower.find("instruction_override") != std::string_view::npos;
}

bool SystemOverride(std::string_view lower) {
    return lower.find("system_override") != std::string_view::npos;
}

struct InjectionPattern {
    SecurityEventType type;
    const char* source;
    bool (*matches)(std::string_view);
    bool lower_case;
};

const std::vector<InjectionPattern>& InjectionPatterns() {
    static const std::vector<InjectionPattern> patterns = [] {
        std::vector<InjectionPattern> p;
        const auto cmd = SecurityEventType::CommandInjectionAttempt;
        p.push_back({cmd, R"(\$\([^)]*\))", &CommandSubstitution, false});
        p.push_back({cmd, R"(`[^`]*`)", &Backticks, false});
        p.push_back({cmd, R"(;\s*\w+)", &Semicolon, false});
        p.push_back({cmd, R"(\|\s*\w+)", &Pipe, false});
        p.push_back({cmd, R"(&&\s*\w+)", &AndAnd, false});
        const auto tpl = SecurityEventType::TemplateInjectionAttempt;
        p.push_back({tpl, R"(\{\{.*?\}\})", &DoubleBrace, false});
        p.push_back({tpl, R"(\$\{.*?\})", &DollarBrace, false});
        p.push_back({tpl, R"(#\{.*?\})", &HashBrace, false});
        const auto sys = SecurityEventType::SystemOverrideAttempt;
        p.push_back({sys, R"(SYSTEM\s*:)", &SystemColon, true});
        p.push_back({sys, R"(ignore\s+.*?previous)", &IgnorePrevious, true});
        p.push_back({sys, "INSTRUCTION_OVERRIDE", &InstructionOverride, true});
        p.push_back({sys, "SYSTEM_OVERRIDE", &SystemOverride, true});
        return p;
    }();
    return patterns;
}

LogLevel LevelFor(SecuritySeverity severity) {
    switch (severity) {
        case SecuritySeverity::Low:      return LogLevel::Info;
        case SecuritySeverity::Medium:   return LogLevel::Warn;
        case SecuritySeverity::High:
        case SecuritySeverity::Critical: return LogLevel::Error;
    }
    return LogLevel::Warn;
}

const char* FindingMessage(SecurityEventType type) {
    switch (type) {
        case SecurityEventType::CommandInjectionAttempt:
            return "Command injection attempt detected in request";
        case SecurityEventType::TemplateInjectionAttempt:
            return "Template injection attempt detected in request";
        case SecurityEventType::SystemOverrideAttempt:
            return "System override attempt detected in request";
        default:
            return "Suspicious request";
    }
}

} // anonymous namespace

const char* SeverityName(SecuritySeverity severity) {
    switch (severity) {
        case SecuritySeverity::Low:      return "low";
        case SecuritySeverity::Medium:   return "medium";
        case SecuritySeverity::High:     return "high";
        case SecuritySeverity::Critical: return "critical";
    }
    return "medium";
}

const char* EventTypeName(SecurityEventType type) {
    switch (type) {
        case SecurityEventType::AuthSuccess:              return "auth_success";
        case SecurityEventType::AuthFailure:              return "auth_failure";
        case SecurityEventType::RateLimitExceeded:        return "rate_limit_exceeded";
        case SecurityEventType::SuspiciousRequest:        return "suspicious_request";
        case SecurityEventType::ToolAccessDenied:         return "tool_access_denied";
        case SecurityEventType::AdminAction:              return "admin_action";
        case SecurityEventType::SourceBlocked:            return "source_blocked";
        case SecurityEventType::CommandInjectionAttempt:  return "command_injection_attempt";
        case SecurityEventType::TemplateInjectionAttempt: return "template_injection_attempt";
        case SecurityEventType::SystemOverrideAttempt:    return "system_override_attempt";
        case SecurityEventType::AnomalyDetected:          return "anomaly_detected";
    }
    return "suspicious_request";
}

nlohmann::json SecurityEvent::ToJson() const {
    nlohmann::json j = {
        {"eventType", EventTypeName(type)},
        {"severity", SeverityName(severity)},
        {"source", source},
        {"message", message},
        {"timestamp", at},
    };
    if (subject_id) {
        j["subjectId"] = *subject_id;
    }
    if (!context.empty()) {
        j["context"] = context;
    }
    return j;
}

std::vector<InjectionFinding> ScanForInjection(std::string_view body) {
    std::vector<InjectionFinding> findings;
    std::string lower(body);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (const auto& pattern : InjectionPatterns()) {
        const bool category_done = std::any_of(
            findings.begin(), findings.end(),
            [&](const InjectionFinding& f) { return f.type == pattern.type; });
        if (category_done) {
            continue;
        }
        if (pattern.matches(pattern.lower_case ? std::string_view(lower) : body)) {
            findings.push_back({pattern.type, pattern.source});
        }
    }
    return findings;
}

// ===========================================================================
// SecurityLogger
// ===========================================================================

SecurityLogger::SecurityLogger(SecurityLoggerConfig config, const IClock& clock,
                               std::unique_ptr<ILogSink> audit_sink)
    : config_(std::move(config)),
      clock_(clock),
      audit_sink_(std::move(audit_sink)),
      alert_window_start_(clock.NowMs()) {
    for (const auto& source : config_.blocked_sources) {
        blocked_[source] = BlockEntry{std::nullopt, "configured block list"};
    }
}

bool SecurityLogger::IsSerious(const SecurityEvent& event) {
    switch (event.type) {
        case SecurityEventType::CommandInjectionAttempt:
        case SecurityEventType::TemplateInjectionAttempt:
        case SecurityEventType::SystemOverrideAttempt:
        case SecurityEventType::AuthFailure:
            return true;
        case SecurityEventType::SourceBlocked:
            return false;
        default:
            return event.severity >= SecuritySeverity::High;
    }
}

void SecurityLogger::RollAlertWindow(TimestampMs now) {
    if (now - alert_window_start_ >= kHourMs) {
        alert_counts_.fill(0);
        alert_window_start_ = now;
    }
}

void SecurityLogger::Emit(const SecurityEvent& event) {
    const auto fields = event.ToJson();
    const auto level = LevelFor(event.severity);
    std::lock_guard<std::mutex> lock(emit_mutex_);
    GlobalLogger().LogFields(level, "security", event.message, fields);
    if (audit_sink_) {
        audit_sink_->WriteFields(level, "security", event.message, fields);
    }
}

void SecurityLogger::EmitAlert(SecuritySeverity severity, std::int64_t count,
                               std::int64_t threshold) {
    const std::string message = "Security alert: " + std::to_string(count) + " " +
                                SeverityName(severity) +
                                " security events in the last hour (threshold: " +
                                std::to_string(threshold) + ")";
    const nlohmann::json fields = {
        {"alert", true},
        {"severity", SeverityName(severity)},
        {"count", count},
        {"threshold", threshold},
    };
    std::lock_guard<std::mutex> lock(emit_mutex_);
    GlobalLogger().LogFields(LogLevel::Warn, "security", message, fields);
    if (audit_sink_) {
        audit_sink_->WriteFields(LogLevel::Warn, "security", message, fields);
    }
}

void SecurityLogger::Record(SecurityEvent event) {
    if (!config_.enabled) {
        return;
    }

    std::vector<SecurityEvent> to_emit;
    std::optional<std::pair<SecuritySeverity, std::int64_t>> alert;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_.NowMs();
        event.at = now;

        RollAlertWindow(now);
        const auto sev = static_cast<std::size_t>(event.severity);
        const auto count = ++alert_counts_[sev];
        if (config_.alerts_enabled && count == config_.alert_thresholds[sev]) {
            alert = std::make_pair(event.severity, count);
        }

        auto& history = events_[event.source];
        while (!history.empty() && history.front().at < now - kHourMs) {
            history.pop_front();
        }
        history.push_back(event);
        while (history.size() > config_.max_events_per_source) {
            history.pop_front();
        }
        to_emit.push_back(event);

        const bool trusted = std::find(config_.trusted_sources.begin(),
                                       config_.trusted_sources.end(),
                                       event.source) != config_.trusted_sources.end();
        const bool already_blocked = blocked_.count(event.source) > 0;
        if (IsSerious(event) && !trusted && !already_blocked &&
            config_.auto_block_threshold > 0) {
            const auto serious = std::count_if(history.begin(), history.end(),
                                               [](const SecurityEvent& e) { return IsSerious(e); });
            if (serious >= config_.auto_block_threshold) {
                const auto until = now + config_.auto_block_minutes * 60 * 1000;
                blocked_[event.source] = BlockEntry{
                    until, "Auto-blocked after " + std::to_string(serious) + " security events"};

                SecurityEvent blocked;
                blocked.type = SecurityEventType::SourceBlocked;
                blocked.severity = SecuritySeverity::Critical;
                blocked.source = event.source;
                blocked.subject_id = event.subject_id;
                blocked.message = "Source auto-blocked after " + std::to_string(serious) +
                                  " security events";
                blocked.context = {{"eventCount", serious},
                                   {"blockMinutes", config_.auto_block_minutes},
                                   {"blockUntil", until}};
                blocked.at = now;
                history.push_back(blocked);
                to_emit.push_back(std::move(blocked));
            }
        }
    }

    for (const auto& e : to_emit) {
        Emit(e);
    }
    if (alert) {
        EmitAlert(alert->first, alert->second,
                  config_.alert_thresholds[static_cast<std::size_t>(alert->first)]);
    }
}

std::vector<InjectionFinding> SecurityLogger::AnalyzeRequest(
    std::string_view body, const std::string& source,
    const std::optional<std::string>& subject_id) {
    auto findings = ScanForInjection(body);
    for (const auto& finding : findings) {
        SecurityEvent event;
        event.type = finding.type;
        event.severity = SecuritySeverity::High;
        event.source = source;
        event.subject_id = subject_id;
        event.message = FindingMessage(finding.type);
        event.context = {{"pattern", finding.pattern}};
        Record(std::move(event));
    }
    return findings;
}

bool SecurityLogger::IsBlocked(const std::string& source) {
    std::optional<std::string> expired_reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = blocked_.find(source);
        if (it == blocked_.end()) {
            return false;
        }
        if (!it->second.until || *it->second.until > clock_.NowMs()) {
            return true;
        }
        expired_reason = it->second.reason;
        blocked_.erase(it);
    }
    LogInfo("security", "Block expired for " + source + " (" + *expired_reason + ")");
    return false;
}

void SecurityLogger::Block(const std::string& source, const std::string& reason,
                           std::int64_t minutes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked_[source] = BlockEntry{clock_.NowMs() + minutes * 60 * 1000, reason};
    }
    SecurityEvent event;
    event.type = SecurityEventType::SourceBlocked;
    event.severity = SecuritySeverity::High;
    event.source = source;
    event.message = "Source manually blocked: " + reason;
    event.context = {{"blockMinutes", minutes}};
    Record(std::move(event));
}

bool SecurityLogger::Unblock(const std::string& source) {
    bool was_blocked = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_blocked = blocked_.erase(source) > 0;
    }
    if (was_blocked) {
        SecurityEvent event;
        event.type = SecurityEventType::AdminAction;
        event.severity = SecuritySeverity::Low;
        event.source = source;
        event.message = "Source manually unblocked";
        Record(std::move(event));
    }
    return was_blocked;
}

std::vector<SecurityEvent> SecurityLogger::RecentEvents(const std::string& source,
                                                        std::int64_t window_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SecurityEvent> out;
    auto it = events_.find(source);
    if (it == events_.end()) {
        return out;
    }
    const auto cutoff = clock_.NowMs() - window_ms;
    for (const auto& e : it->second) {
        if (e.at >= cutoff) {
            out.push_back(e);
        }
    }
    return out;
}

std::array<std::int64_t, 4> SecurityLogger::SeverityCounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (clock_.NowMs() - alert_window_start_ >= kHourMs) {
        return {{0, 0, 0, 0}};
    }
    return alert_counts_;
}

nlohmann::json SecurityLogger::Stats() const {
    const auto counts = SeverityCounts();
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& [source, history] : events_) {
        total += history.size();
    }
    nlohmann::json alerts = nlohmann::json::object();
    for (std::size_t i = 0; i < counts.size(); ++i) {
        alerts[SeverityName(static_cast<SecuritySeverity>(i))] = counts[i];
    }
    return {
        {"blockedSources", blocked_.size()},
        {"totalEvents", total},
        {"activeSources", events_.size()},
        {"alertCounters", alerts},
        {"alertsEnabled", config_.alerts_enabled},
    };
}

std::size_t SecurityLogger::Cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_.NowMs();
    std::size_t removed = 0;
    for (auto it = events_.begin(); it != events_.end();) {
        auto& history = it->second;
        while (!history.empty() && history.front().at < now - kHourMs) {
            history.pop_front();
        }
        if (history.empty()) {
            it = events_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    for (auto it = blocked_.begin(); it != blocked_.end();) {
        if (it->second.until && *it->second.until <= now) {
            it = blocked_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t SecurityLogger::DetectAnomalies() {
    const auto& cfg = config_.anomaly_detection;
    if (!config_.enabled || !cfg.enabled) {
        return 0;
    }

    std::vector<SecurityEvent> anomalies;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto cutoff = clock_.NowMs() - cfg.window_minutes * kMinuteMs;
        for (const auto& [source, history] : events_) {
            std::int64_t total = 0;
            std::int64_t failures = 0;
            for (const auto& e : history) {
                if (e.at <= cutoff || e.type == SecurityEventType::AnomalyDetected) continue;
                ++total;
                if (e.type == SecurityEventType::AuthFailure) ++failures;
            }
            if (total < cfg.min_events) {
                continue;
            }

            const double per_minute =
                static_cast<double>(total) / static_cast<double>(cfg.window_minutes);
            const double error_rate =
                100.0 * static_cast<double>(failures) / static_cast<double>(total);
            std::string reasons;
            if (per_minute > cfg.requests_per_minute) {
                reasons = "High event rate: " + OneDecimal(per_minute) + "/min";
            }
            if (error_rate > cfg.error_rate_percent) {
                if (!reasons.empty()) reasons += ", ";
                reasons += "High auth failure rate: " + OneDecimal(error_rate) + "%";
            }
            if (reasons.empty()) {
                continue;
            }

            SecurityEvent event;
            event.type = SecurityEventType::AnomalyDetected;
            event.severity = SecuritySeverity::High;
            event.source = source;
            event.message = "Anomalous behavior detected: " + reasons;
            event.context = {
                {"events", total},
                {"eventsPerMinute", per_minute},
                {"authFailureRate", error_rate},
                {"windowMinutes", cfg.window_minutes},
            };
            anomalies.push_back(std::move(event));
        }
    }

    for (auto& event : anomalies) {
        Record(std::move(event));
    }
    return anomalies.size();
}

} // namespace mcp_guard
