#pragma once

#include <mcp_guard/core/clock.hpp>
#include <mcp_guard/core/log.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_guard {

enum class SecuritySeverity {
    Low = 0,
    Medium = 1,
    High = 2,
    Critical = 3,
};

enum class SecurityEventType {
    AuthSuccess,
    AuthFailure,
    RateLimitExceeded,
    SuspiciousRequest,
    ToolAccessDenied,
    AdminAction,
    SourceBlocked,
    CommandInjectionAttempt,
    TemplateInjectionAttempt,
    SystemOverrideAttempt,
    AnomalyDetected,
};

[[nodiscard]] const char* SeverityName(SecuritySeverity severity);
[[nodiscard]] const char* EventTypeName(SecurityEventType type);

// ---------------------------------------------------------------------------
// SecurityEvent - one audit record.
//
// `source` is the caller's rate key (subject, email or client address).
// ---------------------------------------------------------------------------
struct SecurityEvent {
    SecurityEventType type = SecurityEventType::SuspiciousRequest;
    SecuritySeverity severity = SecuritySeverity::Medium;
    std::string source;
    std::optional<std::string> subject_id;
    std::string message;
    nlohmann::json context = nlohmann::json::object();
    TimestampMs at = 0;  // filled by SecurityLogger::Record

    [[nodiscard]] nlohmann::json ToJson() const;
};

// Per-source behavior analysis over a sliding window of recorded events.
struct AnomalyDetectionConfig {
    bool enabled = true;
    std::int64_t window_minutes = 15;
    std::int64_t min_events = 5;          // fewer events in the window are ignored
    double requests_per_minute = 100.0;   // events per minute
    double error_rate_percent = 50.0;     // auth failures among events
};

struct SecurityLoggerConfig {
    bool enabled = true;
    bool alerts_enabled = true;
    // Events per severity per hour that raise an alert (Low..Critical).
    std::array<std::int64_t, 4> alert_thresholds{{50, 20, 5, 1}};
    std::int64_t auto_block_threshold = 10;
    std::int64_t auto_block_minutes = 60;
    std::vector<std::string> blocked_sources;  // static, never expire
    std::vector<std::string> trusted_sources;  // never auto-blocked
    std::size_t max_events_per_source = 1000;
    AnomalyDetectionConfig anomaly_detection;
};

struct InjectionFinding {
    SecurityEventType type;
    std::string pattern;
};

// Scan a raw request body for command injection, template injection and
// system override patterns. At most one finding per category.
[[nodiscard]] std::vector<InjectionFinding> ScanForInjection(std::string_view body);

// ---------------------------------------------------------------------------
// SecurityLogger - audit trail, alert counters and source blocking.
//
// Events are written to the global logger and, when given, to an audit
// sink as structured fields. Serious events (injection attempts, auth
// failures, High/Critical severity) count toward auto-blocking of their
// source.
// ---------------------------------------------------------------------------
class SecurityLogger {
public:
    SecurityLogger(SecurityLoggerConfig config, const IClock& clock,
                   std::unique_ptr<ILogSink> audit_sink = nullptr);

    void Record(SecurityEvent event);

    // Pre-filter: log one High event per matched category. Never rejects.
    std::vector<InjectionFinding> AnalyzeRequest(
        std::string_view body, const std::string& source,
        const std::optional<std::string>& subject_id = std::nullopt);

    [[nodiscard]] bool IsBlocked(const std::string& source);
    void Block(const std::string& source, const std::string& reason,
               std::int64_t minutes);
    bool Unblock(const std::string& source);

    // Events for a source newer than now - window_ms, oldest first.
    [[nodiscard]] std::vector<SecurityEvent> RecentEvents(const std::string& source,
                                                          std::int64_t window_ms) const;

    // Events of the current hour per severity.
    [[nodiscard]] std::array<std::int64_t, 4> SeverityCounts() const;

    [[nodiscard]] nlohmann::json Stats() const;

    // Drop sources without events in the last hour and expired blocks.
    // Returns the number of entries removed.
    std::size_t Cleanup();

    // Flag sources whose event rate or auth failure rate over the anomaly
    // window exceeds its threshold. Records one High anomaly_detected event
    // per flagged source and returns how many were flagged.
    std::size_t DetectAnomalies();

private:
    struct BlockEntry {
        std::optional<TimestampMs> until;  // nullopt = permanent
        std::string reason;
    };

    static bool IsSerious(const SecurityEvent& event);
    void RollAlertWindow(TimestampMs now);
    void Emit(const SecurityEvent& event);
    void EmitAlert(SecuritySeverity severity, std::int64_t count, std::int64_t threshold);

    SecurityLoggerConfig config_;
    const IClock& clock_;
    std::unique_ptr<ILogSink> audit_sink_;

    mutable std::mutex mutex_;
    std::map<std::string, std::deque<SecurityEvent>> events_;
    std::map<std::string, BlockEntry> blocked_;
    std::array<std::int64_t, 4> alert_counts_{{0, 0, 0, 0}};
    TimestampMs alert_window_start_ = 0;
    std::mutex emit_mutex_;
};

} // namespace mcp_guard
