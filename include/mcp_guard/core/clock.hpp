#pragma once

#include <chrono>
#include <cstdint>

namespace mcp_guard {

// Milliseconds since the Unix epoch.
using TimestampMs = std::int64_t;

// ---------------------------------------------------------------------------
// IClock - time source for windows, samplers and event logs.
//
// Components that reason about time take an IClock& so tests can drive
// time with ManualClock instead of sleeping.
// ---------------------------------------------------------------------------
class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual TimestampMs NowMs() const = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] TimestampMs NowMs() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }
};

/// Process-wide system clock instance.
inline const IClock& DefaultClock() {
    static const SystemClock clock;
    return clock;
}

} // namespace mcp_guard
