#pragma once

#include <mcp_guard/security/load_sampler.hpp>

#include <memory>
#include <optional>

namespace mcp_guard {
namespace testing {

// Readings shared between a test and the probe it handed to a sampler.
struct LoadReadings {
    std::int64_t cpu_micros = 0;
    std::optional<double> memory_percent = 10.0;
    int cpu_calls = 0;
};

// ---------------------------------------------------------------------------
// FakeLoadProbe - returns whatever the test wrote into LoadReadings.
//
// Usage:
//   auto readings = std::make_shared<LoadReadings>();
//   LoadSampler sampler(std::make_unique<FakeLoadProbe>(readings), clock, {});
//   readings->cpu_micros += 45'000'000;
// ---------------------------------------------------------------------------
class FakeLoadProbe : public ILoadProbe {
public:
    explicit FakeLoadProbe(std::shared_ptr<LoadReadings> readings)
        : readings_(std::move(readings)) {}

    [[nodiscard]] std::int64_t ProcessCpuMicros() override {
        ++readings_->cpu_calls;
        return readings_->cpu_micros;
    }

    [[nodiscard]] std::optional<double> MemoryPercent() override {
        return readings_->memory_percent;
    }

private:
    std::shared_ptr<LoadReadings> readings_;
};

} // namespace testing
} // namespace mcp_guard
