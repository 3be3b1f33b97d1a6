#pragma once

#include <mcp_guard/core/clock.hpp>

#include <array>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace mcp_guard {

// ---------------------------------------------------------------------------
// SystemLoadSample - one published load measurement.
// ---------------------------------------------------------------------------
struct SystemLoadSample {
    double cpu_percent = 0.0;     // [0, 100]
    double memory_percent = 0.0;  // [0, 100]
    TimestampMs sampled_at = 0;
};

struct LoadThresholds {
    double cpu_percent = 80.0;
    double memory_percent = 85.0;
};

// 0 = normal, 1 = light, 2 = moderate, 3 = heavy.
using LoadLevel = int;
inline constexpr LoadLevel kMaxLoadLevel = 3;

// Bucket max(cpu/cpu_threshold, mem/mem_threshold) at <1.0, <1.2, <1.5.
[[nodiscard]] LoadLevel ComputeLoadLevel(const SystemLoadSample& sample,
                                         const LoadThresholds& thresholds);

[[nodiscard]] const char* LoadLevelName(LoadLevel level);

// ---------------------------------------------------------------------------
// ILoadProbe - raw process/host readings.
// ---------------------------------------------------------------------------
class ILoadProbe {
public:
    virtual ~ILoadProbe() = default;

    // User + system CPU time consumed by this process, in microseconds.
    [[nodiscard]] virtual std::int64_t ProcessCpuMicros() = 0;

    // Share of host memory in use, [0, 100]. nullopt when unavailable.
    [[nodiscard]] virtual std::optional<double> MemoryPercent() = 0;
};

// getrusage() for CPU time, /proc/meminfo for memory.
class ProcLoadProbe : public ILoadProbe {
public:
    [[nodiscard]] std::int64_t ProcessCpuMicros() override;
    [[nodiscard]] std::optional<double> MemoryPercent() override;
};

// ---------------------------------------------------------------------------
// LoadSampler - periodically recomputes the load sample.
//
// SampleNow() is the only writer and owns the CPU baseline. Readers get
// the latest published sample through an atomic shared_ptr snapshot and
// never block on the sampler.
// ---------------------------------------------------------------------------
class LoadSampler {
public:
    LoadSampler(std::unique_ptr<ILoadProbe> probe, const IClock& clock,
                LoadThresholds thresholds, std::int64_t interval_ms = 30000);
    ~LoadSampler();

    LoadSampler(const LoadSampler&) = delete;
    LoadSampler& operator=(const LoadSampler&) = delete;

    // Background thread calling SampleNow() every interval.
    void Start();
    void Stop();

    // Take one measurement and publish it. The first call reports 0% CPU.
    void SampleNow();

    [[nodiscard]] std::shared_ptr<const SystemLoadSample> Current() const;
    [[nodiscard]] LoadLevel Level() const;
    [[nodiscard]] const LoadThresholds& Thresholds() const noexcept { return thresholds_; }

private:
    void Run();

    std::unique_ptr<ILoadProbe> probe_;
    const IClock& clock_;
    LoadThresholds thresholds_;
    std::int64_t interval_ms_;

    std::shared_ptr<const SystemLoadSample> current_;

    std::optional<std::int64_t> last_cpu_micros_;
    TimestampMs last_sampled_at_ = 0;

    std::mutex run_mutex_;
    std::condition_variable run_cv_;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace mcp_guard
