#include <mcp_guard/security/load_sampler.hpp>

#include <mcp_guard/core/log.hpp>

#include <sys/resource.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>
#include <string>

namespace mcp_guard {

namespace {

double Clamp(double v) {
    return std::min(100.0, std::max(0.0, v));
}

std::int64_t TimevalMicros(const timeval& tv) {
    return static_cast<std::int64_t>(tv.tv_sec) * 1000000 + tv.tv_usec;
}

} // anonymous namespace

LoadLevel ComputeLoadLevel(const SystemLoadSample& sample,
                           const LoadThresholds& thresholds) {
    const double cpu = thresholds.cpu_percent > 0
                           ? sample.cpu_percent / thresholds.cpu_percent : 0.0;
    const double mem = thresholds.memory_percent > 0
                           ? sample.memory_percent / thresholds.memory_percent : 0.0;
    const double ratio = std::max(cpu, mem);
    if (ratio < 1.0) return 0;
    if (ratio < 1.2) return 1;
    if (ratio < 1.5) return 2;
    return 3;
}

const char* LoadLevelName(LoadLevel level) {
    switch (level) {
        case 0:  return "normal";
        case 1:  return "light_load";
        case 2:  return "moderate_load";
        default: return "heavy_load";
    }
}

// ===========================================================================
// ProcLoadProbe
// ===========================================================================

std::int64_t ProcLoadProbe::ProcessCpuMicros() {
    rusage usage{};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0;
    }
    return TimevalMicros(usage.ru_utime) + TimevalMicros(usage.ru_stime);
}

std::optional<double> ProcLoadProbe::MemoryPercent() {
    std::ifstream in("/proc/meminfo");
    if (!in) {
        return std::nullopt;
    }
    std::optional<double> total;
    std::optional<double> available;
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string key;
        double value = 0;
        fields >> key >> value;
        if (key == "MemTotal:") total = value;
        if (key == "MemAvailable:") available = value;
        if (total && available) break;
    }
    if (!total || !available || *total <= 0) {
        return std::nullopt;
    }
    return Clamp((*total - *available) / *total * 100.0);
}

// ===========================================================================
// LoadSampler
// ===========================================================================

LoadSampler::LoadSampler(std::unique_ptr<ILoadProbe> probe, const IClock& clock,
                         LoadThresholds thresholds, std::int64_t interval_ms)
    : probe_(std::move(probe)),
      clock_(clock),
      thresholds_(thresholds),
      interval_ms_(interval_ms),
      current_(std::make_shared<const SystemLoadSample>()) {}

LoadSampler::~LoadSampler() {
    Stop();
}

void LoadSampler::Start() {
    if (worker_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        stopping_ = false;
    }
    SampleNow();
    worker_ = std::thread([this] { Run(); });
}

void LoadSampler::Stop() {
    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        stopping_ = true;
    }
    run_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void LoadSampler::Run() {
    std::unique_lock<std::mutex> lock(run_mutex_);
    while (!stopping_) {
        if (run_cv_.wait_for(lock, std::chrono::milliseconds(interval_ms_),
                             [this] { return stopping_; })) {
            break;
        }
        lock.unlock();
        SampleNow();
        lock.lock();
    }
}

void LoadSampler::SampleNow() {
    const auto now = clock_.NowMs();
    const auto cpu_micros = probe_->ProcessCpuMicros();

    auto sample = std::make_shared<SystemLoadSample>();
    sample->sampled_at = now;

    if (last_cpu_micros_ && now > last_sampled_at_) {
        const double wall_micros = static_cast<double>(now - last_sampled_at_) * 1000.0;
        const double used = static_cast<double>(cpu_micros - *last_cpu_micros_);
        sample->cpu_percent = Clamp(used / wall_micros * 100.0);
    }
    last_cpu_micros_ = cpu_micros;
    last_sampled_at_ = now;

    if (auto mem = probe_->MemoryPercent()) {
        sample->memory_percent = Clamp(*mem);
    }

    const auto previous_level = Level();
    std::atomic_store(&current_,
                      std::shared_ptr<const SystemLoadSample>(std::move(sample)));
    const auto level = Level();
    if (level != previous_level) {
        LogInfo("load", std::string("Load level changed to ") + LoadLevelName(level));
    }
}

std::shared_ptr<const SystemLoadSample> LoadSampler::Current() const {
    return std::atomic_load(&current_);
}

LoadLevel LoadSampler::Level() const {
    return ComputeLoadLevel(*Current(), thresholds_);
}

} // namespace mcp_guard
