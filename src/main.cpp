#include <mcp_guard/config/config_loader.hpp>
#include <mcp_guard/core/clock.hpp>
#include <mcp_guard/core/log.hpp>
#include <mcp_guard/core/version.hpp>
#include <mcp_guard/mcp/builtin_tools.hpp>
#include <mcp_guard/mcp/procedure.hpp>
#include <mcp_guard/mcp/prompt_catalog.hpp>
#include <mcp_guard/mcp/protocol_handler.hpp>
#include <mcp_guard/mcp/resource_catalog.hpp>
#include <mcp_guard/mcp/tool_registry.hpp>
#include <mcp_guard/security/access_control.hpp>
#include <mcp_guard/security/load_sampler.hpp>
#include <mcp_guard/security/rate_limiter.hpp>
#include <mcp_guard/security/rate_store.hpp>
#include <mcp_guard/security/security_logger.hpp>
#include <mcp_guard/server/http_endpoint.hpp>

#include <chrono>
#include <condition_variable>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig = 1;
constexpr int kExitStartup = 2;

constexpr std::chrono::minutes kCleanupInterval{5};

void PrintError(const mcp_guard::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// Drops expired rate windows and security state, and runs anomaly
// detection, in the background until destroyed.
class WindowJanitor {
public:
    WindowJanitor(mcp_guard::RateLimiter& limiter, mcp_guard::SecurityLogger& security)
        : limiter_(limiter), security_(security), thread_([this] { Run(); }) {}

    ~WindowJanitor() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

    WindowJanitor(const WindowJanitor&) = delete;
    WindowJanitor& operator=(const WindowJanitor&) = delete;

private:
    void Run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!cv_.wait_for(lock, kCleanupInterval, [this] { return stop_; })) {
            const auto removed = limiter_.Cleanup();
            if (removed > 0) {
                mcp_guard::LogDebug("rate_limit",
                                    "Dropped " + std::to_string(removed) + " expired windows");
            }
            const auto dropped = security_.Cleanup();
            if (dropped > 0) {
                mcp_guard::LogDebug("security", "Dropped " + std::to_string(dropped) +
                                                    " idle sources and expired blocks");
            }
            security_.DetectAnomalies();
        }
    }

    mcp_guard::RateLimiter& limiter_;
    mcp_guard::SecurityLogger& security_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread thread_;
};

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_guard;

    // Step 1: CLI flags (argparse handles --help and --version itself).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return kExitConfig;
    }
    auto config = std::move(cli_result).Value();

    // Step 2: YAML file, with CLI values taking precedence.
    if (config.config_file) {
        auto yaml_result = LoadFromYaml(*config.config_file);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error());
            return kExitConfig;
        }
        config = MergeConfigs(yaml_result.Value(), config);
    }

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return kExitConfig;
    }

    // Step 3: logging.
    const auto log_level = config.logging.verbosity > 0 ? LogLevel::Debug : LogLevel::Info;
    if (config.logging.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), log_level);
    } else {
        const bool use_color = !NoColorEnvSet() && IsStderrTty();
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(use_color), log_level);
    }
    LogInfo("main", std::string(kServerName) + " " + kVersion + " starting");

    std::ofstream audit_file;
    std::unique_ptr<ILogSink> audit_sink;
    if (config.logging.audit_file) {
        audit_file.open(*config.logging.audit_file, std::ios::app);
        if (!audit_file) {
            PrintError(Error{"main", "cannot open audit log " + *config.logging.audit_file,
                             ErrorCategory::Configuration});
            return kExitStartup;
        }
        audit_sink = std::make_unique<JsonSink>(audit_file);
    }

    // Step 4: components.
    const auto& clock = DefaultClock();
    LoadSampler sampler(std::make_unique<ProcLoadProbe>(), clock,
                        config.rate_limits.adaptive.thresholds,
                        config.rate_limits.adaptive.interval_ms);
    LocalRateStore store;
    RateLimiter limiter(config.rate_limits, store, clock,
                        config.rate_limits.adaptive.enabled ? &sampler : nullptr);
    SecurityLogger security(config.security, clock, std::move(audit_sink));
    AccessController access(config.auth);

    ProcedureSet procedures;
    auto registered = RegisterBuiltinProcedures(procedures, limiter);
    if (registered.IsErr()) {
        PrintError(registered.Error());
        return kExitStartup;
    }
    ToolRegistry tools(procedures, config.registry);

    PromptCatalog prompts(config.prompts);
    ResourceCatalog resources(config.resources.enabled);
    if (config.resources.include_defaults) {
        auto added = RegisterBuiltinResources(resources, tools, limiter);
        if (added.IsErr()) {
            PrintError(added.Error());
            return kExitStartup;
        }
    }
    for (const auto& entry : config.resources.static_resources) {
        auto added = resources.AddStatic(entry.definition, entry.text);
        if (added.IsErr()) {
            PrintError(added.Error());
            return kExitStartup;
        }
    }

    HandlerOptions handler_options;
    handler_options.max_body_bytes = config.server.max_body_bytes;
    ProtocolHandler handler(tools, access, limiter, security, prompts, resources,
                            handler_options);

    if (config.rate_limits.adaptive.enabled) {
        sampler.Start();
    }
    WindowJanitor janitor(limiter, security);

    // Step 5: serve.
    int exit_code = kExitSuccess;
    if (config.server.stdio) {
        LogInfo("main", "Serving JSON-RPC on stdin/stdout");
        handler.RunStdio(std::cin, std::cout, CallerIdentity::Anonymous("stdio"));
    } else {
        HttpEndpoint endpoint(config.server, handler, access, limiter);
        auto listened = endpoint.Listen();
        if (listened.IsErr()) {
            PrintError(listened.Error());
            exit_code = kExitStartup;
        }
    }

    sampler.Stop();
    LogInfo("main", "Shut down");
    return exit_code;
}
