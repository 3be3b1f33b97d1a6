#include <mcp_guard/config/config_loader.hpp>

#include <mcp_guard/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace mcp_guard {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Configuration};
}

std::vector<std::string> StringList(const YAML::Node& node) {
    std::vector<std::string> out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
        return out;
    }
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

template <typename T>
void ReadIf(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

// Scopes are either a plain list (all required) or {required, anyOf}.
ScopeRequirement ParseScopes(const YAML::Node& node) {
    ScopeRequirement scopes;
    if (node.IsSequence() || node.IsScalar()) {
        scopes.required = StringList(node);
        return scopes;
    }
    if (node["required"]) scopes.required = StringList(node["required"]);
    if (node["anyOf"]) scopes.any_of = StringList(node["anyOf"]);
    return scopes;
}

void ParseServer(const YAML::Node& node, ServerConfig& server) {
    ReadIf(node, "host", server.host);
    ReadIf(node, "port", server.port);
    ReadIf(node, "path", server.path);
    ReadIf(node, "stdio", server.stdio);
    ReadIf(node, "maxBodyBytes", server.max_body_bytes);
    if (node["trustedProxies"]) server.trusted_proxies = StringList(node["trustedProxies"]);
}

void ParseAuth(const YAML::Node& node, AuthSettings& auth, RegistryOptions& registry) {
    ReadIf(node, "requireAuthForToolsList", auth.require_auth_for_tools_list);
    ReadIf(node, "requireAuthForToolsCall", auth.require_auth_for_tools_call);

    auto& policy = auth.policy;
    if (const auto public_tools = node["publicTools"]) {
        if (public_tools.IsScalar() && public_tools.as<std::string>() == "default") {
            policy.public_tools_mode = PublicToolsMode::Default;
        } else {
            policy.public_tools_mode = PublicToolsMode::Explicit;
            policy.allow_list = StringList(public_tools);
        }
    }
    if (node["denyPublicTools"]) policy.deny_list = StringList(node["denyPublicTools"]);
    if (node["publicCategories"]) {
        policy.allowed_categories = StringList(node["publicCategories"]);
    }
    if (node["legacyPublicTools"]) {
        policy.legacy_allow_list = StringList(node["legacyPublicTools"]);
    }
    if (node["adminUsers"]) auth.admin_users = StringList(node["adminUsers"]);
    if (node["namespaceWhitelist"]) {
        registry.namespace_whitelist = StringList(node["namespaceWhitelist"]);
    }
}

void ParseTier(const YAML::Node& node, TierLimits& tier) {
    ReadIf(node, "requestsPerMinute", tier.requests_per_minute);
    ReadIf(node, "tokensPerMinute", tier.tokens_per_minute);
    ReadIf(node, "concurrent", tier.concurrent);
    ReadIf(node, "requestsPerWindow", tier.requests_per_tier_window);
}

void ParseRateLimits(const YAML::Node& node, RateLimitConfig& limits) {
    ReadIf(node, "enabled", limits.enabled);
    ReadIf(node, "windowMs", limits.window_ms);
    ReadIf(node, "tierWindowMs", limits.tier_window_ms);

    if (const auto tiers = node["tiers"]) {
        if (tiers["anonymous"]) ParseTier(tiers["anonymous"], limits.anonymous);
        if (tiers["authenticated"]) ParseTier(tiers["authenticated"], limits.authenticated);
        if (tiers["admin"]) ParseTier(tiers["admin"], limits.admin);
    }

    if (const auto tools = node["tool_limits"]) {
        for (auto it = tools.begin(); it != tools.end(); ++it) {
            ToolLimit limit;
            ReadIf(it->second, "maxRequests", limit.max_requests);
            ReadIf(it->second, "windowMs", limit.window_ms);
            limits.tool_limits[it->first.as<std::string>()] = limit;
        }
    }

    if (const auto burst = node["burst"]) {
        ReadIf(burst, "enabled", limits.burst.enabled);
        ReadIf(burst, "maxRequests", limits.burst.max_requests);
        ReadIf(burst, "windowMs", limits.burst.window_ms);
    }

    if (const auto adaptive = node["adaptive"]) {
        ReadIf(adaptive, "enabled", limits.adaptive.enabled);
        ReadIf(adaptive, "cpuThreshold", limits.adaptive.thresholds.cpu_percent);
        ReadIf(adaptive, "memoryThreshold", limits.adaptive.thresholds.memory_percent);
        ReadIf(adaptive, "intervalMs", limits.adaptive.interval_ms);
        if (const auto multipliers = adaptive["multipliers"]) {
            if (!multipliers.IsSequence() ||
                multipliers.size() != limits.adaptive.multipliers.size()) {
                throw YAML::Exception(multipliers.Mark(),
                                      "adaptive.multipliers needs exactly 4 values");
            }
            for (std::size_t i = 0; i < limits.adaptive.multipliers.size(); ++i) {
                limits.adaptive.multipliers[i] = multipliers[i].as<double>();
            }
        }
    }
}

void ParseSecurity(const YAML::Node& node, SecurityLoggerConfig& security,
                   LoggingConfig& logging) {
    ReadIf(node, "enabled", security.enabled);
    ReadIf(node, "alertsEnabled", security.alerts_enabled);
    if (const auto thresholds = node["alertThresholds"]) {
        ReadIf(thresholds, "low", security.alert_thresholds[0]);
        ReadIf(thresholds, "medium", security.alert_thresholds[1]);
        ReadIf(thresholds, "high", security.alert_thresholds[2]);
        ReadIf(thresholds, "critical", security.alert_thresholds[3]);
    }
    ReadIf(node, "autoBlockThreshold", security.auto_block_threshold);
    ReadIf(node, "autoBlockMinutes", security.auto_block_minutes);
    if (node["blockedSources"]) security.blocked_sources = StringList(node["blockedSources"]);
    if (node["trustedSources"]) security.trusted_sources = StringList(node["trustedSources"]);
    ReadIf(node, "maxEventsPerSource", security.max_events_per_source);
    if (const auto anomaly = node["anomalyDetection"]) {
        auto& detection = security.anomaly_detection;
        ReadIf(anomaly, "enabled", detection.enabled);
        ReadIf(anomaly, "windowMinutes", detection.window_minutes);
        ReadIf(anomaly, "minEvents", detection.min_events);
        if (const auto thresholds = anomaly["thresholds"]) {
            ReadIf(thresholds, "requestsPerMinute", detection.requests_per_minute);
            ReadIf(thresholds, "errorRate", detection.error_rate_percent);
        }
    }
    if (node["auditLog"]) logging.audit_file = node["auditLog"].as<std::string>();
}

PromptDefinition ParsePrompt(const YAML::Node& node) {
    PromptDefinition prompt;
    prompt.name = node["name"].as<std::string>();
    ReadIf(node, "description", prompt.description);
    ReadIf(node, "template", prompt.template_text);
    if (const auto args = node["arguments"]) {
        for (const auto& arg_node : args) {
            PromptArgument arg;
            arg.name = arg_node["name"].as<std::string>();
            ReadIf(arg_node, "description", arg.description);
            ReadIf(arg_node, "required", arg.required);
            ReadIf(arg_node, "default", arg.default_value);
            prompt.arguments.push_back(std::move(arg));
        }
    }
    return prompt;
}

void ParsePrompts(const YAML::Node& node, PromptCatalogConfig& prompts) {
    ReadIf(node, "enabled", prompts.enabled);
    ReadIf(node, "includeDefaults", prompts.include_defaults);
    if (node["excludeDefaults"]) prompts.exclude_defaults = StringList(node["excludeDefaults"]);
    if (const auto custom = node["custom"]) {
        for (const auto& prompt_node : custom) {
            prompts.custom.push_back(ParsePrompt(prompt_node));
        }
    }
}

void ParseResources(const YAML::Node& node, ResourcesConfig& resources) {
    ReadIf(node, "enabled", resources.enabled);
    ReadIf(node, "includeDefaults", resources.include_defaults);
    if (const auto list = node["static"]) {
        for (const auto& item : list) {
            StaticResourceConfig entry;
            auto& def = entry.definition;
            def.uri = item["uri"].as<std::string>();
            def.name = item["name"] ? item["name"].as<std::string>() : def.uri;
            ReadIf(item, "description", def.description);
            ReadIf(item, "mimeType", def.mime_type);
            ReadIf(item, "requireAuth", def.require_auth);
            if (item["scopes"]) def.scopes = ParseScopes(item["scopes"]);
            ReadIf(item, "text", entry.text);
            resources.static_resources.push_back(std::move(entry));
        }
    }
}

AppConfig ParseRoot(const YAML::Node& root) {
    AppConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw YAML::Exception(root.Mark(), "top level must be a mapping");
    }
    if (root["server"]) ParseServer(root["server"], config.server);
    if (root["auth"]) ParseAuth(root["auth"], config.auth, config.registry);
    if (root["rate_limits"]) ParseRateLimits(root["rate_limits"], config.rate_limits);
    if (root["security"]) ParseSecurity(root["security"], config.security, config.logging);
    if (root["prompts"]) ParsePrompts(root["prompts"], config.prompts);
    if (root["resources"]) ParseResources(root["resources"], config.resources);
    if (const auto logging = root["logging"]) {
        ReadIf(logging, "verbosity", config.logging.verbosity);
        ReadIf(logging, "json", config.logging.json);
    }
    return config;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    std::ifstream in{std::string(file_path)};
    if (!in) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Cannot open config file: " + std::string(file_path)));
    }
    std::ostringstream text;
    text << in.rdbuf();

    auto config = LoadFromYamlString(text.str());
    if (config.IsErr()) {
        return Result<AppConfig, Error>::Err(Error{
            "ConfigLoader", std::string(file_path) + ": " + config.Error().message,
            ErrorCategory::Configuration});
    }
    auto loaded = std::move(config).Value();
    loaded.config_file = std::string(file_path);
    return Result<AppConfig, Error>::Ok(std::move(loaded));
}

Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml) {
    try {
        return Result<AppConfig, Error>::Ok(ParseRoot(YAML::Load(std::string(yaml))));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML: " + std::string(e.what())));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program(kServerName, kVersion);

    int verbosity = 0;

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--host")
        .help("Address to bind the HTTP endpoint to");
    program.add_argument("--port")
        .help("HTTP port")
        .scan<'i', int>();
    program.add_argument("--path")
        .help("HTTP path of the JSON-RPC endpoint");
    program.add_argument("--stdio")
        .help("Serve newline-delimited JSON-RPC on stdin/stdout")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--json-logs")
        .help("Write log lines as JSON")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-v", "--verbose")
        .help("Increase log verbosity (-v debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--host")) {
        config.server.host = *val;
    }
    if (auto val = program.present<int>("--port")) {
        if (*val <= 0 || *val > 65535) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid --port: " + std::to_string(*val)));
        }
        config.server.port = static_cast<uint16_t>(*val);
    }
    if (auto val = program.present("--path")) {
        config.server.path = *val;
    }
    if (program.get<bool>("--stdio")) {
        config.server.stdio = true;
    }
    if (program.get<bool>("--json-logs")) {
        config.logging.json = true;
    }
    config.logging.verbosity = verbosity;

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.server.host != defaults.server.host) {
        merged.server.host = cli_overrides.server.host;
    }
    if (cli_overrides.server.port != defaults.server.port) {
        merged.server.port = cli_overrides.server.port;
    }
    if (cli_overrides.server.path != defaults.server.path) {
        merged.server.path = cli_overrides.server.path;
    }
    if (cli_overrides.server.stdio) {
        merged.server.stdio = true;
    }
    if (cli_overrides.logging.json) {
        merged.logging.json = true;
    }
    if (cli_overrides.logging.verbosity > merged.logging.verbosity) {
        merged.logging.verbosity = cli_overrides.logging.verbosity;
    }
    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    auto fail = [](const std::string& message) {
        return Result<void, Error>::Err(MakeConfigError(message));
    };
    auto positive = [](std::int64_t v) { return v > 0; };
    auto percent = [](double v) { return v > 0.0 && v <= 100.0; };

    if (config.server.port == 0) {
        return fail("Invalid port: 0");
    }
    if (config.server.path.empty() || config.server.path.front() != '/') {
        return fail("server.path must start with '/', got '" + config.server.path + "'");
    }
    if (config.server.max_body_bytes == 0) {
        return fail("server.maxBodyBytes must be positive");
    }

    const auto& limits = config.rate_limits;
    if (!positive(limits.window_ms) || !positive(limits.tier_window_ms)) {
        return fail("rate_limits windows must be positive");
    }
    const std::pair<const char*, const TierLimits*> tiers[] = {
        {"anonymous", &limits.anonymous},
        {"authenticated", &limits.authenticated},
        {"admin", &limits.admin},
    };
    for (const auto& [name, tier] : tiers) {
        if (!positive(tier->requests_per_minute) || !positive(tier->tokens_per_minute) ||
            !positive(tier->concurrent) || !positive(tier->requests_per_tier_window)) {
            return fail(std::string("rate_limits.tiers.") + name +
                        ": limits must be positive");
        }
    }
    for (const auto& [tool, limit] : limits.tool_limits) {
        if (!positive(limit.max_requests) || !positive(limit.window_ms)) {
            return fail("rate_limits.tool_limits." + tool + ": limits must be positive");
        }
    }
    if (limits.burst.enabled &&
        (!positive(limits.burst.max_requests) || !positive(limits.burst.window_ms))) {
        return fail("rate_limits.burst: limits must be positive");
    }

    const auto& adaptive = limits.adaptive;
    if (!percent(adaptive.thresholds.cpu_percent) ||
        !percent(adaptive.thresholds.memory_percent)) {
        return fail("rate_limits.adaptive thresholds must be in (0, 100]");
    }
    if (!positive(adaptive.interval_ms)) {
        return fail("rate_limits.adaptive.intervalMs must be positive");
    }
    for (std::size_t i = 0; i < adaptive.multipliers.size(); ++i) {
        const double m = adaptive.multipliers[i];
        if (m <= 0.0 || m > 1.0) {
            return fail("rate_limits.adaptive.multipliers must be in (0, 1]");
        }
        if (i > 0 && m > adaptive.multipliers[i - 1]) {
            return fail("rate_limits.adaptive.multipliers must be non-increasing");
        }
    }

    const auto& security = config.security;
    for (auto threshold : security.alert_thresholds) {
        if (!positive(threshold)) {
            return fail("security.alertThresholds must be positive");
        }
    }
    if (!positive(security.auto_block_threshold) || !positive(security.auto_block_minutes)) {
        return fail("security autoblock settings must be positive");
    }
    const auto& detection = security.anomaly_detection;
    if (!positive(detection.window_minutes) || !positive(detection.min_events) ||
        detection.requests_per_minute <= 0.0) {
        return fail("security.anomalyDetection: window and thresholds must be positive");
    }
    if (!percent(detection.error_rate_percent)) {
        return fail("security.anomalyDetection.thresholds.errorRate must be in (0, 100]");
    }

    for (const auto& prompt : config.prompts.custom) {
        if (prompt.name.empty()) {
            return fail("prompts.custom: every prompt needs a name");
        }
    }
    for (const auto& resource : config.resources.static_resources) {
        if (resource.definition.uri.empty()) {
            return fail("resources.static: every resource needs a uri");
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_guard
