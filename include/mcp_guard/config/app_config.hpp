#pragma once

#include <mcp_guard/mcp/prompt_catalog.hpp>
#include <mcp_guard/mcp/protocol_handler.hpp>
#include <mcp_guard/mcp/resource_catalog.hpp>
#include <mcp_guard/mcp/tool_registry.hpp>
#include <mcp_guard/security/access_control.hpp>
#include <mcp_guard/security/rate_limiter.hpp>
#include <mcp_guard/security/security_logger.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcp_guard {

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 3000;
    std::string path = "/mcp";
    bool stdio = false;
    std::size_t max_body_bytes = kDefaultMaxBodyBytes;
    // Peers allowed to set X-Auth-* headers. Empty trusts every peer.
    std::vector<std::string> trusted_proxies;
};

// A resource whose body is fixed text from the configuration file.
struct StaticResourceConfig {
    ResourceDefinition definition;
    std::string text;
};

struct ResourcesConfig {
    bool enabled = false;
    bool include_defaults = true;
    std::vector<StaticResourceConfig> static_resources;
};

struct LoggingConfig {
    int verbosity = 0;  // 0 = info, 1 = debug
    bool json = false;
    std::optional<std::string> audit_file;  // security events as JSON lines
};

struct AppConfig {
    std::optional<std::string> config_file;
    ServerConfig server;
    AuthSettings auth;
    RegistryOptions registry;
    RateLimitConfig rate_limits;
    SecurityLoggerConfig security;
    PromptCatalogConfig prompts;
    ResourcesConfig resources;
    LoggingConfig logging;
};

} // namespace mcp_guard
