#pragma once

#include <mcp_guard/config/app_config.hpp>
#include <mcp_guard/core/result.hpp>
#include <mcp_guard/mcp/protocol_handler.hpp>
#include <mcp_guard/security/access_control.hpp>
#include <mcp_guard/security/caller_identity.hpp>

#include <map>
#include <memory>
#include <string>

namespace mcp_guard {

inline constexpr const char* kSubjectHeader = "X-Auth-Subject";
inline constexpr const char* kEmailHeader = "X-Auth-Email";
inline constexpr const char* kScopesHeader = "X-Auth-Scopes";

// Request headers as received. Name lookup is case-insensitive.
using RequestHeaders = std::multimap<std::string, std::string>;

// Build the caller for one HTTP request from headers set by the upstream
// authentication middleware. No subject or email means anonymous, keyed
// by the client address.
[[nodiscard]] CallerIdentity CallerFromHeaders(const AccessController& access,
                                               const RequestHeaders& headers,
                                               const std::string& remote_addr);

// 127.0.0.0/8, ::1 and "localhost".
[[nodiscard]] bool IsLoopbackHost(const std::string& host);

// Whether identity headers from remote_addr are honored. Requests from
// other peers are treated as anonymous.
[[nodiscard]] bool IsTrustedPeer(const ServerConfig& config, const std::string& remote_addr);

// Access-Control-Allow-* headers sent on every response.
[[nodiscard]] const std::map<std::string, std::string>& CorsHeaders();

// ---------------------------------------------------------------------------
// HttpEndpoint - serves a ProtocolHandler over HTTP using cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header.
//
// Bodies over ServerConfig::max_body_bytes are refused by httplib (413).
//
// Routes:
//   POST    <path>   JSON-RPC envelope
//   OPTIONS <path>   CORS preflight (204)
//   GET     /health  liveness and load level
// ---------------------------------------------------------------------------
class HttpEndpoint {
public:
    HttpEndpoint(ServerConfig config, ProtocolHandler& handler,
                 const AccessController& access, const RateLimiter& limiter);
    ~HttpEndpoint();

    HttpEndpoint(const HttpEndpoint&) = delete;
    HttpEndpoint& operator=(const HttpEndpoint&) = delete;
    HttpEndpoint(HttpEndpoint&&) = delete;
    HttpEndpoint& operator=(HttpEndpoint&&) = delete;

    // Bind and serve until Stop(). Err when the address cannot be bound.
    [[nodiscard]] Result<void, Error> Listen();

    // Bind to an ephemeral port on host without serving yet. Returns the port.
    [[nodiscard]] Result<int, Error> BindToAnyPort();
    // Serve on a socket bound by BindToAnyPort(). Blocks until Stop().
    [[nodiscard]] Result<void, Error> ListenAfterBind();
    // Block until the serving loop accepts connections.
    void WaitUntilReady();

    void Stop();
    [[nodiscard]] bool IsRunning() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_guard
