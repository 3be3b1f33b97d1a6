#include <mcp_guard/server/http_endpoint.hpp>

#include <mcp_guard/core/log.hpp>
#include <mcp_guard/core/version.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <optional>

namespace mcp_guard {

namespace {

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::optional<std::string> FindHeader(const RequestHeaders& headers, const std::string& name) {
    for (const auto& [key, value] : headers) {
        if (EqualsIgnoreCase(key, name) && !value.empty()) {
            return value;
        }
    }
    return std::nullopt;
}

void ApplyCors(httplib::Response& res) {
    for (const auto& [name, value] : CorsHeaders()) {
        res.set_header(name, value);
    }
}

} // anonymous namespace

CallerIdentity CallerFromHeaders(const AccessController& access, const RequestHeaders& headers,
                                 const std::string& remote_addr) {
    CredentialClaims claims;
    claims.subject_id = FindHeader(headers, kSubjectHeader);
    claims.email = FindHeader(headers, kEmailHeader);
    claims.raw_scopes = FindHeader(headers, kScopesHeader).value_or("");
    claims.client_address = remote_addr;
    return access.ResolveCaller(claims);
}

bool IsLoopbackHost(const std::string& host) {
    return host == "localhost" || host == "::1" || host.rfind("127.", 0) == 0;
}

bool IsTrustedPeer(const ServerConfig& config, const std::string& remote_addr) {
    return config.trusted_proxies.empty() ||
           std::find(config.trusted_proxies.begin(), config.trusted_proxies.end(),
                     remote_addr) != config.trusted_proxies.end();
}

const std::map<std::string, std::string>& CorsHeaders() {
    static const std::map<std::string, std::string> headers = {
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Authorization"},
    };
    return headers;
}

// ---------------------------------------------------------------------------
// Impl - pimpl body holding the httplib::Server.
// ---------------------------------------------------------------------------
struct HttpEndpoint::Impl {
    ServerConfig config;
    ProtocolHandler& handler;
    const AccessController& access;
    const RateLimiter& limiter;
    httplib::Server server;

    Impl(ServerConfig cfg, ProtocolHandler& h, const AccessController& a,
         const RateLimiter& l)
        : config(std::move(cfg)), handler(h), access(a), limiter(l) {
        server.set_payload_max_length(config.max_body_bytes);
        server.Post(config.path, [this](const httplib::Request& req, httplib::Response& res) {
            HandlePost(req, res);
        });
        server.Options(config.path, [](const httplib::Request&, httplib::Response& res) {
            ApplyCors(res);
            res.status = 204;
        });
        server.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json body = {
                {"status", "ok"},
                {"name", kServerName},
                {"version", kVersion},
                {"load", limiter.LoadStatus()},
            };
            ApplyCors(res);
            res.set_content(body.dump(), "application/json");
        });
        server.set_exception_handler(
            [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
                std::string what;
                try {
                    if (ep) std::rethrow_exception(ep);
                } catch (const std::exception& e) {
                    what = e.what();
                } catch (...) {
                    what = "non-standard exception";
                }
                LogError("http", "Unhandled failure on " + req.path + ": " + what);
                ApplyCors(res);
                res.status = 500;
                res.set_content(MakeError(nullptr, true, ProtocolError::InternalError,
                                          "Internal error")
                                    .dump(),
                                "application/json");
            });
    }

    void HandlePost(const httplib::Request& req, httplib::Response& res) {
        RequestHeaders headers;
        if (IsTrustedPeer(config, req.remote_addr)) {
            for (const auto& [name, value] : req.headers) {
                headers.emplace(name, value);
            }
        } else {
            LogDebug("http", "Ignoring identity headers from untrusted peer " + req.remote_addr);
        }
        const auto caller = CallerFromHeaders(access, headers, req.remote_addr);

        auto response = handler.HandleBody(req.body, caller);
        ApplyCors(res);
        res.status = response.http_status;
        res.set_content(response.body.dump(-1, ' ', false,
                                           nlohmann::json::error_handler_t::replace),
                        "application/json");
    }
};

HttpEndpoint::HttpEndpoint(ServerConfig config, ProtocolHandler& handler,
                           const AccessController& access, const RateLimiter& limiter)
    : impl_(std::make_unique<Impl>(std::move(config), handler, access, limiter)) {}

HttpEndpoint::~HttpEndpoint() {
    if (impl_->server.is_running()) {
        impl_->server.stop();
    }
}

Result<void, Error> HttpEndpoint::Listen() {
    const auto& cfg = impl_->config;
    if (!IsLoopbackHost(cfg.host) && cfg.trusted_proxies.empty()) {
        LogWarn("http", "Listening on non-loopback host " + cfg.host +
                            " without server.trustedProxies: any client can set X-Auth-* "
                            "identity headers");
    }
    LogInfo("http", "Listening on http://" + cfg.host + ":" + std::to_string(cfg.port) +
                        cfg.path);
    if (!impl_->server.listen(cfg.host, cfg.port)) {
        return Result<void, Error>::Err(Error{
            "HttpEndpoint::Listen",
            "cannot listen on " + cfg.host + ":" + std::to_string(cfg.port),
            ErrorCategory::Collaborator});
    }
    return Result<void, Error>::Ok();
}

Result<int, Error> HttpEndpoint::BindToAnyPort() {
    const int port = impl_->server.bind_to_any_port(impl_->config.host);
    if (port <= 0) {
        return Result<int, Error>::Err(Error{
            "HttpEndpoint::BindToAnyPort", "cannot bind to " + impl_->config.host,
            ErrorCategory::Collaborator});
    }
    return Result<int, Error>::Ok(port);
}

Result<void, Error> HttpEndpoint::ListenAfterBind() {
    if (!impl_->server.listen_after_bind()) {
        return Result<void, Error>::Err(Error{
            "HttpEndpoint::ListenAfterBind", "server loop failed",
            ErrorCategory::Collaborator});
    }
    return Result<void, Error>::Ok();
}

void HttpEndpoint::WaitUntilReady() {
    impl_->server.wait_until_ready();
}

void HttpEndpoint::Stop() {
    impl_->server.stop();
}

bool HttpEndpoint::IsRunning() const {
    return impl_->server.is_running();
}

} // namespace mcp_guard
