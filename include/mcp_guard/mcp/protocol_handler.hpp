#pragma once

#include <mcp_guard/core/result.hpp>
#include <mcp_guard/mcp/prompt_catalog.hpp>
#include <mcp_guard/mcp/resource_catalog.hpp>
#include <mcp_guard/mcp/tool_registry.hpp>
#include <mcp_guard/security/access_control.hpp>
#include <mcp_guard/security/caller_identity.hpp>
#include <mcp_guard/security/rate_limiter.hpp>
#include <mcp_guard/security/security_logger.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_guard {

inline constexpr const char* kProtocolVersion = "2024-11-05";

// Largest accepted request body or stdio line, in bytes.
inline constexpr std::size_t kDefaultMaxBodyBytes = 1024 * 1024;
// Deepest accepted array/object nesting in a request.
inline constexpr int kMaxJsonDepth = 64;

// JSON-RPC error codes used on the wire.
enum class ProtocolError : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    RateLimited = -32000,
};

// {jsonrpc:"2.0", id, result}. The id member is omitted when has_id is false.
[[nodiscard]] nlohmann::json MakeResult(const nlohmann::json& id, bool has_id,
                                        const nlohmann::json& result);

// {jsonrpc:"2.0", id, error:{code, message, data?}}
[[nodiscard]] nlohmann::json MakeError(const nlohmann::json& id, bool has_id,
                                       ProtocolError code, const std::string& message,
                                       const std::optional<nlohmann::json>& data = std::nullopt);

// Wrap a procedure result as {content:[...]}:
//   string        -> one text block
//   object/array  -> pretty JSON text block; objects with at most five
//                    members get a "key: value" summary block first
//   other         -> stringified text block
[[nodiscard]] nlohmann::json ShapeToolResult(const nlohmann::json& value);

struct HandlerOptions {
    std::string server_name;
    std::string server_version;
    std::size_t max_body_bytes = kDefaultMaxBodyBytes;
};

// Parse one request. Err for invalid JSON, for nesting deeper than
// kMaxJsonDepth, and for text longer than max_bytes.
[[nodiscard]] Result<nlohmann::json, Error> ParseRequest(std::string_view text,
                                                         std::size_t max_bytes);

// What a transport sends back: status code plus JSON body.
struct HandlerResponse {
    int http_status = 200;
    nlohmann::json body;
};

// ---------------------------------------------------------------------------
// ProtocolHandler - JSON-RPC method dispatch for one server.
//
// Each request runs: pre-filter scan, block check, rate limiting, then the
// method handler (auth enforcement and tool lookup for tools/call). Every
// failure is converted to an error envelope here; nothing escapes.
//
// Methods:
//   initialize, ping, tools/list, tools/call, prompts/list, prompts/get,
//   resources/list, resources/read, notifications/initialized,
//   notifications/cancelled
// ---------------------------------------------------------------------------
class ProtocolHandler {
public:
    ProtocolHandler(ToolRegistry& tools, const AccessController& access,
                    RateLimiter& limiter, SecurityLogger& security,
                    const PromptCatalog& prompts, const ResourceCatalog& resources,
                    HandlerOptions options = {});

    // Raw request body from a transport. Absent, oversized, too deeply
    // nested or unparsable bodies give HTTP 500 with an InternalError envelope.
    [[nodiscard]] HandlerResponse HandleBody(std::string_view body,
                                             const CallerIdentity& caller);

    [[nodiscard]] nlohmann::json HandleMessage(const nlohmann::json& message,
                                               const CallerIdentity& caller);

    // Newline-delimited JSON over a stream pair. Messages without an id get
    // no output line. Lines that ParseRequest rejects get a ParseError.
    // Blocks until EOF.
    void RunStdio(std::istream& in, std::ostream& out, const CallerIdentity& caller);

private:
    struct Request {
        const nlohmann::json& id;
        bool has_id;
        const std::string& method;
        const nlohmann::json& params;
        const CallerIdentity& caller;
    };

    using MethodHandler = nlohmann::json (ProtocolHandler::*)(const Request&);

    nlohmann::json Dispatch(const Request& request);

    nlohmann::json HandleInitialize(const Request& request);
    nlohmann::json HandlePing(const Request& request);
    nlohmann::json HandleToolsList(const Request& request);
    nlohmann::json HandleToolsCall(const Request& request);
    nlohmann::json HandlePromptsList(const Request& request);
    nlohmann::json HandlePromptsGet(const Request& request);
    nlohmann::json HandleResourcesList(const Request& request);
    nlohmann::json HandleResourcesRead(const Request& request);
    nlohmann::json HandleNotification(const Request& request);

    nlohmann::json RateLimited(const Request& request, const RateDecision& decision);
    void RecordEvent(const CallerIdentity& caller, SecurityEventType type,
                     SecuritySeverity severity, std::string message,
                     nlohmann::json context = nlohmann::json::object());

    ToolRegistry& tools_;
    const AccessController& access_;
    RateLimiter& limiter_;
    SecurityLogger& security_;
    const PromptCatalog& prompts_;
    const ResourceCatalog& resources_;
    HandlerOptions options_;
    std::map<std::string, MethodHandler> methods_;
};

} // namespace mcp_guard
