#include <mcp_guard/mcp/protocol_handler.hpp>

#include <mcp_guard/core/log.hpp>
#include <mcp_guard/core/version.hpp>

#include <cctype>
#include <exception>
#include <string>

namespace mcp_guard {

namespace {

constexpr std::size_t kSummaryMaxMembers = 5;

std::int64_t EstimateTokens(std::size_t bytes) {
    return static_cast<std::int64_t>((bytes + 3) / 4);
}

bool IsBlank(std::string_view s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

nlohmann::json TextBlock(std::string text) {
    return {{"type", "text"}, {"text", std::move(text)}};
}

std::string SummaryValue(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string DescribeId(const nlohmann::json& id, bool has_id) {
    if (!has_id) return "-";
    return id.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

// ===========================================================================
// Parsing
// ===========================================================================

Result<nlohmann::json, Error> ParseRequest(std::string_view text, std::size_t max_bytes) {
    auto fail = [](std::string message) {
        return Result<nlohmann::json, Error>::Err(
            Error{"ParseRequest", std::move(message), ErrorCategory::Validation});
    };
    if (text.size() > max_bytes) {
        return fail("Request body exceeds " + std::to_string(max_bytes) + " bytes");
    }

    // Containers past the limit are discarded while parsing so the deep
    // structure is never built.
    bool too_deep = false;
    const nlohmann::json::parser_callback_t limit_depth =
        [&too_deep](int depth, nlohmann::json::parse_event_t event, nlohmann::json&) {
            if ((event == nlohmann::json::parse_event_t::object_start ||
                 event == nlohmann::json::parse_event_t::array_start) &&
                depth >= kMaxJsonDepth) {
                too_deep = true;
            }
            return !too_deep;
        };

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(text.begin(), text.end(), limit_depth);
    } catch (const nlohmann::json::parse_error& e) {
        LogDebug("protocol", std::string("Unparsable request: ") + e.what());
        return fail("Request body is not valid JSON");
    }
    if (too_deep) {
        return fail("Request nesting exceeds " + std::to_string(kMaxJsonDepth) + " levels");
    }
    return Result<nlohmann::json, Error>::Ok(std::move(message));
}

// ===========================================================================
// Envelopes
// ===========================================================================

nlohmann::json MakeResult(const nlohmann::json& id, bool has_id,
                          const nlohmann::json& result) {
    nlohmann::json response = {{"jsonrpc", "2.0"}};
    if (has_id) {
        response["id"] = id;
    }
    response["result"] = result;
    return response;
}

nlohmann::json MakeError(const nlohmann::json& id, bool has_id, ProtocolError code,
                         const std::string& message,
                         const std::optional<nlohmann::json>& data) {
    nlohmann::json error = {
        {"code", static_cast<int>(code)},
        {"message", message},
    };
    if (data) {
        error["data"] = *data;
    }
    nlohmann::json response = {{"jsonrpc", "2.0"}};
    if (has_id) {
        response["id"] = id;
    }
    response["error"] = std::move(error);
    return response;
}

nlohmann::json ShapeToolResult(const nlohmann::json& value) {
    nlohmann::json content = nlohmann::json::array();
    if (value.is_string()) {
        content.push_back(TextBlock(value.get<std::string>()));
    } else if (value.is_object() || value.is_array()) {
        if (value.is_object() && !value.empty() && value.size() <= kSummaryMaxMembers) {
            std::string summary;
            for (auto it = value.begin(); it != value.end(); ++it) {
                if (!summary.empty()) summary += '\n';
                summary += it.key() + ": " + SummaryValue(it.value());
            }
            content.push_back(TextBlock(std::move(summary)));
        }
        content.push_back(TextBlock(
            value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)));
    } else {
        content.push_back(TextBlock(SummaryValue(value)));
    }
    return {{"content", std::move(content)}};
}

// ===========================================================================
// ProtocolHandler
// ===========================================================================

ProtocolHandler::ProtocolHandler(ToolRegistry& tools, const AccessController& access,
                                 RateLimiter& limiter, SecurityLogger& security,
                                 const PromptCatalog& prompts,
                                 const ResourceCatalog& resources, HandlerOptions options)
    : tools_(tools),
      access_(access),
      limiter_(limiter),
      security_(security),
      prompts_(prompts),
      resources_(resources),
      options_(std::move(options)) {
    if (options_.server_name.empty()) options_.server_name = kServerName;
    if (options_.server_version.empty()) options_.server_version = kVersion;

    methods_ = {
        {"initialize", &ProtocolHandler::HandleInitialize},
        {"ping", &ProtocolHandler::HandlePing},
        {"tools/list", &ProtocolHandler::HandleToolsList},
        {"tools/call", &ProtocolHandler::HandleToolsCall},
        {"prompts/list", &ProtocolHandler::HandlePromptsList},
        {"prompts/get", &ProtocolHandler::HandlePromptsGet},
        {"resources/list", &ProtocolHandler::HandleResourcesList},
        {"resources/read", &ProtocolHandler::HandleResourcesRead},
        {"notifications/initialized", &ProtocolHandler::HandleNotification},
        {"notifications/cancelled", &ProtocolHandler::HandleNotification},
    };
}

HandlerResponse ProtocolHandler::HandleBody(std::string_view body,
                                            const CallerIdentity& caller) {
    if (IsBlank(body)) {
        LogWarn("protocol", "Empty request body");
        return {500, MakeError(nullptr, true, ProtocolError::InternalError, "Internal error",
                               nlohmann::json("Empty request body"))};
    }

    auto parsed = ParseRequest(body, options_.max_body_bytes);
    if (parsed.IsErr()) {
        LogWarn("protocol", "Rejected request body: " + parsed.Error().message);
        return {500, MakeError(nullptr, true, ProtocolError::InternalError, "Internal error",
                               nlohmann::json(parsed.Error().message))};
    }
    return {200, HandleMessage(parsed.Value(), caller)};
}

nlohmann::json ProtocolHandler::HandleMessage(const nlohmann::json& message,
                                              const CallerIdentity& caller) {
    static const nlohmann::json kNullId = nullptr;

    if (!message.is_object()) {
        return MakeError(kNullId, true, ProtocolError::InvalidRequest, "Invalid Request");
    }

    const bool has_id = message.contains("id");
    const nlohmann::json& id = has_id ? message["id"] : kNullId;
    if (has_id && !id.is_string() && !id.is_number() && !id.is_null()) {
        return MakeError(kNullId, true, ProtocolError::InvalidRequest, "Invalid Request",
                         nlohmann::json("id must be a string, number or null"));
    }

    if (message.contains("jsonrpc") && message["jsonrpc"] != "2.0") {
        return MakeError(id, has_id, ProtocolError::InvalidRequest,
                         "Invalid JSON-RPC version");
    }

    std::string method;
    if (message.contains("method") && !message["method"].is_null()) {
        if (!message["method"].is_string()) {
            return MakeError(id, has_id, ProtocolError::InvalidRequest, "Invalid Request",
                             nlohmann::json("method must be a string"));
        }
        method = message["method"].get<std::string>();
    }

    static const nlohmann::json kNoParams = nlohmann::json::object();
    const nlohmann::json& params =
        message.contains("params") && !message["params"].is_null() ? message["params"]
                                                                    : kNoParams;

    Request request{id, has_id, method, params, caller};
    const auto source = caller.RateKey();

    try {
        security_.AnalyzeRequest(message.dump(-1, ' ', false,
                                              nlohmann::json::error_handler_t::replace),
                                 source, caller.subject_id);

        if (security_.IsBlocked(source)) {
            LogWarn("protocol", "Rejected request from blocked source " + source);
            return MakeError(id, has_id, ProtocolError::RateLimited,
                             "Access denied. Source is blocked.");
        }

        LogDebug("protocol", "Request " + DescribeId(id, has_id) + ": " +
                                 (method.empty() ? std::string("<none>") : method));

        if (method.rfind("notifications/", 0) == 0) {
            return Dispatch(request);
        }

        std::optional<std::string> tool_name;
        if (method == "tools/call" && params.is_object() && params.contains("name") &&
            params["name"].is_string()) {
            tool_name = params["name"].get<std::string>();
        }

        auto admission = limiter_.Admit(caller, tool_name);
        if (admission.IsErr()) {
            LogError("protocol", "Rate limiter failure: " + admission.Error().ToString());
            return MakeError(id, has_id, ProtocolError::InternalError, "Internal error");
        }
        auto admitted = std::move(admission).Value();
        if (!admitted.decision.allowed) {
            return RateLimited(request, admitted.decision);
        }

        // The concurrency slot in `admitted.lease` is held until return.
        return Dispatch(request);
    } catch (const std::exception& e) {
        LogError("protocol", "Unhandled failure in '" + method + "': " + e.what());
        return MakeError(id, has_id, ProtocolError::InternalError, "Internal error",
                         nlohmann::json(e.what()));
    }
}

nlohmann::json ProtocolHandler::Dispatch(const Request& request) {
    auto it = methods_.find(request.method);
    if (it == methods_.end()) {
        return MakeError(request.id, request.has_id, ProtocolError::MethodNotFound,
                         "Method '" + request.method + "' not found");
    }
    return (this->*(it->second))(request);
}

void ProtocolHandler::RunStdio(std::istream& in, std::ostream& out,
                               const CallerIdentity& caller) {
    std::string line;
    while (std::getline(in, line)) {
        if (IsBlank(line)) continue;

        auto parsed = ParseRequest(line, options_.max_body_bytes);
        if (parsed.IsErr()) {
            out << MakeError(nullptr, true, ProtocolError::ParseError, "Parse error",
                             nlohmann::json(parsed.Error().message))
                       .dump()
                << "\n";
            out.flush();
            continue;
        }
        const auto& message = parsed.Value();

        auto response = HandleMessage(message, caller);
        if (message.is_object() && !message.contains("id")) {
            continue;
        }
        out << response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
            << "\n";
        out.flush();
    }
}

nlohmann::json ProtocolHandler::RateLimited(const Request& request,
                                            const RateDecision& decision) {
    RecordEvent(request.caller, SecurityEventType::RateLimitExceeded, SecuritySeverity::Medium,
                "Rate limit exceeded (" + std::string(LimitScopeName(decision.scope)) + ")",
                {{"method", request.method}, {"limit", decision.window.limit}});
    return MakeError(request.id, request.has_id, ProtocolError::RateLimited,
                     decision.Message(), decision.ErrorData());
}

void ProtocolHandler::RecordEvent(const CallerIdentity& caller, SecurityEventType type,
                                  SecuritySeverity severity, std::string message,
                                  nlohmann::json context) {
    SecurityEvent event;
    event.type = type;
    event.severity = severity;
    event.source = caller.RateKey();
    event.subject_id = caller.subject_id;
    event.message = std::move(message);
    event.context = std::move(context);
    security_.Record(std::move(event));
}

// ===========================================================================
// Methods
// ===========================================================================

nlohmann::json ProtocolHandler::HandleInitialize(const Request& request) {
    std::string client = "unknown";
    if (request.params.is_object() && request.params.contains("clientInfo")) {
        const auto& info = request.params["clientInfo"];
        if (info.is_object() && info.contains("name") && info["name"].is_string()) {
            client = info["name"].get<std::string>();
        }
    }
    LogInfo("protocol", "Client initialized: " + client);

    nlohmann::json capabilities = {{"tools", nlohmann::json::object()}};
    if (prompts_.Enabled()) {
        capabilities["prompts"] = nlohmann::json::object();
    }
    if (resources_.Enabled()) {
        capabilities["resources"] = {{"subscribe", true}, {"listChanged", true}};
    }

    nlohmann::json result = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", std::move(capabilities)},
        {"serverInfo", {{"name", options_.server_name},
                        {"version", options_.server_version}}},
    };
    return MakeResult(request.id, request.has_id, result);
}

nlohmann::json ProtocolHandler::HandlePing(const Request& request) {
    return MakeResult(request.id, request.has_id, nlohmann::json::object());
}

nlohmann::json ProtocolHandler::HandleToolsList(const Request& request) {
    auto snapshot = tools_.Snapshot();
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : snapshot->tools) {
        if (access_.CanList(request.caller, tool.Facts(), tool.required_scopes)) {
            tools.push_back(tool.ToJson());
        }
    }
    return MakeResult(request.id, request.has_id, {{"tools", std::move(tools)}});
}

nlohmann::json ProtocolHandler::HandleToolsCall(const Request& request) {
    const auto& params = request.params;
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(request.id, request.has_id, ProtocolError::InvalidParams,
                         "Missing 'name' parameter");
    }
    const auto name = params["name"].get<std::string>();

    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return MakeError(request.id, request.has_id, ProtocolError::InvalidParams,
                             "Tool arguments must be an object");
        }
        arguments = params["arguments"];
    }

    const auto not_found = "Tool '" + name + "' not found";
    auto snapshot = tools_.Snapshot();
    const auto* tool = snapshot->Find(name);
    if (tool == nullptr) {
        return MakeError(request.id, request.has_id, ProtocolError::MethodNotFound, not_found);
    }

    const auto access = access_.CanCall(request.caller, tool->Facts(), tool->required_scopes);
    if (!access.Allowed()) {
        const bool unauthenticated = access.outcome == AccessOutcome::AuthenticationRequired;
        RecordEvent(request.caller,
                    unauthenticated ? SecurityEventType::AuthFailure
                                    : SecurityEventType::ToolAccessDenied,
                    SecuritySeverity::Medium, "Access denied to tool '" + name + "'",
                    {{"tool", name}, {"missingScopes", access.missing_scopes}});
        return MakeError(request.id, request.has_id, ProtocolError::MethodNotFound, not_found);
    }

    const auto args_text = arguments.dump();
    const auto estimate = EstimateTokens(args_text.size());
    auto tokens = limiter_.CheckTokens(request.caller, estimate);
    if (tokens.IsErr()) {
        LogError("protocol", "Token budget check failed: " + tokens.Error().ToString());
        return MakeError(request.id, request.has_id, ProtocolError::InternalError,
                         "Internal error");
    }
    if (!tokens.Value().allowed) {
        return RateLimited(request, tokens.Value());
    }

    CallContext context{request.caller, request.id, name};
    nlohmann::json output;
    try {
        output = InvokeProcedure(*tool->procedure, arguments, context);
    } catch (const ProcedureError& e) {
        if (e.GetKind() == ProcedureError::Kind::InvalidInput) {
            return MakeError(request.id, request.has_id, ProtocolError::InvalidParams,
                             "Invalid arguments for tool '" + name + "'",
                             nlohmann::json(e.what()));
        }
        LogWarn("protocol", "Tool '" + name + "' failed: " + e.what());
        return MakeError(request.id, request.has_id, ProtocolError::InternalError,
                         "Tool execution failed", nlohmann::json(e.what()));
    } catch (const std::exception& e) {
        LogWarn("protocol", "Tool '" + name + "' failed: " + e.what());
        return MakeError(request.id, request.has_id, ProtocolError::InternalError,
                         "Tool execution failed", nlohmann::json(e.what()));
    }

    auto shaped = ShapeToolResult(output);
    const auto actual = EstimateTokens(args_text.size() + shaped.dump().size());
    auto recorded = limiter_.RecordTokens(request.caller, actual, estimate);
    if (recorded.IsErr()) {
        LogWarn("protocol", "Token usage not recorded: " + recorded.Error().ToString());
    }

    LogDebug("protocol", "Tool '" + name + "' completed");
    return MakeResult(request.id, request.has_id, shaped);
}

nlohmann::json ProtocolHandler::HandlePromptsList(const Request& request) {
    if (!prompts_.Enabled()) {
        return MakeError(request.id, request.has_id, ProtocolError::MethodNotFound,
                         "Method '" + request.method + "' not found");
    }
    nlohmann::json prompts = nlohmann::json::array();
    for (const auto& prompt : prompts_.Prompts()) {
        prompts.push_back(prompt.ListJson());
    }
    return MakeResult(request.id, request.has_id, {{"prompts", std::move(prompts)}});
}

nlohmann::json ProtocolHandler::HandlePromptsGet(const Request& request) {
    if (!prompts_.Enabled()) {
        return MakeError(request.id, request.has_id, ProtocolError::MethodNotFound,
                         "Method '" + request.method + "' not found");
    }
    const auto& params = request.params;
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return MakeError(request.id, request.has_id, ProtocolError::InvalidParams,
                         "Missing 'name' parameter");
    }
    const auto arguments = params.value("arguments", nlohmann::json::object());
    auto result = prompts_.Get(params["name"].get<std::string>(), arguments);
    if (result.IsErr()) {
        return MakeError(request.id, request.has_id, ProtocolError::InvalidParams,
                         result.Error().message);
    }
    return MakeResult(request.id, request.has_id, result.Value());
}

nlohmann::json ProtocolHandler::HandleResourcesList(const Request& request) {
    if (!resources_.Enabled()) {
        return MakeError(request.id, request.has_id, ProtocolError::MethodNotFound,
                         "Method '" + request.method + "' not found");
    }
    nlohmann::json resources = nlohmann::json::array();
    for (const auto& resource : resources_.Visible(request.caller)) {
        resources.push_back(resource.ListJson());
    }
    return MakeResult(request.id, request.has_id, {{"resources", std::move(resources)}});
}

nlohmann::json ProtocolHandler::HandleResourcesRead(const Request& request) {
    if (!resources_.Enabled()) {
        return MakeError(request.id, request.has_id, ProtocolError::MethodNotFound,
                         "Method '" + request.method + "' not found");
    }
    const auto& params = request.params;
    if (!params.is_object() || !params.contains("uri") || !params["uri"].is_string()) {
        return MakeError(request.id, request.has_id, ProtocolError::InvalidParams,
                         "Missing 'uri' parameter");
    }
    auto result = resources_.Read(params["uri"].get<std::string>(), request.caller);
    if (result.IsErr()) {
        const auto& error = result.Error();
        if (error.category == ErrorCategory::NotFound) {
            return MakeError(request.id, request.has_id, ProtocolError::InvalidParams,
                             error.message);
        }
        LogWarn("protocol", "Resource read failed: " + error.ToString());
        return MakeError(request.id, request.has_id, ProtocolError::InternalError,
                         "Resource read failed", nlohmann::json(error.message));
    }
    return MakeResult(request.id, request.has_id, result.Value());
}

nlohmann::json ProtocolHandler::HandleNotification(const Request& request) {
    if (request.method == "notifications/cancelled") {
        // In-flight work is not interrupted; the notice is only recorded.
        const auto request_id = request.params.is_object()
                                    ? request.params.value("requestId", nlohmann::json())
                                    : nlohmann::json();
        LogInfo("protocol", "Client cancelled request " + request_id.dump() +
                                (request.params.is_object() && request.params.contains("reason")
                                     ? " (" + request.params["reason"].dump() + ")"
                                     : std::string()));
    } else {
        LogInfo("protocol", "Client reported initialized");
    }
    return MakeResult(request.id, request.has_id, nlohmann::json::object());
}

} // namespace mcp_guard
