#include <mcp_guard/mcp/builtin_tools.hpp>

#include <mcp_guard/core/log.hpp>
#include <mcp_guard/core/version.hpp>
#include <mcp_guard/mcp/protocol_handler.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <string>

namespace mcp_guard {

namespace {

constexpr std::int64_t kMaxEchoRepeat = 5;

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

ToolMetadata PublicTool(std::string description, std::string category) {
    ToolMetadata meta;
    meta.description = std::move(description);
    meta.category = std::move(category);
    meta.is_public = true;
    return meta;
}

ToolMetadata ScopedTool(std::string description, std::string category,
                        ScopeRequirement scopes) {
    ToolMetadata meta;
    meta.description = std::move(description);
    meta.category = std::move(category);
    meta.scopes = std::move(scopes);
    return meta;
}

// ---------------------------------------------------------------------------
// Procedures
// ---------------------------------------------------------------------------

Procedure EchoProcedure() {
    Procedure p;
    p.path = "utility.echo";
    p.input = param::Object({
        {"message", param::String().Describe("Message to echo back")},
        {"uppercase", param::WithDefault(param::Boolean(), false)
                          .Describe("Convert message to uppercase")},
        {"repeat", param::WithDefault(param::Integer(), 1)
                       .Describe("Number of times to repeat the message (1-5)")},
    });
    p.tool = PublicTool("Echo a message back, optionally uppercased or repeated", "utility");
    p.handler = [](const nlohmann::json& input, const CallContext&) -> nlohmann::json {
        const auto repeat = input["repeat"].get<std::int64_t>();
        if (repeat < 1 || repeat > kMaxEchoRepeat) {
            throw ProcedureError(ProcedureError::Kind::InvalidInput,
                                 "repeat: must be between 1 and 5");
        }
        auto message = input["message"].get<std::string>();
        if (input["uppercase"].get<bool>()) {
            message = ToUpper(std::move(message));
        }
        std::string out;
        for (std::int64_t i = 0; i < repeat; ++i) {
            if (i > 0) out += ' ';
            out += message;
        }
        return out;
    };
    return p;
}

Procedure GreetingProcedure() {
    Procedure p;
    p.path = "utility.greeting";
    p.input = param::Object({
        {"name", param::WithDefault(param::String(), "World")
                     .Describe("Name of the person to greet")},
        {"language", param::WithDefault(param::Enum({"en", "es", "fr"}), "en")
                         .Describe("Language for the greeting")},
    });
    p.tool = PublicTool("Generate a greeting", "utility");
    p.handler = [](const nlohmann::json& input, const CallContext&) -> nlohmann::json {
        const auto name = input["name"].get<std::string>();
        const auto language = input["language"].get<std::string>();
        if (language == "es") return "Hola, " + name + "!";
        if (language == "fr") return "Bonjour, " + name + "!";
        return "Hello, " + name + "!";
    };
    return p;
}

Procedure HealthProcedure(RateLimiter& limiter) {
    Procedure p;
    p.path = "system.health";
    p.input = param::Object({});
    p.tool = ScopedTool("Report server load and the caller's rate-limit usage", "system",
                        ScopeRequirement{{}, {"system:read", "admin"}});
    p.handler = [&limiter](const nlohmann::json&,
                           const CallContext& context) -> nlohmann::json {
        auto usage = limiter.Status(context.caller);
        if (usage.IsErr()) {
            throw ProcedureError(ProcedureError::Kind::Failed, usage.Error().message);
        }
        return {
            {"status", "ok"},
            {"version", kVersion},
            {"load", limiter.LoadStatus()},
            {"rateLimit", usage.Value()},
        };
    };
    return p;
}

Procedure ResetRateLimitsProcedure(RateLimiter& limiter) {
    Procedure p;
    p.path = "admin.reset_rate_limits";
    p.input = param::Object({
        {"identity", param::Optional(param::String())
                         .Describe("Subject id, email or client address to reset; "
                                   "defaults to the caller")},
    });
    p.tool = ScopedTool("Clear the rate-limit windows of a caller", "admin",
                        ScopeRequirement{{"admin"}, {}});
    p.handler = [&limiter](const nlohmann::json& input,
                           const CallContext& context) -> nlohmann::json {
        CallerIdentity target = context.caller;
        if (input.contains("identity") && input["identity"].is_string()) {
            // Tier of the target is unknown; reset clears the keys of every tier.
            target = CallerIdentity{};
            target.subject_id = input["identity"].get<std::string>();
        }
        limiter.Reset(target);
        LogInfo("admin", "Rate limits reset for " + target.RateKey() + " by " +
                             context.caller.RateKey());
        return {{"reset", target.RateKey()}};
    };
    return p;
}

} // anonymous namespace

Result<void, Error> RegisterBuiltinProcedures(ProcedureSet& procedures, RateLimiter& limiter) {
    for (auto& procedure : {EchoProcedure(), GreetingProcedure(), HealthProcedure(limiter),
                            ResetRateLimitsProcedure(limiter)}) {
        auto added = procedures.Add(procedure);
        if (added.IsErr()) {
            return added;
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> RegisterBuiltinResources(ResourceCatalog& resources, ToolRegistry& tools,
                                             const RateLimiter& limiter) {
    ResourceDefinition server_info;
    server_info.uri = "mcp://internal/server-info";
    server_info.name = "Server information";
    server_info.description = "Server name, version, protocol version and load";
    server_info.mime_type = "application/json";
    auto added = resources.Add(server_info, [&limiter](const CallerIdentity&) {
        nlohmann::json info = {
            {"name", kServerName},
            {"version", kVersion},
            {"protocolVersion", kProtocolVersion},
            {"load", limiter.LoadStatus()},
        };
        return info.dump(2);
    });
    if (added.IsErr()) {
        return added;
    }

    ResourceDefinition catalog;
    catalog.uri = "mcp://internal/tool-catalog";
    catalog.name = "Tool catalog";
    catalog.description = "Every registered tool with its category and required scopes";
    catalog.mime_type = "application/json";
    catalog.require_auth = true;
    return resources.Add(catalog, [&tools](const CallerIdentity&) {
        auto snapshot = tools.Snapshot();
        nlohmann::json list = nlohmann::json::array();
        for (const auto& tool : snapshot->tools) {
            list.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"category", tool.category ? nlohmann::json(*tool.category) : nullptr},
                {"public", tool.is_public},
                {"requiredScopes", tool.required_scopes.required},
                {"anyOfScopes", tool.required_scopes.any_of},
            });
        }
        return nlohmann::json{{"generation", snapshot->generation}, {"tools", list}}.dump(2);
    });
}

} // namespace mcp_guard
