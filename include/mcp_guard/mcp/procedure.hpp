#pragma once

#include <mcp_guard/core/result.hpp>
#include <mcp_guard/mcp/param_type.hpp>
#include <mcp_guard/security/access_control.hpp>
#include <mcp_guard/security/caller_identity.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcp_guard {

// ---------------------------------------------------------------------------
// ToolMetadata - marks a procedure as a tool and describes it.
// ---------------------------------------------------------------------------
struct ToolMetadata {
    std::optional<std::string> name;         // overrides the path-derived name
    std::optional<std::string> description;
    std::optional<std::string> category;
    bool is_public = false;
    ScopeRequirement scopes;
};

// Per-invocation context handed to procedure handlers.
struct CallContext {
    CallerIdentity caller;
    nlohmann::json request_id;
    std::string tool_name;
};

// A handler receives validated input (defaults applied) and returns any
// JSON value. Handlers report failures by throwing.
using ProcedureHandler =
    std::function<nlohmann::json(const nlohmann::json& input, const CallContext& context)>;

struct Procedure {
    std::string path;  // dotted, e.g. "utility.echo"
    ParamType input;
    std::optional<ToolMetadata> tool;
    ProcedureHandler handler;
};

// ---------------------------------------------------------------------------
// ProcedureError - invocation failure thrown across the procedure boundary.
// ---------------------------------------------------------------------------
class ProcedureError : public std::runtime_error {
public:
    enum class Kind {
        InvalidInput,
        Failed,
    };

    ProcedureError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind GetKind() const noexcept { return kind_; }

private:
    Kind kind_;
};

// Validate input against the procedure's declared type, then run its
// handler. Throws ProcedureError(InvalidInput) on validation failure and
// lets handler exceptions propagate.
[[nodiscard]] nlohmann::json InvokeProcedure(const Procedure& procedure,
                                             const nlohmann::json& input,
                                             const CallContext& context);

// ---------------------------------------------------------------------------
// ProcedureSet - the host application's registered procedures.
//
// Insertion-ordered. Every change bumps Version() so dependents (the tool
// registry) can rebuild.
// ---------------------------------------------------------------------------
class ProcedureSet {
public:
    [[nodiscard]] Result<void, Error> Add(Procedure procedure);
    bool Remove(const std::string& path);

    [[nodiscard]] std::vector<std::shared_ptr<const Procedure>> All() const;
    [[nodiscard]] std::shared_ptr<const Procedure> Find(const std::string& path) const;
    [[nodiscard]] std::uint64_t Version() const;
    [[nodiscard]] std::size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<const Procedure>> procedures_;
    std::uint64_t version_ = 0;
};

} // namespace mcp_guard
