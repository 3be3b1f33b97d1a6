#pragma once

#include <mcp_guard/security/caller_identity.hpp>

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_guard {

// ---------------------------------------------------------------------------
// ScopeRequirement - scopes needed to invoke a tool or read a resource.
//
//   required - caller must hold ALL of these
//   any_of   - caller must hold AT LEAST ONE of these
//
// Patterns ending in ":*" match any scope in that namespace.
// ---------------------------------------------------------------------------
struct ScopeRequirement {
    std::vector<std::string> required;
    std::vector<std::string> any_of;

    [[nodiscard]] bool Empty() const noexcept {
        return required.empty() && any_of.empty();
    }

    bool operator==(const ScopeRequirement& other) const {
        return required == other.required && any_of == other.any_of;
    }
};

// Expand held scopes through the built-in hierarchy
// (admin -> user/read/write, write -> read, mcp -> mcp:list/mcp:call/...).
[[nodiscard]] std::set<std::string> ExpandScopes(const std::set<std::string>& scopes);

// True if a held scope satisfies a required pattern.
[[nodiscard]] bool ScopeMatches(std::string_view held, std::string_view pattern);

[[nodiscard]] bool HasScopes(const std::set<std::string>& held,
                             const ScopeRequirement& requirement);

// Scopes from the requirement that the caller is missing. For an unmet
// any_of group the whole group is returned.
[[nodiscard]] std::vector<std::string> MissingScopes(
    const std::set<std::string>& held, const ScopeRequirement& requirement);

// Parse "a b,c" into {"a","b","c"}.
[[nodiscard]] std::set<std::string> ParseScopeList(std::string_view raw);

// ---------------------------------------------------------------------------
// AccessPolicy - public/private resolution rules for tools.
// ---------------------------------------------------------------------------
enum class PublicToolsMode {
    Unset,     // no publicTools configured
    Explicit,  // allow_list is authoritative
    Default,   // "default" sentinel: tool metadata + category filter
};

struct AccessPolicy {
    std::vector<std::string> deny_list;
    PublicToolsMode public_tools_mode = PublicToolsMode::Unset;
    std::vector<std::string> allow_list;
    std::vector<std::string> allowed_categories;
    std::vector<std::string> legacy_allow_list;
};

// What the policy needs to know about a tool.
struct ToolFacts {
    std::string name;
    std::optional<std::string> category;
    bool declared_public = false;
};

enum class VisibilityRule {
    DenyList,
    ExplicitAllowList,
    DefaultMetadata,
    LegacyAllowList,
    ToolMetadata,
};

struct VisibilityDecision {
    bool is_public = false;
    VisibilityRule rule = VisibilityRule::ToolMetadata;
};

[[nodiscard]] const char* VisibilityRuleName(VisibilityRule rule);

// Evaluate the policy rules top to bottom; the first rule that applies
// decides:
//   1. deny list          -> private
//   2. explicit allow list -> public iff listed
//   3. "default"          -> category allowed (or unrestricted, or none) && declared public
//   4. legacy allow list  -> public
//   5. fallback           -> declared public
[[nodiscard]] VisibilityDecision ResolveToolVisibility(const AccessPolicy& policy,
                                                       const ToolFacts& tool);

// ---------------------------------------------------------------------------
// AuthSettings - per-deployment access configuration.
// ---------------------------------------------------------------------------
struct AuthSettings {
    bool require_auth_for_tools_list = false;
    bool require_auth_for_tools_call = true;
    AccessPolicy policy;
    std::vector<std::string> admin_users;  // emails or subject ids
};

// Identity fields as received from upstream middleware.
struct CredentialClaims {
    std::optional<std::string> subject_id;
    std::optional<std::string> email;
    std::string raw_scopes;
    std::string client_address;
};

enum class AccessOutcome {
    Allowed,
    AuthenticationRequired,
    MissingScopes,
};

struct AccessDecision {
    AccessOutcome outcome = AccessOutcome::Allowed;
    std::vector<std::string> missing_scopes;

    [[nodiscard]] bool Allowed() const noexcept {
        return outcome == AccessOutcome::Allowed;
    }
};

// ---------------------------------------------------------------------------
// AccessController - auth enforcer and scope resolver.
//
// Stateless after construction; safe to share across request threads.
// ---------------------------------------------------------------------------
class AccessController {
public:
    explicit AccessController(AuthSettings settings);

    [[nodiscard]] const AuthSettings& Settings() const noexcept { return settings_; }

    // Admin membership test by email or subject id.
    [[nodiscard]] bool IsAdmin(const std::optional<std::string>& email,
                               const std::optional<std::string>& subject_id) const;

    // Build the caller identity for one request. Admins implicitly hold
    // the "admin" scope.
    [[nodiscard]] CallerIdentity ResolveCaller(const CredentialClaims& claims) const;

    [[nodiscard]] bool IsToolPublic(const ToolFacts& tool) const;

    // Whether the tool appears in tools/list for this caller.
    [[nodiscard]] bool CanList(const CallerIdentity& caller, const ToolFacts& tool,
                               const ScopeRequirement& scopes) const;

    // Whether the caller may invoke the tool.
    [[nodiscard]] AccessDecision CanCall(const CallerIdentity& caller,
                                         const ToolFacts& tool,
                                         const ScopeRequirement& scopes) const;

private:
    AuthSettings settings_;
};

} // namespace mcp_guard
