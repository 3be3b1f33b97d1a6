#include <mcp_guard/security/access_control.hpp>

#include <algorithm>
#include <functional>
#include <map>

namespace mcp_guard {

namespace {

const std::map<std::string, std::vector<std::string>>& ScopeHierarchy() {
    static const std::map<std::string, std::vector<std::string>> hierarchy = {
        {"admin", {"user", "read", "write"}},
        {"write", {"read"}},
        {"mcp", {"mcp:list", "mcp:call", "mcp:tools"}},
        {"mcp:tools", {"mcp:list", "mcp:call"}},
        {"ai:admin", {"ai:execute", "ai:configure", "ai:read"}},
        {"ai:configure", {"ai:read"}},
        {"system:admin", {"system:read", "system:health"}},
    };
    return hierarchy;
}

bool Contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

bool HeldSatisfies(const std::set<std::string>& expanded, const std::string& pattern) {
    return std::any_of(expanded.begin(), expanded.end(), [&](const std::string& held) {
        return ScopeMatches(held, pattern);
    });
}

using VisibilityRuleFn =
    std::function<std::optional<bool>(const AccessPolicy&, const ToolFacts&)>;

struct VisibilityRuleEntry {
    VisibilityRule rule;
    VisibilityRuleFn evaluate;
};

const std::vector<VisibilityRuleEntry>& VisibilityRules() {
    static const std::vector<VisibilityRuleEntry> rules = {
        {VisibilityRule::DenyList,
         [](const AccessPolicy& p, const ToolFacts& t) -> std::optional<bool> {
             if (Contains(p.deny_list, t.name)) return false;
             return std::nullopt;
         }},
        {VisibilityRule::ExplicitAllowList,
         [](const AccessPolicy& p, const ToolFacts& t) -> std::optional<bool> {
             if (p.public_tools_mode != PublicToolsMode::Explicit) return std::nullopt;
             return Contains(p.allow_list, t.name);
         }},
        {VisibilityRule::DefaultMetadata,
         [](const AccessPolicy& p, const ToolFacts& t) -> std::optional<bool> {
             if (p.public_tools_mode != PublicToolsMode::Default) return std::nullopt;
             // Uncategorized tools are not filtered by category.
             if (!p.allowed_categories.empty() && t.category &&
                 !Contains(p.allowed_categories, *t.category)) {
                 return false;
             }
             return t.declared_public;
         }},
        {VisibilityRule::LegacyAllowList,
         [](const AccessPolicy& p, const ToolFacts& t) -> std::optional<bool> {
             if (Contains(p.legacy_allow_list, t.name)) return true;
             return std::nullopt;
         }},
        {VisibilityRule::ToolMetadata,
         [](const AccessPolicy&, const ToolFacts& t) -> std::optional<bool> {
             return t.declared_public;
         }},
    };
    return rules;
}

} // anonymous namespace

// ===========================================================================
// Scopes
// ===========================================================================

std::set<std::string> ExpandScopes(const std::set<std::string>& scopes) {
    std::set<std::string> expanded;
    std::vector<std::string> pending(scopes.begin(), scopes.end());
    const auto& hierarchy = ScopeHierarchy();
    while (!pending.empty()) {
        auto scope = std::move(pending.back());
        pending.pop_back();
        if (!expanded.insert(scope).second) {
            continue;
        }
        auto it = hierarchy.find(scope);
        if (it != hierarchy.end()) {
            pending.insert(pending.end(), it->second.begin(), it->second.end());
        }
    }
    return expanded;
}

bool ScopeMatches(std::string_view held, std::string_view pattern) {
    if (held == pattern) {
        return true;
    }
    constexpr std::string_view kWildcard = ":*";
    auto namespace_of = [&](std::string_view wildcard) {
        return wildcard.substr(0, wildcard.size() - 1);  // keeps the ':'
    };
    if (pattern.size() > kWildcard.size() &&
        pattern.substr(pattern.size() - kWildcard.size()) == kWildcard) {
        auto prefix = namespace_of(pattern);
        return held.size() > prefix.size() && held.substr(0, prefix.size()) == prefix;
    }
    if (held.size() > kWildcard.size() &&
        held.substr(held.size() - kWildcard.size()) == kWildcard) {
        auto prefix = namespace_of(held);
        return pattern.size() > prefix.size() &&
               pattern.substr(0, prefix.size()) == prefix;
    }
    return false;
}

bool HasScopes(const std::set<std::string>& held, const ScopeRequirement& requirement) {
    return MissingScopes(held, requirement).empty();
}

std::vector<std::string> MissingScopes(const std::set<std::string>& held,
                                       const ScopeRequirement& requirement) {
    if (requirement.Empty()) {
        return {};
    }
    const auto expanded = ExpandScopes(held);

    std::vector<std::string> missing;
    for (const auto& scope : requirement.required) {
        if (!HeldSatisfies(expanded, scope)) {
            missing.push_back(scope);
        }
    }
    if (!missing.empty()) {
        return missing;
    }

    if (!requirement.any_of.empty()) {
        bool any = std::any_of(requirement.any_of.begin(), requirement.any_of.end(),
                               [&](const std::string& s) { return HeldSatisfies(expanded, s); });
        if (!any) {
            return requirement.any_of;
        }
    }
    return {};
}

std::set<std::string> ParseScopeList(std::string_view raw) {
    std::set<std::string> scopes;
    std::string current;
    for (char c : raw) {
        if (c == ' ' || c == ',' || c == '\t') {
            if (!current.empty()) scopes.insert(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) scopes.insert(std::move(current));
    return scopes;
}

// ===========================================================================
// Visibility
// ===========================================================================

const char* VisibilityRuleName(VisibilityRule rule) {
    switch (rule) {
        case VisibilityRule::DenyList:          return "deny_list";
        case VisibilityRule::ExplicitAllowList: return "explicit_allow_list";
        case VisibilityRule::DefaultMetadata:   return "default_metadata";
        case VisibilityRule::LegacyAllowList:   return "legacy_allow_list";
        case VisibilityRule::ToolMetadata:      return "tool_metadata";
    }
    return "tool_metadata";
}

VisibilityDecision ResolveToolVisibility(const AccessPolicy& policy, const ToolFacts& tool) {
    for (const auto& entry : VisibilityRules()) {
        if (auto verdict = entry.evaluate(policy, tool)) {
            return VisibilityDecision{*verdict, entry.rule};
        }
    }
    return VisibilityDecision{tool.declared_public, VisibilityRule::ToolMetadata};
}

// ===========================================================================
// AccessController
// ===========================================================================

AccessController::AccessController(AuthSettings settings)
    : settings_(std::move(settings)) {}

bool AccessController::IsAdmin(const std::optional<std::string>& email,
                               const std::optional<std::string>& subject_id) const {
    const auto& admins = settings_.admin_users;
    if (email && !email->empty() && Contains(admins, *email)) return true;
    if (subject_id && !subject_id->empty() && Contains(admins, *subject_id)) return true;
    return false;
}

CallerIdentity AccessController::ResolveCaller(const CredentialClaims& claims) const {
    CallerIdentity caller;
    if (claims.subject_id && !claims.subject_id->empty()) {
        caller.subject_id = claims.subject_id;
    }
    if (claims.email && !claims.email->empty()) {
        caller.email = claims.email;
    }
    caller.client_address = claims.client_address;
    if (caller.IsAuthenticated()) {
        caller.scopes = ParseScopeList(claims.raw_scopes);
        caller.is_admin = IsAdmin(caller.email, caller.subject_id);
        if (caller.is_admin) {
            caller.scopes.insert("admin");
        }
    }
    return caller;
}

bool AccessController::IsToolPublic(const ToolFacts& tool) const {
    return ResolveToolVisibility(settings_.policy, tool).is_public;
}

bool AccessController::CanList(const CallerIdentity& caller, const ToolFacts& tool,
                               const ScopeRequirement& scopes) const {
    const bool is_public = IsToolPublic(tool);
    if (is_public) {
        return true;
    }
    if (!caller.IsAuthenticated()) {
        if (settings_.require_auth_for_tools_list) {
            return false;
        }
        return scopes.Empty();
    }
    return HasScopes(caller.scopes, scopes);
}

AccessDecision AccessController::CanCall(const CallerIdentity& caller,
                                         const ToolFacts& tool,
                                         const ScopeRequirement& scopes) const {
    AccessDecision decision;
    if (IsToolPublic(tool)) {
        return decision;
    }
    if (!caller.IsAuthenticated() && settings_.require_auth_for_tools_call) {
        decision.outcome = AccessOutcome::AuthenticationRequired;
        return decision;
    }
    auto missing = MissingScopes(caller.scopes, scopes);
    if (!missing.empty()) {
        decision.outcome = AccessOutcome::MissingScopes;
        decision.missing_scopes = std::move(missing);
    }
    return decision;
}

} // namespace mcp_guard
