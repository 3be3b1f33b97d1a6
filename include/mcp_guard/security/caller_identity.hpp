#pragma once

#include <optional>
#include <set>
#include <string>

namespace mcp_guard {

// ---------------------------------------------------------------------------
// CallerIdentity - who is making the current request.
//
// Built per request from the credential that upstream middleware already
// verified; this engine never validates tokens itself. Lives for one
// request only.
// ---------------------------------------------------------------------------
struct CallerIdentity {
    std::optional<std::string> subject_id;
    std::optional<std::string> email;
    std::set<std::string> scopes;
    bool is_admin = false;
    std::string client_address;  // used as rate key for anonymous callers

    [[nodiscard]] bool IsAuthenticated() const noexcept {
        return subject_id.has_value() || email.has_value();
    }

    // Stable key for rate windows and security-event sources.
    [[nodiscard]] std::string RateKey() const {
        if (subject_id && !subject_id->empty()) return *subject_id;
        if (email && !email->empty()) return *email;
        if (!client_address.empty()) return client_address;
        return "anonymous";
    }

    static CallerIdentity Anonymous(std::string client_address = {}) {
        CallerIdentity caller;
        caller.client_address = std::move(client_address);
        return caller;
    }
};

enum class CallerTier {
    Anonymous,
    Authenticated,
    Admin,
};

[[nodiscard]] inline CallerTier TierOf(const CallerIdentity& caller) {
    if (caller.is_admin) return CallerTier::Admin;
    if (caller.IsAuthenticated()) return CallerTier::Authenticated;
    return CallerTier::Anonymous;
}

[[nodiscard]] inline const char* TierName(CallerTier tier) {
    switch (tier) {
        case CallerTier::Anonymous:     return "anonymous";
        case CallerTier::Authenticated: return "authenticated";
        case CallerTier::Admin:         return "admin";
    }
    return "anonymous";
}

} // namespace mcp_guard
