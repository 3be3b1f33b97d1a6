#pragma once

#include <mcp_guard/core/result.hpp>
#include <mcp_guard/security/access_control.hpp>
#include <mcp_guard/security/caller_identity.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <vector>

namespace mcp_guard {

struct ResourceDefinition {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type = "text/plain";
    bool require_auth = false;
    ScopeRequirement scopes;

    // {uri, name, description, mimeType}
    [[nodiscard]] nlohmann::json ListJson() const;
};

// Produces the resource body for one caller. May throw.
using ResourceProvider = std::function<std::string(const CallerIdentity& caller)>;

// ---------------------------------------------------------------------------
// ResourceCatalog - resources served by resources/list and resources/read.
//
// Resources a caller may not access are hidden from the listing and read
// as NotFound, indistinguishable from a missing URI.
// ---------------------------------------------------------------------------
class ResourceCatalog {
public:
    explicit ResourceCatalog(bool enabled = false) : enabled_(enabled) {}

    [[nodiscard]] bool Enabled() const noexcept { return enabled_; }

    [[nodiscard]] Result<void, Error> Add(ResourceDefinition definition,
                                          ResourceProvider provider);
    [[nodiscard]] Result<void, Error> AddStatic(ResourceDefinition definition,
                                                std::string text);

    [[nodiscard]] static bool CanAccess(const ResourceDefinition& definition,
                                        const CallerIdentity& caller);

    [[nodiscard]] std::vector<ResourceDefinition> Visible(const CallerIdentity& caller) const;

    // {contents:[{uri, mimeType, text}]}
    [[nodiscard]] Result<nlohmann::json, Error> Read(const std::string& uri,
                                                     const CallerIdentity& caller) const;

private:
    struct Entry {
        ResourceDefinition definition;
        ResourceProvider provider;
    };

    bool enabled_;
    std::vector<Entry> entries_;
};

} // namespace mcp_guard
