#include <mcp_guard/mcp/resource_catalog.hpp>

#include <mcp_guard/security/description_sanitizer.hpp>

#include <algorithm>
#include <exception>

namespace mcp_guard {

nlohmann::json ResourceDefinition::ListJson() const {
    return {
        {"uri", uri},
        {"name", name},
        {"description", description},
        {"mimeType", mime_type},
    };
}

Result<void, Error> ResourceCatalog::Add(ResourceDefinition definition,
                                         ResourceProvider provider) {
    if (definition.uri.empty() || !provider) {
        return Result<void, Error>::Err(Error{
            "ResourceCatalog::Add", "resource needs a uri and a provider",
            ErrorCategory::Validation});
    }
    const auto exists = std::any_of(entries_.begin(), entries_.end(), [&](const Entry& e) {
        return e.definition.uri == definition.uri;
    });
    if (exists) {
        return Result<void, Error>::Err(Error{
            "ResourceCatalog::Add", "resource '" + definition.uri + "' already registered",
            ErrorCategory::Validation});
    }
    definition.description = SanitizeDescription(definition.description);
    entries_.push_back(Entry{std::move(definition), std::move(provider)});
    return Result<void, Error>::Ok();
}

Result<void, Error> ResourceCatalog::AddStatic(ResourceDefinition definition,
                                               std::string text) {
    return Add(std::move(definition),
               [text = std::move(text)](const CallerIdentity&) { return text; });
}

bool ResourceCatalog::CanAccess(const ResourceDefinition& definition,
                                const CallerIdentity& caller) {
    if (definition.require_auth && !caller.IsAuthenticated()) {
        return false;
    }
    return HasScopes(caller.scopes, definition.scopes);
}

std::vector<ResourceDefinition> ResourceCatalog::Visible(const CallerIdentity& caller) const {
    std::vector<ResourceDefinition> out;
    for (const auto& entry : entries_) {
        if (CanAccess(entry.definition, caller)) {
            out.push_back(entry.definition);
        }
    }
    return out;
}

Result<nlohmann::json, Error> ResourceCatalog::Read(const std::string& uri,
                                                    const CallerIdentity& caller) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.definition.uri == uri; });
    if (it == entries_.end() || !CanAccess(it->definition, caller)) {
        return Result<nlohmann::json, Error>::Err(Error{
            "ResourceCatalog::Read", "Resource '" + uri + "' not found",
            ErrorCategory::NotFound});
    }

    std::string text;
    try {
        text = it->provider(caller);
    } catch (const std::exception& e) {
        return Result<nlohmann::json, Error>::Err(Error{
            "ResourceCatalog::Read", e.what(), ErrorCategory::Collaborator});
    }

    nlohmann::json result = {
        {"contents", nlohmann::json::array({
            {{"uri", uri}, {"mimeType", it->definition.mime_type}, {"text", text}},
        })},
    };
    return Result<nlohmann::json, Error>::Ok(std::move(result));
}

} // namespace mcp_guard
