#include <mcp_guard/mcp/tool_registry.hpp>

#include <mcp_guard/core/log.hpp>
#include <mcp_guard/mcp/schema_extractor.hpp>
#include <mcp_guard/security/description_sanitizer.hpp>

#include <algorithm>

namespace mcp_guard {

namespace {

bool InWhitelist(const std::string& path, const std::vector<std::string>& whitelist) {
    if (whitelist.empty()) {
        return true;
    }
    return std::any_of(whitelist.begin(), whitelist.end(), [&](const std::string& ns) {
        if (path == ns) return true;
        return path.size() > ns.size() && path.compare(0, ns.size(), ns) == 0 &&
               path[ns.size()] == '.';
    });
}

} // anonymous namespace

ToolFacts ToolDescriptor::Facts() const {
    return ToolFacts{name, category, is_public};
}

nlohmann::json ToolDescriptor::ToJson() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema},
    };
}

const ToolDescriptor* ToolSnapshot::Find(const std::string& name) const {
    auto it = index.find(name);
    if (it == index.end()) {
        return nullptr;
    }
    return &tools[it->second];
}

std::string VisibleToolName(const Procedure& procedure) {
    if (procedure.tool && procedure.tool->name && !procedure.tool->name->empty()) {
        return *procedure.tool->name;
    }
    const auto dot = procedure.path.rfind('.');
    return dot == std::string::npos ? procedure.path : procedure.path.substr(dot + 1);
}

std::shared_ptr<const ToolSnapshot> BuildToolSnapshot(
    const std::vector<std::shared_ptr<const Procedure>>& procedures,
    const RegistryOptions& options, std::uint64_t generation) {
    auto snapshot = std::make_shared<ToolSnapshot>();
    snapshot->generation = generation;

    for (const auto& procedure : procedures) {
        if (!procedure->tool) {
            continue;
        }
        if (!InWhitelist(procedure->path, options.namespace_whitelist)) {
            LogDebug("registry", "Skipping '" + procedure->path +
                                     "': outside namespace whitelist");
            continue;
        }

        const auto& meta = *procedure->tool;
        ToolDescriptor descriptor;
        descriptor.name = VisibleToolName(*procedure);
        if (snapshot->index.count(descriptor.name) > 0) {
            LogWarn("registry", "Duplicate tool name '" + descriptor.name + "' from '" +
                                    procedure->path + "', keeping first registration");
            continue;
        }

        auto sanitized = SanitizeDescriptionDetailed(
            meta.description ? *meta.description : "Execute " + descriptor.name);
        if (!sanitized.filtered_patterns.empty()) {
            LogWarn("registry", "Filtered description of tool '" + descriptor.name + "' (" +
                                    std::to_string(sanitized.filtered_patterns.size()) +
                                    " pattern classes)");
        }
        descriptor.description = std::move(sanitized.text);
        descriptor.input_schema = ExtractInputSchema(procedure->input);
        descriptor.category = meta.category;
        descriptor.is_public = meta.is_public;
        descriptor.required_scopes = meta.scopes;
        descriptor.procedure = procedure;

        snapshot->index.emplace(descriptor.name, snapshot->tools.size());
        snapshot->tools.push_back(std::move(descriptor));
    }

    LogDebug("registry", "Built tool snapshot " + std::to_string(generation) + " with " +
                             std::to_string(snapshot->tools.size()) + " tools");
    return snapshot;
}

// ===========================================================================
// ToolRegistry
// ===========================================================================

ToolRegistry::ToolRegistry(const ProcedureSet& procedures, RegistryOptions options)
    : procedures_(procedures), options_(std::move(options)) {
    Rebuild();
}

void ToolRegistry::Rebuild() {
    std::lock_guard<std::mutex> lock(rebuild_mutex_);
    // Read the version before the procedures so a concurrent Add triggers
    // another rebuild instead of being missed.
    const auto version = procedures_.Version();
    auto snapshot = BuildToolSnapshot(procedures_.All(), options_, version);
    std::atomic_store(&current_, std::move(snapshot));
}

std::shared_ptr<const ToolSnapshot> ToolRegistry::Snapshot() {
    auto snapshot = std::atomic_load(&current_);
    if (snapshot && snapshot->generation == procedures_.Version()) {
        return snapshot;
    }
    Rebuild();
    return std::atomic_load(&current_);
}

} // namespace mcp_guard
