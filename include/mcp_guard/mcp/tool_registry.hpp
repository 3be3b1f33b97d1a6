#pragma once

#include <mcp_guard/mcp/procedure.hpp>
#include <mcp_guard/security/access_control.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcp_guard {

// ---------------------------------------------------------------------------
// ToolDescriptor - one tool as advertised to clients.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;     // sanitized
    nlohmann::json input_schema;
    std::optional<std::string> category;
    bool is_public = false;      // as declared by the tool itself
    ScopeRequirement required_scopes;
    std::shared_ptr<const Procedure> procedure;

    [[nodiscard]] ToolFacts Facts() const;

    // {name, description, inputSchema}
    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolSnapshot - immutable, ordered set of descriptors.
// ---------------------------------------------------------------------------
struct ToolSnapshot {
    std::vector<ToolDescriptor> tools;
    std::map<std::string, std::size_t> index;
    std::uint64_t generation = 0;

    [[nodiscard]] const ToolDescriptor* Find(const std::string& name) const;
};

struct RegistryOptions {
    // When non-empty, only procedures whose path starts with one of these
    // namespaces become tools.
    std::vector<std::string> namespace_whitelist;
};

// Metadata name, or the last dotted segment of the procedure path.
[[nodiscard]] std::string VisibleToolName(const Procedure& procedure);

// Build descriptors for every procedure carrying tool metadata. Duplicate
// visible names keep the first registration.
[[nodiscard]] std::shared_ptr<const ToolSnapshot> BuildToolSnapshot(
    const std::vector<std::shared_ptr<const Procedure>>& procedures,
    const RegistryOptions& options, std::uint64_t generation);

// ---------------------------------------------------------------------------
// ToolRegistry - keeps the current snapshot in step with a ProcedureSet.
//
// Snapshot() rebuilds wholesale when the procedure set's version changed.
// Callers keep the snapshot they obtained for the rest of their request.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    ToolRegistry(const ProcedureSet& procedures, RegistryOptions options = {});

    [[nodiscard]] std::shared_ptr<const ToolSnapshot> Snapshot();

    // Force a rebuild from the current procedure set.
    void Rebuild();

private:
    const ProcedureSet& procedures_;
    RegistryOptions options_;
    std::mutex rebuild_mutex_;
    std::shared_ptr<const ToolSnapshot> current_;
};

} // namespace mcp_guard
