#pragma once

#include <mcp_guard/core/result.hpp>
#include <mcp_guard/mcp/procedure.hpp>
#include <mcp_guard/mcp/resource_catalog.hpp>
#include <mcp_guard/mcp/tool_registry.hpp>
#include <mcp_guard/security/rate_limiter.hpp>

namespace mcp_guard {

// Register the server's own procedures:
//   utility.echo              public, echoes a message with optional case transform
//   utility.greeting          public, localized greeting
//   system.health             scope system:read (or admin), load and limiter state
//   admin.reset_rate_limits   scope admin, clears a caller's rate windows
// The limiter is captured by reference and must outlive the set.
[[nodiscard]] Result<void, Error> RegisterBuiltinProcedures(ProcedureSet& procedures,
                                                            RateLimiter& limiter);

// Register mcp://internal/server-info and mcp://internal/tool-catalog.
// Both capture their arguments by reference.
[[nodiscard]] Result<void, Error> RegisterBuiltinResources(ResourceCatalog& resources,
                                                           ToolRegistry& tools,
                                                           const RateLimiter& limiter);

} // namespace mcp_guard
