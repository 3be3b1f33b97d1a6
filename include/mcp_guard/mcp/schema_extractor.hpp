#pragma once

#include <mcp_guard/mcp/param_type.hpp>

#include <nlohmann/json.hpp>

namespace mcp_guard {

// {type:object, properties:{}, additionalProperties:false}
[[nodiscard]] nlohmann::json EmptyObjectSchema();

// JSON Schema fragment for any ParamType.
//   Object   -> {type:object, properties, required[], additionalProperties:false}
//   Union    -> {oneOf:[...]}
//   Optional -> inner schema
//   Default  -> inner schema plus "default"
//   Enum     -> {type:string, enum:[...]}
//   Array    -> {type:array, items}
[[nodiscard]] nlohmann::json ToJsonSchema(const ParamType& type);

// Tool input schema. Anything that is not an object at the top level
// (void, scalars, unions) yields EmptyObjectSchema().
[[nodiscard]] nlohmann::json ExtractInputSchema(const ParamType& type);

} // namespace mcp_guard
