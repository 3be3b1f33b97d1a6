#pragma once

#include <mcp_guard/core/result.hpp>

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace mcp_guard {

enum class ParamKind {
    Void,
    String,
    Number,
    Integer,
    Boolean,
    Enum,
    Array,
    Object,
    Union,
    Optional,
    Default,
};

struct ParamField;

// ---------------------------------------------------------------------------
// ParamType - declared input type of a procedure.
//
// A small value tree built with the param:: helpers below. Wrapper kinds
// (Array, Optional, Default) keep their inner type in children[0]; Union
// keeps its alternatives in children; Object keeps its members in fields.
// ---------------------------------------------------------------------------
struct ParamType {
    ParamKind kind = ParamKind::Void;
    std::string description;
    std::vector<std::string> enum_values;
    std::vector<ParamField> fields;
    std::vector<ParamType> children;
    nlohmann::json default_value;

    // Copy with a description attached.
    [[nodiscard]] ParamType Describe(std::string text) const;

    // Optional and Default members need not be supplied.
    [[nodiscard]] bool IsRequiredMember() const noexcept;
};

struct ParamField {
    std::string name;
    ParamType type;
};

namespace param {

[[nodiscard]] ParamType Void();
[[nodiscard]] ParamType String();
[[nodiscard]] ParamType Number();
[[nodiscard]] ParamType Integer();
[[nodiscard]] ParamType Boolean();
[[nodiscard]] ParamType Enum(std::vector<std::string> values);
[[nodiscard]] ParamType Array(ParamType items);
[[nodiscard]] ParamType Object(std::vector<ParamField> fields);
[[nodiscard]] ParamType Union(std::vector<ParamType> alternatives);
[[nodiscard]] ParamType Optional(ParamType inner);
[[nodiscard]] ParamType WithDefault(ParamType inner, nlohmann::json value);

} // namespace param

// Validate `input` against `type`, filling in declared defaults.
// Absent or null input for an object type is treated as {}. Unknown
// object members are rejected.
[[nodiscard]] Result<nlohmann::json, Error> ParseInput(const ParamType& type,
                                                       const nlohmann::json& input);

} // namespace mcp_guard
