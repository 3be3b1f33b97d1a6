#include <mcp_guard/mcp/schema_extractor.hpp>

namespace mcp_guard {

nlohmann::json EmptyObjectSchema() {
    return {
        {"type", "object"},
        {"properties", nlohmann::json::object()},
        {"additionalProperties", false},
    };
}

nlohmann::json ToJsonSchema(const ParamType& type) {
    nlohmann::json schema = nlohmann::json::object();
    switch (type.kind) {
        case ParamKind::Void:
            return EmptyObjectSchema();
        case ParamKind::String:
            schema["type"] = "string";
            break;
        case ParamKind::Number:
            schema["type"] = "number";
            break;
        case ParamKind::Integer:
            schema["type"] = "integer";
            break;
        case ParamKind::Boolean:
            schema["type"] = "boolean";
            break;
        case ParamKind::Enum:
            schema["type"] = "string";
            schema["enum"] = type.enum_values;
            break;
        case ParamKind::Array:
            schema["type"] = "array";
            schema["items"] = type.children.empty() ? nlohmann::json::object()
                                                    : ToJsonSchema(type.children[0]);
            break;
        case ParamKind::Object: {
            nlohmann::json properties = nlohmann::json::object();
            nlohmann::json required = nlohmann::json::array();
            for (const auto& field : type.fields) {
                properties[field.name] = ToJsonSchema(field.type);
                if (field.type.IsRequiredMember()) {
                    required.push_back(field.name);
                }
            }
            schema["type"] = "object";
            schema["properties"] = std::move(properties);
            schema["required"] = std::move(required);
            schema["additionalProperties"] = false;
            break;
        }
        case ParamKind::Union: {
            nlohmann::json one_of = nlohmann::json::array();
            for (const auto& alternative : type.children) {
                one_of.push_back(ToJsonSchema(alternative));
            }
            schema["oneOf"] = std::move(one_of);
            break;
        }
        case ParamKind::Optional:
        case ParamKind::Default:
            if (!type.children.empty()) {
                schema = ToJsonSchema(type.children[0]);
            }
            if (type.kind == ParamKind::Default) {
                schema["default"] = type.default_value;
            }
            break;
    }
    if (!type.description.empty()) {
        schema["description"] = type.description;
    }
    return schema;
}

nlohmann::json ExtractInputSchema(const ParamType& type) {
    if (type.kind != ParamKind::Object) {
        return EmptyObjectSchema();
    }
    return ToJsonSchema(type);
}

} // namespace mcp_guard
