#include <mcp_guard/mcp/param_type.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <set>

namespace mcp_guard {

namespace {

Result<nlohmann::json, Error> Invalid(const std::string& path, const std::string& message) {
    return Result<nlohmann::json, Error>::Err(Error{
        "ParseInput", (path.empty() ? std::string("input") : path) + ": " + message,
        ErrorCategory::Validation});
}

std::string MemberPath(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "." + name;
}

Result<nlohmann::json, Error> Parse(const ParamType& type, const nlohmann::json& value,
                                    const std::string& path) {
    using R = Result<nlohmann::json, Error>;
    switch (type.kind) {
        case ParamKind::Void:
            return R::Ok(value.is_null() ? nlohmann::json::object() : value);

        case ParamKind::String:
            if (!value.is_string()) return Invalid(path, "expected string");
            return R::Ok(value);

        case ParamKind::Number:
            if (!value.is_number()) return Invalid(path, "expected number");
            return R::Ok(value);

        case ParamKind::Integer:
            if (value.is_number_integer()) return R::Ok(value);
            if (value.is_number_float()) {
                const double d = value.get<double>();
                if (std::floor(d) == d) return R::Ok(static_cast<std::int64_t>(d));
            }
            return Invalid(path, "expected integer");

        case ParamKind::Boolean:
            if (!value.is_boolean()) return Invalid(path, "expected boolean");
            return R::Ok(value);

        case ParamKind::Enum: {
            if (!value.is_string()) return Invalid(path, "expected string");
            const auto s = value.get<std::string>();
            if (std::find(type.enum_values.begin(), type.enum_values.end(), s) ==
                type.enum_values.end()) {
                return Invalid(path, "'" + s + "' is not an allowed value");
            }
            return R::Ok(value);
        }

        case ParamKind::Array: {
            if (!value.is_array()) return Invalid(path, "expected array");
            nlohmann::json out = nlohmann::json::array();
            for (std::size_t i = 0; i < value.size(); ++i) {
                auto item = Parse(type.children.at(0), value[i],
                                  path + "[" + std::to_string(i) + "]");
                if (item.IsErr()) return item;
                out.push_back(std::move(item).Value());
            }
            return R::Ok(std::move(out));
        }

        case ParamKind::Object: {
            const nlohmann::json& obj = value.is_null() ? nlohmann::json::object() : value;
            if (!obj.is_object()) return Invalid(path, "expected object");

            std::set<std::string> known;
            nlohmann::json out = nlohmann::json::object();
            for (const auto& field : type.fields) {
                known.insert(field.name);
                const auto member_path = MemberPath(path, field.name);
                auto it = obj.find(field.name);
                if (it == obj.end() || it->is_null()) {
                    if (field.type.kind == ParamKind::Default) {
                        out[field.name] = field.type.default_value;
                    } else if (field.type.IsRequiredMember()) {
                        return Invalid(member_path, "required");
                    }
                    continue;
                }
                auto parsed = Parse(field.type, *it, member_path);
                if (parsed.IsErr()) return parsed;
                out[field.name] = std::move(parsed).Value();
            }
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                if (known.count(it.key()) == 0) {
                    return Invalid(MemberPath(path, it.key()), "unknown field");
                }
            }
            return R::Ok(std::move(out));
        }

        case ParamKind::Union: {
            for (const auto& alternative : type.children) {
                auto parsed = Parse(alternative, value, path);
                if (parsed.IsOk()) return parsed;
            }
            return Invalid(path, "does not match any alternative");
        }

        case ParamKind::Optional:
        case ParamKind::Default:
            if (value.is_null()) {
                return R::Ok(type.kind == ParamKind::Default ? type.default_value
                                                              : nlohmann::json());
            }
            return Parse(type.children.at(0), value, path);
    }
    return Invalid(path, "unsupported type");
}

ParamType Make(ParamKind kind) {
    ParamType t;
    t.kind = kind;
    return t;
}

} // anonymous namespace

ParamType ParamType::Describe(std::string text) const {
    ParamType copy = *this;
    copy.description = std::move(text);
    return copy;
}

bool ParamType::IsRequiredMember() const noexcept {
    return kind != ParamKind::Optional && kind != ParamKind::Default;
}

namespace param {

ParamType Void() { return Make(ParamKind::Void); }
ParamType String() { return Make(ParamKind::String); }
ParamType Number() { return Make(ParamKind::Number); }
ParamType Integer() { return Make(ParamKind::Integer); }
ParamType Boolean() { return Make(ParamKind::Boolean); }

ParamType Enum(std::vector<std::string> values) {
    auto t = Make(ParamKind::Enum);
    t.enum_values = std::move(values);
    return t;
}

ParamType Array(ParamType items) {
    auto t = Make(ParamKind::Array);
    t.children.push_back(std::move(items));
    return t;
}

ParamType Object(std::vector<ParamField> fields) {
    auto t = Make(ParamKind::Object);
    t.fields = std::move(fields);
    return t;
}

ParamType Union(std::vector<ParamType> alternatives) {
    auto t = Make(ParamKind::Union);
    t.children = std::move(alternatives);
    return t;
}

ParamType Optional(ParamType inner) {
    auto t = Make(ParamKind::Optional);
    t.description = inner.description;
    t.children.push_back(std::move(inner));
    return t;
}

ParamType WithDefault(ParamType inner, nlohmann::json value) {
    auto t = Make(ParamKind::Default);
    t.description = inner.description;
    t.default_value = std::move(value);
    t.children.push_back(std::move(inner));
    return t;
}

} // namespace param

Result<nlohmann::json, Error> ParseInput(const ParamType& type, const nlohmann::json& input) {
    return Parse(type, input, "");
}

} // namespace mcp_guard
