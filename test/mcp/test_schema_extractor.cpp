#include <catch2/catch_test_macros.hpp>

#include <mcp_guard/mcp/schema_extractor.hpp>

using namespace mcp_guard;

// ===========================================================================
// ExtractInputSchema
// ===========================================================================

TEST_CASE("ExtractInputSchema: object with required and defaulted members", "[schema]") {
    auto type = param::Object({
        {"message", param::String().Describe("Message to echo back")},
        {"uppercase", param::WithDefault(param::Boolean(), false)},
        {"tag", param::Optional(param::String())},
    });

    auto schema = ExtractInputSchema(type);
    CHECK(schema["type"] == "object");
    CHECK(schema["additionalProperties"] == false);
    CHECK(schema["required"] == nlohmann::json::array({"message"}));
    CHECK(schema["properties"]["message"]["type"] == "string");
    CHECK(schema["properties"]["message"]["description"] == "Message to echo back");
    CHECK(schema["properties"]["uppercase"]["type"] == "boolean");
    CHECK(schema["properties"]["uppercase"]["default"] == false);
    CHECK(schema["properties"]["tag"] == nlohmann::json{{"type", "string"}});
}

TEST_CASE("ExtractInputSchema: non-object inputs give the empty object schema",
          "[schema]") {
    const auto empty = EmptyObjectSchema();
    CHECK(ExtractInputSchema(param::Void()) == empty);
    CHECK(ExtractInputSchema(param::String()) == empty);
    CHECK(ExtractInputSchema(param::Union({param::Integer(), param::String()})) == empty);
    CHECK(empty["properties"].empty());
    CHECK(empty["additionalProperties"] == false);
}

TEST_CASE("ExtractInputSchema: object without members lists none required", "[schema]") {
    auto schema = ExtractInputSchema(param::Object({}));
    CHECK(schema["properties"].empty());
    CHECK(schema["required"].empty());
}

// ===========================================================================
// ToJsonSchema
// ===========================================================================

TEST_CASE("ToJsonSchema: scalar and enum kinds", "[schema]") {
    CHECK(ToJsonSchema(param::Number())["type"] == "number");
    CHECK(ToJsonSchema(param::Integer())["type"] == "integer");

    auto e = ToJsonSchema(param::Enum({"en", "es", "fr"}));
    CHECK(e["type"] == "string");
    CHECK(e["enum"] == nlohmann::json::array({"en", "es", "fr"}));
}

TEST_CASE("ToJsonSchema: arrays and nested objects", "[schema]") {
    auto type = param::Object({
        {"items", param::Array(param::Object({{"id", param::Integer()}}))},
    });
    auto schema = ToJsonSchema(type);
    const auto& items = schema["properties"]["items"];
    CHECK(items["type"] == "array");
    CHECK(items["items"]["type"] == "object");
    CHECK(items["items"]["required"] == nlohmann::json::array({"id"}));
}

TEST_CASE("ToJsonSchema: unions become oneOf", "[schema]") {
    auto schema = ToJsonSchema(param::Union({param::Integer(), param::String()}));
    REQUIRE(schema["oneOf"].size() == 2);
    CHECK(schema["oneOf"][0]["type"] == "integer");
    CHECK(schema["oneOf"][1]["type"] == "string");
}

TEST_CASE("ToJsonSchema: default keeps the inner description", "[schema]") {
    auto type = param::WithDefault(param::Integer().Describe("Repeat count"), 1);
    auto schema = ToJsonSchema(type);
    CHECK(schema["type"] == "integer");
    CHECK(schema["default"] == 1);
    CHECK(schema["description"] == "Repeat count");
}
