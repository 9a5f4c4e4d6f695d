// SPDX-License-Identifier: Apache-2.0
#include <mcp/ToolSchemaInterpreter.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace toolbridge;

namespace
{
    using Outcome = SchemaInterpretation::Outcome;

    auto schemaOf(std::string_view text) -> std::optional<SchemaValue>
    {
        return SchemaValue::fromJson(nlohmann::json::parse(text));
    }

    auto interpret(std::string_view text, bool requiresInput = false) -> SchemaInterpretation
    {
        return ToolSchemaInterpreter {}.interpret(schemaOf(text), requiresInput);
    }
} // namespace

TEST_CASE("The default chain tries structured strategies before heuristics", "[schema]")
{
    auto const interpreter = ToolSchemaInterpreter {};
    auto const& chain = interpreter.chain();

    REQUIRE(chain.size() == 9);
    CHECK(chain.front() == SchemaStrategy::DirectProperties);
    CHECK(chain[6] == SchemaStrategy::FreeText);
    CHECK(chain.back() == SchemaStrategy::LastResort);
    CHECK(schemaStrategyName(SchemaStrategy::ArrayEncoded) == "array-encoded");
}

TEST_CASE("Conventional properties and required lists are read", "[schema]")
{
    auto const result = interpret(R"({
        "type": "object",
        "properties": {
            "recursive": { "type": "boolean", "default": false },
            "path": { "type": "string", "description": "File path" }
        },
        "required": ["path"]
    })");

    REQUIRE(result.outcome == Outcome::Parameters);
    CHECK(result.strategy == SchemaStrategy::PropertiesWrapper);
    CHECK(result.source() == ParameterSource::Schema);
    REQUIRE(result.parameters.size() == 2);

    CHECK(result.parameters[0].name == "path");
    CHECK(result.parameters[0].isRequired);
    CHECK(result.parameters[0].description == "File path");

    CHECK(result.parameters[1].name == "recursive");
    CHECK(!result.parameters[1].isRequired);
    CHECK(result.parameters[1].type == "boolean");
    CHECK(result.parameters[1].example == "false");
}

TEST_CASE("Top-level typed keys are parameters themselves", "[schema]")
{
    auto const result = interpret(R"({
        "query": { "type": "string", "example": "weather" },
        "limit": { "type": "integer" },
        "required": ["query"]
    })");

    REQUIRE(result.outcome == Outcome::Parameters);
    CHECK(result.strategy == SchemaStrategy::DirectProperties);
    REQUIRE(result.parameters.size() == 2);
    CHECK(result.parameters[0] == ParameterInfo { .name = "query", .isRequired = true, .example = "weather" });
    CHECK(result.parameters[1] == ParameterInfo { .name = "limit", .isRequired = false, .type = "integer" });
}

TEST_CASE("Nullable type lists report the non-null type", "[schema]")
{
    auto const result = interpret(R"({"properties": {"count": {"type": ["null", "integer"]}}})");

    REQUIRE(result.parameters.size() == 1);
    CHECK(result.parameters[0].type == "integer");
}

TEST_CASE("Parameters below a params or parameters key are read", "[schema]")
{
    SECTION("params with properties")
    {
        auto const result = interpret(R"({"params": {"properties": {"id": {"type": "integer"}}, "required": ["id"]}})");
        REQUIRE(result.outcome == Outcome::Parameters);
        CHECK(result.strategy == SchemaStrategy::ParamsWrapper);
        REQUIRE(result.parameters.size() == 1);
        CHECK(result.parameters[0] == ParameterInfo { .name = "id", .isRequired = true, .type = "integer" });
    }

    SECTION("parameters holding typed keys directly")
    {
        auto const result = interpret(R"({"parameters": {"name": {"type": "string"}}})");
        REQUIRE(result.outcome == Outcome::Parameters);
        CHECK(result.strategy == SchemaStrategy::ParamsWrapper);
        REQUIRE(result.parameters.size() == 1);
        CHECK(result.parameters[0].name == "name");
    }
}

TEST_CASE("Array item properties are prefixed with items", "[schema]")
{
    auto const result = interpret(R"({
        "type": "array",
        "items": { "type": "object", "properties": { "x": { "type": "number" } }, "required": ["x"] }
    })");

    REQUIRE(result.outcome == Outcome::Parameters);
    CHECK(result.strategy == SchemaStrategy::ArrayItems);
    REQUIRE(result.parameters.size() == 1);
    CHECK(result.parameters[0] == ParameterInfo { .name = "items.x", .isRequired = true, .type = "array<number>" });
}

TEST_CASE("Composition alternatives are indexed by keyword", "[schema]")
{
    auto const result = interpret(R"({
        "oneOf": [
            { "properties": { "a": { "type": "string" } } },
            { "properties": { "b": { "type": "integer" } }, "required": ["b"] }
        ]
    })");

    REQUIRE(result.outcome == Outcome::Parameters);
    CHECK(result.strategy == SchemaStrategy::Composition);
    REQUIRE(result.parameters.size() == 2);
    CHECK(result.parameters[0].name == "oneOf[1].b");
    CHECK(result.parameters[0].isRequired);
    CHECK(result.parameters[1].name == "oneOf[0].a");
}

TEST_CASE("Array-encoded schemas read like their object form", "[schema]")
{
    auto const encoded = interpret(R"([["required", ["q"]], ["properties", [["q", [["type", "string"]]]]]])");
    auto const object = interpret(R"({"properties": {"q": {"type": "string"}}, "required": ["q"]})");

    REQUIRE(encoded.outcome == Outcome::Parameters);
    CHECK(encoded.strategy == SchemaStrategy::ArrayEncoded);
    CHECK(encoded.parameters == object.parameters);
    REQUIRE(encoded.parameters.size() == 1);
    CHECK(encoded.parameters[0] == ParameterInfo { .name = "q", .isRequired = true, .type = "string" });
}

TEST_CASE("Free text yields a heuristic guess", "[schema]")
{
    auto const result = interpret(R"({"properties": "see below", "type": "object", "command": "shell command"})");

    REQUIRE(result.outcome == Outcome::Parameters);
    CHECK(result.strategy == SchemaStrategy::FreeText);
    CHECK(result.isHeuristic());
    CHECK(result.source() == ParameterSource::Heuristic);
    REQUIRE(result.parameters.size() == 1);
    CHECK(result.parameters[0].name == "command");
    CHECK(!result.parameters[0].isRequired);
}

TEST_CASE("Free text never turns annotation values into parameters", "[schema]")
{
    for (auto const* text: { R"({"type": "object", "properties": {}, "title": "pingArguments"})",
                             R"({"type": "object", "description": "Lists"})" })
    {
        INFO(text);
        auto const result = interpret(text);
        CHECK(result.outcome == Outcome::Parameterless);
        CHECK(result.strategy == SchemaStrategy::Parameterless);
        CHECK(result.parameters.empty());
    }

    auto const schema = schemaOf(R"({"type": "object", "properties": {}, "title": "pingArguments"})");
    REQUIRE(schema.has_value());
    CHECK(ToolSchemaInterpreter::extract(SchemaStrategy::FreeText, *schema).empty());

    auto const described = interpret(R"({"properties": "none", "title": "Runner", "description": "Runs it"})");
    CHECK(described.outcome != Outcome::Parameters);
}

TEST_CASE("Empty object schemas are parameterless", "[schema]")
{
    for (auto const* text: { R"({})", R"({"type": "object"})", R"({"type": "object", "properties": {}})",
                             R"({"type": "object", "properties": {}, "required": []})" })
    {
        INFO(text);
        auto const result = interpret(text, true);
        CHECK(result.outcome == Outcome::Parameterless);
        CHECK(result.strategy == SchemaStrategy::Parameterless);
        CHECK(result.parameters.empty());
        CHECK(result.source() == ParameterSource::Schema);
    }
}

TEST_CASE("The generic input is used only for tools that need an argument", "[schema]")
{
    auto const needed = interpret(R"({"type": "string"})", true);
    REQUIRE(needed.outcome == Outcome::Parameters);
    CHECK(needed.strategy == SchemaStrategy::LastResort);
    CHECK(needed.source() == ParameterSource::Heuristic);
    REQUIRE(needed.parameters.size() == 1);
    CHECK(needed.parameters[0] == ParameterInfo { .name = "input", .isRequired = true, .type = "string" });

    auto const optional = interpret(R"({"type": "string"})", false);
    CHECK(optional.outcome == Outcome::Unknown);
    CHECK(optional.source() == ParameterSource::None);
}

TEST_CASE("A missing schema is unknown", "[schema]")
{
    auto const interpreter = ToolSchemaInterpreter {};

    CHECK(interpreter.interpret(std::nullopt, true).outcome == Outcome::Unknown);
    CHECK(interpreter.interpret(SchemaValue {}, true).outcome == Outcome::Unknown);
    CHECK(!interpreter.interpret(std::nullopt, false).strategy.has_value());
}

TEST_CASE("A custom chain limits the strategies tried", "[schema]")
{
    auto const interpreter = ToolSchemaInterpreter({ SchemaStrategy::DirectProperties });
    auto const result = interpreter.interpret(schemaOf(R"({"properties": {"q": {"type": "string"}}})"), false);

    CHECK(result.outcome == Outcome::Unknown);
}

TEST_CASE("Composition keywords are read in oneOf, anyOf, allOf order", "[schema]")
{
    auto const params = ToolSchemaInterpreter::extract(
        SchemaStrategy::Composition,
        SchemaValue::fromJson(nlohmann::json::parse(R"({
            "anyOf": [ { "properties": { "a": { "type": "string" } } } ],
            "oneOf": [ { "properties": { "a": { "type": "string" } } } ]
        })")));

    REQUIRE(params.size() == 2);
    CHECK(params[0].name == "oneOf[0].a");
    CHECK(params[1].name == "anyOf[0].a");
}
