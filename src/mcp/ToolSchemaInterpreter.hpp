// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/SchemaValue.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief One way of reading parameters out of a tool schema.
enum class SchemaStrategy : std::uint8_t
{
    DirectProperties,  ///< Top-level keys whose value is an object with a "type".
    PropertiesWrapper, ///< Conventional JSON-Schema "properties" + "required".
    ParamsWrapper,     ///< Same, below a "params" or "parameters" key.
    ArrayItems,        ///< "type": "array" with "items.properties"; names become "items.<name>".
    Composition,       ///< oneOf/anyOf/allOf alternatives; names become "<keyword>[<i>].<name>".
    ArrayEncoded,      ///< Schema flattened into nested ["key", value] arrays.
    FreeText,          ///< Quoted identifiers found in the rendered schema.
    Parameterless,     ///< Empty object schema; the tool takes no arguments.
    LastResort,        ///< A single generic "input" for tools known to need one.
};

[[nodiscard]] auto schemaStrategyName(SchemaStrategy strategy) -> std::string_view;

/// @brief Result of interpreting one tool schema.
struct SchemaInterpretation
{
    enum class Outcome : std::uint8_t
    {
        Parameters,
        Parameterless,
        Unknown,
    };

    Outcome outcome = Outcome::Unknown;
    std::optional<SchemaStrategy> strategy;

    /// @brief Required parameters first, each group in schema order.
    std::vector<ParameterInfo> parameters;

    /// @brief True when the parameters are a guess rather than read from structure.
    [[nodiscard]] auto isHeuristic() const -> bool
    {
        return strategy == SchemaStrategy::FreeText || strategy == SchemaStrategy::LastResort;
    }

    /// @brief Registry source matching this interpretation.
    [[nodiscard]] auto source() const -> ParameterSource
    {
        if (outcome == Outcome::Unknown)
            return ParameterSource::None;
        return isHeuristic() ? ParameterSource::Heuristic : ParameterSource::Schema;
    }
};

/// @brief Turns a raw tool schema into a parameter table.
///
/// Strategies run in chain order and the first one that yields a parameter wins. A strategy
/// that does not recognize the shape yields nothing; malformed input never raises.
class ToolSchemaInterpreter
{
  public:
    /// @brief Uses the default chain (declaration order of SchemaStrategy).
    ToolSchemaInterpreter();

    explicit ToolSchemaInterpreter(std::vector<SchemaStrategy> chain);

    /// @brief Interprets a tool schema.
    /// @param schema The raw schema, or std::nullopt when the server sent none.
    /// @param requiresInput Whether the tool is known to take an argument (enables LastResort).
    [[nodiscard]] auto interpret(const std::optional<SchemaValue>& schema, bool requiresInput) const
        -> SchemaInterpretation;

    [[nodiscard]] auto chain() const -> const std::vector<SchemaStrategy>& { return _chain; }

    /// @brief Runs a single extracting strategy.
    /// @return The parameters found, empty when the shape does not match. Parameterless and
    ///         LastResort never extract anything here.
    [[nodiscard]] static auto extract(SchemaStrategy strategy, const SchemaValue& schema)
        -> std::vector<ParameterInfo>;

    /// @brief True for `{}` and `{"type": "object"}`-like schemas that declare no arguments.
    [[nodiscard]] static auto isParameterlessSchema(const SchemaValue& schema) -> bool;

  private:
    std::vector<SchemaStrategy> _chain;
};

} // namespace toolbridge
