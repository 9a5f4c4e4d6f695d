// SPDX-License-Identifier: Apache-2.0
#include "ToolSchemaInterpreter.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <regex>
#include <set>
#include <string>

namespace toolbridge
{

namespace
{
    constexpr auto GenericParameterName = std::string_view { "input" };

    constexpr auto CompositionKeywords = std::array<std::string_view, 3> { "oneOf", "anyOf", "allOf" };

    constexpr auto WrapperKeys = std::array<std::string_view, 2> { "params", "parameters" };

    /// Schema grammar keys that hold structure rather than a parameter.
    auto isStructuralKeyword(std::string_view word) -> bool
    {
        static constexpr auto keywords = std::array<std::string_view, 12> {
            "properties", "required", "type",        "items",  "oneOf",      "anyOf",
            "allOf",      "not",      "definitions", "params", "parameters", "additionalProperties",
        };
        return std::ranges::find(keywords, word) != keywords.end();
    }

    /// Schema annotation keys. Free-text scanning skips them along with the structural ones.
    auto isAnnotationKeyword(std::string_view word) -> bool
    {
        static constexpr auto keywords = std::array<std::string_view, 9> {
            "description", "title", "default", "enum", "example", "examples", "format", "const", "schema",
        };
        return std::ranges::find(keywords, word) != keywords.end();
    }

    auto isTypeName(std::string_view word) -> bool
    {
        static constexpr auto names = std::array<std::string_view, 7> {
            "string", "number", "integer", "boolean", "object", "array", "null",
        };
        return std::ranges::find(names, word) != names.end();
    }

    /// Reads "type": "x" or "type": ["x", "null"].
    auto typeOf(const SchemaValue* node) -> std::optional<std::string>
    {
        if (!node)
            return std::nullopt;

        if (auto const* name = node->asString())
            return *name;

        if (auto const* names = node->asArray())
        {
            for (const auto& item: *names)
            {
                if (auto const* name = item.asString(); name && *name != "null")
                    return *name;
            }
        }
        return std::nullopt;
    }

    auto requiredNames(const SchemaValue& node) -> std::set<std::string>
    {
        auto names = std::set<std::string> {};
        auto const* required = node.find("required");
        if (!required)
            return names;

        if (auto const* list = required->asArray())
        {
            for (const auto& item: *list)
            {
                if (auto const* name = item.asString())
                    names.insert(*name);
            }
        }
        return names;
    }

    auto makeParameter(std::string name, const SchemaValue& property, bool isRequired, bool requireType)
        -> std::optional<ParameterInfo>
    {
        // Shorthand "name": "string".
        if (auto const* shorthand = property.asString())
        {
            if (requireType)
                return std::nullopt;
            return ParameterInfo { .name = std::move(name), .isRequired = isRequired, .type = *shorthand };
        }

        if (!property.isObject())
            return std::nullopt;

        auto type = typeOf(property.find("type"));
        if (!type && requireType)
            return std::nullopt;

        auto param = ParameterInfo {
            .name = std::move(name),
            .isRequired = isRequired,
            .type = type.value_or("string"),
        };

        if (auto const* description = property.find("description"))
        {
            if (auto const* text = description->asString())
                param.description = *text;
        }

        if (auto const* example = property.find("example"))
            param.example = example->scalarText();
        if (!param.example)
        {
            if (auto const* fallback = property.find("default"))
                param.example = fallback->scalarText();
        }

        return param;
    }

    auto parametersFrom(const SchemaValue& properties, const std::set<std::string>& required, bool requireType)
        -> std::vector<ParameterInfo>
    {
        auto params = std::vector<ParameterInfo> {};
        auto const* members = properties.asObject();
        if (!members)
            return params;

        for (const auto& [name, property]: *members)
        {
            if (auto param = makeParameter(name, property, required.contains(name), requireType))
                params.push_back(std::move(*param));
        }
        return params;
    }

    /// Turns [["k", v], ...] or ["k", v, ...] into an object. Objects pass through unchanged.
    auto pairsToObject(const SchemaValue& value) -> SchemaValue
    {
        if (value.isObject())
            return value;

        auto members = SchemaObject {};
        if (auto const* items = value.asArray())
        {
            for (size_t i = 0; i < items->size(); ++i)
            {
                const auto& item = (*items)[i];
                if (auto const* pair = item.asArray(); pair && pair->size() == 2 && (*pair)[0].isString())
                {
                    members.emplace_back(*(*pair)[0].asString(), (*pair)[1]);
                }
                else if (item.isString() && i + 1 < items->size())
                {
                    members.emplace_back(*item.asString(), (*items)[i + 1]);
                    ++i;
                }
            }
        }
        return SchemaValue(SchemaValue::Storage { std::move(members) });
    }

    auto extractDirectProperties(const SchemaValue& schema) -> std::vector<ParameterInfo>
    {
        auto params = std::vector<ParameterInfo> {};
        auto const* members = schema.asObject();
        if (!members)
            return params;

        auto const required = requiredNames(schema);
        for (const auto& [name, property]: *members)
        {
            if (isStructuralKeyword(name))
                continue;
            if (auto param = makeParameter(name, property, required.contains(name), true))
                params.push_back(std::move(*param));
        }
        return params;
    }

    auto extractPropertiesWrapper(const SchemaValue& schema) -> std::vector<ParameterInfo>
    {
        auto const* properties = schema.find("properties");
        if (!properties)
            return {};
        return parametersFrom(*properties, requiredNames(schema), false);
    }

    auto extractParamsWrapper(const SchemaValue& schema) -> std::vector<ParameterInfo>
    {
        for (auto const key: WrapperKeys)
        {
            auto const* wrapper = schema.find(key);
            if (!wrapper || !wrapper->isObject())
                continue;

            auto required = requiredNames(schema);
            required.merge(requiredNames(*wrapper));

            auto params = std::vector<ParameterInfo> {};
            if (auto const* properties = wrapper->find("properties"))
                params = parametersFrom(*properties, required, false);
            else
                params = parametersFrom(*wrapper, required, true);

            if (!params.empty())
                return params;
        }
        return {};
    }

    auto extractArrayItems(const SchemaValue& schema) -> std::vector<ParameterInfo>
    {
        if (typeOf(schema.find("type")) != std::optional<std::string>("array"))
            return {};

        auto const* items = schema.find("items");
        if (!items)
            return {};
        auto const* properties = items->find("properties");
        if (!properties)
            return {};

        auto params = parametersFrom(*properties, requiredNames(*items), false);
        for (auto& param: params)
        {
            param.name = std::format("items.{}", param.name);
            param.type = std::format("array<{}>", param.type);
        }
        return params;
    }

    auto extractComposition(const SchemaValue& schema) -> std::vector<ParameterInfo>
    {
        auto params = std::vector<ParameterInfo> {};
        for (auto const keyword: CompositionKeywords)
        {
            auto const* alternatives = schema.find(keyword);
            if (!alternatives || !alternatives->isArray())
                continue;

            auto const& list = *alternatives->asArray();
            for (size_t index = 0; index < list.size(); ++index)
            {
                auto const* properties = list[index].find("properties");
                if (!properties)
                    continue;

                for (auto& param: parametersFrom(*properties, requiredNames(list[index]), false))
                {
                    param.name = std::format("{}[{}].{}", keyword, index, param.name);
                    params.push_back(std::move(param));
                }
            }
        }
        return params;
    }

    auto extractArrayEncoded(const SchemaValue& schema) -> std::vector<ParameterInfo>
    {
        if (!schema.isArray())
            return {};

        auto const top = pairsToObject(schema);
        auto const* properties = top.find("properties");
        if (!properties)
            return {};

        auto const required = requiredNames(top);
        auto const entries = pairsToObject(*properties);

        auto params = std::vector<ParameterInfo> {};
        for (const auto& [name, property]: *entries.asObject())
        {
            auto const normalized = property.isArray() ? pairsToObject(property) : property;
            if (auto param = makeParameter(name, normalized, required.contains(name), false))
                params.push_back(std::move(*param));
        }
        return params;
    }

    auto extractFreeText(const SchemaValue& schema) -> std::vector<ParameterInfo>
    {
        if (ToolSchemaInterpreter::isParameterlessSchema(schema))
            return {};

        // Keys holding an object first, then any other key. String values are never candidates.
        static const auto objectKeyPattern = std::regex(R"re("(\w+)"\s*:\s*\{)re");
        static const auto keyPattern = std::regex(R"re("(\w+)"\s*:)re");

        auto const text = schema.render();
        for (auto const* pattern: { &objectKeyPattern, &keyPattern })
        {
            for (auto it = std::sregex_iterator(text.begin(), text.end(), *pattern); it != std::sregex_iterator();
                 ++it)
            {
                auto word = (*it)[1].str();
                if (isStructuralKeyword(word) || isAnnotationKeyword(word) || isTypeName(word))
                    continue;
                return { ParameterInfo { .name = std::move(word), .isRequired = false, .type = "string" } };
            }
        }
        return {};
    }

    void normalize(std::vector<ParameterInfo>& params)
    {
        auto seen = std::set<std::string> {};
        std::erase_if(params, [&seen](const ParameterInfo& param) { return !seen.insert(param.name).second; });
        std::stable_partition(params.begin(), params.end(), [](const ParameterInfo& param) { return param.isRequired; });
    }
} // namespace

auto schemaStrategyName(SchemaStrategy strategy) -> std::string_view
{
    switch (strategy)
    {
        case SchemaStrategy::DirectProperties: return "direct-properties";
        case SchemaStrategy::PropertiesWrapper: return "properties";
        case SchemaStrategy::ParamsWrapper: return "params-wrapper";
        case SchemaStrategy::ArrayItems: return "array-items";
        case SchemaStrategy::Composition: return "composition";
        case SchemaStrategy::ArrayEncoded: return "array-encoded";
        case SchemaStrategy::FreeText: return "free-text";
        case SchemaStrategy::Parameterless: return "parameterless";
        case SchemaStrategy::LastResort: return "last-resort";
    }
    return "unknown";
}

ToolSchemaInterpreter::ToolSchemaInterpreter():
    ToolSchemaInterpreter({
        SchemaStrategy::DirectProperties,
        SchemaStrategy::PropertiesWrapper,
        SchemaStrategy::ParamsWrapper,
        SchemaStrategy::ArrayItems,
        SchemaStrategy::Composition,
        SchemaStrategy::ArrayEncoded,
        SchemaStrategy::FreeText,
        SchemaStrategy::Parameterless,
        SchemaStrategy::LastResort,
    })
{
}

ToolSchemaInterpreter::ToolSchemaInterpreter(std::vector<SchemaStrategy> chain): _chain(std::move(chain))
{
}

auto ToolSchemaInterpreter::interpret(const std::optional<SchemaValue>& schema, bool requiresInput) const
    -> SchemaInterpretation
{
    using Outcome = SchemaInterpretation::Outcome;

    if (!schema || schema->isNull())
        return SchemaInterpretation {};

    for (auto const strategy: _chain)
    {
        switch (strategy)
        {
            case SchemaStrategy::Parameterless:
                if (isParameterlessSchema(*schema))
                    return SchemaInterpretation { .outcome = Outcome::Parameterless, .strategy = strategy };
                break;

            case SchemaStrategy::LastResort:
                if (requiresInput)
                {
                    log::debug("No parameters recognized in schema {}, assuming '{}'", schema->render(),
                               GenericParameterName);
                    return SchemaInterpretation {
                        .outcome = Outcome::Parameters,
                        .strategy = strategy,
                        .parameters = { ParameterInfo {
                            .name = std::string(GenericParameterName), .isRequired = true, .type = "string" } },
                    };
                }
                break;

            case SchemaStrategy::DirectProperties:
            case SchemaStrategy::PropertiesWrapper:
            case SchemaStrategy::ParamsWrapper:
            case SchemaStrategy::ArrayItems:
            case SchemaStrategy::Composition:
            case SchemaStrategy::ArrayEncoded:
            case SchemaStrategy::FreeText:
                if (auto params = extract(strategy, *schema); !params.empty())
                {
                    return SchemaInterpretation {
                        .outcome = Outcome::Parameters,
                        .strategy = strategy,
                        .parameters = std::move(params),
                    };
                }
                break;
        }
    }

    return SchemaInterpretation {};
}

auto ToolSchemaInterpreter::extract(SchemaStrategy strategy, const SchemaValue& schema) -> std::vector<ParameterInfo>
{
    auto params = std::vector<ParameterInfo> {};
    switch (strategy)
    {
        case SchemaStrategy::DirectProperties: params = extractDirectProperties(schema); break;
        case SchemaStrategy::PropertiesWrapper: params = extractPropertiesWrapper(schema); break;
        case SchemaStrategy::ParamsWrapper: params = extractParamsWrapper(schema); break;
        case SchemaStrategy::ArrayItems: params = extractArrayItems(schema); break;
        case SchemaStrategy::Composition: params = extractComposition(schema); break;
        case SchemaStrategy::ArrayEncoded: params = extractArrayEncoded(schema); break;
        case SchemaStrategy::FreeText: params = extractFreeText(schema); break;
        case SchemaStrategy::Parameterless:
        case SchemaStrategy::LastResort: break;
    }
    normalize(params);
    return params;
}

auto ToolSchemaInterpreter::isParameterlessSchema(const SchemaValue& schema) -> bool
{
    auto const* members = schema.asObject();
    if (!members)
        return false;

    for (const auto& [key, value]: *members)
    {
        if (key == "type")
        {
            if (auto const type = typeOf(&value); type && *type != "object")
                return false;
            continue;
        }

        if (key == "properties" || key == "params" || key == "parameters")
        {
            if (auto const* entries = value.asObject(); entries && entries->empty())
                continue;
            return false;
        }

        if (key == "required")
        {
            if (auto const* names = value.asArray(); names && names->empty())
                continue;
            return false;
        }

        if (key == "items" || std::ranges::find(CompositionKeywords, key) != CompositionKeywords.end())
            return false;

        if (value.isObject() && value.contains("type"))
            return false;
    }
    return true;
}

} // namespace toolbridge
