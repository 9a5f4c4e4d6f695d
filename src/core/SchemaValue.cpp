// SPDX-License-Identifier: Apache-2.0
#include "SchemaValue.hpp"

#include <format>
#include <limits>

namespace toolbridge
{

namespace
{
    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };
} // namespace

auto SchemaValue::fromJson(const nlohmann::json& value) -> SchemaValue
{
    using ValueType = nlohmann::json::value_t;

    switch (value.type())
    {
        case ValueType::boolean: return SchemaValue(Storage { value.get<bool>() });
        case ValueType::number_integer: return SchemaValue(Storage { value.get<std::int64_t>() });
        case ValueType::number_unsigned: {
            auto const raw = value.get<std::uint64_t>();
            if (raw <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                return SchemaValue(Storage { static_cast<std::int64_t>(raw) });
            return SchemaValue(Storage { static_cast<double>(raw) });
        }
        case ValueType::number_float: return SchemaValue(Storage { value.get<double>() });
        case ValueType::string: return SchemaValue(Storage { value.get<std::string>() });
        case ValueType::array: {
            auto items = SchemaArray {};
            items.reserve(value.size());
            for (const auto& item: value)
                items.push_back(fromJson(item));
            return SchemaValue(Storage { std::move(items) });
        }
        case ValueType::object: {
            auto members = SchemaObject {};
            members.reserve(value.size());
            for (const auto& [key, member]: value.items())
                members.emplace_back(key, fromJson(member));
            return SchemaValue(Storage { std::move(members) });
        }
        case ValueType::null:
        case ValueType::binary:
        case ValueType::discarded: break;
    }
    return SchemaValue {};
}

auto SchemaValue::toJson() const -> nlohmann::json
{
    return visit(Overloaded {
        [](std::nullptr_t) -> nlohmann::json { return nullptr; },
        [](bool b) -> nlohmann::json { return b; },
        [](std::int64_t i) -> nlohmann::json { return i; },
        [](double d) -> nlohmann::json { return d; },
        [](const std::string& s) -> nlohmann::json { return s; },
        [](const SchemaArray& items) -> nlohmann::json {
            auto out = nlohmann::json::array();
            for (const auto& item: items)
                out.push_back(item.toJson());
            return out;
        },
        [](const SchemaObject& members) -> nlohmann::json {
            auto out = nlohmann::json::object();
            for (const auto& [key, member]: members)
                out[key] = member.toJson();
            return out;
        },
    });
}

auto SchemaValue::render() const -> std::string
{
    return toJson().dump();
}

auto SchemaValue::find(std::string_view key) const -> const SchemaValue*
{
    auto const* members = asObject();
    if (!members)
        return nullptr;

    for (const auto& [name, member]: *members)
    {
        if (name == key)
            return &member;
    }
    return nullptr;
}

auto SchemaValue::scalarText() const -> std::optional<std::string>
{
    return visit(Overloaded {
        [](std::nullptr_t) -> std::optional<std::string> { return std::nullopt; },
        [](bool b) -> std::optional<std::string> { return b ? "true" : "false"; },
        [](std::int64_t i) -> std::optional<std::string> { return std::format("{}", i); },
        [](double d) -> std::optional<std::string> { return std::format("{}", d); },
        [](const std::string& s) -> std::optional<std::string> { return s; },
        [](const SchemaArray&) -> std::optional<std::string> { return std::nullopt; },
        [](const SchemaObject&) -> std::optional<std::string> { return std::nullopt; },
    });
}

} // namespace toolbridge
