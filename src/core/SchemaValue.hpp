// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace toolbridge
{

class SchemaValue;

/// @brief Ordered list of schema values.
using SchemaArray = std::vector<SchemaValue>;

/// @brief Object members in the order they were read.
using SchemaObject = std::vector<std::pair<std::string, SchemaValue>>;

/// @brief Closed recursive value type for tool schema fragments.
///
/// Schemas reported by servers do not follow a single shape, so the interpreter walks this
/// type instead of assuming JSON-Schema structure. Every alternative is visited explicitly.
class SchemaValue
{
  public:
    using Storage =
        std::variant<std::nullptr_t, bool, std::int64_t, double, std::string, SchemaArray, SchemaObject>;

    enum class Kind : std::uint8_t
    {
        Null,
        Bool,
        Integer,
        Number,
        String,
        Array,
        Object,
    };

    SchemaValue() = default;
    explicit SchemaValue(Storage value): _value(std::move(value)) {}

    /// @brief Converts a parsed JSON value. Binary and discarded values map to null.
    [[nodiscard]] static auto fromJson(const nlohmann::json& value) -> SchemaValue;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /// @brief Compact textual rendering, used by free-text heuristics and diagnostics.
    [[nodiscard]] auto render() const -> std::string;

    [[nodiscard]] auto kind() const noexcept -> Kind { return static_cast<Kind>(_value.index()); }

    [[nodiscard]] auto isNull() const noexcept -> bool { return kind() == Kind::Null; }
    [[nodiscard]] auto isObject() const noexcept -> bool { return kind() == Kind::Object; }
    [[nodiscard]] auto isArray() const noexcept -> bool { return kind() == Kind::Array; }
    [[nodiscard]] auto isString() const noexcept -> bool { return kind() == Kind::String; }

    [[nodiscard]] auto asObject() const noexcept -> const SchemaObject* { return std::get_if<SchemaObject>(&_value); }
    [[nodiscard]] auto asArray() const noexcept -> const SchemaArray* { return std::get_if<SchemaArray>(&_value); }
    [[nodiscard]] auto asString() const noexcept -> const std::string* { return std::get_if<std::string>(&_value); }

    /// @brief Looks up an object member.
    /// @return The member value, or nullptr if this is not an object or the key is absent.
    [[nodiscard]] auto find(std::string_view key) const -> const SchemaValue*;

    [[nodiscard]] auto contains(std::string_view key) const -> bool { return find(key) != nullptr; }

    /// @brief Text of a scalar value (string as-is, numbers and booleans rendered).
    /// @return The text, or std::nullopt for null, arrays and objects.
    [[nodiscard]] auto scalarText() const -> std::optional<std::string>;

    [[nodiscard]] auto storage() const noexcept -> const Storage& { return _value; }

    template <typename Visitor>
    decltype(auto) visit(Visitor&& visitor) const
    {
        return std::visit(std::forward<Visitor>(visitor), _value);
    }

    auto operator==(const SchemaValue& other) const -> bool = default;

  private:
    Storage _value { nullptr };
};

} // namespace toolbridge
