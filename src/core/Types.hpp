// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/SchemaValue.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace toolbridge
{

/// @brief A tool as reported by the server's tools/list response.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    std::optional<SchemaValue> rawSchema;
};

/// @brief One accepted argument of a tool.
struct ParameterInfo
{
    std::string name;
    bool isRequired = false;
    std::string type = "string";
    std::optional<std::string> description;
    std::optional<std::string> example;

    auto operator==(const ParameterInfo& other) const -> bool = default;
};

/// @brief Where a piece of parameter information came from, weakest first.
enum class ParameterSource : std::uint8_t
{
    None,
    Heuristic,
    HelpText,
    Schema,
};

[[nodiscard]] constexpr auto parameterSourceName(ParameterSource source) -> std::string_view
{
    switch (source)
    {
        case ParameterSource::None: return "none";
        case ParameterSource::Heuristic: return "heuristic";
        case ParameterSource::HelpText: return "help-text";
        case ParameterSource::Schema: return "schema";
    }
    return "unknown";
}

/// @brief Sub-actions exposed by an umbrella server tool.
struct SubToolRegistration
{
    std::string serverToolName;
    std::vector<std::string> actions;
    std::map<std::string, std::string> actionDescriptions;
};

struct TextContent
{
    std::string text;
};

struct ImageContent
{
    std::string data;
    std::string mimeType;
};

struct AudioContent
{
    std::string data;
    std::string mimeType;
};

struct ResourceContent
{
    std::string uri;
    std::string mimeType;
    std::optional<std::string> text;
};

/// @brief A content item whose type this client does not understand. The raw item is kept.
struct UnknownContent
{
    std::string type;
    nlohmann::json raw;
};

using ContentItem = std::variant<TextContent, ImageContent, AudioContent, ResourceContent, UnknownContent>;

/// @brief Decoded result of a tools/call request.
struct ToolCallResult
{
    /// @brief The first text item, or empty if the result carries no text.
    std::string text;
    std::vector<ContentItem> content;
    bool isError = false;
};

} // namespace toolbridge
