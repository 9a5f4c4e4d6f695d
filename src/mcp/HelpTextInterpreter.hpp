// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace toolbridge
{

/// @brief One bullet of help/list output.
struct HelpEntry
{
    std::string name;
    std::string description;

    /// @brief Declared by continuation lines of the form `name (type): description`.
    std::vector<ParameterInfo> parameters;
};

/// @brief What could be recovered from a help/list text.
struct HelpTextInterpretation
{
    SubToolRegistration registration;
    std::vector<HelpEntry> entries;

    /// @brief The umbrella tool's argument, if the text has any entries.
    std::optional<ParameterInfo> umbrellaParameter;

    /// @brief True when umbrellaParameter is the generic fallback rather than read from the text.
    bool lowConfidence = false;
};

/// @brief Recovers sub-actions and argument names from human-readable help output.
///
/// Lines starting with a bullet ("-", "*" or "•") open an entry; "name: description" splits at
/// the first colon. Following lines extend the description unless they declare a parameter.
class HelpTextInterpreter
{
  public:
    /// @brief Interprets a help/list tool's output for the given umbrella tool.
    [[nodiscard]] auto interpret(std::string_view text, std::string_view serverToolName) const
        -> HelpTextInterpretation;

    [[nodiscard]] static auto parseEntries(std::string_view text) -> std::vector<HelpEntry>;

    /// @brief Finds the umbrella argument name in phrases like "using parameter 'x'",
    ///        "with argument x" or "parameter name is x". Patterns are tried in that order.
    [[nodiscard]] static auto inferParameterName(std::string_view text) -> std::optional<std::string>;

    /// @brief Finds a tool's argument in its description, e.g. "takes a 'path' parameter".
    [[nodiscard]] static auto inferToolParameter(std::string_view description) -> std::optional<std::string>;

    /// @brief True for tool names that are known to take no arguments (list, help, show_env, ...).
    [[nodiscard]] static auto isKnownParameterless(std::string_view toolName) -> bool;
};

} // namespace toolbridge
