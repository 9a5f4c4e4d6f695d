// SPDX-License-Identifier: Apache-2.0
#include "HelpTextInterpreter.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <ranges>
#include <regex>
#include <span>

namespace toolbridge
{

namespace
{
    constexpr auto GenericParameterName = std::string_view { "input" };

    constexpr auto NoParameterTools = std::array<std::string_view, 13> {
        "list",         "help",          "xcf_help",  "show_help",   "tools",
        "show_env",     "show_folder",   "show_current_project",     "list_projects",
        "use_xcf",      "grant_permission", "run_project", "build_project",
    };

    auto trim(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t\r\n");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t\r\n");
        return text.substr(first, last - first + 1);
    }

    /// Returns the text after a bullet marker, or std::nullopt if the line is not a bullet.
    /// The marker must be followed by whitespace, so "**Usage**:" is not a bullet.
    auto stripBullet(std::string_view line) -> std::optional<std::string_view>
    {
        for (auto const marker: { std::string_view { "-" }, std::string_view { "*" }, std::string_view { "•" } })
        {
            if (!line.starts_with(marker) || line.size() == marker.size())
                continue;
            if (auto const next = line[marker.size()]; next == ' ' || next == '\t')
                return trim(line.substr(marker.size()));
        }
        return std::nullopt;
    }

    auto isIdentifier(std::string_view name) -> bool
    {
        auto const isWordChar = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; };
        return !name.empty() && isWordChar(name.front()) && std::ranges::all_of(name, [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
        });
    }

    auto firstMatch(std::string_view text, std::span<const std::regex> patterns) -> std::optional<std::string>
    {
        auto const subject = std::string(text);
        for (const auto& pattern: patterns)
        {
            auto match = std::smatch {};
            if (std::regex_search(subject, match, pattern))
                return match[1].str();
        }
        return std::nullopt;
    }

    void appendDescription(std::string& description, std::string_view more)
    {
        if (!description.empty())
            description += ' ';
        description += more;
    }
} // namespace

auto HelpTextInterpreter::interpret(std::string_view text, std::string_view serverToolName) const
    -> HelpTextInterpretation
{
    auto result = HelpTextInterpretation {};
    result.entries = parseEntries(text);
    result.registration.serverToolName = std::string(serverToolName);

    for (const auto& entry: result.entries)
    {
        if (std::ranges::find(result.registration.actions, entry.name) != result.registration.actions.end())
            continue;
        result.registration.actions.push_back(entry.name);
        result.registration.actionDescriptions[entry.name] = entry.description;
    }

    if (result.registration.actions.empty())
        return result;

    auto const description = std::format("Action for {} commands", serverToolName);
    if (auto name = inferParameterName(text))
    {
        result.umbrellaParameter =
            ParameterInfo { .name = std::move(*name), .isRequired = true, .type = "string", .description = description };
    }
    else
    {
        log::warning("Could not infer the argument name of '{}' from its help text, using '{}'", serverToolName,
                     GenericParameterName);
        result.umbrellaParameter = ParameterInfo {
            .name = std::string(GenericParameterName), .isRequired = true, .type = "string", .description = description
        };
        result.lowConfidence = true;
    }

    return result;
}

auto HelpTextInterpreter::parseEntries(std::string_view text) -> std::vector<HelpEntry>
{
    static const auto parameterLine = std::regex(R"(^(\w+)\s+\((\w+)\)\s*(?::\s*(.*))?$)");

    auto entries = std::vector<HelpEntry> {};

    for (auto const rawLine: std::views::split(text, '\n'))
    {
        auto const line = trim(std::string_view(rawLine.begin(), rawLine.end()));
        if (line.empty())
            continue;

        if (auto const bullet = stripBullet(line))
        {
            auto const colon = bullet->find(':');
            auto name = trim(bullet->substr(0, colon));
            auto description = colon == std::string_view::npos ? std::string_view {} : trim(bullet->substr(colon + 1));

            // "- build builds the project": the first word is the name.
            if (colon == std::string_view::npos)
            {
                auto const space = name.find_first_of(" \t");
                if (space != std::string_view::npos)
                {
                    description = trim(name.substr(space));
                    name = name.substr(0, space);
                }
            }

            auto const isDecoration = [](char c) { return c == '`' || c == '\'' || c == '"' || c == '*'; };
            while (!name.empty() && isDecoration(name.front()))
                name.remove_prefix(1);
            while (!name.empty() && isDecoration(name.back()))
                name.remove_suffix(1);

            if (!isIdentifier(name))
                continue;

            entries.push_back(HelpEntry { .name = std::string(name), .description = std::string(description) });
            continue;
        }

        if (entries.empty())
            continue;

        auto& current = entries.back();
        auto const subject = std::string(line);
        auto match = std::smatch {};
        if (std::regex_match(subject, match, parameterLine))
        {
            auto param = ParameterInfo {
                .name = match[1].str(),
                .isRequired = match[3].matched && match[3].str().find("required") != std::string::npos,
                .type = match[2].str(),
            };
            if (match[3].matched && match[3].length() > 0)
                param.description = match[3].str();
            current.parameters.push_back(std::move(param));
            continue;
        }

        appendDescription(current.description, line);
    }

    return entries;
}

auto HelpTextInterpreter::inferParameterName(std::string_view text) -> std::optional<std::string>
{
    static const auto patterns = std::array<std::regex, 3> {
        std::regex(R"(using\s+(?:parameter|param|argument|arg)\s+["']?(\w+)["']?)", std::regex::icase),
        std::regex(R"(with\s+(?:parameter|param|argument|arg)\s+["']?(\w+)["']?)", std::regex::icase),
        std::regex(R"((?:parameter|param|argument|arg)(?:\s+name)?\s+is\s+["']?(\w+)["']?)", std::regex::icase),
    };
    return firstMatch(text, patterns);
}

auto HelpTextInterpreter::inferToolParameter(std::string_view description) -> std::optional<std::string>
{
    static const auto patterns = std::array<std::regex, 2> {
        std::regex(R"(takes\s+(?:a|an)\s+["']?(\w+)["']?\s+(?:parameter|param|argument|arg))", std::regex::icase),
        std::regex(R"(using\s+(?:(?:the|a|an)\s+)?["']?(\w+)["']?\s+(?:parameter|param|argument|arg))",
                   std::regex::icase),
    };

    if (auto name = firstMatch(description, patterns))
        return name;
    return inferParameterName(description);
}

auto HelpTextInterpreter::isKnownParameterless(std::string_view toolName) -> bool
{
    return std::ranges::any_of(NoParameterTools, [toolName](std::string_view known) {
        auto const suffix = std::format("_{}", known);
        return toolName == known || toolName.ends_with(suffix)
               || (toolName.starts_with("mcp_") && toolName.find(suffix) != std::string_view::npos);
    });
}

} // namespace toolbridge
