// SPDX-License-Identifier: Apache-2.0
#include "ToolRegistry.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace toolbridge
{

namespace
{
    constexpr auto DefaultArgumentName = std::string_view { "text" };

    /// Applies the provenance rule. Returns false if @p source may not touch @p entry.
    auto acceptUpdate(RegistryEntry& entry, ParameterSource source) -> bool
    {
        if (source == ParameterSource::None || source < entry.source)
            return false;

        if (source > entry.source)
        {
            entry.parameters.clear();
            entry.schema.clear();
            entry.descriptions.clear();
            entry.examples.clear();
            entry.parameterless = false;
            entry.source = source;
        }
        return true;
    }

    /// Tiers 1 and 2 for a single entry.
    auto resolveOwn(const RegistryEntry& entry) -> std::optional<ArgumentResolution>
    {
        if (!entry.parameters.empty())
        {
            return ArgumentResolution {
                .name = entry.parameters.front().name,
                .tier = ResolutionTier::ParameterInfo,
                .source = entry.source,
            };
        }
        if (!entry.schema.empty())
        {
            return ArgumentResolution {
                .name = entry.schema.front().first,
                .tier = ResolutionTier::SchemaMap,
                .source = entry.source,
            };
        }
        return std::nullopt;
    }
} // namespace

auto resolutionTierName(ResolutionTier tier) -> std::string_view
{
    switch (tier)
    {
        case ResolutionTier::ParameterInfo: return "registered parameter info";
        case ResolutionTier::SchemaMap: return "schema";
        case ResolutionTier::ServerAction: return "server action parameter";
        case ResolutionTier::Default: return "default";
    }
    return "unknown";
}

void ToolRegistry::registerTool(const ToolDescriptor& tool)
{
    auto const lock = std::lock_guard(_mutex);

    auto const it = std::ranges::find(_tools, tool.name, &ToolDescriptor::name);
    if (it != _tools.end())
        *it = tool;
    else
        _tools.push_back(tool);

    entryFor(tool.name);
}

auto ToolRegistry::registerParameters(std::string_view tool, std::vector<ParameterInfo> parameters,
                                      ParameterSource source) -> bool
{
    if (parameters.empty())
        return false;

    auto const lock = std::lock_guard(_mutex);
    auto& entry = entryFor(tool);
    if (!acceptUpdate(entry, source))
    {
        log::debug("Ignoring {} parameters for '{}', already known from {}", parameterSourceName(source), tool,
                   parameterSourceName(entry.source));
        return false;
    }

    for (const auto& param: parameters)
    {
        if (param.description)
            entry.descriptions[param.name] = *param.description;
        if (param.example)
            entry.examples[param.name] = *param.example;
    }

    entry.parameters = std::move(parameters);
    entry.parameterless = false;
    log::debug("Registered parameters for '{}' from {}: first is '{}'", tool, parameterSourceName(source),
               entry.parameters.front().name);
    return true;
}

auto ToolRegistry::registerSchema(std::string_view tool, SchemaMap schema, ParameterSource source) -> bool
{
    auto const lock = std::lock_guard(_mutex);
    auto& entry = entryFor(tool);
    if (!acceptUpdate(entry, source))
        return false;

    entry.schema = std::move(schema);
    entry.parameterless = entry.schema.empty() && entry.parameters.empty();
    return true;
}

auto ToolRegistry::markParameterless(std::string_view tool, ParameterSource source) -> bool
{
    auto const lock = std::lock_guard(_mutex);
    auto& entry = entryFor(tool);
    if (!acceptUpdate(entry, source))
        return false;

    entry.parameters.clear();
    entry.schema.clear();
    entry.parameterless = true;
    log::debug("Registered '{}' as parameterless ({})", tool, parameterSourceName(source));
    return true;
}

void ToolRegistry::registerSubTools(const SubToolRegistration& registration)
{
    auto const lock = std::lock_guard(_mutex);

    auto& existing = _subTools[registration.serverToolName];
    existing.serverToolName = registration.serverToolName;

    for (const auto& action: registration.actions)
    {
        if (std::ranges::find(existing.actions, action) == existing.actions.end())
            existing.actions.push_back(action);
    }
    for (const auto& [action, description]: registration.actionDescriptions)
        existing.actionDescriptions[action] = description;
}

auto ToolRegistry::resolve(std::string_view tool) const -> ArgumentResolution
{
    auto const lock = std::lock_guard(_mutex);

    if (auto const* entry = findEntry(tool))
    {
        if (auto own = resolveOwn(*entry))
            return *own;
    }

    if (auto const server = serverForActionLocked(tool))
    {
        auto resolution = ArgumentResolution {
            .name = std::string(DefaultArgumentName),
            .tier = ResolutionTier::ServerAction,
            .source = ParameterSource::None,
            .server = *server,
        };
        if (auto const* serverEntry = findEntry(*server))
        {
            if (auto own = resolveOwn(*serverEntry))
            {
                resolution.name = std::move(own->name);
                resolution.source = own->source;
            }
        }
        return resolution;
    }

    return ArgumentResolution { .name = std::string(DefaultArgumentName) };
}

auto ToolRegistry::resolveArgumentName(std::string_view tool) const -> std::string
{
    return resolve(tool).name;
}

auto ToolRegistry::resolveProvenance(std::string_view tool) const -> std::string
{
    auto const resolution = resolve(tool);
    switch (resolution.tier)
    {
        case ResolutionTier::ParameterInfo:
        case ResolutionTier::SchemaMap:
            return std::format("(from {}, {})", resolutionTierName(resolution.tier),
                               parameterSourceName(resolution.source));
        case ResolutionTier::ServerAction:
            return std::format("(from {} of '{}')", resolutionTierName(resolution.tier), resolution.server);
        case ResolutionTier::Default: break;
    }
    return "(default)";
}

auto ToolRegistry::hasTool(std::string_view tool) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    return std::ranges::find(_tools, tool, &ToolDescriptor::name) != _tools.end();
}

auto ToolRegistry::findTool(std::string_view tool) const -> std::optional<ToolDescriptor>
{
    auto const lock = std::lock_guard(_mutex);
    auto const it = std::ranges::find(_tools, tool, &ToolDescriptor::name);
    if (it == _tools.end())
        return std::nullopt;
    return *it;
}

auto ToolRegistry::tools() const -> std::vector<ToolDescriptor>
{
    auto const lock = std::lock_guard(_mutex);
    return _tools;
}

auto ToolRegistry::knownTools() const -> std::vector<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    auto names = std::vector<std::string> {};
    names.reserve(_tools.size());
    for (const auto& tool: _tools)
        names.push_back(tool.name);
    return names;
}

auto ToolRegistry::snapshot(std::string_view tool) const -> std::optional<RegistryEntry>
{
    auto const lock = std::lock_guard(_mutex);
    if (auto const* entry = findEntry(tool))
        return *entry;
    return std::nullopt;
}

auto ToolRegistry::parameters(std::string_view tool) const -> std::vector<ParameterInfo>
{
    auto const lock = std::lock_guard(_mutex);
    if (auto const* entry = findEntry(tool))
        return entry->parameters;
    return {};
}

auto ToolRegistry::isParameterless(std::string_view tool) const -> bool
{
    auto const lock = std::lock_guard(_mutex);
    auto const* entry = findEntry(tool);
    return entry && entry->parameterless;
}

auto ToolRegistry::source(std::string_view tool) const -> ParameterSource
{
    auto const lock = std::lock_guard(_mutex);
    auto const* entry = findEntry(tool);
    return entry ? entry->source : ParameterSource::None;
}

auto ToolRegistry::subTools(std::string_view server) const -> std::optional<SubToolRegistration>
{
    auto const lock = std::lock_guard(_mutex);
    auto const it = _subTools.find(server);
    if (it == _subTools.end())
        return std::nullopt;
    return it->second;
}

auto ToolRegistry::serverForAction(std::string_view action) const -> std::optional<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    return serverForActionLocked(action);
}

auto ToolRegistry::parameterDescription(std::string_view tool, std::string_view parameter) const
    -> std::optional<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    auto const* entry = findEntry(tool);
    if (!entry)
        return std::nullopt;
    auto const it = entry->descriptions.find(std::string(parameter));
    if (it == entry->descriptions.end())
        return std::nullopt;
    return it->second;
}

auto ToolRegistry::parameterExample(std::string_view tool, std::string_view parameter) const
    -> std::optional<std::string>
{
    auto const lock = std::lock_guard(_mutex);
    auto const* entry = findEntry(tool);
    if (!entry)
        return std::nullopt;
    auto const it = entry->examples.find(std::string(parameter));
    if (it == entry->examples.end())
        return std::nullopt;
    return it->second;
}

void ToolRegistry::reset()
{
    auto const lock = std::lock_guard(_mutex);
    _entries.clear();
    _tools.clear();
    _subTools.clear();
}

auto ToolRegistry::entryFor(std::string_view tool) -> RegistryEntry&
{
    auto it = _entries.find(tool);
    if (it == _entries.end())
        it = _entries.emplace(std::string(tool), RegistryEntry {}).first;
    return it->second;
}

auto ToolRegistry::findEntry(std::string_view tool) const -> const RegistryEntry*
{
    auto const it = _entries.find(tool);
    return it == _entries.end() ? nullptr : &it->second;
}

auto ToolRegistry::serverForActionLocked(std::string_view action) const -> std::optional<std::string>
{
    for (const auto& [server, registration]: _subTools)
    {
        if (server != action && std::ranges::find(registration.actions, action) != registration.actions.end())
            return server;
    }
    return std::nullopt;
}

} // namespace toolbridge
