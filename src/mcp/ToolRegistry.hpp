// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace toolbridge
{

/// @brief Parameter name to type, in schema order.
using SchemaMap = std::vector<std::pair<std::string, std::string>>;

/// @brief Best-known parameter information for one tool.
struct RegistryEntry
{
    /// @brief Strength of the data below; ParameterSource::None means "no info yet".
    ParameterSource source = ParameterSource::None;
    bool parameterless = false;
    std::vector<ParameterInfo> parameters;
    SchemaMap schema;
    std::map<std::string, std::string> descriptions;
    std::map<std::string, std::string> examples;
};

/// @brief Which precedence tier produced a resolved argument name.
enum class ResolutionTier : std::uint8_t
{
    ParameterInfo,
    SchemaMap,
    ServerAction,
    Default,
};

struct ArgumentResolution
{
    std::string name;
    ResolutionTier tier = ResolutionTier::Default;
    ParameterSource source = ParameterSource::None;

    /// @brief The umbrella tool, for ResolutionTier::ServerAction.
    std::string server;
};

/// @brief Per-session table of discovered tools and their parameters.
///
/// Updates are single-key upserts. Information from a weaker source never overwrites a
/// stronger one (schema > help-text > heuristic); a stronger source replaces everything known
/// about the tool. Entries disappear only on reset(). All members are safe to call concurrently.
class ToolRegistry
{
  public:
    /// @brief Records a discovered tool. Re-registering a name replaces its descriptor.
    void registerTool(const ToolDescriptor& tool);

    /// @brief Records a tool's parameter table.
    /// @return False if the update was ignored (weaker source or empty list).
    auto registerParameters(std::string_view tool, std::vector<ParameterInfo> parameters,
                            ParameterSource source = ParameterSource::Schema) -> bool;

    /// @brief Records a tool's name-to-type map. An empty map marks the tool parameterless.
    /// @return False if the update was ignored.
    auto registerSchema(std::string_view tool, SchemaMap schema, ParameterSource source = ParameterSource::Schema)
        -> bool;

    /// @brief Marks a tool as explicitly taking no arguments.
    /// @return False if the update was ignored.
    auto markParameterless(std::string_view tool, ParameterSource source) -> bool;

    /// @brief Adds sub-actions to an umbrella tool, merging with earlier registrations.
    void registerSubTools(const SubToolRegistration& registration);

    /// @brief Resolves the argument name to use when calling @p tool.
    ///
    /// Precedence: the tool's registered parameters, its schema map, the umbrella tool's
    /// name when @p tool is a sub-action, and finally "text".
    [[nodiscard]] auto resolve(std::string_view tool) const -> ArgumentResolution;

    [[nodiscard]] auto resolveArgumentName(std::string_view tool) const -> std::string;

    /// @brief Describes the tier used by resolveArgumentName(), for diagnostics only.
    [[nodiscard]] auto resolveProvenance(std::string_view tool) const -> std::string;

    [[nodiscard]] auto hasTool(std::string_view tool) const -> bool;
    [[nodiscard]] auto findTool(std::string_view tool) const -> std::optional<ToolDescriptor>;

    /// @brief Registered tools in discovery order.
    [[nodiscard]] auto tools() const -> std::vector<ToolDescriptor>;

    /// @brief Names of the registered tools in discovery order.
    [[nodiscard]] auto knownTools() const -> std::vector<std::string>;

    [[nodiscard]] auto snapshot(std::string_view tool) const -> std::optional<RegistryEntry>;
    [[nodiscard]] auto parameters(std::string_view tool) const -> std::vector<ParameterInfo>;
    [[nodiscard]] auto isParameterless(std::string_view tool) const -> bool;
    [[nodiscard]] auto source(std::string_view tool) const -> ParameterSource;

    [[nodiscard]] auto subTools(std::string_view server) const -> std::optional<SubToolRegistration>;

    /// @brief Returns the umbrella tool that lists @p action as a sub-action.
    [[nodiscard]] auto serverForAction(std::string_view action) const -> std::optional<std::string>;

    [[nodiscard]] auto parameterDescription(std::string_view tool, std::string_view parameter) const
        -> std::optional<std::string>;
    [[nodiscard]] auto parameterExample(std::string_view tool, std::string_view parameter) const
        -> std::optional<std::string>;

    /// @brief Forgets everything. Used when a new connection starts.
    void reset();

  private:
    auto entryFor(std::string_view tool) -> RegistryEntry&;
    [[nodiscard]] auto findEntry(std::string_view tool) const -> const RegistryEntry*;
    [[nodiscard]] auto serverForActionLocked(std::string_view action) const -> std::optional<std::string>;

    mutable std::mutex _mutex;
    std::map<std::string, RegistryEntry, std::less<>> _entries;
    std::vector<ToolDescriptor> _tools;
    std::map<std::string, SubToolRegistration, std::less<>> _subTools;
};

[[nodiscard]] auto resolutionTierName(ResolutionTier tier) -> std::string_view;

} // namespace toolbridge
