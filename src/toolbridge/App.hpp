// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <toolbridge/Config.hpp>

#include <memory>
#include <string_view>

namespace toolbridge
{

/// @brief Command-line host: connects one configured server and drives it from stdin or flags.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Starts the selected server and waits for discovery to finish.
    /// @param serverName Configured server name, or empty for the default.
    /// @return Success or an error.
    [[nodiscard]] auto initialize(std::string_view serverName) -> VoidResult;

    /// @brief Prints the discovered tools and their resolved arguments.
    /// @return Exit code.
    [[nodiscard]] auto listTools() -> int;

    /// @brief Calls one tool and prints its result.
    /// @param tool Tool or sub-action name.
    /// @param input Free-form input, used when @p argumentsJson is empty.
    /// @param argumentsJson Explicit JSON argument object.
    /// @return Exit code.
    [[nodiscard]] auto callOnce(std::string_view tool, std::string_view input, std::string_view argumentsJson)
        -> int;

    /// @brief Runs the interactive loop until /quit or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace toolbridge
