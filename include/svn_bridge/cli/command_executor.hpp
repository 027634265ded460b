#pragma once

#include <svn_bridge/cli/command_router.hpp>
#include <svn_bridge/core/result.hpp>
#include <svn_bridge/svn/i_command_runner.hpp>

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace svn_bridge {

// Creates the runner a command handler talks to. Production code passes
// MakeProcessRunner; tests hand out a MockCommandRunner.
using RunnerFactory =
    std::function<std::unique_ptr<ICommandRunner>(const AppConfig& config)>;

// ProcessRunner for config.svn_binary with the configured timeout.
std::unique_ptr<ICommandRunner> MakeProcessRunner(const AppConfig& config);

// Register status, log, info, list, update, commit, add, delete, revert,
// cleanup, lock and unlock. Results go to out, errors to err.
void RegisterAllCommands(CommandRouter& router, RunnerFactory factory,
                         std::ostream& out, std::ostream& err);

// Print top-level help (commands, global flags, examples).
void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color);

// "S:E", "S:HEAD" or "S" → log range. HEAD as the end means open-ended.
Result<std::pair<std::optional<int64_t>, std::optional<int64_t>>, Error>
ParseLogRange(const std::string& text);

} // namespace svn_bridge
