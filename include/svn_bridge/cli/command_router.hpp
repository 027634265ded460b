#pragma once

#include <svn_bridge/config/app_config.hpp>

#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace svn_bridge {

// ---------------------------------------------------------------------------
// CommandHandler — implementation of one svn-bridge command.
// Receives the merged, validated configuration; returns the process exit
// code (0 on success, Error::ExitCode() on failure).
// ---------------------------------------------------------------------------
using CommandHandler = std::function<int(const AppConfig& config)>;

// ---------------------------------------------------------------------------
// CommandHelp — detailed help metadata for a single command.
// ---------------------------------------------------------------------------
struct CommandHelp {
    std::string usage;                  // e.g. "svn-bridge log <path> [-l N] [-r S:E]"
    std::string long_description;
    std::vector<std::string> examples;
};

struct CommandInfo {
    std::string name;
    std::string description;
    CommandHandler handler;
    std::optional<CommandHelp> help;
};

// ---------------------------------------------------------------------------
// CommandRouter — name → handler table for `svn-bridge <command> ...`.
//
// Usage:
//   CommandRouter router;
//   router.Register("status", "Working-copy status", handler);
//   return router.Dispatch("status", config, std::cerr);
// ---------------------------------------------------------------------------
class CommandRouter {
public:
    CommandRouter() = default;

    void Register(const std::string& name,
                  const std::string& description,
                  CommandHandler handler);

    void Register(const std::string& name,
                  const std::string& description,
                  CommandHandler handler,
                  CommandHelp help);

    [[nodiscard]] bool Has(const std::string& name) const;

    // Registered commands, sorted by name.
    [[nodiscard]] std::vector<CommandInfo> Commands() const;

    // Run the named handler. Unknown names print an error plus the command
    // list to err and return 1.
    int Dispatch(const std::string& name, const AppConfig& config,
                 std::ostream& err) const;

    void PrintHelp(std::ostream& out) const;

    // Usage, description and examples of one command. Returns false for
    // unknown names.
    bool PrintCommandHelp(const std::string& name, std::ostream& out) const;

private:
    std::map<std::string, CommandInfo> commands_;
};

} // namespace svn_bridge
