#pragma once

#include <svn_bridge/svn/execution_context.hpp>

#include <optional>
#include <string>
#include <vector>

namespace svn_bridge {

// Operands of one svn-bridge invocation.
struct CommandOptions {
    std::vector<std::string> targets;      // paths or URLs
    int limit = 100;                       // log
    std::optional<std::string> revision;   // log range "S:E", list/update -r
    std::optional<std::string> depth;      // list
    std::optional<std::string> message;    // commit, lock
    bool force = false;                    // unlock
};

struct AppConfig {
    std::string svn_binary = "svn";
    ExecutionContext execution;
    std::optional<std::string> password_env;        // repository password
    std::optional<std::string> proxy_password_env;  // proxy password
    CommandOptions command;

    std::optional<std::string> config_file;  // -c/--config
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    int color = -1;  // 1 = always, 0 = never, -1 = auto (TTY / NO_COLOR)
};

} // namespace svn_bridge
