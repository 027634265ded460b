#include <svn_bridge/cli/command_executor.hpp>
#include <svn_bridge/cli/output_formatter.hpp>
#include <svn_bridge/core/ansi.hpp>
#include <svn_bridge/core/convert.hpp>
#include <svn_bridge/core/terminal.hpp>

#include <svn_bridge/svn/execution_context.hpp>
#include <svn_bridge/svn/process_runner.hpp>
#include <svn_bridge/svn/svn_client.hpp>

#include <nlohmann/json.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace svn_bridge {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

Error MakeValidationError(const std::string& command, const std::string& message) {
    return Error::Make(command, message, ErrorCategory::Config);
}

OutputFormatter MakeFormatter(const AppConfig& config, std::ostream& out,
                              std::ostream& err) {
    return OutputFormatter(config.json_output,
                           ResolveColor(config.color, IsStdoutTty()), out, err);
}

int Fail(const OutputFormatter& fmt, const Error& error) {
    fmt.PrintError(error);
    return error.ExitCode();
}

// The single target of a command, or fallback when none was given.
Result<std::string, Error> OneTarget(const AppConfig& config, const std::string& command,
                                     const std::optional<std::string>& fallback) {
    const auto& targets = config.command.targets;
    if (targets.size() > 1) {
        return Result<std::string, Error>::Err(MakeValidationError(
            command, "'" + command + "' takes one target, got " +
                         std::to_string(targets.size())));
    }
    if (targets.empty()) {
        if (!fallback) {
            return Result<std::string, Error>::Err(MakeValidationError(
                command, "Missing target. Usage: svn-bridge " + command + " <path>"));
        }
        return Result<std::string, Error>::Ok(*fallback);
    }
    return Result<std::string, Error>::Ok(targets.front());
}

std::string OptionalNumber(const std::optional<int64_t>& value) {
    return value ? std::to_string(*value) : "";
}

std::string FirstLine(const std::string& text) {
    auto end = text.find('\n');
    return end == std::string::npos ? text : text.substr(0, end);
}

// ---------------------------------------------------------------------------
// JSON views of the typed results
// ---------------------------------------------------------------------------

nlohmann::json StatusEntryJson(const StatusEntry& entry) {
    nlohmann::json j;
    j["path"] = entry.path;
    j["status"] = std::string(StatusName(entry.status));
    j["is_directory"] = entry.is_directory;
    if (entry.revision) j["revision"] = *entry.revision;
    if (entry.author) j["author"] = *entry.author;
    if (entry.date) j["date"] = *entry.date;
    if (entry.props_status) {
        j["props_status"] = std::string(StatusName(*entry.props_status));
    }
    if (entry.lock) {
        j["lock"] = {{"owner", entry.lock->owner},
                     {"comment", entry.lock->comment},
                     {"date", entry.lock->date}};
    }
    if (entry.changelist) j["changelist"] = *entry.changelist;
    return j;
}

nlohmann::json LogEntryJson(const LogEntry& entry) {
    nlohmann::json paths = nlohmann::json::array();
    for (const auto& p : entry.paths) {
        nlohmann::json pj;
        pj["action"] = std::string(1, PathActionSymbol(p.action));
        pj["path"] = p.path;
        if (p.copy_from_path) pj["copy_from_path"] = *p.copy_from_path;
        if (p.copy_from_revision) pj["copy_from_revision"] = *p.copy_from_revision;
        paths.push_back(std::move(pj));
    }
    return {{"revision", entry.revision},
            {"author", entry.author},
            {"date", entry.date},
            {"message", entry.message},
            {"paths", paths}};
}

// ---------------------------------------------------------------------------
// status
// ---------------------------------------------------------------------------
int HandleStatus(const AppConfig& config, ICommandRunner& runner,
                 const OutputFormatter& fmt) {
    auto target = OneTarget(config, "status", std::string("."));
    if (target.IsErr()) return Fail(fmt, target.Error());

    SvnClient client(runner, config.execution);
    auto result = client.Status(target.Value());
    if (result.IsErr()) return Fail(fmt, result.Error());
    const auto& status = result.Value();

    if (fmt.IsJsonMode()) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : status.entries) {
            entries.push_back(StatusEntryJson(entry));
        }
        nlohmann::json j;
        j["path"] = status.path;
        j["revision"] = status.revision;
        j["entries"] = entries;
        fmt.PrintJson(j.dump());
        return 0;
    }

    std::vector<std::string> headers = {"St", "Pr", "Rev", "Author", "Path"};
    std::vector<std::vector<std::string>> rows;
    for (const auto& entry : status.entries) {
        rows.push_back({std::string(1, StatusSymbol(entry.status)),
                        entry.props_status ? std::string(1, StatusSymbol(*entry.props_status))
                                           : "",
                        OptionalNumber(entry.revision),
                        entry.author.value_or(""),
                        entry.path});
    }
    fmt.PrintTable(headers, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// log
// ---------------------------------------------------------------------------
int HandleLog(const AppConfig& config, ICommandRunner& runner,
              const OutputFormatter& fmt) {
    auto target = OneTarget(config, "log", std::string("."));
    if (target.IsErr()) return Fail(fmt, target.Error());

    LogOptions options;
    options.limit = config.command.limit;
    if (config.command.revision) {
        auto range = ParseLogRange(*config.command.revision);
        if (range.IsErr()) return Fail(fmt, range.Error());
        options.start_revision = range.Value().first;
        options.end_revision = range.Value().second;
    }

    SvnClient client(runner, config.execution);
    auto result = client.Log(target.Value(), options);
    if (result.IsErr()) return Fail(fmt, result.Error());
    const auto& log = result.Value();

    if (fmt.IsJsonMode()) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : log.entries) {
            entries.push_back(LogEntryJson(entry));
        }
        nlohmann::json j;
        j["start_revision"] = log.start_revision;
        j["end_revision"] = log.end_revision;
        j["entries"] = entries;
        fmt.PrintJson(j.dump());
        return 0;
    }

    std::vector<std::string> headers = {"Rev", "Author", "Date", "Message"};
    std::vector<std::vector<std::string>> rows;
    for (const auto& entry : log.entries) {
        rows.push_back({std::to_string(entry.revision), entry.author, entry.date,
                        FirstLine(entry.message)});
    }
    fmt.PrintTable(headers, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// info
// ---------------------------------------------------------------------------
int HandleInfo(const AppConfig& config, ICommandRunner& runner,
               const OutputFormatter& fmt) {
    auto target = OneTarget(config, "info", std::string("."));
    if (target.IsErr()) return Fail(fmt, target.Error());

    SvnClient client(runner, config.execution);
    auto result = client.Info(target.Value());
    if (result.IsErr()) return Fail(fmt, result.Error());
    const auto& info = result.Value();

    if (fmt.IsJsonMode()) {
        nlohmann::json j;
        j["path"] = info.path;
        j["url"] = info.url;
        j["repository_root"] = info.repository_root;
        j["repository_uuid"] = info.repository_uuid;
        j["revision"] = info.revision;
        j["node_kind"] = std::string(NodeKindName(info.node_kind));
        j["last_changed_author"] = info.last_changed_author;
        j["last_changed_revision"] = info.last_changed_revision;
        j["last_changed_date"] = info.last_changed_date;
        if (info.working_copy_root) j["working_copy_root"] = *info.working_copy_root;
        fmt.PrintJson(j.dump());
        return 0;
    }

    std::vector<std::pair<std::string, std::string>> fields = {
        {"URL", info.url},
        {"Repository Root", info.repository_root},
        {"Repository UUID", info.repository_uuid},
        {"Revision", std::to_string(info.revision)},
        {"Node Kind", std::string(NodeKindName(info.node_kind))},
        {"Last Changed Author", info.last_changed_author},
        {"Last Changed Rev", std::to_string(info.last_changed_revision)},
        {"Last Changed Date", info.last_changed_date},
    };
    if (info.working_copy_root) {
        fields.emplace_back("Working Copy Root", *info.working_copy_root);
    }
    fmt.PrintDetail(info.path, fields);
    return 0;
}

// ---------------------------------------------------------------------------
// list
// ---------------------------------------------------------------------------
int HandleList(const AppConfig& config, ICommandRunner& runner,
               const OutputFormatter& fmt) {
    auto target = OneTarget(config, "list", std::string("."));
    if (target.IsErr()) return Fail(fmt, target.Error());

    ListOptions options;
    options.revision = config.command.revision;
    options.depth = config.command.depth;

    SvnClient client(runner, config.execution);
    auto result = client.List(target.Value(), options);
    if (result.IsErr()) return Fail(fmt, result.Error());
    const auto& list = result.Value();

    if (fmt.IsJsonMode()) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : list.entries) {
            nlohmann::json e;
            e["name"] = entry.name;
            e["path"] = entry.path;
            e["kind"] = std::string(NodeKindName(entry.kind));
            if (entry.size) e["size"] = *entry.size;
            e["revision"] = entry.revision;
            e["author"] = entry.author;
            e["date"] = entry.date;
            entries.push_back(std::move(e));
        }
        nlohmann::json j;
        j["path"] = list.path;
        j["entries"] = entries;
        fmt.PrintJson(j.dump());
        return 0;
    }

    std::vector<std::string> headers = {"Rev", "Author", "Size", "Name"};
    std::vector<std::vector<std::string>> rows;
    for (const auto& entry : list.entries) {
        auto name = entry.kind == NodeKind::Dir ? entry.name + "/" : entry.name;
        rows.push_back({std::to_string(entry.revision), entry.author,
                        OptionalNumber(entry.size), name});
    }
    fmt.PrintTable(headers, rows);
    return 0;
}

// ---------------------------------------------------------------------------
// update / commit
// ---------------------------------------------------------------------------
int HandleUpdate(const AppConfig& config, ICommandRunner& runner,
                 const OutputFormatter& fmt) {
    auto target = OneTarget(config, "update", std::string("."));
    if (target.IsErr()) return Fail(fmt, target.Error());

    std::optional<int64_t> revision;
    if (config.command.revision && *config.command.revision != "HEAD") {
        revision = convert::ParseInt(*config.command.revision);
        if (!revision || *revision < 0) {
            return Fail(fmt, MakeValidationError(
                                 "update", "Invalid revision '" +
                                               *config.command.revision + "'"));
        }
    }

    SvnClient client(runner, config.execution);
    auto result = client.Update(target.Value(), revision);
    if (result.IsErr()) return Fail(fmt, result.Error());

    auto rev = result.Value().revision;
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(nlohmann::json{{"success", true}, {"revision", rev}}.dump());
    } else if (!config.quiet) {
        fmt.PrintSuccess("At revision " + std::to_string(rev));
    }
    return 0;
}

int HandleCommit(const AppConfig& config, ICommandRunner& runner,
                 const OutputFormatter& fmt) {
    if (!config.command.message) {
        return Fail(fmt, MakeValidationError(
                             "commit", "Missing commit message. Usage: svn-bridge "
                                       "commit <paths...> -m <message>"));
    }
    auto paths = config.command.targets;
    if (paths.empty()) {
        paths.push_back(".");
    }

    SvnClient client(runner, config.execution);
    auto result = client.Commit(paths, *config.command.message);
    if (result.IsErr()) return Fail(fmt, result.Error());

    auto rev = result.Value().revision;
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(nlohmann::json{{"success", true}, {"revision", rev}}.dump());
    } else if (!config.quiet) {
        fmt.PrintSuccess(rev > 0 ? "Committed revision " + std::to_string(rev)
                                 : std::string("Nothing to commit"));
    }
    return 0;
}

// ---------------------------------------------------------------------------
// add / delete / revert / cleanup / lock / unlock
// ---------------------------------------------------------------------------
int ReportDone(const AppConfig& config, const OutputFormatter& fmt,
               const Result<void, Error>& result, const std::string& message) {
    if (result.IsErr()) return Fail(fmt, result.Error());
    if (fmt.IsJsonMode() || !config.quiet) {
        fmt.PrintSuccess(message);
    }
    return 0;
}

std::string PathCount(size_t n) {
    return std::to_string(n) + (n == 1 ? " path" : " paths");
}

int HandleAdd(const AppConfig& config, ICommandRunner& runner,
              const OutputFormatter& fmt) {
    SvnClient client(runner, config.execution);
    const auto& paths = config.command.targets;
    return ReportDone(config, fmt, client.Add(paths), "Added " + PathCount(paths.size()));
}

int HandleDelete(const AppConfig& config, ICommandRunner& runner,
                 const OutputFormatter& fmt) {
    SvnClient client(runner, config.execution);
    const auto& paths = config.command.targets;
    return ReportDone(config, fmt, client.Delete(paths),
                      "Deleted " + PathCount(paths.size()));
}

int HandleRevert(const AppConfig& config, ICommandRunner& runner,
                 const OutputFormatter& fmt) {
    SvnClient client(runner, config.execution);
    const auto& paths = config.command.targets;
    return ReportDone(config, fmt, client.Revert(paths),
                      "Reverted " + PathCount(paths.size()));
}

int HandleCleanup(const AppConfig& config, ICommandRunner& runner,
                  const OutputFormatter& fmt) {
    auto target = OneTarget(config, "cleanup", std::string("."));
    if (target.IsErr()) return Fail(fmt, target.Error());
    SvnClient client(runner, config.execution);
    return ReportDone(config, fmt, client.Cleanup(target.Value()),
                      "Cleaned up " + target.Value());
}

int HandleLock(const AppConfig& config, ICommandRunner& runner,
               const OutputFormatter& fmt) {
    auto target = OneTarget(config, "lock", std::nullopt);
    if (target.IsErr()) return Fail(fmt, target.Error());
    SvnClient client(runner, config.execution);
    return ReportDone(config, fmt, client.Lock(target.Value(), config.command.message),
                      "Locked " + target.Value());
}

int HandleUnlock(const AppConfig& config, ICommandRunner& runner,
                 const OutputFormatter& fmt) {
    auto target = OneTarget(config, "unlock", std::nullopt);
    if (target.IsErr()) return Fail(fmt, target.Error());
    SvnClient client(runner, config.execution);
    return ReportDone(config, fmt, client.Unlock(target.Value(), config.command.force),
                      "Unlocked " + target.Value());
}

using Handler = int (*)(const AppConfig&, ICommandRunner&, const OutputFormatter&);

struct CommandSpec {
    const char* name;
    const char* description;
    Handler handler;
    const char* usage;
    const char* example;
};

const CommandSpec kCommands[] = {
    {"status", "Working-copy status", HandleStatus,
     "svn-bridge status [path]", "svn-bridge status ~/wc --json"},
    {"log", "Commit history, newest first", HandleLog,
     "svn-bridge log [path] [-l N] [-r S:E]", "svn-bridge log ~/wc -l 20 -r 100:HEAD"},
    {"info", "Repository and working-copy information", HandleInfo,
     "svn-bridge info [path|url]", "svn-bridge info https://svn.example.com/repo/trunk"},
    {"list", "Directory listing of a repository URL", HandleList,
     "svn-bridge list [url] [-r REV] [--depth D]",
     "svn-bridge list https://svn.example.com/repo/trunk --depth immediates"},
    {"update", "Update a working copy", HandleUpdate,
     "svn-bridge update [path] [-r REV]", "svn-bridge update ~/wc -r 120"},
    {"commit", "Commit changes", HandleCommit,
     "svn-bridge commit [paths...] -m <message>", "svn-bridge commit a.txt b.txt -m \"Fix typo\""},
    {"add", "Schedule files for addition", HandleAdd,
     "svn-bridge add <paths...>", "svn-bridge add src/new.cpp"},
    {"delete", "Schedule files for deletion", HandleDelete,
     "svn-bridge delete <paths...>", "svn-bridge delete old.txt"},
    {"revert", "Discard local changes", HandleRevert,
     "svn-bridge revert <paths...>", "svn-bridge revert a.txt"},
    {"cleanup", "Recover an interrupted working copy", HandleCleanup,
     "svn-bridge cleanup [path]", "svn-bridge cleanup ~/wc"},
    {"lock", "Lock a file in the repository", HandleLock,
     "svn-bridge lock <path> [-m <comment>]", "svn-bridge lock design.psd -m \"editing\""},
    {"unlock", "Release a lock", HandleUnlock,
     "svn-bridge unlock <path> [--force]", "svn-bridge unlock design.psd --force"},
};

} // anonymous namespace

Result<std::pair<std::optional<int64_t>, std::optional<int64_t>>, Error>
ParseLogRange(const std::string& text) {
    using Range = std::pair<std::optional<int64_t>, std::optional<int64_t>>;
    auto invalid = [&]() {
        return Result<Range, Error>::Err(MakeValidationError(
            "log", "Invalid revision range '" + text + "' (expected S, S:E or S:HEAD)"));
    };

    auto colon = text.find(':');
    auto start = convert::ParseInt(std::string_view(text).substr(0, colon));
    if (!start || *start < 0) {
        return invalid();
    }
    if (colon == std::string::npos) {
        return Result<Range, Error>::Ok(Range{start, std::nullopt});
    }
    auto end_text = convert::Trim(std::string_view(text).substr(colon + 1));
    if (end_text == "HEAD") {
        return Result<Range, Error>::Ok(Range{start, std::nullopt});
    }
    auto end = convert::ParseInt(end_text);
    if (!end || *end < 0) {
        return invalid();
    }
    return Result<Range, Error>::Ok(Range{start, end});
}

std::unique_ptr<ICommandRunner> MakeProcessRunner(const AppConfig& config) {
    return std::make_unique<ProcessRunner>(config.svn_binary,
                                           RunnerOptionsFor(config.execution));
}

void RegisterAllCommands(CommandRouter& router, RunnerFactory factory,
                         std::ostream& out, std::ostream& err) {
    for (const auto& spec : kCommands) {
        auto handler = spec.handler;
        router.Register(
            spec.name, spec.description,
            [factory, handler, &out, &err](const AppConfig& config) {
                auto fmt = MakeFormatter(config, out, err);
                auto runner = factory(config);
                return handler(config, *runner, fmt);
            },
            CommandHelp{spec.usage, "", {spec.example}});
    }
}

void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color) {
    using namespace ansi;
    auto heading = [&](const char* text) {
        if (color) out << kBold << text << kReset << "\n";
        else out << text << "\n";
    };

    out << "svn-bridge - typed access to Subversion working copies\n\n";
    router.PrintHelp(out);

    out << "\n";
    heading("Global flags:");
    out << "  -c, --config <file>        YAML config file\n"
           "  --svn <path>               svn executable (default: svn)\n"
           "  --cwd <dir>                Directory to run svn in\n"
           "  --timeout <seconds>        Kill svn after this long (0 = never)\n"
           "  --username <name>          Repository username\n"
           "  --password-env <VAR>       Read the repository password from VAR\n"
           "  --insecure                 Accept untrusted server certificates\n"
           "  --proxy-host <host>        HTTP proxy (with --proxy-port)\n"
           "  --json                     JSON output\n"
           "  --color / --no-color       Force or disable colors\n"
           "  -v, --verbose / -q, --quiet\n"
           "  --log-file <file>          Also write log lines to a file\n"
           "  --version                  Print version\n";

    out << "\n";
    heading("Examples:");
    for (const char* example : {"svn-bridge status ~/wc",
                                "svn-bridge log ~/wc -l 5 --json",
                                "svn-bridge commit a.txt -m \"Fix typo\""}) {
        if (color) out << "  " << kDim << "$ " << kReset << example << "\n";
        else out << "  $ " << example << "\n";
    }
}

} // namespace svn_bridge
