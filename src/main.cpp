#include <svn_bridge/cli/command_executor.hpp>
#include <svn_bridge/cli/command_router.hpp>
#include <svn_bridge/cli/output_formatter.hpp>
#include <svn_bridge/config/config_loader.hpp>
#include <svn_bridge/core/log.hpp>
#include <svn_bridge/core/terminal.hpp>
#include <svn_bridge/core/version.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;

bool HasFlag(int argc, const char* const* argv, std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == flag) return true;
    }
    return false;
}

// Resolve color mode for help output (stdout-based, before config loading).
bool ResolveColorForHelp(int argc, const char* const* argv) {
    int forced = -1;
    if (HasFlag(argc, argv, "--color")) forced = 1;
    if (HasFlag(argc, argv, "--no-color")) forced = 0;
    return svn_bridge::ResolveColor(forced, svn_bridge::IsStdoutTty());
}

bool IsHelpToken(std::string_view arg) {
    return arg == "--help" || arg == "-h" || arg == "help";
}

// Error before a config exists: honour --json from the raw arguments.
int ReportEarlyError(const svn_bridge::Error& error, int argc,
                     const char* const* argv) {
    svn_bridge::OutputFormatter fmt(HasFlag(argc, argv, "--json"), false);
    fmt.PrintError(error);
    return error.ExitCode();
}

// argv without the command token, so LoadFromCli sees flags and targets.
std::vector<const char*> StripCommand(int argc, const char* const* argv) {
    std::vector<const char*> stripped;
    stripped.reserve(static_cast<size_t>(argc));
    stripped.push_back(argv[0]);
    for (int i = 2; i < argc; ++i) {
        stripped.push_back(argv[i]);
    }
    return stripped;
}

void InitLogging(const svn_bridge::AppConfig& config) {
    using namespace svn_bridge;

    auto level = LogLevel::Warn;
    if (config.verbose) level = LogLevel::Debug;
    if (config.quiet) level = LogLevel::Error;

    std::vector<std::unique_ptr<ILogSink>> sinks;
    if (config.json_output) {
        sinks.push_back(std::make_unique<JsonSink>(std::cerr));
    } else {
        sinks.push_back(std::make_unique<ColorConsoleSink>(
            ResolveColor(config.color, IsStderrTty())));
    }

    std::string file_problem;
    if (config.log_file) {
        auto file = std::make_unique<FileSink>(*config.log_file);
        if (file->IsOpen()) {
            sinks.push_back(std::move(file));
        } else {
            file_problem = "Cannot open log file " + *config.log_file;
        }
    }

    InitGlobalLogger(std::make_unique<TeeSink>(std::move(sinks)), level);
    if (!file_problem.empty()) {
        LogWarn("main", file_problem);
    }
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace svn_bridge;

    CommandRouter router;
    RegisterAllCommands(router, MakeProcessRunner, std::cout, std::cerr);

    // No arguments: print top-level help.
    if (argc == 1) {
        PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    std::string_view command{argv[1]};
    if (command == "--version") {
        std::cout << "svn-bridge " << kVersion << "\n";
        return kExitSuccess;
    }
    if (IsHelpToken(command)) {
        PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }
    if (!router.Has(std::string(command))) {
        std::cerr << "Error: unknown command '" << command << "'\n";
        router.PrintHelp(std::cerr);
        return kExitUsage;
    }
    if (HasFlag(argc, argv, "--help") || HasFlag(argc, argv, "-h")) {
        router.PrintCommandHelp(std::string(command), std::cout);
        return kExitSuccess;
    }

    // Flags and targets → AppConfig.
    auto stripped = StripCommand(argc, argv);
    auto cli_result = LoadFromCli(static_cast<int>(stripped.size()), stripped.data());
    if (cli_result.IsErr()) {
        return ReportEarlyError(cli_result.Error(), argc, argv);
    }
    auto config = std::move(cli_result).Value();

    // YAML file, overridden by the command line.
    if (config.config_file) {
        auto yaml_result = LoadFromYaml(*config.config_file);
        if (yaml_result.IsErr()) {
            return ReportEarlyError(yaml_result.Error(), argc, argv);
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    auto resolved = ResolvePasswordEnv(std::move(config));
    if (resolved.IsErr()) {
        return ReportEarlyError(resolved.Error(), argc, argv);
    }
    config = std::move(resolved).Value();

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return ReportEarlyError(valid.Error(), argc, argv);
    }

    InitLogging(config);
    LogDebug("main", "svn-bridge " + std::string(kVersion) + " running '" +
                         std::string(command) + "'");

    return router.Dispatch(std::string(command), config, std::cerr);
}
