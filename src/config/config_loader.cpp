#include <svn_bridge/config/config_loader.hpp>

#include <svn_bridge/core/convert.hpp>
#include <svn_bridge/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cstdlib>
#include <stdexcept>

namespace svn_bridge {

namespace {

constexpr const char* kOperation = "ConfigLoader";

constexpr std::array<const char*, 4> kDepths = {
    "empty", "files", "immediates", "infinity"};

Error MakeConfigError(const std::string& message) {
    return Error::Make(kOperation, message, ErrorCategory::Config);
}

// Copy node[key] into target when present.
template <typename T>
void Read(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

template <typename T>
void Read(const YAML::Node& node, const char* key, std::optional<T>& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

void ReadProxy(const YAML::Node& node, AppConfig& config) {
    auto& proxy = config.execution.proxy;
    Read(node, "host", proxy.host);
    Read(node, "port", proxy.port);
    Read(node, "username", proxy.username);
    Read(node, "password", proxy.password);
    Read(node, "password_env", config.proxy_password_env);
    Read(node, "bypass_local", proxy.bypass_local);
    // A proxy section with a host is enabled unless it says otherwise.
    proxy.enabled = !proxy.host.empty();
    Read(node, "enabled", proxy.enabled);
}

} // anonymous namespace

std::optional<int> ParseColorMode(std::string_view value) {
    auto trimmed = convert::Trim(value);
    if (trimmed == "auto") return -1;
    if (trimmed == "always") return 1;
    if (trimmed == "never") return 0;
    if (auto flag = convert::ParseBool(trimmed)) {
        return *flag ? 1 : 0;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        auto root = YAML::LoadFile(std::string(file_path));

        if (const auto svn = root["svn"]) {
            Read(svn, "binary", config.svn_binary);
            Read(svn, "config_dir", config.execution.config_dir);
            Read(svn, "working_dir", config.execution.working_dir);
        }
        if (const auto proxy = root["proxy"]) {
            ReadProxy(proxy, config);
        }

        Read(root, "username", config.execution.username);
        Read(root, "password", config.execution.password);
        Read(root, "password_env", config.password_env);
        Read(root, "ssl_verify", config.execution.ssl_verify);
        Read(root, "timeout", config.execution.timeout_seconds);
        Read(root, "non_interactive", config.execution.non_interactive);

        Read(root, "limit", config.command.limit);
        Read(root, "log_file", config.log_file);
        Read(root, "json_output", config.json_output);
        Read(root, "verbose", config.verbose);
        Read(root, "quiet", config.quiet);

        if (root["color"]) {
            auto text = root["color"].as<std::string>();
            auto mode = ParseColorMode(text);
            if (!mode) {
                return Result<AppConfig, Error>::Err(MakeConfigError(
                    "Invalid color '" + text + "' (expected auto, always or never)"));
            }
            config.color = *mode;
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    config.config_file = std::string(file_path);
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    // -h/-v are handled by main; -v is --verbose here.
    argparse::ArgumentParser program("svn-bridge", kVersion,
                                     argparse::default_arguments::none);

    program.add_argument("targets")
        .help("Working-copy paths or repository URLs")
        .nargs(argparse::nargs_pattern::any);

    // Execution
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--svn")
        .help("svn executable (default: svn from PATH)");
    program.add_argument("--config-dir")
        .help("svn configuration directory");
    program.add_argument("--cwd")
        .help("Directory to run svn in");
    program.add_argument("--timeout")
        .help("Kill svn after this many seconds (0 = never)")
        .scan<'i', int>();
    program.add_argument("--insecure")
        .help("Accept untrusted server certificates")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--username")
        .help("Repository username");
    program.add_argument("--password")
        .help("Repository password");
    program.add_argument("--password-env")
        .help("Environment variable containing the repository password");
    program.add_argument("--proxy-host")
        .help("HTTP proxy host (enables the proxy)");
    program.add_argument("--proxy-port")
        .help("HTTP proxy port")
        .scan<'i', int>();
    program.add_argument("--proxy-user")
        .help("HTTP proxy username");
    program.add_argument("--proxy-password-env")
        .help("Environment variable containing the proxy password");
    program.add_argument("--proxy-bypass-local")
        .help("Do not use the proxy for localhost")
        .default_value(false)
        .implicit_value(true);

    // Command operands
    program.add_argument("-l", "--limit")
        .help("Maximum number of log entries")
        .scan<'i', int>();
    program.add_argument("-r", "--revision")
        .help("Revision or range (log: S:E)");
    program.add_argument("--depth")
        .help("List depth: empty, files, immediates, infinity");
    program.add_argument("-m", "--message")
        .help("Commit or lock message");
    program.add_argument("--force")
        .help("Break another user's lock (unlock)")
        .default_value(false)
        .implicit_value(true);

    // Output
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;

    if (auto val = program.present<std::vector<std::string>>("targets")) {
        config.command.targets = *val;
    }

    // Execution
    if (auto val = program.present("--config")) {
        config.config_file = *val;
    }
    if (auto val = program.present("--svn")) {
        config.svn_binary = *val;
    }
    if (auto val = program.present("--config-dir")) {
        config.execution.config_dir = *val;
    }
    if (auto val = program.present("--cwd")) {
        config.execution.working_dir = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.execution.timeout_seconds = *val;
    }
    if (program.get<bool>("--insecure")) {
        config.execution.ssl_verify = false;
    }
    if (auto val = program.present("--username")) {
        config.execution.username = *val;
    }
    if (auto val = program.present("--password")) {
        config.execution.password = *val;
    }
    if (auto val = program.present("--password-env")) {
        config.password_env = *val;
    }
    if (auto val = program.present("--proxy-host")) {
        config.execution.proxy.enabled = true;
        config.execution.proxy.host = *val;
    }
    if (auto val = program.present<int>("--proxy-port")) {
        config.execution.proxy.port = *val;
    }
    if (auto val = program.present("--proxy-user")) {
        config.execution.proxy.username = *val;
    }
    if (auto val = program.present("--proxy-password-env")) {
        config.proxy_password_env = *val;
    }
    if (program.get<bool>("--proxy-bypass-local")) {
        config.execution.proxy.bypass_local = true;
    }

    // Command operands
    if (auto val = program.present<int>("--limit")) {
        config.command.limit = *val;
    }
    if (auto val = program.present("--revision")) {
        config.command.revision = *val;
    }
    if (auto val = program.present("--depth")) {
        config.command.depth = *val;
    }
    if (auto val = program.present("--message")) {
        config.command.message = *val;
    }
    if (program.get<bool>("--force")) {
        config.command.force = true;
    }

    // Output
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--verbose")) {
        config.verbose = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }
    if (program.get<bool>("--color")) {
        config.color = 1;
    }
    if (program.get<bool>("--no-color")) {
        config.color = 0;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const AppConfig& cli_overrides) {
    const AppConfig defaults;
    AppConfig merged = yaml_base;

    if (cli_overrides.svn_binary != defaults.svn_binary) {
        merged.svn_binary = cli_overrides.svn_binary;
    }

    // Execution
    const auto& cli_exec = cli_overrides.execution;
    auto& exec = merged.execution;
    if (cli_exec.config_dir.has_value()) {
        exec.config_dir = cli_exec.config_dir;
    }
    if (cli_exec.working_dir.has_value()) {
        exec.working_dir = cli_exec.working_dir;
    }
    if (cli_exec.timeout_seconds != defaults.execution.timeout_seconds) {
        exec.timeout_seconds = cli_exec.timeout_seconds;
    }
    if (!cli_exec.ssl_verify) {
        exec.ssl_verify = false;
    }
    if (!cli_exec.username.empty()) {
        exec.username = cli_exec.username;
    }
    if (!cli_exec.password.empty()) {
        exec.password = cli_exec.password;
    }
    if (cli_overrides.password_env.has_value()) {
        merged.password_env = cli_overrides.password_env;
    }

    // Proxy
    if (cli_exec.proxy.enabled) {
        exec.proxy.enabled = true;
    }
    if (!cli_exec.proxy.host.empty()) {
        exec.proxy.host = cli_exec.proxy.host;
    }
    if (cli_exec.proxy.port != 0) {
        exec.proxy.port = cli_exec.proxy.port;
    }
    if (!cli_exec.proxy.username.empty()) {
        exec.proxy.username = cli_exec.proxy.username;
    }
    if (cli_exec.proxy.bypass_local) {
        exec.proxy.bypass_local = true;
    }
    if (cli_overrides.proxy_password_env.has_value()) {
        merged.proxy_password_env = cli_overrides.proxy_password_env;
    }

    // Command operands only come from the command line, except the limit
    // which may have a configured default.
    merged.command = cli_overrides.command;
    if (cli_overrides.command.limit == defaults.command.limit) {
        merged.command.limit = yaml_base.command.limit;
    }

    // Output
    if (cli_overrides.config_file.has_value()) {
        merged.config_file = cli_overrides.config_file;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.color != defaults.color) {
        merged.color = cli_overrides.color;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolvePasswordEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolvePasswordEnv(AppConfig config) {
    auto resolve = [](const std::optional<std::string>& env_var,
                      std::string& password) -> Result<void, Error> {
        if (!password.empty() || !env_var.has_value()) {
            return Result<void, Error>::Ok();
        }
        const char* env_val = std::getenv(env_var->c_str());
        if (env_val == nullptr) {
            return Result<void, Error>::Err(
                MakeConfigError("Environment variable '" + *env_var +
                                "' not set (specified by password_env)"));
        }
        password = env_val;
        return Result<void, Error>::Ok();
    };

    auto repo = resolve(config.password_env, config.execution.password);
    if (repo.IsErr()) {
        return Result<AppConfig, Error>::Err(repo.Error());
    }
    auto proxy = resolve(config.proxy_password_env, config.execution.proxy.password);
    if (proxy.IsErr()) {
        return Result<AppConfig, Error>::Err(proxy.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.svn_binary.empty()) {
        return Result<void, Error>::Err(MakeConfigError("svn binary must not be empty"));
    }
    if (config.execution.timeout_seconds < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must not be negative, got " +
                            std::to_string(config.execution.timeout_seconds)));
    }
    const auto& proxy = config.execution.proxy;
    if (proxy.enabled) {
        if (proxy.host.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("Proxy is enabled but no proxy host is set"));
        }
        if (proxy.port <= 0 || proxy.port > 65535) {
            return Result<void, Error>::Err(
                MakeConfigError("Invalid proxy port: " + std::to_string(proxy.port)));
        }
    }
    if (config.command.limit <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Limit must be positive, got " +
                            std::to_string(config.command.limit)));
    }
    if (config.command.depth.has_value()) {
        bool known = false;
        for (const auto* depth : kDepths) {
            known = known || *config.command.depth == depth;
        }
        if (!known) {
            return Result<void, Error>::Err(MakeConfigError(
                "Invalid depth '" + *config.command.depth +
                "' (expected empty, files, immediates or infinity)"));
        }
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace svn_bridge
