#include <svn_bridge/svn/execution_context.hpp>

#include <svn_bridge/core/log.hpp>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace svn_bridge {

namespace {

constexpr const char* kOperation = "TempSvnConfig";
constexpr const char* kTempPrefix = "svn-config-";

} // anonymous namespace

bool ProxyConfigured(const ProxySettings& proxy) {
    return proxy.enabled && !proxy.host.empty() && proxy.port > 0;
}

std::vector<std::string> BuildGlobalArgs(
    const ExecutionContext& context,
    const std::optional<std::string>& temp_config_dir) {
    std::vector<std::string> args;

    if (temp_config_dir.has_value()) {
        args.push_back("--config-dir");
        args.push_back(*temp_config_dir);
    } else if (context.config_dir.has_value() && !context.config_dir->empty()) {
        args.push_back("--config-dir");
        args.push_back(*context.config_dir);
    }

    // --trust-server-cert-failures is only honoured in non-interactive mode.
    if (context.non_interactive || !context.ssl_verify) {
        args.push_back("--non-interactive");
    }

    if (!context.username.empty()) {
        args.push_back("--username");
        args.push_back(context.username);
    }
    if (!context.password.empty()) {
        args.push_back("--password");
        args.push_back(context.password);
    }

    if (!context.ssl_verify) {
        args.push_back("--trust-server-cert-failures");
        args.push_back(kTrustedCertFailures);
        LogWarn("svn", std::string("SSL verification bypassed for ") +
                           context.working_dir.value_or("current directory") +
                           " (accepting " + kTrustedCertFailures + ")");
    }
    return args;
}

std::string RenderServersFile(const ProxySettings& proxy) {
    std::string out = "[global]\n";
    out += "http-proxy-host = " + proxy.host + "\n";
    out += "http-proxy-port = " + std::to_string(proxy.port) + "\n";
    if (!proxy.username.empty()) {
        out += "http-proxy-username = " + proxy.username + "\n";
    }
    if (!proxy.password.empty()) {
        out += "http-proxy-password = " + proxy.password + "\n";
    }
    if (proxy.bypass_local) {
        out += "http-proxy-exceptions = localhost, 127.0.0.1\n";
    }
    return out;
}

ProcessRunnerOptions RunnerOptionsFor(const ExecutionContext& context) {
    ProcessRunnerOptions options;
    if (context.timeout_seconds > 0) {
        options.timeout = std::chrono::milliseconds(
            static_cast<int64_t>(context.timeout_seconds) * 1000);
    }
    return options;
}

// ---------------------------------------------------------------------------
// TempSvnConfig
// ---------------------------------------------------------------------------

Result<std::unique_ptr<TempSvnConfig>, Error> TempSvnConfig::Create(
    const ProxySettings& proxy) {
    using ResultType = Result<std::unique_ptr<TempSvnConfig>, Error>;
    namespace fs = std::filesystem;

    if (!ProxyConfigured(proxy)) {
        return ResultType::Err(Error::Make(
            kOperation, "Proxy is not configured (need enabled, host and port)",
            ErrorCategory::Config));
    }

    std::error_code ec;
    auto base = fs::temp_directory_path(ec);
    if (ec) {
        return ResultType::Err(Error::Make(
            kOperation, "No temporary directory: " + ec.message(),
            ErrorCategory::Internal));
    }

    std::string pattern = (base / (std::string(kTempPrefix) + "XXXXXX")).string();
    if (::mkdtemp(pattern.data()) == nullptr) {
        return ResultType::Err(Error::Make(
            kOperation, "mkdtemp failed: " + std::string(std::strerror(errno)),
            ErrorCategory::Internal));
    }
    // Owns the directory from here on; early returns clean it up.
    std::unique_ptr<TempSvnConfig> config(new TempSvnConfig(pattern));

    const auto servers = fs::path(pattern) / "servers";
    {
        std::ofstream file(servers, std::ios::out | std::ios::trunc);
        if (!file) {
            return ResultType::Err(Error::Make(
                kOperation, "Cannot write " + servers.string(),
                ErrorCategory::Internal));
        }
        fs::permissions(servers, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) {
            return ResultType::Err(Error::Make(
                kOperation, "Cannot restrict " + servers.string() + ": " + ec.message(),
                ErrorCategory::Internal));
        }
        file << RenderServersFile(proxy);
        if (!file.flush()) {
            return ResultType::Err(Error::Make(
                kOperation, "Cannot write " + servers.string(),
                ErrorCategory::Internal));
        }
    }

    LogDebug("svn", "Created temporary config directory " + pattern);
    return ResultType::Ok(std::move(config));
}

TempSvnConfig::~TempSvnConfig() {
    std::error_code ec;
    std::filesystem::remove_all(directory_, ec);
    if (ec) {
        LogWarn("svn", "Failed to remove temporary config directory " +
                           directory_ + ": " + ec.message());
    } else {
        LogDebug("svn", "Removed temporary config directory " + directory_);
    }
}

} // namespace svn_bridge
