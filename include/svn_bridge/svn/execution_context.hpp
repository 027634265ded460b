#pragma once

#include <svn_bridge/core/result.hpp>
#include <svn_bridge/svn/process_runner.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace svn_bridge {

struct ProxySettings {
    bool enabled = false;
    std::string host;
    int port = 0;
    std::string username;
    std::string password;
    bool bypass_local = false;
};

// ---------------------------------------------------------------------------
// ExecutionContext — per-client settings that become leading svn flags,
// a private config directory and the runner's deadline.
// ---------------------------------------------------------------------------
struct ExecutionContext {
    ProxySettings proxy;
    bool ssl_verify = true;
    int timeout_seconds = 0;  // 0 = no deadline
    bool non_interactive = true;
    std::string username;
    std::string password;
    std::optional<std::string> config_dir;
    // Directory svn is started in; relative targets resolve against it.
    std::optional<std::string> working_dir;
};

/// Certificate failures accepted when ssl_verify is off. "other" is never
/// part of the list.
inline constexpr const char* kTrustedCertFailures =
    "unknown-ca,hostname-mismatch,expired,not-yet-valid";

/// True if the proxy is enabled and has a host and a port.
bool ProxyConfigured(const ProxySettings& proxy);

/// Leading flags for every svn invocation. temp_config_dir (from
/// TempSvnConfig) takes precedence over context.config_dir.
std::vector<std::string> BuildGlobalArgs(
    const ExecutionContext& context,
    const std::optional<std::string>& temp_config_dir);

/// Body of the svn "servers" file carrying the proxy settings.
std::string RenderServersFile(const ProxySettings& proxy);

/// Runner options derived from the context (timeout in milliseconds).
ProcessRunnerOptions RunnerOptionsFor(const ExecutionContext& context);

// ---------------------------------------------------------------------------
// TempSvnConfig — private svn config directory holding proxy settings.
//
// Keeps proxy credentials out of the command line and the environment. The
// directory is created with mkdtemp (mode 0700), the servers file is 0600,
// and both are removed when the object is destroyed.
// ---------------------------------------------------------------------------
class TempSvnConfig {
public:
    /// Fails with ErrorCategory::Config if the proxy is not configured and
    /// with ErrorCategory::Internal on filesystem errors.
    [[nodiscard]] static Result<std::unique_ptr<TempSvnConfig>, Error> Create(
        const ProxySettings& proxy);

    ~TempSvnConfig();

    TempSvnConfig(const TempSvnConfig&) = delete;
    TempSvnConfig& operator=(const TempSvnConfig&) = delete;
    TempSvnConfig(TempSvnConfig&&) = delete;
    TempSvnConfig& operator=(TempSvnConfig&&) = delete;

    [[nodiscard]] const std::string& Directory() const noexcept { return directory_; }

private:
    explicit TempSvnConfig(std::string directory) : directory_(std::move(directory)) {}

    std::string directory_;
};

} // namespace svn_bridge
