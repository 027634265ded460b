#pragma once

#include <svn_bridge/svn/i_command_runner.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace svn_bridge {

/// Locale forced on every child so non-ASCII paths and messages arrive as
/// UTF-8.
inline constexpr const char* kUtf8Locale = "en_US.UTF-8";

// ---------------------------------------------------------------------------
// CancellationToken — shared flag a caller can trip from any thread to
// abort a running command. Copies share the same flag.
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() const noexcept { flag_->store(true); }
    [[nodiscard]] bool IsCancelled() const noexcept { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct ProcessRunnerOptions {
    // Zero means no deadline. On expiry the child is killed and Run returns
    // ErrorCategory::Timeout.
    std::chrono::milliseconds timeout{0};
    std::optional<CancellationToken> cancellation;
    // Extra variables for the child, applied after the locale override.
    std::map<std::string, std::string> environment;
};

// ---------------------------------------------------------------------------
// ProcessRunner — ICommandRunner over fork/execvp.
//
// stdout and stderr are drained together through poll(), so a large report
// cannot dead-lock on a full pipe. stderr is dropped on success. Each Run()
// spawns exactly one process; no retries.
// ---------------------------------------------------------------------------
class ProcessRunner : public ICommandRunner {
public:
    explicit ProcessRunner(std::string executable,
                           ProcessRunnerOptions options = {});

    [[nodiscard]] Result<std::string, Error> Run(
        const std::vector<std::string>& args,
        const std::optional<std::string>& working_dir) override;

    [[nodiscard]] const std::string& Executable() const noexcept { return executable_; }

private:
    std::string executable_;
    ProcessRunnerOptions options_;
};

/// Child environment: base (NAME=VALUE strings) with LANG and LC_ALL set to
/// kUtf8Locale, then overrides applied. Later definitions replace earlier
/// ones; order of first appearance is kept.
std::vector<std::string> BuildChildEnvironment(
    const std::vector<std::string>& base,
    const std::map<std::string, std::string>& overrides);

/// Render a command line for logs, masking the value after --password.
std::string DescribeCommand(const std::string& executable,
                            const std::vector<std::string>& args);

} // namespace svn_bridge
