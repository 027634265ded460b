#pragma once

#include <svn_bridge/core/result.hpp>

#include <optional>
#include <string>
#include <vector>

namespace svn_bridge {

// ---------------------------------------------------------------------------
// ICommandRunner — runs the svn binary once and returns its stdout.
//
// SvnClient depends on this interface rather than on process spawning, so
// extractor and facade logic can be tested offline with MockCommandRunner
// returning literal XML.
//
// Ok(stdout) on exit code 0. Non-zero exit → ErrorCategory::CommandExecution
// with stderr attached. Never throws on expected failures.
// Implementations keep no per-call state; calls may run concurrently.
// ---------------------------------------------------------------------------
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    // Non-copyable, non-movable (polymorphic base).
    ICommandRunner(const ICommandRunner&) = delete;
    ICommandRunner& operator=(const ICommandRunner&) = delete;
    ICommandRunner(ICommandRunner&&) = delete;
    ICommandRunner& operator=(ICommandRunner&&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> Run(
        const std::vector<std::string>& args,
        const std::optional<std::string>& working_dir) = 0;

protected:
    ICommandRunner() = default;
};

} // namespace svn_bridge
