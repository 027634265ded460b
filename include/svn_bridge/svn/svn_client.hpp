#pragma once

#include <svn_bridge/core/result.hpp>
#include <svn_bridge/svn/execution_context.hpp>
#include <svn_bridge/svn/i_command_runner.hpp>
#include <svn_bridge/svn/model.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace svn_bridge {

struct LogOptions {
    int limit = 100;                       // 0 = no -l flag
    std::optional<int64_t> start_revision;
    std::optional<int64_t> end_revision;
    bool verbose = true;                   // changed paths
};

struct ListOptions {
    std::optional<std::string> revision;   // number, HEAD, {DATE}, ...
    std::optional<std::string> depth;      // empty, files, immediates, infinity
};

// ---------------------------------------------------------------------------
// SvnClient — runs svn through an ICommandRunner and returns typed results.
//
// The read commands use the --xml reports and the extractors in
// status_parser / log_parser / info_parser / list_parser. Every command gets
// the global flags of the ExecutionContext; a configured proxy is passed via
// a TempSvnConfig that lives for the duration of one command.
//
// The runner is borrowed and must outlive the client.
// ---------------------------------------------------------------------------
class SvnClient {
public:
    SvnClient(ICommandRunner& runner, ExecutionContext context);

    [[nodiscard]] Result<StatusResult, Error> Status(const std::string& path);
    [[nodiscard]] Result<LogResult, Error> Log(const std::string& path,
                                               const LogOptions& options = {});
    [[nodiscard]] Result<InfoResult, Error> Info(const std::string& target);
    [[nodiscard]] Result<ListResult, Error> List(const std::string& url,
                                                 const ListOptions& options = {});

    [[nodiscard]] Result<UpdateResult, Error> Update(
        const std::string& path, std::optional<int64_t> revision = std::nullopt);
    [[nodiscard]] Result<CommitResult, Error> Commit(
        const std::vector<std::string>& paths, const std::string& message);

    [[nodiscard]] Result<void, Error> Add(const std::vector<std::string>& paths);
    [[nodiscard]] Result<void, Error> Delete(const std::vector<std::string>& paths);
    [[nodiscard]] Result<void, Error> Revert(const std::vector<std::string>& paths);
    [[nodiscard]] Result<void, Error> Cleanup(const std::string& path);
    [[nodiscard]] Result<void, Error> Lock(
        const std::string& path, const std::optional<std::string>& message = std::nullopt);
    [[nodiscard]] Result<void, Error> Unlock(const std::string& path, bool force = false);

    [[nodiscard]] const ExecutionContext& Context() const noexcept { return context_; }

private:
    // Prepends the global flags and runs one svn command. Runner errors get
    // `operation` as their operation name.
    Result<std::string, Error> Execute(std::string_view operation,
                                       std::vector<std::string> args);

    Result<void, Error> ExecuteOnPaths(std::string_view operation,
                                       const std::string& subcommand,
                                       const std::vector<std::string>& paths);

    ICommandRunner& runner_;
    ExecutionContext context_;
};

/// Revision from `svn update` output ("Updated to revision N." or
/// "At revision N."; the last occurrence wins). 0 when absent.
int64_t ParseUpdateRevision(std::string_view output);

/// Revision from `svn commit` output ("Committed revision N."). 0 when
/// nothing was committed.
int64_t ParseCommitRevision(std::string_view output);

} // namespace svn_bridge
