#include <svn_bridge/svn/svn_client.hpp>

#include <svn_bridge/core/convert.hpp>
#include <svn_bridge/core/log.hpp>
#include <svn_bridge/svn/info_parser.hpp>
#include <svn_bridge/svn/list_parser.hpp>
#include <svn_bridge/svn/log_parser.hpp>
#include <svn_bridge/svn/status_parser.hpp>

#include <initializer_list>
#include <memory>

namespace svn_bridge {

namespace {

Error NoPathsError(std::string_view operation) {
    return Error::Make(std::string(operation), "At least one path is required",
                       ErrorCategory::Config);
}

// Revision on the last line that starts with one of the prefixes and ends
// in "N."; 0 when there is none.
int64_t LastRevisionLine(std::string_view output,
                         std::initializer_list<std::string_view> prefixes) {
    int64_t revision = 0;
    size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\n', start);
        if (end == std::string_view::npos) {
            end = output.size();
        }
        auto line = convert::Trim(output.substr(start, end - start));
        for (auto prefix : prefixes) {
            if (line.substr(0, prefix.size()) != prefix) {
                continue;
            }
            auto rest = line.substr(prefix.size());
            if (!rest.empty() && rest.back() == '.') {
                rest.remove_suffix(1);
            }
            if (auto value = convert::ParseInt(rest); value && *value >= 0) {
                revision = *value;
            }
        }
        start = end + 1;
    }
    return revision;
}

std::string RevisionRange(const LogOptions& options) {
    if (options.start_revision && options.end_revision) {
        return std::to_string(*options.start_revision) + ":" +
               std::to_string(*options.end_revision);
    }
    if (options.start_revision) {
        return std::to_string(*options.start_revision) + ":HEAD";
    }
    // End only: walk back from it to the first revision.
    return std::to_string(*options.end_revision) + ":1";
}

} // anonymous namespace

int64_t ParseUpdateRevision(std::string_view output) {
    return LastRevisionLine(output, {"Updated to revision ", "At revision "});
}

int64_t ParseCommitRevision(std::string_view output) {
    return LastRevisionLine(output, {"Committed revision "});
}

SvnClient::SvnClient(ICommandRunner& runner, ExecutionContext context)
    : runner_(runner), context_(std::move(context)) {}

Result<std::string, Error> SvnClient::Execute(std::string_view operation,
                                              std::vector<std::string> args) {
    std::unique_ptr<TempSvnConfig> temp_config;
    std::optional<std::string> temp_dir;
    if (ProxyConfigured(context_.proxy)) {
        auto created = TempSvnConfig::Create(context_.proxy);
        if (created.IsErr()) {
            auto error = std::move(created).Error();
            error.operation = std::string(operation);
            return Result<std::string, Error>::Err(std::move(error));
        }
        temp_config = std::move(created).Value();
        temp_dir = temp_config->Directory();
    }

    auto full_args = BuildGlobalArgs(context_, temp_dir);
    full_args.insert(full_args.end(), std::make_move_iterator(args.begin()),
                     std::make_move_iterator(args.end()));

    auto result = runner_.Run(full_args, context_.working_dir);
    if (result.IsErr()) {
        auto error = std::move(result).Error();
        error.operation = std::string(operation);
        LogDebug("svn", error.ToString());
        return Result<std::string, Error>::Err(std::move(error));
    }
    return result;
}

Result<void, Error> SvnClient::ExecuteOnPaths(std::string_view operation,
                                              const std::string& subcommand,
                                              const std::vector<std::string>& paths) {
    if (paths.empty()) {
        return Result<void, Error>::Err(NoPathsError(operation));
    }
    std::vector<std::string> args{subcommand};
    args.insert(args.end(), paths.begin(), paths.end());
    auto output = Execute(operation, std::move(args));
    if (output.IsErr()) {
        return Result<void, Error>::Err(std::move(output).Error());
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------

Result<StatusResult, Error> SvnClient::Status(const std::string& path) {
    auto xml = Execute("SvnClient::Status", {"status", "--xml", path});
    if (xml.IsErr()) {
        return Result<StatusResult, Error>::Err(std::move(xml).Error());
    }
    return ParseStatusXml(xml.Value(), path);
}

Result<LogResult, Error> SvnClient::Log(const std::string& path,
                                        const LogOptions& options) {
    std::vector<std::string> args{"log", "--xml"};
    if (options.verbose) {
        args.push_back("--verbose");
    }
    if (options.limit > 0) {
        args.push_back("-l");
        args.push_back(std::to_string(options.limit));
    }
    if (options.start_revision || options.end_revision) {
        args.push_back("-r");
        args.push_back(RevisionRange(options));
    }
    args.push_back(path);

    auto xml = Execute("SvnClient::Log", std::move(args));
    if (xml.IsErr()) {
        return Result<LogResult, Error>::Err(std::move(xml).Error());
    }
    return ParseLogXml(xml.Value());
}

Result<InfoResult, Error> SvnClient::Info(const std::string& target) {
    auto xml = Execute("SvnClient::Info", {"info", "--xml", target});
    if (xml.IsErr()) {
        return Result<InfoResult, Error>::Err(std::move(xml).Error());
    }
    return ParseInfoXml(xml.Value());
}

Result<ListResult, Error> SvnClient::List(const std::string& url,
                                          const ListOptions& options) {
    std::vector<std::string> args{"list", "--xml", "-v"};
    if (options.revision) {
        args.push_back("-r");
        args.push_back(*options.revision);
    }
    if (options.depth) {
        args.push_back("--depth");
        args.push_back(*options.depth);
    }
    args.push_back(url);

    auto xml = Execute("SvnClient::List", std::move(args));
    if (xml.IsErr()) {
        return Result<ListResult, Error>::Err(std::move(xml).Error());
    }
    return ParseListXml(xml.Value());
}

// ---------------------------------------------------------------------------
// Working-copy changes
// ---------------------------------------------------------------------------

Result<UpdateResult, Error> SvnClient::Update(const std::string& path,
                                              std::optional<int64_t> revision) {
    std::vector<std::string> args{"update"};
    if (revision) {
        args.push_back("-r");
        args.push_back(std::to_string(*revision));
    }
    args.push_back(path);

    auto output = Execute("SvnClient::Update", std::move(args));
    if (output.IsErr()) {
        return Result<UpdateResult, Error>::Err(std::move(output).Error());
    }
    return Result<UpdateResult, Error>::Ok(
        UpdateResult{ParseUpdateRevision(output.Value())});
}

Result<CommitResult, Error> SvnClient::Commit(const std::vector<std::string>& paths,
                                              const std::string& message) {
    if (paths.empty()) {
        return Result<CommitResult, Error>::Err(NoPathsError("SvnClient::Commit"));
    }
    std::vector<std::string> args{"commit", "-m", message};
    args.insert(args.end(), paths.begin(), paths.end());

    auto output = Execute("SvnClient::Commit", std::move(args));
    if (output.IsErr()) {
        return Result<CommitResult, Error>::Err(std::move(output).Error());
    }
    auto revision = ParseCommitRevision(output.Value());
    if (revision == 0) {
        LogInfo("svn", "Nothing to commit");
    }
    return Result<CommitResult, Error>::Ok(CommitResult{revision});
}

Result<void, Error> SvnClient::Add(const std::vector<std::string>& paths) {
    return ExecuteOnPaths("SvnClient::Add", "add", paths);
}

Result<void, Error> SvnClient::Delete(const std::vector<std::string>& paths) {
    return ExecuteOnPaths("SvnClient::Delete", "delete", paths);
}

Result<void, Error> SvnClient::Revert(const std::vector<std::string>& paths) {
    return ExecuteOnPaths("SvnClient::Revert", "revert", paths);
}

Result<void, Error> SvnClient::Cleanup(const std::string& path) {
    return ExecuteOnPaths("SvnClient::Cleanup", "cleanup", {path});
}

Result<void, Error> SvnClient::Lock(const std::string& path,
                                    const std::optional<std::string>& message) {
    std::vector<std::string> args{"lock"};
    if (message) {
        args.push_back("-m");
        args.push_back(*message);
    }
    args.push_back(path);
    auto output = Execute("SvnClient::Lock", std::move(args));
    if (output.IsErr()) {
        return Result<void, Error>::Err(std::move(output).Error());
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> SvnClient::Unlock(const std::string& path, bool force) {
    std::vector<std::string> args{"unlock"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(path);
    auto output = Execute("SvnClient::Unlock", std::move(args));
    if (output.IsErr()) {
        return Result<void, Error>::Err(std::move(output).Error());
    }
    return Result<void, Error>::Ok();
}

} // namespace svn_bridge
