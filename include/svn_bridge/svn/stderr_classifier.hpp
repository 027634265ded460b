#pragma once

#include <svn_bridge/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace svn_bridge {

// ---------------------------------------------------------------------------
// StderrClassification — what kind of failure an svn diagnostic describes.
//
// Rules are checked in order, case-insensitively:
//   "authentication" | "authorization" | "access forbidden" → Authentication
//   "conflict"                                              → Conflict
//   "connection" | "network" | "timeout" | "host"           → Network
//   "working copy" | "locked" | "cleanup"                   → WorkingCopy
//   otherwise                                               → Generic
// ---------------------------------------------------------------------------
struct StderrClassification {
    FailureKind kind = FailureKind::Generic;
    std::string detail;                      // realm, URL or path
    std::vector<std::string> conflicted_paths;
    std::string summary;                     // first line of the diagnostic
};

[[nodiscard]] StderrClassification ClassifyStderr(std::string_view stderr_text);

/// Fill failure/failure_detail/conflicted_paths of a CommandExecution error
/// from its stderr_text. Other categories are left untouched.
void ApplyStderrClassification(Error& error);

} // namespace svn_bridge
