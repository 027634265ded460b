#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace svn_bridge {

// ---------------------------------------------------------------------------
// Typed results of the four svn XML reports.
//
// Pure value types with no tinyxml2 dependency. Each parse call builds one
// result and hands ownership to the caller; nothing is cached between calls.
// ---------------------------------------------------------------------------

// Working-copy status of a path. Closed set: any other report value
// normalizes to None.
enum class StatusKind {
    None,            // ' '  none / normal
    Added,           // 'A'
    Conflicted,      // 'C'
    Deleted,         // 'D'
    Ignored,         // 'I'
    Modified,        // 'M'
    Replaced,        // 'R'
    ExternalDir,     // 'X'  unversioned directory created by an externals definition
    Unversioned,     // '?'
    Missing,         // '!'
    Obstructed,      // '~'
};

enum class NodeKind {
    File,
    Dir,
};

// Action on a changed path in a log entry.
enum class PathAction {
    Added,     // 'A'
    Deleted,   // 'D'
    Modified,  // 'M'
    Replaced,  // 'R'
};

// -- Enum codecs -------------------------------------------------------------

/// Accepts the single-character form (" ", "A", ..., "~") and the word form
/// svn writes in XML ("none", "normal", "added", ..., "external").
/// Anything else → StatusKind::None.
StatusKind ParseStatusKind(std::string_view value);

char StatusSymbol(StatusKind kind);
std::string_view StatusName(StatusKind kind);

/// "file" / "dir" (case-insensitive); anything else → fallback.
NodeKind ParseNodeKind(std::string_view value, NodeKind fallback);
std::string_view NodeKindName(NodeKind kind);

/// "A"/"D"/"M"/"R" (case-insensitive); anything else → Modified.
PathAction ParsePathAction(std::string_view value);
char PathActionSymbol(PathAction action);

// -- status ------------------------------------------------------------------

struct LockInfo {
    std::string owner;
    std::string comment;
    std::string date;
};

struct StatusEntry {
    std::string path;
    StatusKind status = StatusKind::None;
    // Last-commit metadata; set only when the report carried a <commit>.
    std::optional<int64_t> revision;
    std::optional<std::string> author;
    std::optional<std::string> date;
    // Never set by the parser. Telling a deleted/missing directory from a
    // file needs filesystem access, which belongs to the caller.
    bool is_directory = false;
    // Set only when present and not None.
    std::optional<StatusKind> props_status;
    std::optional<LockInfo> lock;
    // Name of the changelist the entry was reported under, if any.
    std::optional<std::string> changelist;
};

struct StatusResult {
    std::string path;                 // queried root
    std::vector<StatusEntry> entries; // report order
    int64_t revision = 0;
};

// -- log ---------------------------------------------------------------------

struct LogPath {
    PathAction action = PathAction::Modified;
    std::string path;
    std::optional<std::string> copy_from_path;
    std::optional<int64_t> copy_from_revision;
};

inline constexpr std::string_view kUnknownAuthor = "unknown";

struct LogEntry {
    int64_t revision = 0;
    std::string author{kUnknownAuthor};
    std::string date;
    std::string message;
    std::vector<LogPath> paths;
};

struct LogResult {
    std::vector<LogEntry> entries;  // strictly by revision, newest first
    int64_t start_revision = 0;     // min revision, 0 when empty
    int64_t end_revision = 0;       // max revision, 0 when empty
};

// -- info --------------------------------------------------------------------

struct InfoResult {
    std::string path;
    std::string url;
    std::string repository_root;
    std::string repository_uuid;
    int64_t revision = 0;
    NodeKind node_kind = NodeKind::Dir;
    std::string last_changed_author;
    int64_t last_changed_revision = 0;
    std::string last_changed_date;
    // Only for targets inside a checked-out working copy.
    std::optional<std::string> working_copy_root;
};

// -- list --------------------------------------------------------------------

struct ListEntry {
    std::string name;
    std::string path;
    NodeKind kind = NodeKind::File;
    std::optional<int64_t> size;   // files only
    int64_t revision = 0;
    std::string author;
    std::string date;
};

struct ListResult {
    std::string path;
    std::vector<ListEntry> entries;
};

// -- mutating commands -------------------------------------------------------

struct UpdateResult {
    int64_t revision = 0;
};

struct CommitResult {
    int64_t revision = 0;  // 0 when nothing was committed
};

} // namespace svn_bridge
