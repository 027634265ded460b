#include <svn_bridge/svn/model.hpp>

#include <svn_bridge/core/convert.hpp>

#include <cctype>
#include <string>

namespace svn_bridge {

namespace {

std::string Lower(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::optional<StatusKind> StatusFromSymbol(char symbol) {
    switch (symbol) {
        case ' ': return StatusKind::None;
        case 'A': return StatusKind::Added;
        case 'C': return StatusKind::Conflicted;
        case 'D': return StatusKind::Deleted;
        case 'I': return StatusKind::Ignored;
        case 'M': return StatusKind::Modified;
        case 'R': return StatusKind::Replaced;
        case 'X': return StatusKind::ExternalDir;
        case '?': return StatusKind::Unversioned;
        case '!': return StatusKind::Missing;
        case '~': return StatusKind::Obstructed;
        default:  return std::nullopt;
    }
}

} // anonymous namespace

StatusKind ParseStatusKind(std::string_view value) {
    // A lone space is the "no modification" symbol; check before trimming.
    if (value.size() == 1) {
        return StatusFromSymbol(value[0]).value_or(StatusKind::None);
    }

    const auto word = Lower(convert::Trim(value));
    if (word == "added") return StatusKind::Added;
    if (word == "conflicted") return StatusKind::Conflicted;
    if (word == "deleted") return StatusKind::Deleted;
    if (word == "ignored") return StatusKind::Ignored;
    if (word == "modified") return StatusKind::Modified;
    if (word == "replaced") return StatusKind::Replaced;
    if (word == "external" || word == "unversioned-external-dir") {
        return StatusKind::ExternalDir;
    }
    if (word == "unversioned") return StatusKind::Unversioned;
    if (word == "missing") return StatusKind::Missing;
    if (word == "obstructed") return StatusKind::Obstructed;
    // "none", "normal" and anything unrecognized.
    return StatusKind::None;
}

char StatusSymbol(StatusKind kind) {
    switch (kind) {
        case StatusKind::None:        return ' ';
        case StatusKind::Added:       return 'A';
        case StatusKind::Conflicted:  return 'C';
        case StatusKind::Deleted:     return 'D';
        case StatusKind::Ignored:     return 'I';
        case StatusKind::Modified:    return 'M';
        case StatusKind::Replaced:    return 'R';
        case StatusKind::ExternalDir: return 'X';
        case StatusKind::Unversioned: return '?';
        case StatusKind::Missing:     return '!';
        case StatusKind::Obstructed:  return '~';
    }
    return ' ';
}

std::string_view StatusName(StatusKind kind) {
    switch (kind) {
        case StatusKind::None:        return "none";
        case StatusKind::Added:       return "added";
        case StatusKind::Conflicted:  return "conflicted";
        case StatusKind::Deleted:     return "deleted";
        case StatusKind::Ignored:     return "ignored";
        case StatusKind::Modified:    return "modified";
        case StatusKind::Replaced:    return "replaced";
        case StatusKind::ExternalDir: return "unversioned-external-dir";
        case StatusKind::Unversioned: return "unversioned";
        case StatusKind::Missing:     return "missing";
        case StatusKind::Obstructed:  return "obstructed";
    }
    return "none";
}

NodeKind ParseNodeKind(std::string_view value, NodeKind fallback) {
    const auto word = Lower(convert::Trim(value));
    if (word == "file") return NodeKind::File;
    if (word == "dir") return NodeKind::Dir;
    return fallback;
}

std::string_view NodeKindName(NodeKind kind) {
    return kind == NodeKind::File ? "file" : "dir";
}

PathAction ParsePathAction(std::string_view value) {
    const auto trimmed = convert::Trim(value);
    if (trimmed.size() != 1) {
        return PathAction::Modified;
    }
    switch (std::toupper(static_cast<unsigned char>(trimmed[0]))) {
        case 'A': return PathAction::Added;
        case 'D': return PathAction::Deleted;
        case 'R': return PathAction::Replaced;
        default:  return PathAction::Modified;
    }
}

char PathActionSymbol(PathAction action) {
    switch (action) {
        case PathAction::Added:    return 'A';
        case PathAction::Deleted:  return 'D';
        case PathAction::Modified: return 'M';
        case PathAction::Replaced: return 'R';
    }
    return 'M';
}

} // namespace svn_bridge
