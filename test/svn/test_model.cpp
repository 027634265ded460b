#include <catch2/catch_test_macros.hpp>

#include <svn_bridge/svn/model.hpp>

using namespace svn_bridge;

// ===========================================================================
// StatusKind
// ===========================================================================

TEST_CASE("ParseStatusKind: single-character symbols", "[svn][model]") {
    CHECK(ParseStatusKind(" ") == StatusKind::None);
    CHECK(ParseStatusKind("A") == StatusKind::Added);
    CHECK(ParseStatusKind("C") == StatusKind::Conflicted);
    CHECK(ParseStatusKind("D") == StatusKind::Deleted);
    CHECK(ParseStatusKind("I") == StatusKind::Ignored);
    CHECK(ParseStatusKind("M") == StatusKind::Modified);
    CHECK(ParseStatusKind("R") == StatusKind::Replaced);
    CHECK(ParseStatusKind("X") == StatusKind::ExternalDir);
    CHECK(ParseStatusKind("?") == StatusKind::Unversioned);
    CHECK(ParseStatusKind("!") == StatusKind::Missing);
    CHECK(ParseStatusKind("~") == StatusKind::Obstructed);
}

TEST_CASE("ParseStatusKind: word forms written by svn", "[svn][model]") {
    CHECK(ParseStatusKind("normal") == StatusKind::None);
    CHECK(ParseStatusKind("none") == StatusKind::None);
    CHECK(ParseStatusKind("modified") == StatusKind::Modified);
    CHECK(ParseStatusKind("Unversioned") == StatusKind::Unversioned);
    CHECK(ParseStatusKind("external") == StatusKind::ExternalDir);
    CHECK(ParseStatusKind("missing") == StatusKind::Missing);
}

TEST_CASE("ParseStatusKind: unknown values normalize to None", "[svn][model]") {
    CHECK(ParseStatusKind("Z") == StatusKind::None);
    CHECK(ParseStatusKind("incomplete") == StatusKind::None);
    CHECK(ParseStatusKind("") == StatusKind::None);
}

TEST_CASE("StatusSymbol and StatusName", "[svn][model]") {
    CHECK(StatusSymbol(StatusKind::Unversioned) == '?');
    CHECK(StatusSymbol(StatusKind::None) == ' ');
    CHECK(StatusName(StatusKind::ExternalDir) == "unversioned-external-dir");
    CHECK(StatusName(StatusKind::Obstructed) == "obstructed");
    CHECK(ParseStatusKind(StatusName(StatusKind::ExternalDir)) == StatusKind::ExternalDir);
}

// ===========================================================================
// NodeKind / PathAction
// ===========================================================================

TEST_CASE("ParseNodeKind: file, dir and fallback", "[svn][model]") {
    CHECK(ParseNodeKind("file", NodeKind::Dir) == NodeKind::File);
    CHECK(ParseNodeKind("DIR", NodeKind::File) == NodeKind::Dir);
    CHECK(ParseNodeKind("symlink", NodeKind::Dir) == NodeKind::Dir);
    CHECK(ParseNodeKind("", NodeKind::File) == NodeKind::File);
    CHECK(NodeKindName(NodeKind::File) == "file");
}

TEST_CASE("ParsePathAction: missing or unknown action is Modified", "[svn][model]") {
    CHECK(ParsePathAction("A") == PathAction::Added);
    CHECK(ParsePathAction("d") == PathAction::Deleted);
    CHECK(ParsePathAction("R") == PathAction::Replaced);
    CHECK(ParsePathAction("") == PathAction::Modified);
    CHECK(ParsePathAction("Q") == PathAction::Modified);
    CHECK(PathActionSymbol(PathAction::Replaced) == 'R');
}

TEST_CASE("LogEntry: author defaults to unknown", "[svn][model]") {
    LogEntry entry;
    CHECK(entry.author == "unknown");
    CHECK(entry.paths.empty());
}
