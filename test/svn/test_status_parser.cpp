#include <catch2/catch_test_macros.hpp>

#include <svn_bridge/svn/status_parser.hpp>

using namespace svn_bridge;

namespace {

const char* kTypicalStatus = R"(<?xml version="1.0" encoding="UTF-8"?>
<status>
<target path="/home/dev/wc">
<entry path="/home/dev/wc/src/main.c">
<wc-status item="modified" props="none" revision="12">
<commit revision="10">
<author>alice</author>
<date>2024-03-01T10:00:00.000000Z</date>
</commit>
</wc-status>
</entry>
<entry path="/home/dev/wc/notes.txt">
<wc-status item="unversioned" props="none">
</wc-status>
</entry>
<entry path="/home/dev/wc/lib">
<wc-status item="added" props="modified" revision="-1">
</wc-status>
</entry>
<against revision="15"/>
</target>
</status>)";

} // anonymous namespace

// ===========================================================================
// Empty / degenerate input
// ===========================================================================

TEST_CASE("ParseStatusXml: empty input yields empty result", "[svn][status]") {
    auto r = ParseStatusXml("", "/wc");
    REQUIRE(r.IsOk());
    CHECK(r.Value().path == "/wc");
    CHECK(r.Value().entries.empty());
    CHECK(r.Value().revision == 0);
}

TEST_CASE("ParseStatusXml: whitespace-only input yields empty result", "[svn][status]") {
    auto r = ParseStatusXml("  \n\t ", "/wc");
    REQUIRE(r.IsOk());
    CHECK(r.Value().entries.empty());
}

TEST_CASE("ParseStatusXml: report without target yields empty result", "[svn][status]") {
    auto r = ParseStatusXml("<status></status>", ".");
    REQUIRE(r.IsOk());
    CHECK(r.Value().path == ".");
    CHECK(r.Value().entries.empty());
    CHECK(r.Value().revision == 0);
}

TEST_CASE("ParseStatusXml: malformed XML is a parse error", "[svn][status]") {
    auto r = ParseStatusXml("<status><target path=\".\">", ".");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Parse);
    CHECK(r.Error().operation == "ParseStatusXml");
    CHECK(r.Error().raw_input.has_value());
}

// ===========================================================================
// Entries
// ===========================================================================

TEST_CASE("ParseStatusXml: typical report", "[svn][status]") {
    auto r = ParseStatusXml(kTypicalStatus, "/home/dev/wc");
    REQUIRE(r.IsOk());
    const auto& result = r.Value();
    REQUIRE(result.entries.size() == 3);
    CHECK(result.revision == 15);

    const auto& modified = result.entries[0];
    CHECK(modified.path == "/home/dev/wc/src/main.c");
    CHECK(modified.status == StatusKind::Modified);
    CHECK(modified.revision == 10);
    CHECK(modified.author == "alice");
    CHECK(modified.date == "2024-03-01T10:00:00.000000Z");
    CHECK_FALSE(modified.props_status.has_value());
    CHECK_FALSE(modified.is_directory);

    const auto& unversioned = result.entries[1];
    CHECK(unversioned.status == StatusKind::Unversioned);
    CHECK_FALSE(unversioned.revision.has_value());
    CHECK_FALSE(unversioned.author.has_value());

    const auto& added = result.entries[2];
    CHECK(added.status == StatusKind::Added);
    REQUIRE(added.props_status.has_value());
    CHECK(*added.props_status == StatusKind::Modified);
}

TEST_CASE("ParseStatusXml: single entry is not collapsed", "[svn][status]") {
    auto r = ParseStatusXml(
        R"(<status><target path="."><entry path="a.txt"><wc-status item="M"/></entry></target></status>)",
        ".");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().entries.size() == 1);
    CHECK(r.Value().entries[0].status == StatusKind::Modified);
}

TEST_CASE("ParseStatusXml: two entries keep report order", "[svn][status]") {
    auto r = ParseStatusXml(
        R"(<status><target path=".">
             <entry path="b.txt"><wc-status item="deleted"/></entry>
             <entry path="a.txt"><wc-status item="missing"/></entry>
           </target></status>)",
        ".");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().entries.size() == 2);
    CHECK(r.Value().entries[0].path == "b.txt");
    CHECK(r.Value().entries[0].status == StatusKind::Deleted);
    CHECK(r.Value().entries[1].status == StatusKind::Missing);
}

TEST_CASE("ParseStatusXml: unknown status value normalizes to none", "[svn][status]") {
    auto r = ParseStatusXml(
        R"(<status><target path="."><entry path="x"><wc-status item="Z"/></entry></target></status>)",
        ".");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().entries.size() == 1);
    CHECK(r.Value().entries[0].status == StatusKind::None);
}

TEST_CASE("ParseStatusXml: unknown props value leaves props status unset", "[svn][status]") {
    auto r = ParseStatusXml(
        R"(<status><target path="."><entry path="x"><wc-status item="modified" props="Z"/></entry></target></status>)",
        ".");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().entries.size() == 1);
    CHECK(r.Value().entries[0].status == StatusKind::Modified);
    CHECK_FALSE(r.Value().entries[0].props_status.has_value());
}

TEST_CASE("ParseStatusXml: entry without wc-status keeps defaults", "[svn][status]") {
    auto r = ParseStatusXml(
        R"(<status><target path="."><entry path="odd"/></target></status>)", ".");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().entries.size() == 1);
    CHECK(r.Value().entries[0].path == "odd");
    CHECK(r.Value().entries[0].status == StatusKind::None);
}

TEST_CASE("ParseStatusXml: non-numeric commit revision becomes 0", "[svn][status]") {
    auto r = ParseStatusXml(
        R"(<status><target path="."><entry path="f"><wc-status item="modified">
             <commit revision="abc"><author>bob</author></commit>
           </wc-status></entry></target></status>)",
        ".");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().entries.size() == 1);
    CHECK(r.Value().entries[0].revision == 0);
    CHECK(r.Value().entries[0].author == "bob");
}

TEST_CASE("ParseStatusXml: revision from target attribute", "[svn][status]") {
    auto r = ParseStatusXml(R"(<status><target path="." revision="42"></target></status>)", ".");
    REQUIRE(r.IsOk());
    CHECK(r.Value().revision == 42);
    CHECK(r.Value().entries.empty());
}

TEST_CASE("ParseStatusXml: lock information", "[svn][status]") {
    auto r = ParseStatusXml(
        R"(<status><target path="."><entry path="big.psd"><wc-status item="normal">
             <lock><token>opaquelocktoken:1</token><owner>carol</owner>
               <comment>editing</comment><created>2024-01-01T00:00:00Z</created></lock>
           </wc-status></entry></target></status>)",
        ".");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().entries.size() == 1);
    const auto& entry = r.Value().entries[0];
    REQUIRE(entry.lock.has_value());
    CHECK(entry.lock->owner == "carol");
    CHECK(entry.lock->comment == "editing");
    CHECK(entry.lock->date == "2024-01-01T00:00:00Z");
}

TEST_CASE("ParseStatusXml: changelist entries carry the changelist name", "[svn][status]") {
    auto r = ParseStatusXml(
        R"(<status>
             <target path="."><entry path="a"><wc-status item="modified"/></entry></target>
             <changelist name="feature-x">
               <entry path="b"><wc-status item="modified"/></entry>
             </changelist>
           </status>)",
        ".");
    REQUIRE(r.IsOk());
    REQUIRE(r.Value().entries.size() == 2);
    CHECK_FALSE(r.Value().entries[0].changelist.has_value());
    REQUIRE(r.Value().entries[1].changelist.has_value());
    CHECK(*r.Value().entries[1].changelist == "feature-x");
}
