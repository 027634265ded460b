#include <catch2/catch_test_macros.hpp>

#include <svn_bridge/svn/xml_tree.hpp>

using namespace svn_bridge;

TEST_CASE("ParseXmlTree: attributes and child elements share one field map", "[svn][xml]") {
    auto r1 = ParseXmlTree(R"(<commit revision="5"><author>alice</author></commit>)", "test");
    auto r2 = ParseXmlTree(R"(<commit><revision>5</revision><author>alice</author></commit>)", "test");
    REQUIRE(r1.IsOk());
    REQUIRE(r2.IsOk());
    CHECK(r1.Value().Value("revision") == "5");
    CHECK(r2.Value().Value("revision") == "5");
    CHECK(r1.Value().Value("author") == "alice");
}

TEST_CASE("ParseXmlTree: collection element with one item is still a list", "[svn][xml]") {
    auto r = ParseXmlTree(R"(<log><logentry revision="1"/></log>)", "test");
    REQUIRE(r.IsOk());
    CHECK(r.Value().FindAll("logentry").size() == 1);
}

TEST_CASE("ParseXmlTree: collection keeps every occurrence in order", "[svn][xml]") {
    auto r = ParseXmlTree(
        R"(<target><entry path="a"/><entry path="b"/><entry path="c"/></target>)", "test");
    REQUIRE(r.IsOk());
    auto entries = r.Value().FindAll("entry");
    REQUIRE(entries.size() == 3);
    CHECK(entries[0]->Value("path") == "a");
    CHECK(entries[2]->Value("path") == "c");
}

TEST_CASE("ParseXmlTree: scalar name keeps first occurrence", "[svn][xml]") {
    auto r = ParseXmlTree(R"(<x><author>first</author><author>second</author></x>)", "test");
    REQUIRE(r.IsOk());
    CHECK(r.Value().FindAll("author").size() == 1);
    CHECK(r.Value().Value("author") == "first");
}

TEST_CASE("ParseXmlTree: attribute wins over same-named child", "[svn][xml]") {
    auto r = ParseXmlTree(R"(<x revision="7"><revision>8</revision></x>)", "test");
    REQUIRE(r.IsOk());
    CHECK(r.Value().Value("revision") == "7");
}

TEST_CASE("ParseXmlTree: text content is trimmed", "[svn][xml]") {
    auto r = ParseXmlTree("<msg>\n  fix bug  \n</msg>", "test");
    REQUIRE(r.IsOk());
    CHECK(r.Value().Name() == "msg");
    CHECK(r.Value().Text() == "fix bug");
}

TEST_CASE("ParseXmlTree: malformed XML is a parse error with raw input", "[svn][xml]") {
    const std::string bad = "<status><target></status>";
    auto r = ParseXmlTree(bad, "ParseStatusXml");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Parse);
    CHECK(r.Error().operation == "ParseStatusXml");
    REQUIRE(r.Error().raw_input.has_value());
    CHECK(*r.Error().raw_input == bad);
    CHECK(r.Error().cause.has_value());
}

TEST_CASE("XmlNode: Path follows first occurrences", "[svn][xml]") {
    auto r = ParseXmlTree(
        R"(<entry><wc-info><wcroot-abspath>/home/wc</wcroot-abspath></wc-info></entry>)",
        "test");
    REQUIRE(r.IsOk());
    const auto* node = r.Value().Path({"wc-info", "wcroot-abspath"});
    REQUIRE(node != nullptr);
    CHECK(node->Text() == "/home/wc");
    CHECK(r.Value().Path({"wc-info", "missing"}) == nullptr);
}

TEST_CASE("XmlNode: FirstNonEmpty skips blank fields", "[svn][xml]") {
    auto r = ParseXmlTree(R"(<logentry><msg>  </msg><message>hello</message></logentry>)",
                          "test");
    REQUIRE(r.IsOk());
    CHECK(r.Value().FirstNonEmpty({"msg", "message"}) == "hello");
    CHECK_FALSE(r.Value().FirstNonEmpty({"nothing"}).has_value());
}

TEST_CASE("IsCollectionElement: fixed set", "[svn][xml]") {
    CHECK(IsCollectionElement("entry"));
    CHECK(IsCollectionElement("changelist"));
    CHECK_FALSE(IsCollectionElement("commit"));
}
