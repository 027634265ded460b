#include <catch2/catch_test_macros.hpp>

#include <svn_bridge/cli/output_formatter.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>

using namespace svn_bridge;

// ===========================================================================
// Tables
// ===========================================================================

TEST_CASE("OutputFormatter: plain table is aligned", "[cli][output]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);
    fmt.PrintTable({"Rev", "Author"}, {{"12", "alice"}, {"9", "bob"}});
    CHECK(out.str() ==
          "Rev  Author\n"
          "---  ------\n"
          "12   alice\n"
          "9    bob\n");
}

TEST_CASE("OutputFormatter: JSON table is an array of objects", "[cli][output]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);
    fmt.PrintTable({"Rev", "Author"}, {{"12", "alice"}});

    auto j = nlohmann::json::parse(out.str());
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 1);
    CHECK(j[0]["Rev"] == "12");
    CHECK(j[0]["Author"] == "alice");
}

TEST_CASE("OutputFormatter: JSON table with no rows", "[cli][output]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);
    fmt.PrintTable({"Name"}, {});
    CHECK(out.str() == "[]\n");
}

TEST_CASE("OutputFormatter: color table contains the cells", "[cli][output]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, true, out, err);
    REQUIRE(fmt.IsColorMode());
    fmt.PrintTable({"Name"}, {{"trunk"}});
    CHECK(out.str().find("Name") != std::string::npos);
    CHECK(out.str().find("trunk") != std::string::npos);
}

TEST_CASE("OutputFormatter: JSON mode disables color", "[cli][output]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, true, out, err);
    CHECK(fmt.IsJsonMode());
    CHECK_FALSE(fmt.IsColorMode());
}

// ===========================================================================
// Detail / success
// ===========================================================================

TEST_CASE("OutputFormatter: plain detail block", "[cli][output]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);
    fmt.PrintDetail(".", {{"URL", "https://svn/repo"}, {"Revision", "5"}});
    CHECK(out.str() ==
          ".\n"
          "  URL:      https://svn/repo\n"
          "  Revision: 5\n");
}

TEST_CASE("OutputFormatter: JSON detail object", "[cli][output]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);
    fmt.PrintDetail(".", {{"URL", "https://svn/repo"}});
    auto j = nlohmann::json::parse(out.str());
    CHECK(j["URL"] == "https://svn/repo");
}

TEST_CASE("OutputFormatter: success message", "[cli][output]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter plain(false, false, out, err);
    plain.PrintSuccess("Committed revision 5");
    CHECK(out.str() == "Committed revision 5\n");

    std::ostringstream json_out;
    OutputFormatter json(true, false, json_out, err);
    json.PrintSuccess("done");
    auto j = nlohmann::json::parse(json_out.str());
    CHECK(j["success"] == true);
    CHECK(j["message"] == "done");
}

// ===========================================================================
// Errors
// ===========================================================================

TEST_CASE("OutputFormatter: plain command failure", "[cli][output]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);
    auto e = Error::CommandFailed("SvnClient::Commit", 1,
                                  "svn: E155015: '/wc/a.txt' remains in conflict\n");
    e.failure = FailureKind::Conflict;
    e.conflicted_paths = {"/wc/a.txt"};
    fmt.PrintError(e);

    CHECK(out.str().empty());
    CHECK(err.str() ==
          "Error: SvnClient::Commit (exit 1)\n"
          "  svn: E155015: '/wc/a.txt' remains in conflict\n"
          "  Kind: conflict\n"
          "  Conflict: /wc/a.txt\n");
}

TEST_CASE("OutputFormatter: plain parse failure shows cause", "[cli][output]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(false, false, out, err);
    fmt.PrintError(Error::ParseFailure("ParseLogXml", "Malformed XML report", "<log",
                                       "XML_ERROR_PARSING"));
    CHECK(err.str() ==
          "Error: ParseLogXml\n"
          "  Malformed XML report\n"
          "  Cause: XML_ERROR_PARSING\n");
}

TEST_CASE("ErrorToJson: command failure members", "[cli][output]") {
    auto e = Error::CommandFailed("SvnClient::Update", 1, "svn: E170013: Unable to connect\n");
    e.failure = FailureKind::Network;
    e.failure_detail = "https://svn.example.com";
    auto j = nlohmann::json::parse(ErrorToJson(e));
    const auto& body = j["error"];
    CHECK(body["operation"] == "SvnClient::Update");
    CHECK(body["category"] == "command_execution");
    CHECK(body["exit_code"] == 1);
    CHECK(body["failure"] == "network");
    CHECK(body["detail"] == "https://svn.example.com");
    CHECK(body["stderr"] == "svn: E170013: Unable to connect\n");
    CHECK_FALSE(body.contains("conflicted_paths"));
}

TEST_CASE("ErrorToJson: config error omits command members", "[cli][output]") {
    auto j = nlohmann::json::parse(
        ErrorToJson(Error::Make("ConfigLoader", "bad", ErrorCategory::Config)));
    const auto& body = j["error"];
    CHECK(body["category"] == "config");
    CHECK_FALSE(body.contains("exit_code"));
    CHECK_FALSE(body.contains("failure"));
    CHECK_FALSE(body.contains("stderr"));
}

TEST_CASE("OutputFormatter: JSON error goes to stderr", "[cli][output]") {
    std::ostringstream out;
    std::ostringstream err;
    OutputFormatter fmt(true, false, out, err);
    fmt.PrintError(Error::EmptyInput("ParseInfoXml", "Empty XML input for svn info"));
    CHECK(out.str().empty());
    auto j = nlohmann::json::parse(err.str());
    CHECK(j["error"]["category"] == "empty_input");
}
