#include <svn_bridge/svn/log_parser.hpp>

#include <svn_bridge/core/convert.hpp>
#include <svn_bridge/svn/xml_tree.hpp>

#include <algorithm>

namespace svn_bridge {

namespace {

constexpr const char* kOperation = "ParseLogXml";

LogPath ParseChangedPath(const XmlNode& node) {
    LogPath out;
    out.action = ParsePathAction(convert::StringOr(node.Value("action"), "M"));

    // Text content first; some writers put the path in an attribute instead.
    out.path = node.Text().empty()
        ? convert::StringOr(node.Value("path"))
        : node.Text();

    if (auto from = node.Value("copyfrom-path"); !convert::IsBlank(from)) {
        out.copy_from_path = *from;
    }
    if (auto from_rev = node.Value("copyfrom-rev"); !convert::IsBlank(from_rev)) {
        out.copy_from_revision = convert::NonNegativeOr(from_rev);
    }
    return out;
}

LogEntry ParseEntry(const XmlNode& node) {
    LogEntry out;
    out.revision = convert::NonNegativeOr(node.Value("revision"));
    out.author = convert::NonEmptyOr(node.Value("author"), kUnknownAuthor);
    out.date = convert::StringOr(node.Value("date"));
    out.message = convert::StringOr(node.FirstNonEmpty({"msg", "message"}));

    for (const auto* paths : node.FindAll("paths")) {
        for (const auto* path : paths->FindAll("path")) {
            out.paths.push_back(ParseChangedPath(*path));
        }
    }
    return out;
}

} // anonymous namespace

Result<LogResult, Error> ParseLogXml(std::string_view xml) {
    if (convert::Trim(xml).empty()) {
        return Result<LogResult, Error>::Ok(LogResult{});
    }

    auto tree = ParseXmlTree(xml, kOperation);
    if (tree.IsErr()) {
        return Result<LogResult, Error>::Err(std::move(tree).Error());
    }

    LogResult result;
    for (const auto* entry : tree.Value().FindAll("logentry")) {
        result.entries.push_back(ParseEntry(*entry));
    }
    if (result.entries.empty()) {
        return Result<LogResult, Error>::Ok(std::move(result));
    }

    std::stable_sort(result.entries.begin(), result.entries.end(),
                     [](const LogEntry& a, const LogEntry& b) {
                         return a.revision > b.revision;
                     });
    result.end_revision = result.entries.front().revision;
    result.start_revision = result.entries.back().revision;

    return Result<LogResult, Error>::Ok(std::move(result));
}

} // namespace svn_bridge
