#include <svn_bridge/svn/status_parser.hpp>

#include <svn_bridge/core/convert.hpp>
#include <svn_bridge/core/log.hpp>
#include <svn_bridge/svn/xml_tree.hpp>

#include <string>

namespace svn_bridge {

namespace {

constexpr const char* kOperation = "ParseStatusXml";

StatusResult EmptyResult(std::string_view base_path) {
    StatusResult result;
    result.path = std::string(base_path);
    return result;
}

StatusEntry ParseEntry(const XmlNode& entry,
                       const std::optional<std::string>& changelist) {
    StatusEntry out;
    out.path = convert::StringOr(entry.Value("path"));
    out.changelist = changelist;

    const auto* wc = entry.Find("wc-status");
    if (!wc) {
        return out;
    }

    out.status = ParseStatusKind(convert::StringOr(wc->Value("item"), " "));

    if (auto props = wc->Value("props")) {
        auto kind = ParseStatusKind(*props);
        if (kind != StatusKind::None) {
            out.props_status = kind;
        }
    }

    if (const auto* commit = wc->Find("commit")) {
        out.revision = convert::NonNegativeOr(commit->Value("revision"));
        out.author = convert::StringOr(commit->Value("author"));
        out.date = convert::StringOr(commit->Value("date"));
    }

    if (const auto* lock = wc->Find("lock")) {
        LockInfo info;
        info.owner = convert::StringOr(lock->Value("owner"));
        info.comment = convert::StringOr(lock->Value("comment"));
        info.date = convert::StringOr(
            lock->FirstNonEmpty({"creation-date", "created"}));
        out.lock = std::move(info);
    }
    return out;
}

void AppendEntries(const XmlNode& parent,
                   const std::optional<std::string>& changelist,
                   std::vector<StatusEntry>& entries) {
    for (const auto* entry : parent.FindAll("entry")) {
        entries.push_back(ParseEntry(*entry, changelist));
    }
}

} // anonymous namespace

Result<StatusResult, Error> ParseStatusXml(std::string_view xml,
                                           std::string_view base_path) {
    if (convert::Trim(xml).empty()) {
        return Result<StatusResult, Error>::Ok(EmptyResult(base_path));
    }

    auto tree = ParseXmlTree(xml, kOperation);
    if (tree.IsErr()) {
        return Result<StatusResult, Error>::Err(std::move(tree).Error());
    }
    const auto& root = tree.Value();

    auto targets = root.FindAll("target");
    if (targets.empty()) {
        LogWarn("parser", "status report has no <target> element");
        return Result<StatusResult, Error>::Ok(EmptyResult(base_path));
    }

    StatusResult result = EmptyResult(base_path);
    for (const auto* target : targets) {
        AppendEntries(*target, std::nullopt, result.entries);
    }
    for (const auto* changelist : root.FindAll("changelist")) {
        AppendEntries(*changelist, changelist->Value("name"), result.entries);
    }

    // Older clients put the revision on <target>; with --show-updates it
    // comes as <against revision="N"/>.
    const auto* first = targets.front();
    auto revision = first->Value("revision");
    if (convert::IsBlank(revision)) {
        if (const auto* against = first->Find("against")) {
            revision = against->Value("revision");
        }
    }
    result.revision = convert::NonNegativeOr(revision);

    return Result<StatusResult, Error>::Ok(std::move(result));
}

} // namespace svn_bridge
