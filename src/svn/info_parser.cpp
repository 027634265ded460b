#include <svn_bridge/svn/info_parser.hpp>

#include <svn_bridge/core/convert.hpp>
#include <svn_bridge/svn/xml_tree.hpp>

namespace svn_bridge {

namespace {

constexpr const char* kOperation = "ParseInfoXml";

std::optional<std::string> ValueAt(const XmlNode& node,
                                   std::initializer_list<std::string_view> path) {
    const auto* found = node.Path(path);
    if (!found) {
        return std::nullopt;
    }
    return found->Text();
}

} // anonymous namespace

Result<InfoResult, Error> ParseInfoXml(std::string_view xml) {
    if (convert::Trim(xml).empty()) {
        return Result<InfoResult, Error>::Err(
            Error::EmptyInput(kOperation, "Empty XML input for svn info"));
    }

    auto tree = ParseXmlTree(xml, kOperation);
    if (tree.IsErr()) {
        return Result<InfoResult, Error>::Err(std::move(tree).Error());
    }
    const auto& root = tree.Value();

    if (root.Name() != "info") {
        auto error = Error::EmptyInput(
            kOperation, "No <info> element in report (root is <" + root.Name() + ">)");
        error.raw_input = std::string(xml);
        return Result<InfoResult, Error>::Err(std::move(error));
    }
    const auto* entry = root.Find("entry");
    if (!entry) {
        auto error = Error::EmptyInput(kOperation, "No <entry> element in info report");
        error.raw_input = std::string(xml);
        return Result<InfoResult, Error>::Err(std::move(error));
    }

    InfoResult info;
    info.path = convert::StringOr(entry->Value("path"));
    auto url = entry->Value("url");
    if (convert::IsBlank(url)) {
        url = ValueAt(*entry, {"repository", "url"});
    }
    info.url = convert::StringOr(url);
    info.repository_root = convert::StringOr(ValueAt(*entry, {"repository", "root"}));
    info.repository_uuid = convert::StringOr(ValueAt(*entry, {"repository", "uuid"}));
    info.revision = convert::NonNegativeOr(entry->Value("revision"));
    info.node_kind = ParseNodeKind(convert::StringOr(entry->Value("kind")),
                                   NodeKind::Dir);

    if (const auto* commit = entry->Find("commit")) {
        info.last_changed_author = convert::StringOr(commit->Value("author"));
        info.last_changed_revision = convert::NonNegativeOr(commit->Value("revision"));
        info.last_changed_date = convert::StringOr(commit->Value("date"));
    }

    auto wc_root = ValueAt(*entry, {"wc-info", "wcroot-abspath"});
    if (convert::IsBlank(wc_root)) {
        wc_root = root.Value("wc-root-abspath");
    }
    if (!convert::IsBlank(wc_root)) {
        info.working_copy_root = *wc_root;
    }

    return Result<InfoResult, Error>::Ok(std::move(info));
}

} // namespace svn_bridge
