#include <svn_bridge/svn/list_parser.hpp>

#include <svn_bridge/core/convert.hpp>
#include <svn_bridge/svn/xml_tree.hpp>

namespace svn_bridge {

namespace {

constexpr const char* kOperation = "ParseListXml";

std::string JoinPath(const std::string& base, const std::string& name) {
    if (base.empty()) return name;
    if (name.empty()) return base;
    if (base.back() == '/') return base + name;
    return base + "/" + name;
}

ListEntry ParseEntry(const XmlNode& node, const std::string& list_path) {
    ListEntry out;
    out.name = convert::StringOr(node.Value("name"));
    out.kind = ParseNodeKind(convert::StringOr(node.Value("kind")), NodeKind::File);

    auto path = node.Value("path");
    out.path = convert::IsBlank(path) ? JoinPath(list_path, out.name) : *path;

    if (out.kind == NodeKind::File) {
        out.size = convert::OptionalNonNegative(node.Value("size"));
    }

    if (const auto* commit = node.Find("commit")) {
        out.revision = convert::NonNegativeOr(commit->Value("revision"));
        out.author = convert::StringOr(commit->Value("author"));
        out.date = convert::StringOr(commit->Value("date"));
    }
    return out;
}

} // anonymous namespace

Result<ListResult, Error> ParseListXml(std::string_view xml) {
    if (convert::Trim(xml).empty()) {
        return Result<ListResult, Error>::Ok(ListResult{});
    }

    auto tree = ParseXmlTree(xml, kOperation);
    if (tree.IsErr()) {
        return Result<ListResult, Error>::Err(std::move(tree).Error());
    }
    const auto& root = tree.Value();

    std::vector<const XmlNode*> lists;
    if (root.Name() == "list") {
        lists.push_back(&root);
    } else {
        lists = root.FindAll("list");
    }

    ListResult result;
    for (const auto* list : lists) {
        const auto list_path = convert::StringOr(list->Value("path"));
        if (result.path.empty()) {
            result.path = list_path;
        }
        for (const auto* entry : list->FindAll("entry")) {
            result.entries.push_back(ParseEntry(*entry, list_path));
        }
    }
    return Result<ListResult, Error>::Ok(std::move(result));
}

} // namespace svn_bridge
