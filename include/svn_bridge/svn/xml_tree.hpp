#pragma once

#include <svn_bridge/core/result.hpp>

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace svn_bridge {

// ---------------------------------------------------------------------------
// XmlNode — normalized view of one XML element.
//
// Attributes and child elements live in the same field map, so extractors
// never care whether svn wrote <commit revision="5"> or
// <commit><revision>5</revision></commit>.
//
// Collection names (see IsCollectionElement) keep every occurrence, in
// document order, whether the report had one item or many. Any other name
// keeps its first occurrence only; attributes are inserted before child
// elements and therefore win over a same-named child.
// ---------------------------------------------------------------------------
class XmlNode {
public:
    XmlNode() = default;
    explicit XmlNode(std::string name) : name_(std::move(name)) {}

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

    /// Trimmed text content of the element (empty for attributes-only nodes;
    /// for attribute fields this is the attribute value).
    [[nodiscard]] const std::string& Text() const noexcept { return text_; }

    [[nodiscard]] bool Has(std::string_view key) const;

    /// First field with the given name, or nullptr.
    [[nodiscard]] const XmlNode* Find(std::string_view key) const;

    /// All fields with the given name (empty when absent). For collection
    /// names this is every occurrence; for others at most one.
    [[nodiscard]] std::vector<const XmlNode*> FindAll(std::string_view key) const;

    /// Text of the first field with the given name; nullopt when absent.
    [[nodiscard]] std::optional<std::string> Value(std::string_view key) const;

    /// Text of the first of the keys that is present and not blank.
    [[nodiscard]] std::optional<std::string> FirstNonEmpty(
        std::initializer_list<std::string_view> keys) const;

    /// Follow a chain of names through first occurrences, e.g.
    /// node.Path({"wc-info", "wcroot-abspath"}).
    [[nodiscard]] const XmlNode* Path(std::initializer_list<std::string_view> keys) const;

    // -- Building (used by ParseXmlTree) ----------------------------------

    void SetText(std::string text) { text_ = std::move(text); }

    /// Adds a field, honouring the collection/scalar rule. Returns false if
    /// a scalar field of that name already existed and the node was dropped.
    bool AddField(XmlNode child);

private:
    std::string name_;
    std::string text_;
    std::map<std::string, std::vector<XmlNode>, std::less<>> fields_;
};

/// Element names that are always represented as lists:
/// entry, logentry, path, paths, target, list, changelist.
bool IsCollectionElement(std::string_view name);

/// Parse raw XML into a normalized tree rooted at the document element.
/// Malformed XML → ErrorCategory::Parse with the raw text attached and the
/// parser diagnostic as cause. No repair is attempted.
[[nodiscard]] Result<XmlNode, Error> ParseXmlTree(std::string_view xml,
                                                  std::string_view operation);

} // namespace svn_bridge
