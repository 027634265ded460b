#include <svn_bridge/svn/xml_tree.hpp>

#include <svn_bridge/core/convert.hpp>
#include <svn_bridge/core/log.hpp>

#include <tinyxml2.h>

#include <array>

namespace svn_bridge {

namespace {

constexpr std::array<std::string_view, 7> kCollectionElements = {
    "entry", "logentry", "path", "paths", "target", "list", "changelist",
};

// Concatenate every text/CDATA child; GetText() only sees the first one.
std::string CollectText(const tinyxml2::XMLElement* element) {
    std::string text;
    for (const auto* node = element->FirstChild(); node;
         node = node->NextSibling()) {
        if (const auto* t = node->ToText()) {
            if (t->Value()) text += t->Value();
        }
    }
    return std::string(convert::Trim(text));
}

XmlNode Convert(const tinyxml2::XMLElement* element) {
    XmlNode node(element->Name() ? element->Name() : "");
    node.SetText(CollectText(element));

    for (const auto* attr = element->FirstAttribute(); attr;
         attr = attr->Next()) {
        XmlNode field(attr->Name());
        field.SetText(attr->Value() ? attr->Value() : "");
        node.AddField(std::move(field));
    }

    for (const auto* child = element->FirstChildElement(); child;
         child = child->NextSiblingElement()) {
        if (!node.AddField(Convert(child))) {
            LogDebug("parser", std::string("collapsed repeated <") +
                                   child->Name() + "> under <" +
                                   node.Name() + ">");
        }
    }
    return node;
}

} // anonymous namespace

bool IsCollectionElement(std::string_view name) {
    for (auto candidate : kCollectionElements) {
        if (candidate == name) return true;
    }
    return false;
}

bool XmlNode::Has(std::string_view key) const {
    return fields_.find(key) != fields_.end();
}

const XmlNode* XmlNode::Find(std::string_view key) const {
    auto it = fields_.find(key);
    if (it == fields_.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second.front();
}

std::vector<const XmlNode*> XmlNode::FindAll(std::string_view key) const {
    std::vector<const XmlNode*> out;
    auto it = fields_.find(key);
    if (it == fields_.end()) {
        return out;
    }
    out.reserve(it->second.size());
    for (const auto& node : it->second) {
        out.push_back(&node);
    }
    return out;
}

std::optional<std::string> XmlNode::Value(std::string_view key) const {
    const auto* node = Find(key);
    if (!node) {
        return std::nullopt;
    }
    return node->Text();
}

std::optional<std::string> XmlNode::FirstNonEmpty(
    std::initializer_list<std::string_view> keys) const {
    for (auto key : keys) {
        auto value = Value(key);
        if (!convert::IsBlank(value)) {
            return value;
        }
    }
    return std::nullopt;
}

const XmlNode* XmlNode::Path(std::initializer_list<std::string_view> keys) const {
    const XmlNode* current = this;
    for (auto key : keys) {
        current = current->Find(key);
        if (!current) {
            return nullptr;
        }
    }
    return current;
}

bool XmlNode::AddField(XmlNode child) {
    auto& slot = fields_[child.Name()];
    if (!slot.empty() && !IsCollectionElement(child.Name())) {
        return false;
    }
    slot.push_back(std::move(child));
    return true;
}

Result<XmlNode, Error> ParseXmlTree(std::string_view xml,
                                    std::string_view operation) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        std::string cause;
        if (const char* err = doc.ErrorStr(); err != nullptr && *err != '\0') {
            cause = err;
        }
        if (const int line = doc.ErrorLineNum(); line > 0) {
            cause += " (line " + std::to_string(line) + ")";
        }
        return Result<XmlNode, Error>::Err(Error::ParseFailure(
            std::string(operation), "Malformed XML report",
            std::string(xml), std::move(cause)));
    }

    const auto* root = doc.RootElement();
    if (!root) {
        return Result<XmlNode, Error>::Err(Error::ParseFailure(
            std::string(operation), "XML report has no root element",
            std::string(xml)));
    }
    return Result<XmlNode, Error>::Ok(Convert(root));
}

} // namespace svn_bridge
