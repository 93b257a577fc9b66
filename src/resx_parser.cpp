#include "resx_parser.hpp"

#include "parse_error.hpp"
#include "text_utils.hpp"

#include <cstring>

namespace transtree {
namespace {

constexpr const char* kStringType = "System.String";

bool is_string_resource(const pugi::xml_node& data) {
    const auto type = data.attribute("type");
    if (!type) {
        return true;
    }
    // "System.String, mscorlib, ..." style type names are accepted by prefix
    const std::string_view name(type.value());
    return std::string_view(kStringType).starts_with(name) || name.starts_with(kStringType);
}

bool has_preserve_attr(const pugi::xml_node& data) {
    return std::strcmp(data.attribute("xml:space").value(), "preserve") == 0;
}

struct ResxItem {
    std::string key;
    std::string value;
    std::string comment;
};

// Calls fn for every string <data> element that has a name and a <value>.
template <typename Fn>
void for_each_string_item(const pugi::xml_node& root, Fn&& fn) {
    for (const auto& data : root.children("data")) {
        if (!is_string_resource(data)) {
            continue;
        }

        ResxItem item;
        item.key = trim(data.attribute("name").value());
        if (item.key.empty()) {
            continue;
        }

        const auto value = data.child("value");
        if (!value) {
            continue;
        }
        item.value = value.child_value();
        if (!has_preserve_attr(data)) {
            item.value = trim(item.value);
        }
        item.comment = trim(data.child("comment").child_value());

        fn(item);
    }
}

}  // namespace

bool ResxParser::can_handle_extension(std::string_view extension) const {
    return iequals(extension, ".resx");
}

void ResxParser::load_document(const std::string& content, pugi::xml_document& doc) {
    const pugi::xml_parse_result parse =
        doc.load_buffer(content.data(), content.size(), pugi::parse_default | pugi::parse_ws_pcdata);
    if (!parse) {
        const auto offset = static_cast<std::size_t>(parse.offset);
        const TextPosition pos = position_at(content, offset);
        throw TextParseError(parse.description(), offset, offset, pos.line, pos.column);
    }

    if (!doc.document_element()) {
        throw ParserError("The translation file has no XML root node.");
    }
}

std::optional<Translation> ResxParser::load_translation(const std::string& content, const std::string& /*locale*/) const {
    if (trim(content).empty()) {
        return std::nullopt;
    }

    pugi::xml_document doc;
    load_document(content, doc);

    Translation translation;
    for_each_string_item(doc.document_element(), [&](const ResxItem& item) {
        TranslationEntry entry = is_reference(item.value)
            ? TranslationEntry::reference_to(trim(item.value.substr(1)))
            : TranslationEntry::literal(item.value);
        if (!entry.is_reference()) {
            entry.templated = is_templated_text(item.value);
        }
        if (!item.comment.empty()) {
            entry.description = item.comment;
        }
        translation.add(item.key, std::move(entry));
    });

    return translation;
}

TranslationTree ResxParser::load_structure(const std::string& content) const {
    pugi::xml_document doc;
    load_document(content, doc);

    TranslationTree tree;
    for_each_string_item(doc.document_element(), [&](const ResxItem& item) {
        tree.add_entry(item.key, !is_reference(item.value) && is_templated_text(item.value));
    });
    return tree;
}

TranslationConfiguration ResxParser::parse_configuration(const std::string& content) const {
    return parse_xml_configuration(content);
}

}  // namespace transtree
