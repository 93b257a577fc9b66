#include "json_parser.hpp"

#include "json_document.hpp"
#include "parse_error.hpp"
#include "text_utils.hpp"

namespace transtree {

nlohmann::ordered_json JsonParserBase::parse_document(const std::string& content) {
    nlohmann::ordered_json root = decode_json_document(content);
    if (!root.is_object()) {
        throw ParserError("The translation file has no root object");
    }
    return root;
}

std::optional<Translation> JsonParserBase::load_translation(const std::string& content, const std::string& /*locale*/) const {
    if (trim(content).empty()) {
        return std::nullopt;
    }
    return load_document(parse_document(content));
}

TranslationTree JsonParserBase::load_structure(const std::string& content) const {
    TranslationTree tree;
    load_tree_node(parse_document(content), tree.root());
    return tree;
}

TranslationConfiguration JsonParserBase::parse_configuration(const std::string& content) const {
    return parse_json_configuration(content);
}

std::optional<bool> JsonParserBase::should_skip_string_property(const std::string& key) const {
    if (key.empty()) {
        return std::nullopt;
    }
    return false;
}

std::optional<bool> JsonParserBase::should_skip_object_property(const std::string& key) const {
    if (key.empty()) {
        return std::nullopt;
    }
    return false;
}

std::string JsonParserBase::leaf_name(const std::string& key) const {
    return key;
}

std::string JsonParserBase::qualify(const std::string& group, const std::string& name) {
    return group.empty() ? name : group + "." + name;
}

void JsonParserBase::load_tree_node(const nlohmann::ordered_json& object, TreeNode& node) const {
    for (const auto& [raw_key, value] : object.items()) {
        if (!value.is_string()) {
            continue;
        }

        const std::string key = trim(raw_key);
        const auto skip = should_skip_string_property(key);
        if (!skip) {
            throw ParserError("Invalid key '" + key + "' encountered");
        }
        if (*skip) {
            continue;
        }

        const auto& text = value.get_ref<const std::string&>();
        const std::string name = leaf_name(key);
        if (!node.add_leaf(name, !is_reference(text) && is_templated_text(text))) {
            throw DuplicateKeyError(name);
        }
    }

    for (const auto& [raw_name, value] : object.items()) {
        if (!value.is_object()) {
            continue;
        }

        const std::string name = trim(raw_name);
        const auto skip = should_skip_object_property(name);
        if (!skip) {
            throw ParserError("Invalid group '" + name + "' encountered");
        }
        if (*skip) {
            continue;
        }

        if (node.find_node(name) != nullptr) {
            throw ParserError("Duplicate group name '" + name + "' specified");
        }

        TreeNode* child = node.make_node(name);
        if (child == nullptr) {
            throw ParserError("Group '" + name + "' could not be used to build a tree of translation entries");
        }
        load_tree_node(value, *child);
    }
}

bool JsonParser::can_handle_extension(std::string_view extension) const {
    return iequals(extension, ".json");
}

Translation JsonParser::load_document(const nlohmann::ordered_json& root) const {
    Translation translation;
    load_entries(root, translation, std::string());
    return translation;
}

void JsonParser::load_entries(const nlohmann::ordered_json& object, Translation& translation, const std::string& group) const {
    for (const auto& [raw_key, value] : object.items()) {
        if (!value.is_string()) {
            continue;
        }

        const std::string name = trim(raw_key);
        if (!should_skip_string_property(name)) {
            throw ParserError("Invalid key '" + name + "' encountered");
        }

        const std::string key = qualify(group, name);
        const auto& text = value.get_ref<const std::string&>();

        if (is_reference(text)) {
            translation.add(key, TranslationEntry::reference_to(text.substr(1)));
            continue;
        }

        auto& entry = translation.add(key, TranslationEntry::literal(text));
        entry.templated = is_templated_text(text);
    }

    for (const auto& [raw_name, value] : object.items()) {
        if (!value.is_object()) {
            continue;
        }

        const std::string name = trim(raw_name);
        if (!should_skip_object_property(name)) {
            throw ParserError("Invalid group '" + name + "' encountered");
        }
        load_entries(value, translation, qualify(group, name));
    }
}

}  // namespace transtree
