#pragma once

#include "translation_parser.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace transtree {

// Shared handling of JSON-based formats: document decoding, configuration and the key tree.
class JsonParserBase : public TranslationParser {
public:
    using TranslationParser::TranslationParser;

    std::optional<Translation> load_translation(const std::string& content, const std::string& locale) const override;
    TranslationTree load_structure(const std::string& content) const override;
    TranslationConfiguration parse_configuration(const std::string& content) const override;

    // Throws TextParseError with the decoder's position on malformed JSON and
    // DuplicateKeyError when an object repeats a member name.
    static nlohmann::ordered_json parse_document(const std::string& content);

protected:
    virtual Translation load_document(const nlohmann::ordered_json& root) const = 0;

    // nullopt rejects the name, true skips the property.
    virtual std::optional<bool> should_skip_string_property(const std::string& key) const;
    virtual std::optional<bool> should_skip_object_property(const std::string& key) const;

    // Name of the tree leaf for a string member.
    virtual std::string leaf_name(const std::string& key) const;

    static std::string qualify(const std::string& group, const std::string& name);

private:
    void load_tree_node(const nlohmann::ordered_json& object, TreeNode& node) const;
};

class JsonParser final : public JsonParserBase {
public:
    using JsonParserBase::JsonParserBase;

    bool can_handle_extension(std::string_view extension) const override;

    // Adds the string members of object (and, recursively, of its object members) to
    // translation under the group prefix. String members are registered before any
    // nested group is entered.
    void load_entries(const nlohmann::ordered_json& object, Translation& translation, const std::string& group) const;

protected:
    TextFormat default_text_format() const override { return TextFormat::DotNet; }
    Translation load_document(const nlohmann::ordered_json& root) const override;
};

}  // namespace transtree
