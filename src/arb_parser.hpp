#pragma once

#include "json_parser.hpp"

namespace transtree {

// Application Resource Bundle: JSON with '@@' file metadata and '@key' entry attributes.
class ArbParser final : public JsonParserBase {
public:
    using JsonParserBase::JsonParserBase;

    bool can_handle_extension(std::string_view extension) const override;

protected:
    TextFormat default_text_format() const override { return TextFormat::Arb; }
    Translation load_document(const nlohmann::ordered_json& root) const override;

    std::optional<bool> should_skip_string_property(const std::string& key) const override;
    std::optional<bool> should_skip_object_property(const std::string& key) const override;
    // "key@target" is stored under "key".
    std::string leaf_name(const std::string& key) const override;

private:
    void load_entries(const nlohmann::ordered_json& object, Translation& translation, const std::string& group) const;
    void load_string_properties(const nlohmann::ordered_json& object, Translation& translation, const std::string& group) const;
    void load_object_properties(const nlohmann::ordered_json& object, Translation& translation, const std::string& group) const;
};

}  // namespace transtree
