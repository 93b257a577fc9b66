#pragma once

#include "translation_parser.hpp"

#include <pugixml.hpp>

namespace transtree {

// .NET XML resource files: <data name="key"><value>text</value></data> under the root.
class ResxParser final : public TranslationParser {
public:
    using TranslationParser::TranslationParser;

    bool can_handle_extension(std::string_view extension) const override;

    std::optional<Translation> load_translation(const std::string& content, const std::string& locale) const override;
    TranslationTree load_structure(const std::string& content) const override;
    TranslationConfiguration parse_configuration(const std::string& content) const override;

protected:
    TextFormat default_text_format() const override { return TextFormat::DotNet; }

private:
    static void load_document(const std::string& content, pugi::xml_document& doc);
};

}  // namespace transtree
