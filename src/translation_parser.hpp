#pragma once

#include "placeholder.hpp"
#include "text_utils.hpp"
#include "translation.hpp"
#include "translation_config.hpp"
#include "translation_tree.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace transtree {

inline constexpr char kReferenceMarker = '@';

// Settings read once when a parser is created; a parser never sees later changes.
struct ParserSettings {
    // Overrides the format's own escaping convention when set.
    std::optional<TextFormat> text_format;
    char csv_separator = ',';
    bool tsv_expect_quotes = false;
    bool recognize_references = true;
    bool treat_empty_values_as_absent = false;
    std::string description_column_caption = "Description";
};

class TranslationParser {
public:
    explicit TranslationParser(ParserSettings settings) : settings_(std::move(settings)) {}
    virtual ~TranslationParser() = default;

    // Exact, case-insensitive match against the format's extension (with the leading dot).
    virtual bool can_handle_extension(std::string_view extension) const = 0;

    // Returns nullopt when the content holds no translation for the locale.
    // An empty locale selects the file's first (default) translation.
    virtual std::optional<Translation> load_translation(const std::string& content, const std::string& locale) const = 0;

    // Keys of the default translation arranged by dotted path.
    virtual TranslationTree load_structure(const std::string& content) const = 0;

    virtual TranslationConfiguration parse_configuration(const std::string& content) const = 0;

    TextFormat text_format() const { return settings_.text_format.value_or(default_text_format()); }
    const ParserSettings& settings() const noexcept { return settings_; }

protected:
    virtual TextFormat default_text_format() const = 0;

    bool is_reference(std::string_view value) const noexcept {
        return settings_.recognize_references && !value.empty() && value.front() == kReferenceMarker;
    }

    bool is_templated_text(std::string_view text) const noexcept {
        return string_has_parameters(text, text_format());
    }

    // In escaping modes the entry keeps the raw text beside the unescaped one;
    // classification always looks at the raw text.
    TranslationEntry make_literal_entry(const std::string& raw) const {
        const TextFormat format = text_format();
        TranslationEntry entry = format == TextFormat::BackslashEscaping || format == TextFormat::DotNet
            ? TranslationEntry::literal(unescape_string(raw), raw)
            : TranslationEntry::literal(raw);
        entry.templated = is_templated_text(raw);
        return entry;
    }

private:
    ParserSettings settings_;
};

}  // namespace transtree
