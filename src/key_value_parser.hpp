#pragma once

#include "parse_error.hpp"
#include "translation_parser.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace transtree {

struct TextMark {
    std::size_t offset = 0;
    std::size_t line = 1;
    std::size_t column = 1;
};

// Character cursor over a document that keeps line and column numbers current.
class TextCursor {
public:
    explicit TextCursor(const std::string& content) : content_(content) {}

    bool is_eof() const noexcept { return pos_ >= content_.size(); }
    char peek(std::size_t ahead = 0) const noexcept;
    char advance() noexcept;
    bool at(std::string_view token) const noexcept;
    void skip(std::size_t count) noexcept;

    // Spaces, tabs and carriage returns.
    void skip_blanks() noexcept;
    bool at_line_end() const noexcept;
    void skip_to_line_end() noexcept;

    TextMark mark() const noexcept { return {pos_, line_, column_}; }

    // Errors at the cursor, or spanning from an earlier mark to the cursor.
    TextParseError error(const std::string& message) const;
    TextParseError error(const std::string& message, const TextMark& from) const;

private:
    const std::string& content_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
};

// A value as read from the document. escaped_text is set when text was decoded from
// escape sequences and holds the value as written.
struct KeyValueText {
    std::string text;
    std::optional<std::string> escaped_text;
};

struct KeyValueItem {
    std::string section;
    std::string key;
    KeyValueText value;
    std::size_t line_number = 1;

    std::string qualified_key() const { return section.empty() ? key : section + "." + key; }
};

struct KeyValueDocument {
    std::vector<std::string> sections;
    std::vector<KeyValueItem> items;
};

// Base of the INI and TOML formats: "key = value" lines grouped by "[section]" headers.
// Sections become groups; keys may be dotted.
class KeyValueParser : public TranslationParser {
public:
    using TranslationParser::TranslationParser;

    std::optional<Translation> load_translation(const std::string& content, const std::string& locale) const override;
    TranslationTree load_structure(const std::string& content) const override;

    // Throws TextParseError on malformed lines, on empty or duplicate sections and
    // on keys repeated within the document (compared ignoring case).
    KeyValueDocument read_document(const std::string& content) const;

protected:
    TextFormat default_text_format() const override { return TextFormat::None; }

    virtual bool is_comment_start(char ch) const = 0;
    virtual bool is_separator(char ch) const = 0;
    virtual std::string read_key(TextCursor& cursor) const = 0;
    // Called with the cursor on the first non-blank character after the separator.
    virtual KeyValueText read_value(TextCursor& cursor) const = 0;

    virtual TranslationEntry make_value_entry(const KeyValueText& value) const;

    static bool is_key_char(char ch) noexcept;

private:
    std::string read_section(TextCursor& cursor) const;
    void finish_line(TextCursor& cursor) const;
    TranslationEntry make_entry(const KeyValueText& value) const;
};

// ';' or '#' comments, '=' or ':' separators, the rest of the line is the value.
// A value wrapped in matching quotes loses them.
class IniParser final : public KeyValueParser {
public:
    using KeyValueParser::KeyValueParser;

    bool can_handle_extension(std::string_view extension) const override;
    TranslationConfiguration parse_configuration(const std::string& content) const override;

protected:
    bool is_comment_start(char ch) const override { return ch == ';' || ch == '#'; }
    bool is_separator(char ch) const override { return ch == '=' || ch == ':'; }
    std::string read_key(TextCursor& cursor) const override;
    KeyValueText read_value(TextCursor& cursor) const override;
};

// The string subset of TOML: bare or quoted keys, basic and literal strings, both
// single- and multi-line.
class TomlParser final : public KeyValueParser {
public:
    using KeyValueParser::KeyValueParser;

    bool can_handle_extension(std::string_view extension) const override;

    // Top-level settings plus a [translations] section.
    TranslationConfiguration parse_configuration(const std::string& content) const override;

protected:
    bool is_comment_start(char ch) const override { return ch == '#'; }
    bool is_separator(char ch) const override { return ch == '='; }
    std::string read_key(TextCursor& cursor) const override;
    KeyValueText read_value(TextCursor& cursor) const override;
    TranslationEntry make_value_entry(const KeyValueText& value) const override;

private:
    static KeyValueText read_basic_string(TextCursor& cursor);
    static KeyValueText read_multiline_basic_string(TextCursor& cursor);
    static KeyValueText read_literal_string(TextCursor& cursor);
    static KeyValueText read_multiline_literal_string(TextCursor& cursor);
};

}  // namespace transtree
