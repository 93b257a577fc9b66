#include "key_value_parser.hpp"

#include "text_utils.hpp"

#include <cctype>
#include <unordered_set>
#include <utility>

namespace transtree {
namespace {

bool is_letter(char ch) {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

// "a..b", ".a" and "a." name a group with an empty name.
bool has_empty_segment(const std::string& path) {
    return path.front() == '.' || path.back() == '.' || path.find("..") != std::string::npos;
}

std::string quoted_char(char ch) {
    return std::string("'") + ch + "'";
}

void skip_first_newline(TextCursor& cursor) {
    if (cursor.peek() == '\n') {
        cursor.advance();
    } else if (cursor.peek() == '\r' && cursor.peek(1) == '\n') {
        cursor.skip(2);
    }
}

}  // namespace

// ============================================================================
// TextCursor
// ============================================================================

char TextCursor::peek(std::size_t ahead) const noexcept {
    return pos_ + ahead < content_.size() ? content_[pos_ + ahead] : '\0';
}

char TextCursor::advance() noexcept {
    if (is_eof()) {
        return '\0';
    }
    const char ch = content_[pos_++];
    if (ch == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return ch;
}

bool TextCursor::at(std::string_view token) const noexcept {
    return std::string_view(content_).substr(pos_).starts_with(token);
}

void TextCursor::skip(std::size_t count) noexcept {
    for (std::size_t i = 0; i < count && !is_eof(); ++i) {
        advance();
    }
}

void TextCursor::skip_blanks() noexcept {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
}

bool TextCursor::at_line_end() const noexcept {
    return is_eof() || peek() == '\n' || (peek() == '\r' && peek(1) == '\n');
}

void TextCursor::skip_to_line_end() noexcept {
    while (!is_eof() && peek() != '\n') {
        advance();
    }
}

TextParseError TextCursor::error(const std::string& message) const {
    return TextParseError(message, pos_, pos_, line_, column_);
}

TextParseError TextCursor::error(const std::string& message, const TextMark& from) const {
    return TextParseError(message, from.offset, pos_, from.line, from.column);
}

// ============================================================================
// KeyValueParser
// ============================================================================

bool KeyValueParser::is_key_char(char ch) noexcept {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '_' || ch == '-' || ch == '.';
}

KeyValueDocument KeyValueParser::read_document(const std::string& content) const {
    KeyValueDocument doc;
    std::unordered_set<std::string> seen_sections;
    std::unordered_set<std::string> seen_keys;
    std::string section;

    TextCursor cursor(content);

    while (true) {
        while (!cursor.is_eof() && std::isspace(static_cast<unsigned char>(cursor.peek()))) {
            cursor.advance();
        }
        if (cursor.is_eof()) {
            break;
        }

        if (is_comment_start(cursor.peek())) {
            cursor.skip_to_line_end();
            continue;
        }

        if (cursor.peek() == '[') {
            const TextMark from = cursor.mark();
            section = read_section(cursor);
            if (!seen_sections.insert(to_lower_ascii(section)).second) {
                throw cursor.error("Duplicate section name `" + section + "`", from);
            }
            doc.sections.push_back(section);
            finish_line(cursor);
            continue;
        }

        const TextMark key_mark = cursor.mark();
        KeyValueItem item;
        item.section = section;
        item.key = trim(read_key(cursor));
        item.line_number = key_mark.line;

        if (item.key.empty()) {
            throw cursor.error("Empty key detected on line " + std::to_string(key_mark.line), key_mark);
        }
        if (has_empty_segment(item.key)) {
            throw cursor.error("Key `" + item.key + "` contains an empty group name", key_mark);
        }

        cursor.skip_blanks();
        if (cursor.at_line_end()) {
            throw cursor.error("Line " + std::to_string(key_mark.line) + " does not contain a key/value pair", key_mark);
        }
        if (!is_separator(cursor.peek())) {
            throw cursor.error("Key-value separator expected, character " + quoted_char(cursor.peek()) + " found instead");
        }
        cursor.advance();
        cursor.skip_blanks();

        const std::string qualified = item.qualified_key();
        if (!seen_keys.insert(to_lower_ascii(qualified)).second) {
            throw cursor.error("Duplicate key `" + qualified + "`", key_mark);
        }

        item.value = read_value(cursor);
        finish_line(cursor);
        doc.items.push_back(std::move(item));
    }

    return doc;
}

std::string KeyValueParser::read_section(TextCursor& cursor) const {
    cursor.advance();  // '['
    const TextMark from = cursor.mark();

    std::string name;
    while (!cursor.is_eof() && is_key_char(cursor.peek())) {
        name += cursor.advance();
    }

    if (cursor.at_line_end()) {
        throw cursor.error("Unexpected end of line");
    }
    if (cursor.peek() != ']') {
        throw cursor.error("Character " + quoted_char(cursor.peek()) + " is not valid for a section name");
    }
    if (name.empty()) {
        throw cursor.error("A section name may not be empty", from);
    }
    if (name.front() != '_' && !is_letter(name.front())) {
        throw cursor.error("A section name may not start with " + quoted_char(name.front()), from);
    }
    if (has_empty_segment(name)) {
        throw cursor.error("Section name `" + name + "` contains an empty group name", from);
    }

    cursor.advance();  // ']'
    return name;
}

// Only blanks or a comment may follow a section header or a value.
void KeyValueParser::finish_line(TextCursor& cursor) const {
    cursor.skip_blanks();
    if (cursor.is_eof()) {
        return;
    }
    if (cursor.peek() == '\n') {
        cursor.advance();
        return;
    }
    if (is_comment_start(cursor.peek())) {
        cursor.skip_to_line_end();
        return;
    }
    throw cursor.error("Unexpected character " + quoted_char(cursor.peek()));
}

TranslationEntry KeyValueParser::make_value_entry(const KeyValueText& value) const {
    return make_literal_entry(value.text);
}

TranslationEntry KeyValueParser::make_entry(const KeyValueText& value) const {
    if (is_reference(value.text)) {
        return TranslationEntry::reference_to(trim(value.text.substr(1)));
    }
    return make_value_entry(value);
}

std::optional<Translation> KeyValueParser::load_translation(const std::string& content, const std::string& /*locale*/) const {
    if (trim(content).empty()) {
        return std::nullopt;
    }

    const KeyValueDocument doc = read_document(content);

    Translation translation;
    for (const auto& item : doc.items) {
        if (item.value.text.empty() && settings().treat_empty_values_as_absent) {
            continue;
        }
        translation.add(item.qualified_key(), make_entry(item.value));
    }
    return translation;
}

TranslationTree KeyValueParser::load_structure(const std::string& content) const {
    TranslationTree tree;
    if (trim(content).empty()) {
        return tree;
    }

    const KeyValueDocument doc = read_document(content);

    // sections without keys still show up as groups
    for (const auto& section : doc.sections) {
        if (tree.make_node(section) == nullptr) {
            throw ParserError("Section '" + section + "' could not be used to build a tree of translation entries");
        }
    }
    for (const auto& item : doc.items) {
        tree.add_entry(item.qualified_key(), make_entry(item.value).templated);
    }
    return tree;
}

// ============================================================================
// IniParser
// ============================================================================

bool IniParser::can_handle_extension(std::string_view extension) const {
    return iequals(extension, ".ini");
}

TranslationConfiguration IniParser::parse_configuration(const std::string& content) const {
    return parse_ini_configuration(content);
}

std::string IniParser::read_key(TextCursor& cursor) const {
    const char first = cursor.peek();
    if (first != '_' && !is_letter(first)) {
        throw cursor.error("Unexpected character " + quoted_char(first));
    }

    std::string key;
    while (!cursor.is_eof() && is_key_char(cursor.peek())) {
        key += cursor.advance();
    }
    return key;
}

KeyValueText IniParser::read_value(TextCursor& cursor) const {
    std::string raw;
    while (!cursor.is_eof() && cursor.peek() != '\n') {
        raw += cursor.advance();
    }

    std::string text = trim(raw);
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
        text = text.substr(1, text.size() - 2);
    }
    return KeyValueText{std::move(text), std::nullopt};
}

// ============================================================================
// TomlParser
// ============================================================================

bool TomlParser::can_handle_extension(std::string_view extension) const {
    return iequals(extension, ".toml");
}

TranslationConfiguration TomlParser::parse_configuration(const std::string& content) const {
    TranslationConfiguration config;
    if (trim(content).empty()) {
        return config;
    }

    const std::string translations_prefix = std::string(kConfigTranslations) + ".";

    for (const auto& item : read_document(content).items) {
        const std::string value = trim(item.value.text);

        if (iequals(item.section, kConfigTranslations)) {
            add_translation_reference(config, item.key, value);
        } else if (item.section.empty()) {
            if (item.key.size() > translations_prefix.size() &&
                iequals(item.key.substr(0, translations_prefix.size()), translations_prefix)) {
                add_translation_reference(config, item.key.substr(translations_prefix.size()), value);
            } else {
                apply_configuration_setting(config, item.key, value);
            }
        }
    }

    return config;
}

std::string TomlParser::read_key(TextCursor& cursor) const {
    if (cursor.peek() == '"') {
        cursor.advance();
        std::string key;
        while (cursor.peek() != '"') {
            if (cursor.is_eof()) {
                throw cursor.error("Unexpected end of file");
            }
            if (cursor.at_line_end()) {
                throw cursor.error("Unexpected end of line");
            }
            key += cursor.advance();
        }
        cursor.advance();
        return key;
    }

    const char first = cursor.peek();
    if (first != '_' && first != '-' && !is_letter(first)) {
        throw cursor.error("Unexpected character " + quoted_char(first));
    }

    std::string key;
    while (!cursor.is_eof() && is_key_char(cursor.peek())) {
        key += cursor.advance();
    }
    return key;
}

KeyValueText TomlParser::read_value(TextCursor& cursor) const {
    if (cursor.at(R"(""")")) {
        return read_multiline_basic_string(cursor);
    }
    if (cursor.peek() == '"') {
        return read_basic_string(cursor);
    }
    if (cursor.at("'''")) {
        return read_multiline_literal_string(cursor);
    }
    if (cursor.peek() == '\'') {
        return read_literal_string(cursor);
    }
    if (cursor.at_line_end()) {
        throw cursor.error("Unexpected end of line");
    }
    throw cursor.error("A string value expected, character " + quoted_char(cursor.peek()) + " found instead");
}

KeyValueText TomlParser::read_basic_string(TextCursor& cursor) {
    cursor.advance();

    std::string raw;
    while (true) {
        if (cursor.is_eof()) {
            throw cursor.error("Unexpected end of file");
        }
        if (cursor.at_line_end()) {
            throw cursor.error("Unexpected end of line");
        }

        const char ch = cursor.advance();
        if (ch == '"') {
            break;
        }
        raw += ch;

        if (ch == '\\') {
            if (cursor.is_eof()) {
                throw cursor.error("Unexpected end of file");
            }
            if (cursor.at_line_end()) {
                throw cursor.error("Unexpected end of line");
            }
            raw += cursor.advance();
        }
    }

    return KeyValueText{unescape_string(raw), raw};
}

KeyValueText TomlParser::read_multiline_basic_string(TextCursor& cursor) {
    cursor.skip(3);
    skip_first_newline(cursor);

    std::string raw;
    while (true) {
        if (cursor.is_eof()) {
            throw cursor.error("Unexpected end of file");
        }

        // quotes right before the closing delimiter belong to the text
        if (cursor.at(R"(""")") && cursor.peek(3) != '"') {
            cursor.skip(3);
            break;
        }

        const char ch = cursor.peek();
        if (ch == '\\') {
            std::size_t ahead = 1;
            while (cursor.peek(ahead) == ' ' || cursor.peek(ahead) == '\t' || cursor.peek(ahead) == '\r') {
                ++ahead;
            }
            if (cursor.peek(ahead) == '\n') {
                // line-ending backslash: drop the line break and the indentation after it
                cursor.skip(ahead);
                while (!cursor.is_eof() && std::isspace(static_cast<unsigned char>(cursor.peek()))) {
                    cursor.advance();
                }
                continue;
            }

            raw += cursor.advance();
            if (cursor.is_eof()) {
                throw cursor.error("Unexpected end of file");
            }
            raw += cursor.advance();
            continue;
        }

        if (ch == '\r' && cursor.peek(1) == '\n') {
            cursor.advance();
            continue;
        }
        raw += cursor.advance();
    }

    return KeyValueText{unescape_string(raw), raw};
}

KeyValueText TomlParser::read_literal_string(TextCursor& cursor) {
    cursor.advance();

    std::string text;
    while (cursor.peek() != '\'') {
        if (cursor.is_eof()) {
            throw cursor.error("Unexpected end of file");
        }
        if (cursor.at_line_end()) {
            throw cursor.error("Unexpected end of line");
        }
        text += cursor.advance();
    }
    cursor.advance();

    return KeyValueText{std::move(text), std::nullopt};
}

KeyValueText TomlParser::read_multiline_literal_string(TextCursor& cursor) {
    cursor.skip(3);
    skip_first_newline(cursor);

    std::string text;
    while (true) {
        if (cursor.is_eof()) {
            throw cursor.error("Unexpected end of file");
        }
        if (cursor.at("'''") && cursor.peek(3) != '\'') {
            cursor.skip(3);
            break;
        }
        if (cursor.peek() == '\r' && cursor.peek(1) == '\n') {
            cursor.advance();
            continue;
        }
        text += cursor.advance();
    }

    return KeyValueText{std::move(text), std::nullopt};
}

TranslationEntry TomlParser::make_value_entry(const KeyValueText& value) const {
    if (!value.escaped_text) {
        TranslationEntry entry = TranslationEntry::literal(value.text);
        entry.templated = is_templated_text(value.text);
        return entry;
    }

    TranslationEntry entry = TranslationEntry::literal(value.text, *value.escaped_text);
    entry.templated = is_templated_text(*value.escaped_text);
    return entry;
}

}  // namespace transtree
