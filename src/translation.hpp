#pragma once

#include "placeholder.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace transtree {

struct LiteralText {
    std::string text;
    // Raw text as written in the source, kept when escapes were resolved.
    std::optional<std::string> escaped_text;

    bool operator==(const LiteralText&) const = default;
};

struct KeyReference {
    std::string key;

    bool operator==(const KeyReference&) const = default;
};

using EntryValue = std::variant<LiteralText, KeyReference>;

struct TranslationEntry {
    EntryValue value;
    bool templated = false;
    std::optional<std::string> target;

    std::optional<std::string> description;
    std::optional<std::string> type;
    std::optional<std::string> context;
    std::optional<std::string> source_text;
    std::optional<std::string> screen;
    std::optional<std::string> video;
    std::vector<Placeholder> placeholders;

    bool is_reference() const noexcept { return std::holds_alternative<KeyReference>(value); }
    const std::string* text() const noexcept;
    const std::string* escaped_text() const noexcept;
    const std::string* reference() const noexcept;

    static TranslationEntry literal(std::string text, std::optional<std::string> escaped_text = std::nullopt);
    static TranslationEntry reference_to(std::string key);
};

class Translation {
public:
    using Entries = std::map<std::string, TranslationEntry>;

    Translation() = default;
    explicit Translation(std::optional<std::string> locale, std::optional<std::string> context = std::nullopt);

    // Throws DuplicateKeyError when the key exists; the existing entry is left untouched.
    TranslationEntry& add(const std::string& key, TranslationEntry entry);

    const TranslationEntry* find(const std::string& key) const;
    TranslationEntry* find(const std::string& key);
    // Exact match first, then the first key equal to key ignoring ASCII case.
    TranslationEntry* find_ignoring_case(const std::string& key);
    bool contains(const std::string& key) const { return entries_.contains(key); }

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    const Entries& entries() const noexcept { return entries_; }

    std::optional<std::string> locale;
    std::optional<std::string> context;
    std::optional<std::string> author;
    std::optional<std::string> last_modified;
    std::map<std::string, std::string> custom_properties;
    std::string original_file;

private:
    Entries entries_;
};

// Same keys with the same text, reference and template flag.
bool same_content(const Translation& a, const Translation& b);

}  // namespace transtree
