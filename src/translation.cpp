#include "translation.hpp"

#include "parse_error.hpp"
#include "text_utils.hpp"

#include <utility>

namespace transtree {

const std::string* TranslationEntry::text() const noexcept {
    if (const auto* literal = std::get_if<LiteralText>(&value)) {
        return &literal->text;
    }
    return nullptr;
}

const std::string* TranslationEntry::escaped_text() const noexcept {
    if (const auto* literal = std::get_if<LiteralText>(&value); literal != nullptr && literal->escaped_text) {
        return &*literal->escaped_text;
    }
    return nullptr;
}

const std::string* TranslationEntry::reference() const noexcept {
    if (const auto* ref = std::get_if<KeyReference>(&value)) {
        return &ref->key;
    }
    return nullptr;
}

TranslationEntry TranslationEntry::literal(std::string text, std::optional<std::string> escaped_text) {
    TranslationEntry entry;
    entry.value = LiteralText{std::move(text), std::move(escaped_text)};
    return entry;
}

TranslationEntry TranslationEntry::reference_to(std::string key) {
    TranslationEntry entry;
    entry.value = KeyReference{std::move(key)};
    return entry;
}

Translation::Translation(std::optional<std::string> locale, std::optional<std::string> context)
    : locale(std::move(locale)), context(std::move(context)) {}

TranslationEntry& Translation::add(const std::string& key, TranslationEntry entry) {
    auto [it, inserted] = entries_.try_emplace(key, std::move(entry));
    if (!inserted) {
        throw DuplicateKeyError(key);
    }
    return it->second;
}

const TranslationEntry* Translation::find(const std::string& key) const {
    const auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

TranslationEntry* Translation::find(const std::string& key) {
    const auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

TranslationEntry* Translation::find_ignoring_case(const std::string& key) {
    if (auto* entry = find(key)) {
        return entry;
    }
    for (auto& [name, entry] : entries_) {
        if (iequals(name, key)) {
            return &entry;
        }
    }
    return nullptr;
}

bool same_content(const Translation& a, const Translation& b) {
    if (a.size() != b.size()) {
        return false;
    }
    auto it_a = a.entries().begin();
    auto it_b = b.entries().begin();
    for (; it_a != a.entries().end(); ++it_a, ++it_b) {
        if (it_a->first != it_b->first) {
            return false;
        }
        if (it_a->second.value != it_b->second.value || it_a->second.templated != it_b->second.templated) {
            return false;
        }
    }
    return true;
}

}  // namespace transtree
