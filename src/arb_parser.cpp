#include "arb_parser.hpp"

#include "parse_error.hpp"
#include "text_utils.hpp"

namespace transtree {
namespace {

constexpr const char* kArbLocale = "@@locale";
constexpr const char* kArbContext = "@@context";
constexpr const char* kArbLastModified = "@@last_modified";
constexpr const char* kArbAuthor = "@@author";
constexpr const char* kArbCustomPrefix = "@@x-";

constexpr const char* kArbDescription = "description";
constexpr const char* kArbType = "type";
constexpr const char* kArbEntryContext = "context";
constexpr const char* kArbSourceText = "source_text";
constexpr const char* kArbScreen = "screen";
constexpr const char* kArbVideo = "video";
constexpr const char* kArbPlaceholders = "placeholders";

std::optional<std::string> string_member(const nlohmann::ordered_json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return trim(it->get<std::string>());
}

void apply_entry_attributes(TranslationEntry& entry, const nlohmann::ordered_json& attributes) {
    for (const auto& [raw_name, value] : attributes.items()) {
        const std::string name = trim(raw_name);

        if (value.is_string()) {
            const auto& text = value.get_ref<const std::string&>();
            if (iequals(name, kArbDescription)) {
                entry.description = text;
            } else if (iequals(name, kArbType)) {
                entry.type = text;
            } else if (iequals(name, kArbEntryContext)) {
                entry.context = text;
            } else if (iequals(name, kArbSourceText)) {
                entry.source_text = text;
            } else if (iequals(name, kArbScreen)) {
                entry.screen = text;
            } else if (iequals(name, kArbVideo)) {
                entry.video = text;
            }
        } else if (value.is_object() && iequals(name, kArbPlaceholders)) {
            for (const auto& [placeholder_name, definition] : value.items()) {
                if (definition.is_object()) {
                    entry.placeholders.push_back(parse_placeholder(trim(placeholder_name), definition));
                }
            }
        }
    }
}

// Position of the '@' starting a "key@target" suffix, or npos when there is none.
std::size_t target_separator(const std::string& key) {
    const auto at = key.find('@');
    if (at == std::string::npos || at == 0 || at + 1 >= key.size()) {
        return std::string::npos;
    }
    return at;
}

}  // namespace

bool ArbParser::can_handle_extension(std::string_view extension) const {
    return iequals(extension, ".arb");
}

std::optional<bool> ArbParser::should_skip_string_property(const std::string& key) const {
    if (key.empty()) {
        return std::nullopt;
    }
    return key.front() == '@';
}

std::optional<bool> ArbParser::should_skip_object_property(const std::string& key) const {
    if (key.empty()) {
        return std::nullopt;
    }
    return key.front() == '@';
}

std::string ArbParser::leaf_name(const std::string& key) const {
    const auto at = target_separator(key);
    return at == std::string::npos ? key : key.substr(0, at);
}

Translation ArbParser::load_document(const nlohmann::ordered_json& root) const {
    Translation translation(string_member(root, kArbLocale), string_member(root, kArbContext));
    translation.author = string_member(root, kArbAuthor);
    translation.last_modified = string_member(root, kArbLastModified);

    load_entries(root, translation, std::string());
    return translation;
}

void ArbParser::load_entries(const nlohmann::ordered_json& object, Translation& translation, const std::string& group) const {
    load_string_properties(object, translation, group);
    load_object_properties(object, translation, group);
}

void ArbParser::load_string_properties(const nlohmann::ordered_json& object, Translation& translation, const std::string& group) const {
    const std::string custom_prefix(kArbCustomPrefix);

    for (const auto& [raw_key, value] : object.items()) {
        if (!value.is_string()) {
            continue;
        }

        std::string key = trim(raw_key);
        const auto& text = value.get_ref<const std::string&>();

        if (key.size() > custom_prefix.size() && key.starts_with(custom_prefix)) {
            translation.custom_properties[key.substr(custom_prefix.size())] = text;
            continue;
        }
        if (key.empty()) {
            throw ParserError("Invalid key '' encountered");
        }

        if (key.front() == '@') {
            continue;
        }

        std::optional<std::string> target;
        if (const auto at = target_separator(key); at != std::string::npos) {
            target = key.substr(at + 1);
            key.resize(at);
        }

        key = qualify(group, key);

        TranslationEntry entry;
        if (is_reference(text)) {
            entry = TranslationEntry::reference_to(trim(text.substr(1)));
        } else {
            entry = make_literal_entry(text);
        }
        entry.target = std::move(target);

        translation.add(key, std::move(entry));
    }
}

void ArbParser::load_object_properties(const nlohmann::ordered_json& object, Translation& translation, const std::string& group) const {
    for (const auto& [raw_name, value] : object.items()) {
        if (!value.is_object()) {
            continue;
        }

        const std::string name = trim(raw_name);
        if (name.empty()) {
            throw ParserError("Invalid group '' encountered");
        }

        if (name.front() != '@') {
            load_entries(value, translation, qualify(group, name));
            continue;
        }

        if (name.size() == 1) {
            continue;
        }

        // attributes of an entry registered by the string pass above
        if (auto* entry = translation.find_ignoring_case(qualify(group, name.substr(1)))) {
            apply_entry_attributes(*entry, value);
        }
    }
}

}  // namespace transtree
