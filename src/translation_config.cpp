#include "translation_config.hpp"

#include "json_document.hpp"
#include "parse_error.hpp"
#include "text_utils.hpp"

#include <cctype>
#include <sstream>

#include <nlohmann/json.hpp>
#include <pugixml.hpp>

namespace transtree {
namespace {

constexpr const char* kXmlLocaleTag = "locale";
constexpr const char* kXmlNameAttr = "name";

std::string to_upper_ascii(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

void apply_text_processing_mode(TranslationConfiguration& config, const std::string& value) {
    if (value.empty()) {
        return;
    }
    const auto format = text_format_from_string(value);
    if (!format) {
        throw ConfigError("Unknown text processing mode '" + value + "'");
    }
    config.text_format = *format;
}

}  // namespace

void add_translation_reference(TranslationConfiguration& config, const std::string& raw_locale, const std::string& file) {
    std::string locale = trim(raw_locale);
    if (locale.empty()) {
        throw ConfigError("Empty locale name specified in the list of translations");
    }
    locale = locale == kConfigTranslationAsterisk ? std::string(kConfigTranslationDefault) : to_upper_ascii(locale);

    if (!config.translations.emplace(locale, trim(file)).second) {
        throw ConfigError("Duplicate translation reference '" + trim(raw_locale) + "' specified in the list of translations");
    }
}

bool apply_configuration_setting(TranslationConfiguration& config, const std::string& key, const std::string& value) {
    if (iequals(key, kConfigDefaultFile)) {
        config.default_file = value;
    } else if (iequals(key, kConfigDefaultLocale)) {
        config.default_locale = value;
    } else if (iequals(key, kConfigGeneratedNamespace)) {
        config.generated_namespace = value;
    } else if (iequals(key, kConfigGeneratedClass)) {
        config.generated_class = value;
    } else if (iequals(key, kConfigTextProcessingMode)) {
        apply_text_processing_mode(config, value);
    } else {
        return false;
    }
    return true;
}

TranslationConfiguration parse_ini_configuration(const std::string& content) {
    TranslationConfiguration config;

    const std::string translations_prefix = std::string(kConfigTranslations) + ".";
    std::string section;
    std::istringstream in(content);
    std::string raw_line;
    std::size_t line_number = 0;
    std::size_t offset = 0;

    while (std::getline(in, raw_line)) {
        ++line_number;
        const std::size_t line_offset = offset;
        offset += raw_line.size() + 1;

        const std::string line = trim(raw_line);
        if (line.empty() || line.front() == ';' || line.front() == '#') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                throw TextParseError(
                    "Unterminated section header on line " + std::to_string(line_number),
                    line_offset, offset, line_number, 1
                );
            }
            section = to_lower_ascii(trim(line.substr(1, line.size() - 2)));
            continue;
        }

        const auto sep = line.find_first_of("=:");
        if (sep == std::string::npos || sep == 0) {
            throw TextParseError(
                "Expected 'key = value' on line " + std::to_string(line_number),
                line_offset, offset, line_number, 1
            );
        }

        const std::string key = trim(line.substr(0, sep));
        const std::string value = unquote(trim(line.substr(sep + 1)));

        if (section == kConfigTranslations) {
            add_translation_reference(config, key, value);
        } else if (section.empty()) {
            if (key.size() > translations_prefix.size() &&
                iequals(key.substr(0, translations_prefix.size()), translations_prefix)) {
                add_translation_reference(config, key.substr(translations_prefix.size()), value);
            } else {
                apply_configuration_setting(config, key, value);
            }
        }
    }

    return config;
}

TranslationConfiguration parse_json_configuration(const std::string& content) {
    const nlohmann::ordered_json root = decode_json_document(content);
    if (!root.is_object()) {
        throw ConfigError("The configuration file has no root object");
    }

    TranslationConfiguration config;

    for (const auto& [key, value] : root.items()) {
        if (value.is_string()) {
            apply_configuration_setting(config, trim(key), trim(value.get<std::string>()));
            continue;
        }

        if (iequals(trim(key), kConfigTranslations)) {
            if (!value.is_object()) {
                throw ConfigError("The '" + std::string(kConfigTranslations) + "' section must be an object");
            }
            for (const auto& [locale, file] : value.items()) {
                if (!file.is_string()) {
                    throw ConfigError("Translation reference '" + locale + "' is not a string");
                }
                add_translation_reference(config, locale, file.get<std::string>());
            }
        }
    }

    return config;
}

TranslationConfiguration parse_xml_configuration(const std::string& content) {
    pugi::xml_document doc;
    const pugi::xml_parse_result parse = doc.load_buffer(content.data(), content.size(), pugi::parse_default);
    if (!parse) {
        const auto offset = static_cast<std::size_t>(parse.offset);
        const TextPosition pos = position_at(content, offset);
        throw TextParseError(parse.description(), offset, offset, pos.line, pos.column);
    }

    const auto root = doc.document_element();
    if (!root) {
        throw ConfigError("The configuration file has no XML root node");
    }

    TranslationConfiguration config;

    for (const char* key : {kConfigDefaultFile, kConfigDefaultLocale, kConfigGeneratedNamespace,
                            kConfigGeneratedClass, kConfigTextProcessingMode}) {
        if (const auto node = root.child(key)) {
            apply_configuration_setting(config, key, trim(node.child_value()));
        }
    }

    if (const auto translations = root.child(kConfigTranslations)) {
        for (const auto& item : translations.children()) {
            if (item.type() != pugi::node_element) {
                continue;
            }
            if (!iequals(item.name(), kXmlLocaleTag)) {
                throw ConfigError(
                    "Unexpected '" + std::string(item.name()) + "' tag in the '" + kConfigTranslations + "' section"
                );
            }
            const auto name = item.attribute(kXmlNameAttr);
            if (!name || trim(name.value()).empty()) {
                throw ConfigError(
                    std::string("The '") + kXmlNameAttr + "' attribute is missing from the '" + kXmlLocaleTag + "' node"
                );
            }
            add_translation_reference(config, name.value(), item.child_value());
        }
    }

    return config;
}

void validate_configuration(const TranslationConfiguration& config) {
    if (config.default_file.empty()) {
        throw ConfigError(
            "No reference to a default translation file is present in the configuration file. "
            "The reference must be specified as a '" + std::string(kConfigDefaultFile) + "' setting."
        );
    }

    if (config.generated_namespace && !config.generated_namespace->empty() &&
        !is_identifier_with_dots(*config.generated_namespace)) {
        throw ConfigError(
            "The provided namespace name '" + *config.generated_namespace +
            "' is not a valid identifier suitable for a namespace name."
        );
    }

    if (config.generated_class && !config.generated_class->empty() && !is_identifier(*config.generated_class)) {
        throw ConfigError(
            "The provided class name '" + *config.generated_class +
            "' is not a valid identifier suitable for a class name."
        );
    }
}

}  // namespace transtree
