#pragma once

#include "placeholder.hpp"

#include <map>
#include <optional>
#include <string>

namespace transtree {

inline constexpr const char* kConfigDefaultFile = "default_file";
inline constexpr const char* kConfigDefaultLocale = "default_locale";
inline constexpr const char* kConfigGeneratedNamespace = "generated_namespace";
inline constexpr const char* kConfigGeneratedClass = "generated_class";
inline constexpr const char* kConfigTextProcessingMode = "text_processing_mode";
inline constexpr const char* kConfigTranslations = "translations";
inline constexpr const char* kConfigTranslationAsterisk = "*";
inline constexpr const char* kConfigTranslationDefault = "default";

// Describes a set of translation files: the default file and the per-locale ones.
struct TranslationConfiguration {
    std::string default_file;
    std::optional<std::string> default_locale;
    std::optional<std::string> generated_namespace;
    std::optional<std::string> generated_class;
    // Set only when the file names a text processing mode.
    std::optional<TextFormat> text_format;
    // Upper-cased locale name (or "default") -> file name.
    std::map<std::string, std::string> translations;
    // Directory of the configuration file, used to resolve relative file names.
    std::string directory_hint;
};

// Adds a locale -> file reference; "*" names the default file. Throws ConfigError
// for an empty or duplicate locale.
void add_translation_reference(TranslationConfiguration& config, const std::string& raw_locale, const std::string& file);

// Returns false for keys that are not part of the configuration.
bool apply_configuration_setting(TranslationConfiguration& config, const std::string& key, const std::string& value);

// Each parser throws ConfigError (or TextParseError for syntax errors) on bad input.
TranslationConfiguration parse_ini_configuration(const std::string& content);
TranslationConfiguration parse_json_configuration(const std::string& content);
TranslationConfiguration parse_xml_configuration(const std::string& content);

void validate_configuration(const TranslationConfiguration& config);

}  // namespace transtree
