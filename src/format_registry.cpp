#include "format_registry.hpp"

#include "arb_parser.hpp"
#include "json_parser.hpp"
#include "key_value_parser.hpp"
#include "resx_parser.hpp"
#include "table_parser.hpp"
#include "text_utils.hpp"

namespace transtree {
namespace {

template <typename Parser>
ParserFactory make_factory() {
    return [](const ParserSettings& settings) -> std::unique_ptr<TranslationParser> {
        return std::make_unique<Parser>(settings);
    };
}

std::unique_ptr<TranslationParser> create_from(
    const std::map<std::string, ParserFactory>& factories,
    std::string_view extension,
    const ParserSettings& settings
) {
    if (extension.empty()) {
        return nullptr;
    }
    const auto it = factories.find(to_lower_ascii(std::string(extension)));
    if (it == factories.end() || !it->second) {
        return nullptr;
    }
    return it->second(settings);
}

}  // namespace

FormatRegistry& FormatRegistry::global() {
    static FormatRegistry registry;
    return registry;
}

bool FormatRegistry::register_parser(const std::string& extension, ParserFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    return parsers_.emplace(to_lower_ascii(extension), std::move(factory)).second;
}

bool FormatRegistry::register_config_parser(const std::string& extension, ParserFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_parsers_.emplace(to_lower_ascii(extension), std::move(factory)).second;
}

std::unique_ptr<TranslationParser> FormatRegistry::create_parser(std::string_view extension, const ParserSettings& settings) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return create_from(parsers_, extension, settings);
}

std::unique_ptr<TranslationParser> FormatRegistry::create_config_parser(std::string_view extension, const ParserSettings& settings) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return create_from(config_parsers_, extension, settings);
}

std::vector<std::string> FormatRegistry::supported_extensions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(parsers_.size());
    for (const auto& [extension, _] : parsers_) {
        out.push_back(extension);
    }
    return out;
}

bool FormatRegistry::supports(std::string_view extension) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parsers_.contains(to_lower_ascii(std::string(extension)));
}

void FormatRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    parsers_.clear();
    config_parsers_.clear();
}

void register_builtin_formats(FormatRegistry& registry) {
    registry.register_parser(".csv", make_factory<CsvParser>());
    registry.register_parser(".tsv", make_factory<TsvParser>());
    registry.register_parser(".json", make_factory<JsonParser>());
    registry.register_parser(".arb", make_factory<ArbParser>());
    registry.register_parser(".resx", make_factory<ResxParser>());
    registry.register_parser(".ini", make_factory<IniParser>());
    registry.register_parser(".toml", make_factory<TomlParser>());

    // table formats are configured through INI files
    registry.register_config_parser(".cfg", make_factory<IniParser>());
    registry.register_config_parser(".jsoncfg", make_factory<JsonParser>());
    registry.register_config_parser(".arbcfg", make_factory<ArbParser>());
    registry.register_config_parser(".resxcfg", make_factory<ResxParser>());
    registry.register_config_parser(".tomlcfg", make_factory<TomlParser>());
}

}  // namespace transtree
