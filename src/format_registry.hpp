#pragma once

#include "translation_parser.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace transtree {

using ParserFactory = std::function<std::unique_ptr<TranslationParser>(const ParserSettings&)>;

// Maps file extensions to parser factories, separately for translation files and
// configuration files. Extensions are matched case-insensitively.
class FormatRegistry {
public:
    // Process-wide instance. It starts empty: call register_builtin_formats() during
    // startup and clear() at teardown.
    static FormatRegistry& global();

    // The first registration of an extension wins; returns false if it was already taken.
    bool register_parser(const std::string& extension, ParserFactory factory);
    bool register_config_parser(const std::string& extension, ParserFactory factory);

    // nullptr when no parser is registered for the extension.
    std::unique_ptr<TranslationParser> create_parser(std::string_view extension, const ParserSettings& settings) const;
    std::unique_ptr<TranslationParser> create_config_parser(std::string_view extension, const ParserSettings& settings) const;

    std::vector<std::string> supported_extensions() const;
    bool supports(std::string_view extension) const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, ParserFactory> parsers_;
    std::map<std::string, ParserFactory> config_parsers_;
};

// Translation formats: .csv .tsv .json .arb .resx
// Configuration formats: .cfg .jsoncfg .arbcfg .resxcfg
void register_builtin_formats(FormatRegistry& registry);

}  // namespace transtree
