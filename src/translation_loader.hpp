#pragma once

#include "format_registry.hpp"
#include "translation.hpp"
#include "translation_config.hpp"
#include "translation_tree.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <string>

namespace transtree {

struct LoadOptions {
    ParserSettings settings;
    // Locale column for table formats; empty selects the default translation.
    std::string locale;
    bool build_tree = false;
};

struct TranslationDocument {
    std::filesystem::path source_path;
    Translation translation;
    // Present when LoadOptions::build_tree was set.
    std::optional<TranslationTree> tree;
};

// Reads and parses one translation file with the parser registered for its extension.
bool read_translation_file(
    const std::filesystem::path& path,
    const LoadOptions& options,
    const FormatRegistry& registry,
    TranslationDocument& out_doc,
    std::string& error
);

// Parses a configuration file, then builds the key tree of the default translation
// file it names. Relative file names resolve against base_directory, or against the
// configuration file's directory when base_directory is empty.
bool load_translation_structure(
    const std::filesystem::path& config_file,
    const std::filesystem::path& base_directory,
    const ParserSettings& settings,
    const FormatRegistry& registry,
    TranslationTree& out_tree,
    TranslationConfiguration& out_config,
    std::string& error
);

// "<file>:<line>:<column>: <message>" for text errors, "<file>: <message>" otherwise.
std::string describe_parse_error(const std::filesystem::path& path, const std::exception& ex);

std::string lower_extension(const std::filesystem::path& path);

}  // namespace transtree
