#include "translation_loader.hpp"

#include "parse_error.hpp"
#include "text_utils.hpp"

namespace transtree {

std::string lower_extension(const std::filesystem::path& path) {
    return to_lower_ascii(path.extension().string());
}

std::string describe_parse_error(const std::filesystem::path& path, const std::exception& ex) {
    if (const auto* text_error = dynamic_cast<const TextParseError*>(&ex)) {
        return path.string() + ":" + std::to_string(text_error->line_number()) + ":" +
            std::to_string(text_error->column_number()) + ": " + text_error->what();
    }
    return path.string() + ": " + ex.what();
}

bool read_translation_file(
    const std::filesystem::path& path,
    const LoadOptions& options,
    const FormatRegistry& registry,
    TranslationDocument& out_doc,
    std::string& error
) {
    out_doc = TranslationDocument{};
    out_doc.source_path = path;

    const std::string extension = lower_extension(path);
    const auto parser = registry.create_parser(extension, options.settings);
    if (!parser) {
        error = "No parser registered for the '" + extension + "' extension: " + path.string();
        return false;
    }

    std::string content;
    if (!read_text_file(path, content, error)) {
        return false;
    }

    try {
        auto translation = parser->load_translation(content, options.locale);
        if (!translation) {
            error = options.locale.empty()
                ? "No translation found in " + path.string()
                : "No translation for locale '" + options.locale + "' found in " + path.string();
            return false;
        }

        out_doc.translation = std::move(*translation);
        out_doc.translation.original_file = path.string();

        if (options.build_tree) {
            out_doc.tree = build_translation_tree(out_doc.translation);
        }
    } catch (const std::exception& ex) {
        error = describe_parse_error(path, ex);
        return false;
    }

    return true;
}

bool load_translation_structure(
    const std::filesystem::path& config_file,
    const std::filesystem::path& base_directory,
    const ParserSettings& settings,
    const FormatRegistry& registry,
    TranslationTree& out_tree,
    TranslationConfiguration& out_config,
    std::string& error
) {
    const auto config_parser = registry.create_config_parser(lower_extension(config_file), settings);
    if (!config_parser) {
        error = "No configuration parser registered for the '" + lower_extension(config_file) +
            "' extension: " + config_file.string();
        return false;
    }

    std::string config_content;
    if (!read_text_file(config_file, config_content, error)) {
        error = "Loading of the configuration file '" + config_file.string() + "' has failed: " + error;
        return false;
    }

    try {
        out_config = config_parser->parse_configuration(config_content);
        validate_configuration(out_config);
    } catch (const std::exception& ex) {
        error = "Parsing of the configuration file has failed: " + describe_parse_error(config_file, ex);
        return false;
    }
    out_config.directory_hint = config_file.parent_path().string();

    std::filesystem::path default_file(out_config.default_file);
    if (default_file.is_relative()) {
        const auto dir = base_directory.empty() ? config_file.parent_path() : base_directory;
        default_file = dir / default_file;
    }

    ParserSettings effective = settings;
    if (!effective.text_format) {
        effective.text_format = out_config.text_format;
    }

    const std::string extension = lower_extension(default_file);
    const auto parser = registry.create_parser(extension, effective);
    if (!parser) {
        error = "No parser found for the '" + extension + "' file extension that the default translation file '" +
            default_file.string() + "' has";
        return false;
    }

    std::string content;
    if (!read_text_file(default_file, content, error)) {
        error = "Loading of the default translation file '" + default_file.string() + "' has failed: " + error;
        return false;
    }
    if (content.empty()) {
        error = "Default translation file '" + default_file.string() + "' is empty";
        return false;
    }

    try {
        out_tree = parser->load_structure(content);
    } catch (const std::exception& ex) {
        error = describe_parse_error(default_file, ex);
        return false;
    }

    return true;
}

}  // namespace transtree
