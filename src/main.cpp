#include "config.hpp"
#include "format_registry.hpp"
#include "pipeline.hpp"
#include "translation_loader.hpp"
#include "translation_tree.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

bool collect_input_files(
    const std::filesystem::path& input,
    const transtree::FormatRegistry& registry,
    std::vector<std::filesystem::path>& out_files,
    std::string& error
) {
    out_files.clear();

    if (!std::filesystem::exists(input)) {
        error = "Input path does not exist: " + input.string();
        return false;
    }

    if (std::filesystem::is_regular_file(input)) {
        if (!registry.supports(transtree::lower_extension(input))) {
            error = "Input file has no supported translation format: " + input.string();
            return false;
        }
        out_files.push_back(input);
        return true;
    }

    if (!std::filesystem::is_directory(input)) {
        error = "Input path is neither file nor directory: " + input.string();
        return false;
    }

    for (const auto& entry : std::filesystem::recursive_directory_iterator(input)) {
        if (entry.is_regular_file() && registry.supports(transtree::lower_extension(entry.path()))) {
            out_files.push_back(entry.path());
        }
    }

    std::sort(out_files.begin(), out_files.end());

    if (out_files.empty()) {
        error = "No translation files found under: " + input.string();
        return false;
    }

    return true;
}

std::string format_progress_bar(double ratio, std::size_t width) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    const std::size_t filled = static_cast<std::size_t>(ratio * static_cast<double>(width));
    std::string bar(width, '-');
    for (std::size_t i = 0; i < filled && i < width; ++i) {
        bar[i] = '=';
    }
    if (filled < width) {
        bar[filled] = '>';
    }
    return bar;
}

void print_progress(std::size_t done_files, std::size_t total_files, bool done) {
    if (total_files == 0) {
        return;
    }

    const double fraction = static_cast<double>(done_files) / static_cast<double>(total_files);
    const auto pct = static_cast<int>(std::clamp(fraction, 0.0, 1.0) * 100.0);

    std::ostringstream line;
    line
        << "\r["
        << format_progress_bar(fraction, 30)
        << "] "
        << std::setw(3) << pct << "% "
        << "files " << done_files << "/" << total_files;

    std::cerr << line.str();
    if (done) {
        std::cerr << "\n";
    }
    std::cerr.flush();
}

void print_tree_node(const transtree::TreeNode& node, std::size_t depth) {
    const std::string indent(depth * 2, ' ');
    for (const auto& [_, leaf] : node.leaves()) {
        std::cout << indent << leaf.key << (leaf.templated ? " {}" : "") << "\n";
    }
    for (const auto& [_, child] : node.children()) {
        std::cout << indent << child->name() << "/\n";
        print_tree_node(*child, depth + 1);
    }
}

void print_entries(const transtree::Translation& translation) {
    for (const auto& [key, entry] : translation.entries()) {
        std::cout << "  " << key;
        if (const auto* reference = entry.reference()) {
            std::cout << " -> @" << *reference;
        } else if (const auto* text = entry.text()) {
            std::cout << " = " << std::quoted(*text);
        }
        if (entry.templated) {
            std::cout << " [templated]";
        }
        if (entry.target) {
            std::cout << " target=" << *entry.target;
        }
        std::cout << "\n";
    }
}

struct EntryCounts {
    std::size_t templated = 0;
    std::size_t references = 0;
};

EntryCounts count_entries(const transtree::Translation& translation) {
    EntryCounts counts;
    for (const auto& [_, entry] : translation.entries()) {
        if (entry.templated) {
            ++counts.templated;
        }
        if (entry.is_reference()) {
            ++counts.references;
        }
    }
    return counts;
}

int run_config_mode(const AppConfig& config, const transtree::FormatRegistry& registry) {
    transtree::TranslationTree tree;
    transtree::TranslationConfiguration translation_config;
    std::string error;

    if (!transtree::load_translation_structure(
            config.config_path,
            {},
            config.parser,
            registry,
            tree,
            translation_config,
            error
        )) {
        std::cerr << "[error] " << error << "\n";
        return 1;
    }

    if (config.print_tree) {
        print_tree_node(tree.root(), 1);
    }

    std::cout
        << "[ok] " << config.config_path.filename().string()
        << " default_file=" << translation_config.default_file
        << " keys=" << tree.leaf_count()
        << " translations=" << translation_config.translations.size()
        << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    AppConfig config;
    std::string error;

    if (!parse_args(argc, argv, config, error)) {
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        print_usage(argv[0]);
        return error == "help" ? 0 : 1;
    }

    auto& registry = transtree::FormatRegistry::global();
    transtree::register_builtin_formats(registry);

    if (!config.config_path.empty()) {
        const int rc = run_config_mode(config, registry);
        registry.clear();
        return rc;
    }

    std::vector<std::filesystem::path> input_files;
    if (!collect_input_files(config.input_path, registry, input_files, error)) {
        std::cerr << "[fatal] " << error << "\n";
        registry.clear();
        return 1;
    }

    transtree::LoadOptions options;
    options.settings = config.parser;
    options.locale = config.locale;
    options.build_tree = config.print_tree;

    auto progress_callback = [&](std::size_t done_files, std::size_t total_files) {
        if (config.show_progress) {
            print_progress(done_files, total_files, false);
        }
    };

    std::vector<transtree::FileParseResult> results;
    transtree::ParseStats stats;
    transtree::parse_files_parallel(input_files, options, registry, config.workers, results, stats, progress_callback);

    if (config.show_progress) {
        print_progress(input_files.size(), input_files.size(), true);
    }

    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& result = results[i];
        if (!result.ok) {
            std::cerr << "[error] " << result.error << "\n";
            continue;
        }

        const auto& translation = result.doc.translation;
        const EntryCounts counts = count_entries(translation);

        std::cout
            << "[ok] " << input_files[i].filename().string()
            << " entries=" << translation.size()
            << " templated=" << counts.templated
            << " references=" << counts.references;
        if (translation.locale) {
            std::cout << " locale=" << *translation.locale;
        }
        std::cout << "\n";

        if (config.print_entries) {
            print_entries(translation);
        }
        if (config.print_tree && result.doc.tree) {
            print_tree_node(result.doc.tree->root(), 1);
        }
    }

    std::cout
        << "[summary] files=" << stats.files_total
        << " ok=" << stats.files_ok
        << " failed=" << stats.files_failed
        << " entries=" << stats.entries_total
        << " workers=" << stats.workers_used
        << " time_ms=" << stats.wall_time.count()
        << " files_per_sec=" << std::fixed << std::setprecision(1) << stats.files_per_second
        << "\n";

    registry.clear();
    return stats.files_failed == 0 ? 0 : 1;
}
