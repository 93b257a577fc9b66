#include "config.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

bool parse_size_arg(const std::string& key, const std::string& value, std::size_t& out, std::string& error) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            error = "Invalid integer for " + key + ": " + value;
            return false;
        }
        out = static_cast<std::size_t>(parsed);
        return true;
    } catch (const std::logic_error&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

bool parse_separator_arg(const std::string& key, const std::string& value, char& out, std::string& error) {
    if (value == "\\t" || value == "tab") {
        out = '\t';
        return true;
    }
    if (value.size() != 1 || value == "\"" || value == "\n" || value == "\r") {
        error = "Invalid separator for " + key + ": " + value;
        return false;
    }
    out = value.front();
    return true;
}

}  // namespace

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " --input <translation-file-or-dir> [options]\n"
        << "  " << program_name << " --config <translation-config> [options]\n\n"
        << "Options:\n"
        << "  --locale <name>        Locale column to load from CSV/TSV files (default: first column)\n"
        << "  --text-format <mode>   Placeholder syntax: none, backslash, arb, arb-no-escaping, dotnet\n"
        << "                         (default: the format's own)\n"
        << "  --csv-separator <c>    CSV field separator (default: ',')\n"
        << "  --tsv-quotes           TSV fields may be wrapped in double quotes\n"
        << "  --no-references        Treat values starting with '@' as plain text\n"
        << "  --empty-as-absent      Skip empty values in CSV/TSV/INI/TOML files\n"
        << "  --workers <n>          Parser threads (default: hardware concurrency)\n"
        << "  --tree                 Print the key tree of each file\n"
        << "  --entries              Print every parsed entry\n"
        << "  --no-progress          Disable progress bar output\n"
        << "  -h, --help             Show this help\n";
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--input") {
            config.input_path = require_value(arg);
        } else if (arg == "--config") {
            config.config_path = require_value(arg);
        } else if (arg == "--locale") {
            config.locale = require_value(arg);
        } else if (arg == "--text-format") {
            const std::string value = require_value(arg);
            if (!error.empty()) {
                return false;
            }
            const auto format = transtree::text_format_from_string(value);
            if (!format) {
                error = "Unsupported --text-format: " + value +
                    " (supported: none, backslash, arb, arb-no-escaping, dotnet)";
                return false;
            }
            config.parser.text_format = *format;
        } else if (arg == "--csv-separator") {
            const std::string value = require_value(arg);
            if (!error.empty() || !parse_separator_arg(arg, value, config.parser.csv_separator, error)) {
                return false;
            }
        } else if (arg == "--tsv-quotes") {
            config.parser.tsv_expect_quotes = true;
        } else if (arg == "--no-references") {
            config.parser.recognize_references = false;
        } else if (arg == "--empty-as-absent") {
            config.parser.treat_empty_values_as_absent = true;
        } else if (arg == "--workers") {
            const std::string value = require_value(arg);
            if (!error.empty() || !parse_size_arg(arg, value, config.workers, error)) {
                return false;
            }
        } else if (arg == "--tree") {
            config.print_tree = true;
        } else if (arg == "--entries") {
            config.print_entries = true;
        } else if (arg == "--no-progress") {
            config.show_progress = false;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (config.workers == 0) {
        const auto hw = std::thread::hardware_concurrency();
        config.workers = hw == 0 ? 4 : static_cast<std::size_t>(hw);
    }

    if (config.input_path.empty() && config.config_path.empty()) {
        error = "--input or --config is required";
        return false;
    }
    if (!config.input_path.empty() && !config.config_path.empty()) {
        error = "--input and --config cannot be combined";
        return false;
    }

    return true;
}
