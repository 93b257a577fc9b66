#pragma once

#include "translation_parser.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

struct AppConfig {
    std::filesystem::path input_path;
    std::filesystem::path config_path;
    std::string locale;
    std::size_t workers = 0;
    transtree::ParserSettings parser;
    bool print_tree = false;
    bool print_entries = false;
    bool show_progress = true;
};

void print_usage(const char* program_name);
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);
