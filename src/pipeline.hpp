#pragma once

#include "format_registry.hpp"
#include "translation_loader.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace transtree {

struct ParseStats {
    std::size_t files_total = 0;
    std::size_t files_ok = 0;
    std::size_t files_failed = 0;
    std::size_t entries_total = 0;
    std::size_t workers_used = 0;
    std::chrono::milliseconds wall_time{0};
    double files_per_second = 0.0;
};

struct FileParseResult {
    bool ok = false;
    std::string error;
    TranslationDocument doc;
};

// Parses every file on its own worker-owned Translation. A failing file does not stop
// the others; returns false if any file failed. out_results is indexed like files.
bool parse_files_parallel(
    const std::vector<std::filesystem::path>& files,
    const LoadOptions& options,
    const FormatRegistry& registry,
    std::size_t workers,
    std::vector<FileParseResult>& out_results,
    ParseStats& out_stats,
    const std::function<void(std::size_t, std::size_t)>& progress_callback = {}
);

}  // namespace transtree
