#include "pipeline.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <limits>
#include <stop_token>
#include <thread>

namespace transtree {

bool parse_files_parallel(
    const std::vector<std::filesystem::path>& files,
    const LoadOptions& options,
    const FormatRegistry& registry,
    std::size_t workers,
    std::vector<FileParseResult>& out_results,
    ParseStats& out_stats,
    const std::function<void(std::size_t, std::size_t)>& progress_callback
) {
    out_stats = ParseStats{};
    out_stats.files_total = files.size();
    out_results.clear();

    if (files.empty()) {
        return true;
    }

    if (workers == 0) {
        workers = 1;
    }

    const std::size_t workers_used = std::min(workers, files.size());
    out_stats.workers_used = workers_used;

    out_results.resize(files.size());

    std::atomic<std::size_t> next_index{0};
    std::atomic<std::size_t> completed{0};

    const auto started = std::chrono::steady_clock::now();

    std::jthread reporter;
    if (progress_callback) {
        reporter = std::jthread([&](std::stop_token stop_token) {
            std::size_t last_completed = std::numeric_limits<std::size_t>::max();
            while (!stop_token.stop_requested()) {
                const std::size_t done = completed.load(std::memory_order_relaxed);
                if (done != last_completed) {
                    progress_callback(done, files.size());
                    last_completed = done;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            const std::size_t final_done = completed.load(std::memory_order_relaxed);
            if (final_done != last_completed) {
                progress_callback(final_done, files.size());
            }
        });
    }

    auto worker_fn = [&](std::stop_token stop_token) {
        while (!stop_token.stop_requested()) {
            const std::size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
            if (index >= files.size()) {
                return;
            }

            auto& result = out_results[index];
            try {
                result.ok = read_translation_file(files[index], options, registry, result.doc, result.error);
            } catch (const std::exception& ex) {
                result.ok = false;
                result.error = files[index].string() + ": " + ex.what();
            }
            completed.fetch_add(1, std::memory_order_relaxed);
        }
    };

    std::vector<std::jthread> pool;
    pool.reserve(workers_used);
    for (std::size_t i = 0; i < workers_used; ++i) {
        pool.emplace_back(worker_fn);
    }

    for (auto& thread : pool) {
        thread.join();
    }

    if (reporter.joinable()) {
        reporter.request_stop();
        reporter.join();
    }

    const auto ended = std::chrono::steady_clock::now();
    out_stats.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(ended - started);

    for (const auto& result : out_results) {
        if (result.ok) {
            ++out_stats.files_ok;
            out_stats.entries_total += result.doc.translation.size();
        } else {
            ++out_stats.files_failed;
        }
    }

    const double wall_seconds = static_cast<double>(out_stats.wall_time.count()) / 1000.0;
    if (wall_seconds > 0.0) {
        out_stats.files_per_second = static_cast<double>(files.size()) / wall_seconds;
    }

    return out_stats.files_failed == 0;
}

}  // namespace transtree
