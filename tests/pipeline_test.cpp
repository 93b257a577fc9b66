#include "pipeline.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace transtree;

namespace fs = std::filesystem;

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / ("transtree_pipeline_" + std::string(info->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        register_builtin_formats(registry_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write(const std::string& name, const std::string& content) {
        const fs::path path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    fs::path dir_;
    FormatRegistry registry_;
};

TEST_F(PipelineTest, ParsesEveryFile) {
    std::vector<fs::path> files;
    for (int i = 0; i < 12; ++i) {
        files.push_back(write("f" + std::to_string(i) + ".json", "{\"k" + std::to_string(i) + "\": \"v\", \"g\": {\"x\": \"y\"}}"));
    }

    std::vector<FileParseResult> results;
    ParseStats stats;
    EXPECT_TRUE(parse_files_parallel(files, LoadOptions{}, registry_, 4, results, stats));

    ASSERT_EQ(results.size(), files.size());
    EXPECT_EQ(stats.files_total, 12u);
    EXPECT_EQ(stats.files_ok, 12u);
    EXPECT_EQ(stats.files_failed, 0u);
    EXPECT_EQ(stats.entries_total, 24u);
    EXPECT_EQ(stats.workers_used, 4u);

    for (std::size_t i = 0; i < files.size(); ++i) {
        ASSERT_TRUE(results[i].ok) << results[i].error;
        EXPECT_EQ(results[i].doc.source_path, files[i]);
        EXPECT_TRUE(results[i].doc.translation.contains("k" + std::to_string(i)));
    }
}

TEST_F(PipelineTest, ReportsThroughput) {
    std::vector<fs::path> files;
    for (int i = 0; i < 6; ++i) {
        files.push_back(write("t" + std::to_string(i) + ".json", "{\"k\": \"v\"}"));
    }

    std::vector<FileParseResult> results;
    ParseStats stats;
    ASSERT_TRUE(parse_files_parallel(files, LoadOptions{}, registry_, 2, results, stats));

    if (stats.wall_time.count() > 0) {
        const double expected = 6.0 / (static_cast<double>(stats.wall_time.count()) / 1000.0);
        EXPECT_DOUBLE_EQ(stats.files_per_second, expected);
    } else {
        EXPECT_EQ(stats.files_per_second, 0.0);
    }
}

TEST_F(PipelineTest, FailingFileDoesNotStopOthers) {
    const std::vector<fs::path> files{
        write("good.json", R"({"a": "b"})"),
        write("bad.json", R"({"a": )"),
        write("good.arb", R"({"@@locale": "de", "c": "d"})"),
    };

    std::vector<FileParseResult> results;
    ParseStats stats;
    EXPECT_FALSE(parse_files_parallel(files, LoadOptions{}, registry_, 2, results, stats));

    EXPECT_EQ(stats.files_ok, 2u);
    EXPECT_EQ(stats.files_failed, 1u);
    EXPECT_TRUE(results[0].ok);
    EXPECT_FALSE(results[1].ok);
    EXPECT_NE(results[1].error.find("bad.json"), std::string::npos);
    EXPECT_TRUE(results[2].ok);
    EXPECT_EQ(results[2].doc.translation.locale, "de");
}

TEST_F(PipelineTest, WorkersCappedByFileCount) {
    const std::vector<fs::path> files{write("one.csv", "key,en\na,b\n")};

    std::vector<FileParseResult> results;
    ParseStats stats;
    EXPECT_TRUE(parse_files_parallel(files, LoadOptions{}, registry_, 8, results, stats));
    EXPECT_EQ(stats.workers_used, 1u);
}

TEST_F(PipelineTest, ZeroWorkersMeansOne) {
    const std::vector<fs::path> files{write("a.json", R"({"a": "b"})"), write("b.json", R"({"c": "d"})")};

    std::vector<FileParseResult> results;
    ParseStats stats;
    EXPECT_TRUE(parse_files_parallel(files, LoadOptions{}, registry_, 0, results, stats));
    EXPECT_EQ(stats.workers_used, 1u);
    EXPECT_EQ(stats.files_ok, 2u);
}

TEST_F(PipelineTest, ReportsFinalProgress) {
    const std::vector<fs::path> files{write("a.json", R"({"a": "b"})"), write("b.json", R"({"c": "d"})")};

    std::atomic<std::size_t> last_done{0};
    std::atomic<std::size_t> last_total{0};
    auto progress = [&](std::size_t done, std::size_t total) {
        last_done = done;
        last_total = total;
    };

    std::vector<FileParseResult> results;
    ParseStats stats;
    EXPECT_TRUE(parse_files_parallel(files, LoadOptions{}, registry_, 2, results, stats, progress));
    EXPECT_EQ(last_done.load(), 2u);
    EXPECT_EQ(last_total.load(), 2u);
}

TEST_F(PipelineTest, EmptyInput) {
    std::vector<FileParseResult> results;
    ParseStats stats;
    EXPECT_TRUE(parse_files_parallel({}, LoadOptions{}, registry_, 4, results, stats));
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(stats.files_total, 0u);
}
