#include "safecalc/batch_processor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace safecalc;

namespace {
std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        lines.push_back(line);
    }
    return lines;
}
}

class BatchProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        directory = std::filesystem::temp_directory_path() / ("safecalc_batch_" + name);
        std::filesystem::create_directories(directory);
        options.inputPath = directory / "input.txt";
        options.outputPath = directory / "output.csv";
    }

    void TearDown() override { std::filesystem::remove_all(directory); }

    void writeInput(const std::string& content) {
        std::ofstream output(options.inputPath);
        output << content;
    }

    std::filesystem::path directory;
    BatchOptions options;
};

TEST(EvaluateLineTest, FillsSuccessRecord) {
    ExpressionEvaluator evaluator;
    EvaluationRecord record = evaluateLine({3, "2 ^ 3 ^ 2"}, evaluator);
    EXPECT_EQ(record.lineNumber, 3u);
    EXPECT_EQ(record.expression, "2 ^ 3 ^ 2");
    EXPECT_EQ(record.status, "success");
    ASSERT_TRUE(record.value.has_value());
    EXPECT_EQ(*record.value, Number::integer(512));
    EXPECT_TRUE(record.errorKind.empty());
}

TEST(EvaluateLineTest, FillsErrorRecord) {
    ExpressionEvaluator evaluator;
    EvaluationRecord record = evaluateLine({1, ""}, evaluator);
    EXPECT_EQ(record.status, "error");
    EXPECT_FALSE(record.value.has_value());
    EXPECT_EQ(record.errorKind, "EmptyExpression");
    EXPECT_FALSE(record.message.empty());
}

TEST_F(BatchProcessorTest, WritesResultsInInputOrder) {
    writeInput("1 + 1\n5 / 0\n\n(10 + 5) / 3\n2 + a\n3.14 * 2");
    options.threadCount = 4;
    options.chunkSize = 2;
    options.batchSize = 3;

    std::atomic<std::size_t> completed{0};
    BatchSummary summary = runBatch(options, completed);

    EXPECT_EQ(summary.total, 6u);
    EXPECT_EQ(summary.succeeded, 3u);
    EXPECT_EQ(summary.failed, 3u);
    EXPECT_EQ(completed.load(), 6u);

    auto lines = readLines(options.outputPath);
    ASSERT_EQ(lines.size(), 7u);
    EXPECT_EQ(lines[1], "1,\"1 + 1\",success,2,,\"\"");
    EXPECT_TRUE(lines[2].starts_with("2,\"5 / 0\",error,,DivisionByZero,\""));
    EXPECT_TRUE(lines[3].starts_with("3,\"\",error,,EmptyExpression,\""));
    EXPECT_EQ(lines[4], "4,\"(10 + 5) / 3\",success,5,,\"\"");
    EXPECT_TRUE(lines[5].starts_with("5,\"2 + a\",error,,InvalidCharacters,\""));
    EXPECT_EQ(lines[6], "6,\"3.14 * 2\",success,6.28,,\"\"");
}

TEST_F(BatchProcessorTest, AppliesPrecision) {
    writeInput("10 / 3\n");
    options.precision = 4;

    runBatch(options);

    auto lines = readLines(options.outputPath);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "1,\"10 / 3\",success,3.3333,,\"\"");
}

TEST_F(BatchProcessorTest, ManyLinesAcrossChunks) {
    std::ostringstream content;
    for (int i = 1; i <= 250; ++i) {
        content << i << " * 2\n";
    }
    writeInput(content.str());
    options.threadCount = 3;
    options.chunkSize = 40;
    options.batchSize = 17;

    BatchSummary summary = runBatch(options);
    EXPECT_EQ(summary.total, 250u);
    EXPECT_EQ(summary.failed, 0u);

    auto lines = readLines(options.outputPath);
    ASSERT_EQ(lines.size(), 251u);
    for (int i = 1; i <= 250; ++i) {
        std::string expected = std::to_string(i) + ",\"" + std::to_string(i) + " * 2\",success," +
                               std::to_string(i * 2) + ",,\"\"";
        EXPECT_EQ(lines[static_cast<std::size_t>(i)], expected);
    }
}

TEST_F(BatchProcessorTest, EmptyInputProducesHeaderOnly) {
    writeInput("");
    BatchSummary summary = runBatch(options);
    EXPECT_EQ(summary.total, 0u);
    EXPECT_EQ(readLines(options.outputPath).size(), 1u);
}

TEST_F(BatchProcessorTest, MissingInputThrows) {
    options.inputPath = directory / "missing.txt";
    EXPECT_THROW(runBatch(options), std::runtime_error);
}
