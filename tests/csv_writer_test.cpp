#include "safecalc/csv_writer.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace safecalc;

namespace {
std::string readFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    std::ostringstream content;
    content << input.rdbuf();
    return content.str();
}
}

class CsvWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        path = std::filesystem::temp_directory_path() / ("safecalc_csv_" + name + ".csv");
    }

    void TearDown() override { std::filesystem::remove(path); }

    std::filesystem::path path;
};

TEST_F(CsvWriterTest, WritesHeaderOnConstruction) {
    {
        CsvWriter writer(path);
    }
    EXPECT_EQ(readFile(path), "line,expression,status,result,error,message\n");
}

TEST_F(CsvWriterTest, WritesSuccessAndErrorRecords) {
    {
        CsvWriter writer(path);
        EvaluationRecord success;
        success.lineNumber = 1;
        success.expression = "3.14 * 2";
        success.value = Number::real(6.28, 2);
        success.status = "success";

        EvaluationRecord failure;
        failure.lineNumber = 2;
        failure.expression = "5 / 0";
        failure.status = "error";
        failure.errorKind = "DivisionByZero";
        failure.message = "Деление на ноль";

        writer.write({success, failure});
    }

    EXPECT_EQ(readFile(path),
              "line,expression,status,result,error,message\n"
              "1,\"3.14 * 2\",success,6.28,,\"\"\n"
              "2,\"5 / 0\",error,,DivisionByZero,\"Деление на ноль\"\n");
}

TEST_F(CsvWriterTest, ReplacesDoubleQuotesInFields) {
    {
        CsvWriter writer(path);
        EvaluationRecord record;
        record.lineNumber = 7;
        record.expression = "say \"hi\"";
        record.status = "error";
        record.errorKind = "InvalidCharacters";
        record.message = "bad \"char\"";
        writer.writeRecord(record);
    }

    std::string content = readFile(path);
    EXPECT_NE(content.find("7,\"say 'hi'\",error,,InvalidCharacters,\"bad 'char'\""), std::string::npos);
}

TEST_F(CsvWriterTest, UnwritableTargetThrows) {
    auto missing = std::filesystem::temp_directory_path() / "safecalc_no_such_dir" / "out.csv";
    EXPECT_THROW(CsvWriter writer(missing), std::runtime_error);
}
