/**
 * @file    operation_log_test.cpp
 * @brief   CSV operation log tests
 * @license MIT
 */

#include "service/artifact_store.hpp"
#include "service/operation_log.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace dmt {
namespace {

using test::TempDir;

std::vector<std::filesystem::path> csv_files(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().extension() == ".csv") files.push_back(entry.path());
    }
    return files;
}

TEST(OperationLogTest, CsvFieldQuotesOnlyWhenNeeded) {
    EXPECT_EQ(OperationLog::csv_field("plain"), "plain");
    EXPECT_EQ(OperationLog::csv_field(""), "");
    EXPECT_EQ(OperationLog::csv_field("a,b"), "\"a,b\"");
    EXPECT_EQ(OperationLog::csv_field("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(OperationLog::csv_field("two\nlines"), "\"two\nlines\"");
}

TEST(OperationLogTest, EmptyDirectoryDisablesLogging) {
    OperationLog log{std::filesystem::path()};
    EXPECT_FALSE(log.enabled());
    log.record(OperationRecord{});  // no-op
}

TEST(OperationLogTest, RecordsOneRowPerOperation) {
    TempDir dir;
    {
        OperationLog log(dir.path());
        ASSERT_TRUE(log.enabled());

        OperationRecord ok;
        ok.operation = "embed_image";
        ok.description = "Embedded 5-byte payload";
        ok.processing_ms = 12.5;
        ok.extra = {{"bit_length", 40}};
        log.record(ok);

        OperationRecord failed;
        failed.operation = "estimate_crop";
        failed.status = "no_match";
        failed.error = "best score 0.1200, below floor";
        log.record(failed);
    }

    const auto files = csv_files(dir.path());
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename().string().rfind("dualmark_", 0), 0u);

    const auto bytes = read_file_bytes(files[0]);
    const std::string content(bytes.begin(), bytes.end());

    EXPECT_EQ(content.substr(0, content.find('\n') + 1), kCsvHeader);
    EXPECT_NE(content.find(",embed_image,Embedded 5-byte payload,ok,,12.50,"), std::string::npos);
    EXPECT_NE(content.find("\"{\"\"bit_length\"\":40}\""), std::string::npos);
    EXPECT_NE(content.find(",estimate_crop,,no_match,\"best score 0.1200, below floor\",0.00,{}"),
              std::string::npos);
}

TEST(OperationLogTest, HeaderIsWrittenOnce) {
    TempDir dir;
    for (int i = 0; i < 2; ++i) {
        OperationLog log(dir.path());
        OperationRecord rec;
        rec.operation = "attack";
        log.record(rec);
    }

    const auto files = csv_files(dir.path());
    ASSERT_EQ(files.size(), 1u);
    const auto bytes = read_file_bytes(files[0]);
    const std::string content(bytes.begin(), bytes.end());

    EXPECT_EQ(content.rfind(kCsvHeader, 0), 0u);
    EXPECT_EQ(content.find(kCsvHeader, 1), std::string::npos);
    EXPECT_NE(content.find(",attack,"), content.rfind(",attack,"));
}

TEST(OperationLogTest, InvalidUtf8InExtraIsStillRecorded) {
    TempDir dir;
    {
        OperationLog log(dir.path());
        OperationRecord rec;
        rec.operation = "attack";
        rec.status = "validation_error";
        rec.extra = {{"attack_type", "\xff"}};
        log.record(rec);
    }

    const auto files = csv_files(dir.path());
    ASSERT_EQ(files.size(), 1u);
    const auto bytes = read_file_bytes(files[0]);
    const std::string content(bytes.begin(), bytes.end());
    EXPECT_NE(content.find(",attack,,validation_error,"), std::string::npos);
}

}  // namespace
}  // namespace dmt
