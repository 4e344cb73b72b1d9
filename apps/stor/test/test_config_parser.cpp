// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>

#include "config_parser.hpp"
#include "stor_log_init.hpp"
#include "transfer_engine.hpp"

namespace fs = std::filesystem;

namespace stor {
namespace cli {
namespace test {

class ConfigParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("stor_config_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);
  }

  void TearDown() override {
    fs::remove_all(test_dir_);
  }

  std::string write_config(const std::string& content) {
    auto path = test_dir_ / "stor.yaml";
    std::ofstream file(path);
    file << content;
    return path.string();
  }

  fs::path test_dir_;
  ConfigParser parser_;
};

TEST_F(ConfigParserTest, EmptyDocumentKeepsDefaults) {
  StorConfig config;
  ASSERT_TRUE(parser_.load_from_string("{}", config));

  EXPECT_EQ(config.logging.level, "info");
  EXPECT_EQ(config.transfer.workers, 4u);
  EXPECT_EQ(config.transfer.retry_max_attempts, 5);
  EXPECT_EQ(config.s3.region, "us-east-1");
  EXPECT_EQ(config.s3.part_size, 64ull * 1024 * 1024);
}

TEST_F(ConfigParserTest, ParsesAllSections) {
  const std::string yaml = R"(
logging:
  level: debug
  console_colors: false
  file_enabled: true
  file_dir: /tmp/stor_logs
  format: text
transfer:
  workers: 8
  retry_interval_ms: 250
  retry_max_attempts: 10
  item_retries: 1
  log_every_n: 50
  log_interval_ms: 2000
  verify_visibility: false
s3:
  endpoint_url: http://localhost:9000
  region: eu-west-1
  use_ssl: false
  access_key: minio
  secret_key: minio123
  part_size: 16M
  executor_thread_count: 2
)";
  StorConfig config;
  ASSERT_TRUE(parser_.load_from_string(yaml, config)) << parser_.get_last_error();

  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_FALSE(config.logging.console_colors);
  EXPECT_TRUE(config.logging.file_enabled);
  EXPECT_EQ(config.logging.file_dir, "/tmp/stor_logs");
  EXPECT_EQ(config.logging.format, "text");

  EXPECT_EQ(config.transfer.workers, 8u);
  EXPECT_EQ(config.transfer.retry_interval_ms, 250);
  EXPECT_EQ(config.transfer.retry_max_attempts, 10);
  EXPECT_EQ(config.transfer.item_retries, 1);
  EXPECT_EQ(config.transfer.log_every_n, 50u);
  EXPECT_EQ(config.transfer.log_interval_ms, 2000);
  EXPECT_FALSE(config.transfer.verify_visibility);

  EXPECT_EQ(config.s3.endpoint_url, "http://localhost:9000");
  EXPECT_EQ(config.s3.region, "eu-west-1");
  EXPECT_FALSE(config.s3.use_ssl);
  EXPECT_TRUE(config.s3.verify_ssl);
  EXPECT_EQ(config.s3.access_key, "minio");
  EXPECT_EQ(config.s3.secret_key, "minio123");
  EXPECT_EQ(config.s3.part_size, 16ull * 1024 * 1024);
  EXPECT_EQ(config.s3.executor_thread_count, 2);
}

TEST_F(ConfigParserTest, PartSizeAcceptsPlainBytes) {
  StorConfig config;
  ASSERT_TRUE(parser_.load_from_string("s3:\n  part_size: 5242880\n", config));
  EXPECT_EQ(config.s3.part_size, 5242880u);
}

TEST_F(ConfigParserTest, InvalidPartSizeFails) {
  StorConfig config;
  EXPECT_FALSE(parser_.load_from_string("s3:\n  part_size: 10L\n", config));
  EXPECT_NE(parser_.get_last_error().find("part_size"), std::string::npos);
}

TEST_F(ConfigParserTest, MalformedYamlFails) {
  StorConfig config;
  EXPECT_FALSE(parser_.load_from_string("transfer: [workers: 1", config));
  EXPECT_NE(parser_.get_last_error().find("Failed to parse YAML"), std::string::npos);
}

TEST_F(ConfigParserTest, WrongScalarTypeFails) {
  StorConfig config;
  EXPECT_FALSE(parser_.load_from_string("transfer:\n  workers: many\n", config));
}

TEST_F(ConfigParserTest, LoadFromFile) {
  auto path = write_config("transfer:\n  workers: 2\n");
  StorConfig config;
  ASSERT_TRUE(parser_.load_from_file(path, config)) << parser_.get_last_error();
  EXPECT_EQ(config.transfer.workers, 2u);
}

TEST_F(ConfigParserTest, MissingFileFails) {
  StorConfig config;
  EXPECT_FALSE(parser_.load_from_file((test_dir_ / "missing.yaml").string(), config));
  EXPECT_NE(parser_.get_last_error().find("not found"), std::string::npos);
}

TEST_F(ConfigParserTest, ValidateDefaults) {
  StorConfig config;
  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, ValidateRejectsOutOfRange) {
  std::string error;

  StorConfig no_workers;
  no_workers.transfer.workers = 0;
  EXPECT_FALSE(ConfigParser::validate(no_workers, error));
  EXPECT_NE(error.find("workers"), std::string::npos);

  StorConfig no_attempts;
  no_attempts.transfer.retry_max_attempts = 0;
  EXPECT_FALSE(ConfigParser::validate(no_attempts, error));
  EXPECT_NE(error.find("retry_max_attempts"), std::string::npos);

  StorConfig bad_level;
  bad_level.logging.level = "loud";
  EXPECT_FALSE(ConfigParser::validate(bad_level, error));

  StorConfig bad_format;
  bad_format.logging.format = "xml";
  EXPECT_FALSE(ConfigParser::validate(bad_format, error));
}

TEST_F(ConfigParserTest, ConvertLoggingConfig) {
  LoggingSection section;
  section.level = "warn";
  section.console_colors = false;
  section.file_enabled = true;
  section.file_dir = "/tmp/stor_logs";
  section.format = "text";

  logging::LoggingConfig log_config;
  convert_logging_config(section, log_config);

  EXPECT_EQ(log_config.console_level, logging::severity_level::warn);
  EXPECT_EQ(log_config.file_level, logging::severity_level::warn);
  EXPECT_FALSE(log_config.console_colors);
  EXPECT_TRUE(log_config.file_enabled);
  EXPECT_EQ(log_config.file_config.directory, "/tmp/stor_logs");
  EXPECT_FALSE(log_config.file_config.format_json);
}

TEST_F(ConfigParserTest, ConvertTransferOptions) {
  TransferSection section;
  section.workers = 2;
  section.retry_interval_ms = 10;
  section.retry_max_attempts = 3;
  section.item_retries = 0;
  section.log_every_n = 7;
  section.verify_visibility = false;

  transfer::TransferOptions options;
  convert_transfer_options(section, options);

  EXPECT_EQ(options.worker_count, 2u);
  EXPECT_EQ(options.retry_interval.count(), 10);
  EXPECT_EQ(options.retry_max_attempts, 3);
  EXPECT_EQ(options.item_retries, 0);
  EXPECT_EQ(options.progress.log_every_n, 7u);
  EXPECT_FALSE(options.verify_visibility);
}

}  // namespace test
}  // namespace cli
}  // namespace stor
