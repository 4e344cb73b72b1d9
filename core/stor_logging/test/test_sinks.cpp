// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_sinks.cpp
 * @brief Unit tests for console and file sinks
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <boost/log/core.hpp>

#include "stor_console_sink.hpp"
#include "stor_file_sink.hpp"
#include "stor_log_init.hpp"
#include "stor_log_macros.hpp"

namespace fs = std::filesystem;

using namespace stor::logging;

class SinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("stor_sink_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);

    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }

  void TearDown() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  fs::path test_dir_;
};

TEST_F(SinkTest, ConsoleSinkAddRemove) {
  auto colored = create_console_sink(severity_level::debug, true);
  auto plain = create_console_sink(severity_level::error, false);
  ASSERT_NE(colored, nullptr);
  ASSERT_NE(plain, nullptr);

  EXPECT_NO_THROW(add_sink(colored));
  EXPECT_NO_THROW(add_sink(plain));

  {
    STOR_LOG_SCOPED_CONTEXT("batch-1", "posix");
    STOR_LOG_WARN("context attached");
  }

  colored->flush();
  plain->flush();
  remove_sink(colored);
  remove_sink(plain);
}

TEST_F(SinkTest, FileSinkWritesRecords) {
  FileSinkConfig config;
  config.directory = test_dir_.string();
  config.file_pattern = "test_%N.log";
  config.format_json = true;

  auto sink = create_file_sink(config, severity_level::debug);
  ASSERT_NE(sink, nullptr);
  add_sink(sink);

  STOR_LOG_ERROR("file sink record" << kv("key", std::string("a/b")));

  sink->stop();
  sink->flush();
  remove_sink(sink);

  bool found = false;
  for (const auto& entry : fs::directory_iterator(test_dir_)) {
    if (entry.is_regular_file() && fs::file_size(entry.path()) > 0) {
      found = true;
    }
  }
  EXPECT_TRUE(found);
}

TEST_F(SinkTest, FileSinkCreatesMissingDirectory) {
  FileSinkConfig config;
  config.directory = (test_dir_ / "nested" / "logs").string();
  config.format_json = false;

  auto sink = create_file_sink(config, severity_level::info);
  ASSERT_NE(sink, nullptr);
  EXPECT_TRUE(fs::is_directory(test_dir_ / "nested" / "logs"));
}

TEST_F(SinkTest, ScopedContextTagsRecords) {
  FileSinkConfig config;
  config.directory = test_dir_.string();
  config.file_pattern = "context_%N.log";
  config.format_json = true;

  auto sink = create_file_sink(config, severity_level::debug);
  add_sink(sink);

  {
    STOR_LOG_SCOPED_CONTEXT("batch-7", "s3");
    auto attrs = boost::log::core::get()->get_thread_attributes();
    EXPECT_NE(attrs.find("BatchID"), attrs.end());
    EXPECT_NE(attrs.find("Backend"), attrs.end());
    STOR_LOG_INFO("inside context");
  }
  STOR_LOG_INFO("outside context");

  auto attrs = boost::log::core::get()->get_thread_attributes();
  EXPECT_EQ(attrs.find("BatchID"), attrs.end());
  EXPECT_EQ(attrs.find("Backend"), attrs.end());

  sink->stop();
  sink->flush();
  remove_sink(sink);

  std::string inside;
  std::string outside;
  for (const auto& entry : fs::directory_iterator(test_dir_)) {
    std::ifstream in(entry.path());
    std::string line;
    while (std::getline(in, line)) {
      if (line.find("inside context") != std::string::npos) {
        inside = line;
      } else if (line.find("outside context") != std::string::npos) {
        outside = line;
      }
    }
  }
  EXPECT_NE(inside.find("\"batch_id\":\"batch-7\""), std::string::npos) << inside;
  EXPECT_NE(inside.find("\"backend\":\"s3\""), std::string::npos) << inside;
  ASSERT_FALSE(outside.empty());
  EXPECT_EQ(outside.find("batch_id"), std::string::npos) << outside;
}

TEST(EscapeJsonTest, EscapesControlCharacters) {
  EXPECT_EQ(escape_json("plain"), "plain");
  EXPECT_EQ(escape_json("a\"b"), "a\\\"b");
  EXPECT_EQ(escape_json("back\\slash"), "back\\\\slash");
  EXPECT_EQ(escape_json("tab\tnl\n"), "tab\\tnl\\n");
  EXPECT_EQ(escape_json(std::string(1, '\x01')), "\\u0001");
}
