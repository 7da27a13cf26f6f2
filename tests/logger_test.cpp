#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "logger.hpp"

namespace fetcher {
namespace utils {
namespace {

std::string readAll(const std::filesystem::path& path) {
  std::ifstream ifs(path);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

TEST(LoggerTest, ParseLogLevel) {
  LogLevel level = LogLevel::FATAL;
  EXPECT_TRUE(ParseLogLevel("debug", &level));
  EXPECT_EQ(level, LogLevel::DEBUG);
  EXPECT_TRUE(ParseLogLevel("WARN", &level));
  EXPECT_EQ(level, LogLevel::WARN);
  EXPECT_TRUE(ParseLogLevel("Error", &level));
  EXPECT_EQ(level, LogLevel::ERROR);
  EXPECT_FALSE(ParseLogLevel("verbose", &level));
  EXPECT_EQ(level, LogLevel::ERROR);
}

TEST(LoggerTest, WritesFileAndFiltersByLevel) {
  auto dir = std::filesystem::temp_directory_path() / "media-fetcher-logger";
  std::filesystem::remove_all(dir);

  LogConfig cfg;
  cfg.logFilePath = dir.string();
  cfg.logFileName = "test.log";
  cfg.minLevel = LogLevel::INFO;
  cfg.logToConsole = false;
  Logger::initialize(cfg);

  LOG(DEBUG) << "hidden-debug-line";
  LOG(INFO) << "visible-info-line " << 42;

  const std::string content = readAll(dir / "test.log");
  EXPECT_NE(content.find("[INFO]"), std::string::npos);
  EXPECT_NE(content.find("visible-info-line 42"), std::string::npos);
  EXPECT_NE(content.find("logger_test.cpp:"), std::string::npos);
  EXPECT_EQ(content.find("hidden-debug-line"), std::string::npos);
  EXPECT_FALSE(Logger::isEnabled(LogLevel::DEBUG));
  EXPECT_TRUE(Logger::isEnabled(LogLevel::ERROR));
}

TEST(LoggerTest, RotatesWhenFileIsFull) {
  auto dir = std::filesystem::temp_directory_path() / "media-fetcher-rotate";
  std::filesystem::remove_all(dir);

  LogConfig cfg;
  cfg.logFilePath = dir.string();
  cfg.logFileName = "rot.log";
  cfg.maxFileSize = 256;
  cfg.maxBackupFiles = 2;
  cfg.logToConsole = false;
  Logger::initialize(cfg);

  for (int i = 0; i < 20; ++i) {
    LOG(INFO) << "filler line number " << i;
  }
  EXPECT_TRUE(std::filesystem::exists(dir / "rot.log"));
  EXPECT_TRUE(std::filesystem::exists(dir / "rot.log.1"));
  EXPECT_FALSE(std::filesystem::exists(dir / "rot.log.3"));
}

}  // namespace
}  // namespace utils
}  // namespace fetcher
