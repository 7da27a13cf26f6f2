#pragma once

#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace fetcher {
namespace utils {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, FATAL = 4 };

struct LogConfig {
  std::string logFilePath;  // 日志目录（如 "logs"）
  std::string logFileName;  // 日志文件名
  size_t maxFileSize;       // 单个日志文件最大字节数
  size_t maxBackupFiles;    // 最大备份文件数
  LogLevel minLevel;        // 低于该级别的日志被丢弃
  bool logToConsole;        // 是否同时输出到 stderr
  LogConfig()
      : logFilePath("logs"),
        logFileName("media-fetcher.log"),
        maxFileSize(10 * 1024 * 1024),  // 10 MB
        maxBackupFiles(3),
        minLevel(LogLevel::INFO),
        logToConsole(true) {}
};

// 解析 "debug"/"info"/"warn"/"error"/"fatal"（大小写不敏感），失败返回 false
bool ParseLogLevel(const std::string& name, LogLevel* level);

class Logger {
 public:
  // 初始化日志系统（可选配置）
  static void initialize(const LogConfig& config = LogConfig());

  static bool isEnabled(LogLevel level);

  // 日志流式写入
  class LogStream {
   public:
    LogStream(LogLevel level, const char* file, const char* function, int line);
    ~LogStream();

    template <typename T>
    LogStream& operator<<(const T& msg) {
      if (enabled_) oss_ << msg;
      return *this;
    }

   private:
    LogLevel level_;
    bool enabled_;
    std::ostringstream oss_;
  };

 private:
  Logger() = default;
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
};

}  // namespace utils
}  // namespace fetcher

// 日志宏用法：LOG(INFO) << "message";
#define LOG(level)                                                  \
  fetcher::utils::Logger::LogStream(fetcher::utils::LogLevel::level, \
                                    __FILE__, __FUNCTION__, __LINE__)
