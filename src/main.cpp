#include <gflags/gflags.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "Fetcher/Errors.hpp"
#include "Fetcher/HttpMediaSource.hpp"
#include "Fetcher/JobRequest.hpp"
#include "Fetcher/NotificationChannel.hpp"
#include "Fetcher/ProxyValidator.hpp"
#include "Fetcher/TaskExecutor.hpp"
#include "utils/flags.hpp"
#include "utils/logger.hpp"

namespace {

constexpr int kBarWidth = 30;

std::string progressBar(int percent) {
  const int filled = percent * kBarWidth / 100;
  return "[" + std::string(filled, '#') + std::string(kBarWidth - filled, '.') +
         "]";
}

void initLogger() {
  fetcher::utils::LogConfig logCfg;
  logCfg.logFilePath = FLAGS_log_dir;
  logCfg.maxFileSize = FLAGS_log_max_file_size;
  logCfg.maxBackupFiles = FLAGS_log_max_backup_files;
  logCfg.logToConsole = FLAGS_log_to_console;
  if (!fetcher::utils::ParseLogLevel(FLAGS_log_min_level, &logCfg.minLevel)) {
    std::cerr << "Unknown --log_min_level '" << FLAGS_log_min_level
              << "', using info" << std::endl;
  }
  fetcher::utils::Logger::initialize(logCfg);
}

// 目录存在且可写由调用方负责，核心不再检查
bool checkDestination(const std::string& dir) {
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    std::cerr << "Directory does not exist: " << dir << std::endl;
    return false;
  }
  if (::access(dir.c_str(), W_OK) != 0) {
    std::cerr << "No write permission for directory: " << dir << std::endl;
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(
      "media-fetcher [--dest=DIR] [--proxy=URL] [--kind=video|audio] "
      "<url> [<url> ...]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (argc < 2) {
    std::cerr << "Usage: " << argv[0]
              << " [--dest=DIR] [--proxy=URL] [--kind=video|audio] <url>..."
              << std::endl;
    return 1;
  }

  initLogger();

  const std::string dest = FLAGS_dest.empty()
                               ? std::filesystem::current_path().string()
                               : FLAGS_dest;
  if (!checkDestination(dest)) return 1;

  fetcher::MediaKind kind;
  if (!fetcher::parseMediaKind(FLAGS_kind, &kind)) {
    std::cerr << "Unknown --kind '" << FLAGS_kind
              << "', expected video or audio" << std::endl;
    return 1;
  }

  try {
    fetcher::requireValidProxy(FLAGS_proxy);
  } catch (const fetcher::ValidationError& e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  int exitCode = 0;
  try {
    fetcher::HttpMediaSource::Options options;
    options.connectTimeoutSec = FLAGS_connect_timeout_sec;
    options.userAgent = FLAGS_user_agent;
    auto source = std::make_shared<fetcher::HttpMediaSource>(options);
    auto channel = std::make_shared<fetcher::NotificationChannel>();

    fetcher::TaskExecutor executor(source, channel);
    executor.start();

    std::map<fetcher::JobId, fetcher::JobHandle> pending;
    for (int i = 1; i < argc; ++i) {
      fetcher::JobRequest request;
      request.target = argv[i];
      request.destinationDir = dest;
      if (!FLAGS_proxy.empty()) request.proxy = FLAGS_proxy;
      request.kind = kind;
      auto handle = executor.submit(request);
      pending.emplace(handle.id, handle);
      std::cout << "#" << handle.id << " queued " << handle.target << std::endl;
    }

    size_t failed = 0;
    while (!pending.empty()) {
      auto envelope = channel->receive(std::chrono::milliseconds(200));
      if (!envelope) continue;
      auto it = pending.find(envelope->jobId);
      if (it == pending.end()) continue;

      const auto& n = envelope->notification;
      if (const auto* progress = std::get_if<fetcher::Progress>(&n)) {
        std::cout << "#" << it->first << " " << progressBar(progress->percent)
                  << " " << progress->percent << "%" << std::endl;
        continue;
      }
      const auto& terminal = std::get<fetcher::Terminal>(n);
      if (!terminal.succeeded()) ++failed;
      std::cout << "#" << it->first << " " << fetcher::describe(n)
                << std::endl;
      pending.erase(it);
    }

    executor.shutdown();
    channel->close();
    exitCode = failed == 0 ? 0 : 2;
    LOG(INFO) << "All jobs finished, " << failed << " failed";
  } catch (const std::exception& e) {
    // ERROR 级别总会输出到 stderr
    LOG(ERROR) << "Fatal error: " << e.what();
    exitCode = 1;
  }

  gflags::ShutDownCommandLineFlags();
  return exitCode;
}
