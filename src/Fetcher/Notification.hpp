#ifndef FETCHER_NOTIFICATION_HPP_
#define FETCHER_NOTIFICATION_HPP_

#include <string>
#include <variant>

namespace fetcher {

enum class FailureReason {
  RESOLUTION_ERROR,
  NO_STREAM_AVAILABLE,
  TRANSFER_ERROR
};

const char* failureReasonName(FailureReason reason);

struct Progress {
  int percent = 0;  // 0..100
};

struct Success {
  std::string path;
};

struct Failure {
  FailureReason reason = FailureReason::TRANSFER_ERROR;
  std::string detail;
};

// 每个任务恰好一个，且总是最后一个
struct Terminal {
  std::variant<Success, Failure> outcome;

  bool succeeded() const { return std::holds_alternative<Success>(outcome); }
};

using Notification = std::variant<Progress, Terminal>;

inline bool isTerminal(const Notification& n) {
  return std::holds_alternative<Terminal>(n);
}

Notification makeProgress(int percent);
Notification makeSuccess(const std::string& path);
Notification makeFailure(FailureReason reason, const std::string& detail);

// 人类可读的描述，用于日志和 CLI 输出
std::string describe(const Notification& n);

}  // namespace fetcher

#endif  // FETCHER_NOTIFICATION_HPP_
