#include "Notification.hpp"

#include <algorithm>
#include <sstream>

namespace fetcher {

const char* failureReasonName(FailureReason reason) {
  switch (reason) {
    case FailureReason::RESOLUTION_ERROR:
      return "ResolutionError";
    case FailureReason::NO_STREAM_AVAILABLE:
      return "NoStreamAvailable";
    case FailureReason::TRANSFER_ERROR:
      return "TransferError";
    default:
      return "Unknown";
  }
}

Notification makeProgress(int percent) {
  return Progress{std::clamp(percent, 0, 100)};
}

Notification makeSuccess(const std::string& path) {
  return Terminal{Success{path}};
}

Notification makeFailure(FailureReason reason, const std::string& detail) {
  return Terminal{Failure{reason, detail}};
}

std::string describe(const Notification& n) {
  std::ostringstream oss;
  if (const auto* progress = std::get_if<Progress>(&n)) {
    oss << "progress " << progress->percent << "%";
    return oss.str();
  }
  const auto& terminal = std::get<Terminal>(n);
  if (const auto* success = std::get_if<Success>(&terminal.outcome)) {
    oss << "Saved: " << success->path;
  } else {
    const auto& failure = std::get<Failure>(terminal.outcome);
    oss << "Failed: " << failureReasonName(failure.reason);
    if (!failure.detail.empty()) oss << ": " << failure.detail;
  }
  return oss.str();
}

}  // namespace fetcher
