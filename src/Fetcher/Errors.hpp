#ifndef FETCHER_ERRORS_HPP_
#define FETCHER_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace fetcher {

class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// 代理地址格式错误，任务启动前被拒绝
class ValidationError : public Error {
 public:
  explicit ValidationError(const std::string& what) : Error(what) {}
};

// 目标解析失败（网络、非法地址、代理被拒绝）
class ResolutionError : public Error {
 public:
  explicit ResolutionError(const std::string& what) : Error(what) {}
};

// 传输过程中的 I/O 错误
class TransferError : public Error {
 public:
  explicit TransferError(const std::string& what) : Error(what) {}
};

class NotRunningError : public Error {
 public:
  NotRunningError() : Error("TaskExecutor is not running") {}
};

class AlreadyStartedError : public Error {
 public:
  AlreadyStartedError() : Error("TaskExecutor already started") {}
};

}  // namespace fetcher

#endif  // FETCHER_ERRORS_HPP_
