#ifndef FETCHER_JOB_REQUEST_HPP_
#define FETCHER_JOB_REQUEST_HPP_

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace fetcher {

enum class MediaKind { VIDEO, AUDIO };

using JobId = uint64_t;

inline const char* mediaKindName(MediaKind kind) {
  return kind == MediaKind::AUDIO ? "audio" : "video";
}

// "video" / "audio"，其他返回 false
inline bool parseMediaKind(const std::string& name, MediaKind* kind) {
  if (name == "video") {
    *kind = MediaKind::VIDEO;
    return true;
  }
  if (name == "audio") {
    *kind = MediaKind::AUDIO;
    return true;
  }
  return false;
}

// 一次提交的任务，提交后不可修改
struct JobRequest {
  std::string target;
  std::string destinationDir;
  std::optional<std::string> proxy;
  MediaKind kind = MediaKind::VIDEO;
};

// submit 返回的句柄，仅用于标识和日志
struct JobHandle {
  JobId id = 0;
  std::string target;

  bool operator==(const JobHandle& other) const { return id == other.id; }
  bool operator!=(const JobHandle& other) const { return id != other.id; }
};

inline std::ostream& operator<<(std::ostream& os, const JobHandle& handle) {
  return os << "job#" << handle.id << "(" << handle.target << ")";
}

}  // namespace fetcher

#endif  // FETCHER_JOB_REQUEST_HPP_
