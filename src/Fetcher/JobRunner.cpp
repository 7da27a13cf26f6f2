#include "JobRunner.hpp"

#include <algorithm>
#include <exception>
#include <limits>
#include <utility>

#include "Errors.hpp"
#include "logger.hpp"

namespace fetcher {

namespace {
bool matchesKind(const StreamDescriptor& stream, MediaKind kind) {
  if (kind == MediaKind::VIDEO) {
    return stream.layout == StreamLayout::AUDIO_VIDEO;
  }
  return stream.layout == StreamLayout::AUDIO_ONLY;
}
}  // namespace

JobRunner::JobRunner(JobHandle handle, JobRequest request,
                     std::shared_ptr<MediaSource> source,
                     std::shared_ptr<NotificationChannel> channel, PostFn post,
                     OffloadFn offload, DoneFn onDone)
    : handle_(std::move(handle)),
      request_(std::move(request)),
      source_(std::move(source)),
      channel_(std::move(channel)),
      post_(std::move(post)),
      offload_(std::move(offload)),
      onDone_(std::move(onDone)) {}

const char* JobRunner::stateName(State state) {
  switch (state) {
    case State::RESOLVING:
      return "Resolving";
    case State::SELECTING:
      return "Selecting";
    case State::TRANSFERRING:
      return "Transferring";
    case State::SUCCEEDED:
      return "Succeeded";
    case State::FAILED:
      return "Failed";
    default:
      return "Unknown";
  }
}

std::optional<StreamDescriptor> JobRunner::selectStream(
    const std::vector<StreamDescriptor>& streams, MediaKind kind) {
  const StreamDescriptor* best = nullptr;
  for (const auto& stream : streams) {
    if (!matchesKind(stream, kind)) continue;
    if (best == nullptr || stream.qualityRank > best->qualityRank) {
      best = &stream;
    }
  }
  if (best == nullptr) return std::nullopt;
  return *best;
}

int JobRunner::toPercent(uint64_t downloaded, uint64_t total) {
  if (total == 0) return -1;
  if (downloaded >= total) return 100;
  // 整数除法即向下取整；超大值先缩小 total 防止乘法溢出
  if (downloaded > std::numeric_limits<uint64_t>::max() / 100) {
    return static_cast<int>(std::min<uint64_t>(downloaded / (total / 100), 99));
  }
  return static_cast<int>(downloaded * 100 / total);
}

void JobRunner::run() {
  LOG(INFO) << "[JobRunner] " << handle_ << " start, kind="
            << mediaKindName(request_.kind)
            << " dest=" << request_.destinationDir
            << (request_.proxy ? " proxy=" + *request_.proxy : std::string());
  auto self = shared_from_this();
  offloadOrFail([self]() { self->resolve(); },
                FailureReason::RESOLUTION_ERROR);
}

// offload 线程
void JobRunner::resolve() {
  std::vector<StreamDescriptor> streams;
  try {
    streams = source_->resolve(request_.target, request_.proxy);
  } catch (const ResolutionError& e) {
    fail(FailureReason::RESOLUTION_ERROR, e.what());
    return;
  } catch (const std::exception& e) {
    fail(FailureReason::RESOLUTION_ERROR,
         std::string("unexpected: ") + e.what());
    return;
  }
  LOG(DEBUG) << "[JobRunner] " << handle_ << " resolved " << streams.size()
             << " streams";
  auto self = shared_from_this();
  continueOnLoop([self, streams = std::move(streams)]() {
    self->select(streams);
  });
}

// 调度线程
void JobRunner::select(const std::vector<StreamDescriptor>& streams) {
  transition(State::SELECTING);
  auto chosen = selectStream(streams, request_.kind);
  if (!chosen) {
    fail(FailureReason::NO_STREAM_AVAILABLE,
         std::string("no ") + mediaKindName(request_.kind) +
             " stream among " + std::to_string(streams.size()) + " streams");
    return;
  }
  LOG(INFO) << "[JobRunner] " << handle_ << " selected " << chosen->mimeType
            << " rank=" << chosen->qualityRank
            << " size=" << chosen->totalSizeBytes;

  transition(State::TRANSFERRING);
  auto self = shared_from_this();
  offloadOrFail(
      [self, stream = std::move(*chosen)]() { self->transfer(stream); },
      FailureReason::TRANSFER_ERROR);
}

// offload 线程
void JobRunner::transfer(const StreamDescriptor& stream) {
  std::string path;
  try {
    path = source_->transfer(
        stream, request_.destinationDir, request_.proxy,
        [this](uint64_t downloaded, uint64_t total) {
          onProgress(downloaded, total);
        });
  } catch (const TransferError& e) {
    fail(FailureReason::TRANSFER_ERROR, e.what());
    return;
  } catch (const std::exception& e) {
    fail(FailureReason::TRANSFER_ERROR,
         std::string("unexpected: ") + e.what());
    return;
  }
  auto self = shared_from_this();
  continueOnLoop([self, path]() { self->succeed(path); });
}

// transfer 所在线程
void JobRunner::onProgress(uint64_t downloaded, uint64_t total) {
  const int percent = toPercent(downloaded, total);
  if (percent < 0) return;
  std::lock_guard<std::mutex> lock(emit_mutex_);
  if (finished_ || percent <= last_percent_) return;
  last_percent_ = percent;
  channel_->send(handle_.id, makeProgress(percent));
}

void JobRunner::continueOnLoop(Task task) {
  if (post_(task)) return;
  LOG(WARN) << "[JobRunner] " << handle_
            << " scheduling loop stopped, continuing on offload thread";
  task();
}

void JobRunner::offloadOrFail(Task task, FailureReason reason) {
  try {
    offload_(std::move(task));
  } catch (const std::exception& e) {
    fail(reason, std::string("cannot offload: ") + e.what());
  }
}

void JobRunner::transition(State next) {
  State prev = state_.exchange(next);
  LOG(DEBUG) << "[JobRunner] " << handle_ << " " << stateName(prev) << " -> "
             << stateName(next);
}

void JobRunner::succeed(const std::string& path) {
  transition(State::SUCCEEDED);
  LOG(INFO) << "[JobRunner] " << handle_ << " saved to " << path;
  finish(makeSuccess(path));
}

void JobRunner::fail(FailureReason reason, const std::string& detail) {
  transition(State::FAILED);
  LOG(WARN) << "[JobRunner] " << handle_ << " failed: "
            << failureReasonName(reason) << ": " << detail;
  finish(makeFailure(reason, detail));
}

void JobRunner::finish(Notification terminal) {
  {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    if (finished_) {
      LOG(ERROR) << "[JobRunner] " << handle_
                 << " already finished, dropping " << describe(terminal);
      return;
    }
    finished_ = true;
    channel_->send(handle_.id, std::move(terminal));
  }
  if (onDone_) onDone_(handle_.id);
}

}  // namespace fetcher
