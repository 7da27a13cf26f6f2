#ifndef FETCHER_JOB_RUNNER_HPP_
#define FETCHER_JOB_RUNNER_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "JobRequest.hpp"
#include "MediaSource.hpp"
#include "Notification.hpp"
#include "NotificationChannel.hpp"

namespace fetcher {

/**
 * @brief 单个任务的生命周期：Resolving -> Selecting -> Transferring -> 终态
 *
 * run() 在调度线程上调用。resolve 和 transfer 是阻塞调用，通过 offload
 * 放到 OffloadPool 上执行，结果再通过 post 回到调度线程。post 返回 false
 * （调度线程已停止接收任务）时，后续步骤直接在当前 offload 线程上继续，
 * 终态通知仍会发出。所有任务级异常都被转换成 Terminal(Failure)。
 */
class JobRunner : public std::enable_shared_from_this<JobRunner> {
 public:
  enum class State { RESOLVING, SELECTING, TRANSFERRING, SUCCEEDED, FAILED };

  using Task = std::function<void()>;
  using PostFn = std::function<bool(Task)>;
  using OffloadFn = std::function<void(Task)>;
  using DoneFn = std::function<void(JobId)>;

  JobRunner(JobHandle handle, JobRequest request,
            std::shared_ptr<MediaSource> source,
            std::shared_ptr<NotificationChannel> channel, PostFn post,
            OffloadFn offload, DoneFn onDone = nullptr);

  void run();

  State state() const { return state_.load(); }
  const JobHandle& handle() const { return handle_; }

  // 按 kind 过滤后取 qualityRank 最大者，并列时取先出现的
  static std::optional<StreamDescriptor> selectStream(
      const std::vector<StreamDescriptor>& streams, MediaKind kind);

  // floor(downloaded / total * 100)，限制在 [0, 100]；total 为 0 时返回 -1
  static int toPercent(uint64_t downloaded, uint64_t total);

  static const char* stateName(State state);

 private:
  void resolve();
  void select(const std::vector<StreamDescriptor>& streams);
  void transfer(const StreamDescriptor& stream);
  void onProgress(uint64_t downloaded, uint64_t total);

  void continueOnLoop(Task task);
  void offloadOrFail(Task task, FailureReason reason);

  void transition(State next);
  void succeed(const std::string& path);
  void fail(FailureReason reason, const std::string& detail);
  void finish(Notification terminal);

  const JobHandle handle_;
  const JobRequest request_;
  std::shared_ptr<MediaSource> source_;
  std::shared_ptr<NotificationChannel> channel_;
  PostFn post_;
  OffloadFn offload_;
  DoneFn onDone_;

  std::atomic<State> state_{State::RESOLVING};

  // 保护 last_percent_ 与 finished_，保证进度单调且终态之后不再发送
  std::mutex emit_mutex_;
  int last_percent_ = -1;
  bool finished_ = false;
};

}  // namespace fetcher

#endif  // FETCHER_JOB_RUNNER_HPP_
