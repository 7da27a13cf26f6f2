#ifndef FETCHER_TASK_EXECUTOR_HPP_
#define FETCHER_TASK_EXECUTOR_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "JobRequest.hpp"
#include "MediaSource.hpp"
#include "NotificationChannel.hpp"
#include "offload_pool.hpp"

namespace fetcher {

/**
 * @brief 常驻后台调度线程 + 阻塞任务池
 *
 * 状态：NotStarted -> Running -> Stopping -> Stopped。
 * start() 启动唯一的调度线程；submit() 把任务交给调度线程后立即返回；
 * shutdown() 停止接收新任务，执行完队列中已有的任务后等待调度线程退出。
 * 已经交给 OffloadPool 的阻塞调用不会被取消，析构时等待它们结束。
 */
class TaskExecutor {
 public:
  enum class State { NOT_STARTED, RUNNING, STOPPING, STOPPED };
  using Task = std::function<void()>;

  // offloadThreads <= 0 时按 --offload_threads / --custom_tbb_parallel_control
  TaskExecutor(std::shared_ptr<MediaSource> source,
               std::shared_ptr<NotificationChannel> channel,
               int offloadThreads = 0);
  virtual ~TaskExecutor();

  TaskExecutor(const TaskExecutor&) = delete;
  TaskExecutor& operator=(const TaskExecutor&) = delete;

  // 重复调用（包括 shutdown 之后）抛 AlreadyStartedError
  void start();

  // 非 Running 状态抛 NotRunningError
  JobHandle submit(const JobRequest& job);

  // 幂等；未启动时为空操作；在调度线程上调用时记录错误并忽略
  void shutdown();

  // 把 task 交给调度线程执行；调度线程不再接收任务时返回 false
  bool post(Task task);

  State state() const;
  size_t inFlight() const;

  // 等待所有已提交任务产生终态通知，超时返回 false
  bool waitIdle(std::chrono::milliseconds timeout);

  static const char* stateName(State state);

 protected:
  // 创建调度线程；失败时抛 std::system_error，start() 回到 NotStarted
  virtual std::thread spawnLoopThread();

 private:
  void loop();
  void onJobDone(JobId id);

  std::shared_ptr<MediaSource> source_;
  std::shared_ptr<NotificationChannel> channel_;
  std::unique_ptr<utils::OffloadPool> pool_;

  mutable std::mutex mutex_;
  std::condition_variable tasksCv_;
  std::condition_variable stateCv_;
  std::condition_variable idleCv_;
  std::deque<Task> taskQueue_;
  State state_ = State::NOT_STARTED;
  size_t inFlight_ = 0;
  std::thread loopThread_;

  std::atomic<JobId> nextJobId_{1};
};

}  // namespace fetcher

#endif  // FETCHER_TASK_EXECUTOR_HPP_
