#include "TaskExecutor.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include "Errors.hpp"
#include "JobRunner.hpp"
#include "flags.hpp"
#include "logger.hpp"

namespace fetcher {

namespace {
constexpr const char* kOffloadArenaName = "offload";
}  // namespace

TaskExecutor::TaskExecutor(std::shared_ptr<MediaSource> source,
                           std::shared_ptr<NotificationChannel> channel,
                           int offloadThreads)
    : source_(std::move(source)), channel_(std::move(channel)) {
  if (offloadThreads <= 0) offloadThreads = FLAGS_offload_threads;
  pool_ = std::make_unique<utils::OffloadPool>(kOffloadArenaName,
                                               offloadThreads);
}

TaskExecutor::~TaskExecutor() {
  shutdown();
  // 调度线程已退出，剩余的 offload 任务在各自线程上完成终态通知
  pool_.reset();
}

const char* TaskExecutor::stateName(State state) {
  switch (state) {
    case State::NOT_STARTED:
      return "NotStarted";
    case State::RUNNING:
      return "Running";
    case State::STOPPING:
      return "Stopping";
    case State::STOPPED:
      return "Stopped";
    default:
      return "Unknown";
  }
}

void TaskExecutor::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::NOT_STARTED) {
    throw AlreadyStartedError();
  }
  // loop() 以 state_ 判断是否退出，须先置为 Running 再创建线程
  state_ = State::RUNNING;
  try {
    loopThread_ = spawnLoopThread();
  } catch (const std::system_error& e) {
    state_ = State::NOT_STARTED;
    LOG(ERROR) << "[TaskExecutor] failed to start scheduling loop: "
               << e.what();
    throw;
  }
  LOG(INFO) << "[TaskExecutor] started, offload concurrency "
            << pool_->Concurrency();
}

JobHandle TaskExecutor::submit(const JobRequest& job) {
  std::shared_ptr<JobRunner> runner;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::RUNNING) {
      throw NotRunningError();
    }
    JobHandle handle{nextJobId_.fetch_add(1), job.target};
    utils::OffloadPool* pool = pool_.get();
    runner = std::make_shared<JobRunner>(
        handle, job, source_, channel_,
        [this](Task task) { return post(std::move(task)); },
        [pool](Task task) { pool->Submit(std::move(task)); },
        [this](JobId id) { onJobDone(id); });
    taskQueue_.push_back([runner]() { runner->run(); });
    ++inFlight_;
  }
  tasksCv_.notify_one();
  LOG(INFO) << "[TaskExecutor] submitted " << runner->handle();
  return runner->handle();
}

std::thread TaskExecutor::spawnLoopThread() {
  return std::thread([this]() { loop(); });
}

bool TaskExecutor::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != State::RUNNING) return false;
    taskQueue_.push_back(std::move(task));
  }
  tasksCv_.notify_one();
  return true;
}

void TaskExecutor::shutdown() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ == State::NOT_STARTED || state_ == State::STOPPED) return;
    // 调度线程不能 join 自己
    if (std::this_thread::get_id() == loopThread_.get_id()) {
      LOG(ERROR) << "[TaskExecutor] shutdown called from the scheduling loop, "
                    "ignored";
      return;
    }
    if (state_ == State::STOPPING) {
      // 另一个线程正在 shutdown，等它完成
      stateCv_.wait(lock, [this]() { return state_ == State::STOPPED; });
      return;
    }
    state_ = State::STOPPING;
    LOG(INFO) << "[TaskExecutor] stopping, " << taskQueue_.size()
              << " queued tasks, " << inFlight_ << " jobs in flight";
  }
  tasksCv_.notify_all();

  if (loopThread_.joinable()) {
    loopThread_.join();
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::STOPPED;
  }
  stateCv_.notify_all();
  LOG(INFO) << "[TaskExecutor] stopped";
}

TaskExecutor::State TaskExecutor::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

size_t TaskExecutor::inFlight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return inFlight_;
}

bool TaskExecutor::waitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idleCv_.wait_for(lock, timeout, [this]() { return inFlight_ == 0; });
}

void TaskExecutor::loop() {
  LOG(DEBUG) << "[TaskExecutor] scheduling loop running";
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    tasksCv_.wait(lock, [this]() {
      return !taskQueue_.empty() || state_ != State::RUNNING;
    });
    // Stopping 时先执行完队列中剩余的任务再退出
    if (taskQueue_.empty()) break;

    Task task = std::move(taskQueue_.front());
    taskQueue_.pop_front();

    lock.unlock();  // Unlock before executing the task
    try {
      task();
    } catch (const std::exception& e) {
      LOG(ERROR) << "[TaskExecutor] Exception in scheduled task: " << e.what();
    }
    lock.lock();
  }
  LOG(DEBUG) << "[TaskExecutor] scheduling loop exited";
}

void TaskExecutor::onJobDone(JobId id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --inFlight_;
    LOG(DEBUG) << "[TaskExecutor] job#" << id << " done, " << inFlight_
               << " in flight";
  }
  idleCv_.notify_all();
}

}  // namespace fetcher
