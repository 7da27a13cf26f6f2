#include "offload_pool.hpp"

#include <tbb/info.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <sstream>
#include <utility>

#include "flags.hpp"
#include "logger.hpp"

namespace fetcher {
namespace utils {

namespace {
std::atomic<uint64_t> global_task_id{0};

int ResolveConcurrency(const std::string& name, int requested) {
  if (requested > 0) return requested;
  int concurrency = 0;
  auto& defines = OffloadPool::GetTBBParallelCountDefines();
  auto it = defines.find(name);
  if (it != defines.end()) {
    concurrency = it->second;
  }
  if (concurrency <= 0) {
    concurrency = tbb::info::default_concurrency();
  }
  return concurrency;
}
}  // namespace

OffloadPool::OffloadPool(const std::string& name, int concurrency)
    : name_(name), concurrency_(ResolveConcurrency(name, concurrency)) {
  const int parallelism =
      std::max(concurrency_ + 1, tbb::info::default_concurrency());
  parallelism_ = std::make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism,
      static_cast<size_t>(parallelism));
  // 不给外部线程预留 slot，enqueue 的任务全部由 worker 执行
  arena_ = std::make_shared<tbb::task_arena>(concurrency_, 0);
  arena_->initialize();
  LOG(INFO) << "[OffloadPool] Arena '" << name_
            << "' initialized with concurrency: " << concurrency_;
}

OffloadPool::~OffloadPool() {
  Wait();
  arena_->terminate();
  LOG(INFO) << "[OffloadPool] Arena '" << name_ << "' released.";
}

void OffloadPool::Submit(std::function<void()> task) {
  uint64_t task_id = GenerateUniqueTaskId();
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    ++pending_;
  }
  LOG(DEBUG) << "[OffloadPool] '" << name_ << "' enqueue task " << task_id;
  // arena 以 const 方式调用任务，用 shared_ptr 持有以便执行后立即释放
  auto fn = std::make_shared<std::function<void()>>(std::move(task));
  arena_->enqueue([this, task_id, fn]() {
    try {
      (*fn)();
    } catch (const std::exception& e) {
      LOG(ERROR) << "[OffloadPool] Exception in task " << task_id << ": "
                 << e.what();
    }
    *fn = nullptr;
    LOG(DEBUG) << "[OffloadPool] '" << name_ << "' task " << task_id
               << " done";
    OnTaskDone();
  });
}

void OffloadPool::Wait() {
  std::unique_lock<std::mutex> lock(pending_mutex_);
  pending_cv_.wait(lock, [this]() { return pending_ == 0; });
}

size_t OffloadPool::Pending() const {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  return pending_;
}

void OffloadPool::OnTaskDone() {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  --pending_;
  // 在锁内通知，保证 Wait 返回后不再访问本对象
  pending_cv_.notify_all();
}

std::map<std::string, int> OffloadPool::ParseParallelControl(
    const std::string& cfg) {
  std::map<std::string, int> defines;
  std::istringstream ss(cfg);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto pos = item.find(':');
    if (pos == std::string::npos || pos == 0) {
      if (!item.empty()) {
        LOG(WARN) << "[OffloadPool] Ignoring parallel control entry: " << item;
      }
      continue;
    }
    std::string name = item.substr(0, pos);
    try {
      defines[name] = std::stoi(item.substr(pos + 1));
    } catch (const std::exception&) {
      LOG(WARN) << "[OffloadPool] Invalid concurrency for '" << name
                << "': " << item.substr(pos + 1);
    }
  }
  return defines;
}

std::map<std::string, int>& OffloadPool::GetTBBParallelCountDefines() {
  static std::map<std::string, int> defines =
      ParseParallelControl(FLAGS_custom_tbb_parallel_control);
  return defines;
}

uint64_t OffloadPool::GenerateUniqueTaskId() const {
  return global_task_id.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace utils
}  // namespace fetcher
