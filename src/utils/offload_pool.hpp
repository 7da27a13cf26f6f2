#ifndef FETCHER_OFFLOAD_POOL_HPP_
#define FETCHER_OFFLOAD_POOL_HPP_

#include <tbb/global_control.h>
#include <tbb/task_arena.h>

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace fetcher {
namespace utils {

/**
 * @brief 基于 TBB task_arena 的阻塞任务池
 *
 * 每个池拥有一个命名 arena，并发度按以下顺序决定：构造参数 >
 * --custom_tbb_parallel_control 中同名条目 > tbb::info::default_concurrency()。
 * Submit 立即返回，任务在 arena 的工作线程上执行；Wait 阻塞到所有已提交任务结束。
 * 不支持取消正在执行的任务。
 * 注意 global_control 的 max_allowed_parallelism 是进程级的，同时存在多个池时
 * 取最小值生效，上限小的池会压低其它池的 worker 数。每个进程只应有一个
 * TaskExecutor。
 */
class OffloadPool {
 public:
  explicit OffloadPool(const std::string& name, int concurrency = 0);
  ~OffloadPool();

  OffloadPool(const OffloadPool&) = delete;
  OffloadPool& operator=(const OffloadPool&) = delete;

  void Submit(std::function<void()> task);

  // 等待所有已提交的任务执行完毕
  void Wait();

  size_t Pending() const;
  int Concurrency() const { return concurrency_; }
  const std::string& Name() const { return name_; }

  // 解析 "arena1:4,arena2:8"，非法条目被忽略
  static std::map<std::string, int> ParseParallelControl(
      const std::string& cfg);
  static std::map<std::string, int>& GetTBBParallelCountDefines();

 private:
  uint64_t GenerateUniqueTaskId() const;
  void OnTaskDone();

  std::string name_;
  int concurrency_;
  // 阻塞任务不占 CPU，允许 worker 数超过硬件并发度
  std::unique_ptr<tbb::global_control> parallelism_;
  std::shared_ptr<tbb::task_arena> arena_;

  mutable std::mutex pending_mutex_;
  std::condition_variable pending_cv_;
  size_t pending_{0};
};

}  // namespace utils
}  // namespace fetcher

#endif  // FETCHER_OFFLOAD_POOL_HPP_
