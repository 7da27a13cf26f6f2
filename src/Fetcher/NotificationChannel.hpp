#ifndef FETCHER_NOTIFICATION_CHANNEL_HPP_
#define FETCHER_NOTIFICATION_CHANNEL_HPP_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

#include "JobRequest.hpp"
#include "Notification.hpp"

namespace fetcher {

/**
 * @brief 跨线程通知队列
 *
 * send 可在任意线程并发调用，通知按 send 完成的先后顺序交付（FIFO）。
 * 缓冲无上限，不丢弃任何通知；close 之后的 send 被忽略。
 */
class NotificationChannel {
 public:
  struct Envelope {
    JobId jobId = 0;
    Notification notification;
  };
  using Handler = std::function<void(const Envelope&)>;

  NotificationChannel() = default;
  NotificationChannel(const NotificationChannel&) = delete;
  NotificationChannel& operator=(const NotificationChannel&) = delete;

  void send(JobId jobId, Notification notification);

  // 阻塞至多 timeout 取出一条；超时或已关闭且为空时返回 nullopt
  std::optional<Envelope> receive(std::chrono::milliseconds timeout);

  // 在调用线程上交付当前缓冲的全部通知，返回交付数量
  size_t drain(const Handler& handler);

  void close();
  bool closed() const;
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Envelope> queue_;
  bool closed_ = false;
};

}  // namespace fetcher

#endif  // FETCHER_NOTIFICATION_CHANNEL_HPP_
