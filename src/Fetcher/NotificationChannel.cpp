#include "NotificationChannel.hpp"

#include <utility>

#include "logger.hpp"

namespace fetcher {

void NotificationChannel::send(JobId jobId, Notification notification) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      LOG(DEBUG) << "[NotificationChannel] closed, dropping notification "
                 << "for job " << jobId;
      return;
    }
    queue_.push_back(Envelope{jobId, std::move(notification)});
  }
  cv_.notify_one();
}

std::optional<NotificationChannel::Envelope> NotificationChannel::receive(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });
  if (queue_.empty()) return std::nullopt;
  Envelope envelope = std::move(queue_.front());
  queue_.pop_front();
  return envelope;
}

size_t NotificationChannel::drain(const Handler& handler) {
  std::deque<Envelope> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending.swap(queue_);
  }
  for (const auto& envelope : pending) {
    handler(envelope);
  }
  return pending.size();
}

void NotificationChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool NotificationChannel::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t NotificationChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

}  // namespace fetcher
