#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "wlmerge/errors.hpp"

namespace wlmerge {

// Multi-producer / single-consumer queue with a fixed capacity.
// Send blocks while the queue is full; Receive blocks while it is empty and
// still open. After Close, queued items are still drained by Receive.
template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(std::size_t capacity)
      : capacity_(capacity == 0 ? 1 : capacity) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  // Throws ChannelError if the channel was closed before or while waiting.
  void Send(T&& item) {
    std::unique_lock<std::mutex> lk(m_);
    cv_send_.wait(lk, [&] { return q_.size() < capacity_ || closed_; });
    if (closed_) throw ChannelError("send on closed channel");
    q_.emplace_back(std::move(item));
    cv_recv_.notify_one();
  }

  // False once the channel is closed and drained.
  bool Receive(T& out) {
    std::unique_lock<std::mutex> lk(m_);
    cv_recv_.wait(lk, [&] { return !q_.empty() || closed_; });
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    cv_send_.notify_one();
    return true;
  }

  void Close() {
    std::lock_guard<std::mutex> lk(m_);
    closed_ = true;
    cv_recv_.notify_all();
    cv_send_.notify_all();
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(m_);
    return q_.size();
  }

  std::size_t capacity() const { return capacity_; }

 private:
  mutable std::mutex m_;
  std::condition_variable cv_send_;
  std::condition_variable cv_recv_;
  std::deque<T> q_;
  const std::size_t capacity_;
  bool closed_ = false;
};

}  // namespace wlmerge
