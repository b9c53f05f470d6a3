#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace di {

// Multi-producer/multi-consumer FIFO with a fixed capacity. push() blocks
// while full, pop() blocks while empty. close() lets consumers drain what is
// queued; abort() drops it.
template <class T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t cap) : cap_(cap ? cap : 1) {}

  // false if the queue was closed; the item is dropped.
  bool push(T&& it) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_push_.wait(lk, [&]{ return q_.size() < cap_ || closed_; });
    if (closed_) return false;
    q_.push_back(std::move(it));
    cv_pop_.notify_one();
    return true;
  }

  // false once closed and empty.
  bool pop(T& out) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_pop_.wait(lk, [&]{ return !q_.empty() || closed_; });
    if (q_.empty()) return false;
    out = std::move(q_.front());
    q_.pop_front();
    cv_push_.notify_one();
    return true;
  }

  void close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    cv_pop_.notify_all();
    cv_push_.notify_all();
  }

  void abort() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    q_.clear();
    cv_pop_.notify_all();
    cv_push_.notify_all();
  }

private:
  std::mutex mu_;
  std::condition_variable cv_push_, cv_pop_;
  std::deque<T> q_;
  std::size_t cap_;
  bool closed_ = false;
};

}
