#pragma once
/*
 * EventQueue
 *
 * Purpose: thread-safe FIFO carrying results of background work back to the event loop.
 * Design: mutex + condition variable; background jobs only push, the loop only pops.
 */
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

template <typename E>
class EventQueue {
public:
  void push(E ev) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      q_.push_back(std::move(ev));
    }
    cv_.notify_one();
  }

  std::optional<E> try_pop() {
    std::lock_guard<std::mutex> lk(mu_);
    if (q_.empty()) return std::nullopt;
    E ev = std::move(q_.front());
    q_.pop_front();
    return ev;
  }

  E pop() {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return !q_.empty(); });
    E ev = std::move(q_.front());
    q_.pop_front();
    return ev;
  }

  std::optional<E> pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!cv_.wait_for(lk, timeout, [this] { return !q_.empty(); })) return std::nullopt;
    E ev = std::move(q_.front());
    q_.pop_front();
    return ev;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return q_.size();
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<E> q_;
};
