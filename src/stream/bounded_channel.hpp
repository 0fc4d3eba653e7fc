#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "dtx/core/error.hpp"
#include "dtx/core/expected.hpp"

namespace dtx::stream {

// Single-producer single-consumer queue of fixed depth. push() blocks while
// the queue is full, which is what throttles a fast source to the pace of a
// slow sink.
template <typename T>
class BoundedChannel {
 public:
  explicit BoundedChannel(size_t depth) : depth_(depth == 0 ? 1u : depth) {}

  BoundedChannel(const BoundedChannel&) = delete;
  BoundedChannel& operator=(const BoundedChannel&) = delete;

  // Returns false once the consumer has cancelled.
  bool push(T item) {
    std::unique_lock lock(mu_);
    cv_not_full_.wait(lock, [this]() { return queue_.size() < depth_ || cancelled_; });
    if (cancelled_) {
      return false;
    }
    queue_.push_back(std::move(item));
    if (queue_.size() > high_water_) {
      high_water_ = queue_.size();
    }
    cv_not_empty_.notify_one();
    return true;
  }

  void finish() {
    std::scoped_lock lock(mu_);
    finished_ = true;
    cv_not_empty_.notify_all();
  }

  void fail(Error error) {
    std::scoped_lock lock(mu_);
    error_ = std::move(error);
    finished_ = true;
    cv_not_empty_.notify_all();
  }

  void cancel() {
    std::scoped_lock lock(mu_);
    cancelled_ = true;
    queue_.clear();
    cv_not_full_.notify_all();
  }

  // A producer error is reported as soon as it is raised, ahead of any items
  // still queued. An empty optional marks the end of the stream.
  Expected<std::optional<T>> pop() {
    std::unique_lock lock(mu_);
    cv_not_empty_.wait(lock, [this]() { return finished_ || !queue_.empty(); });
    if (error_) {
      return make_unexpected(*error_);
    }
    if (!queue_.empty()) {
      T item = std::move(queue_.front());
      queue_.pop_front();
      cv_not_full_.notify_one();
      return std::optional<T>{std::move(item)};
    }
    return std::optional<T>{};
  }

  size_t high_water() const {
    std::scoped_lock lock(mu_);
    return high_water_;
  }

 private:
  size_t depth_{1};

  mutable std::mutex mu_;
  std::condition_variable cv_not_empty_;
  std::condition_variable cv_not_full_;
  std::deque<T> queue_;
  std::optional<Error> error_;
  size_t high_water_{0};

  bool finished_{false};
  bool cancelled_{false};
};

}  // namespace dtx::stream
