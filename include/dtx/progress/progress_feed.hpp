#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "dtx/core/types.hpp"

namespace dtx {

// One reader of a ProgressFeed. Holds its own bounded buffer; when the
// reader falls behind, the oldest buffered event is dropped.
class ProgressSubscription {
 public:
  explicit ProgressSubscription(size_t capacity);

  ProgressSubscription(const ProgressSubscription&) = delete;
  ProgressSubscription& operator=(const ProgressSubscription&) = delete;

  std::optional<ProgressEvent> try_pop();

  // Waits up to `timeout`. Returns nullopt on timeout or once the feed is
  // closed and the buffer is empty.
  std::optional<ProgressEvent> wait_pop(std::chrono::milliseconds timeout);

  std::vector<ProgressEvent> drain();

  uint64_t dropped() const;
  bool closed() const;

 private:
  friend class ProgressFeed;

  void push(const ProgressEvent& event);
  void close();

  size_t capacity_{1};
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<ProgressEvent> buffer_;
  uint64_t dropped_{0};
  bool closed_{false};
};

// Broadcast channel for progress events. Publishing never blocks on readers.
class ProgressFeed {
 public:
  explicit ProgressFeed(size_t default_capacity = 4096);

  ProgressFeed(const ProgressFeed&) = delete;
  ProgressFeed& operator=(const ProgressFeed&) = delete;

  // capacity 0 selects the feed's default capacity.
  std::shared_ptr<ProgressSubscription> subscribe(size_t capacity = 0);
  void unsubscribe(const std::shared_ptr<ProgressSubscription>& subscription);

  void publish(const ProgressEvent& event);
  bool has_subscribers() const;

  // Wakes every reader; events published afterwards are discarded.
  void close();
  bool closed() const;

 private:
  size_t default_capacity_{4096};
  mutable std::mutex mu_;
  std::vector<std::weak_ptr<ProgressSubscription>> subscribers_;
  bool closed_{false};
};

}  // namespace dtx
