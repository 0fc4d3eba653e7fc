#include "dtx/progress/progress_feed.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace dtx {

ProgressSubscription::ProgressSubscription(size_t capacity)
    : capacity_(capacity == 0 ? 1u : capacity) {}

void ProgressSubscription::push(const ProgressEvent& event) {
  {
    std::scoped_lock lock(mu_);
    if (closed_) {
      return;
    }
    if (buffer_.size() >= capacity_) {
      buffer_.pop_front();
      ++dropped_;
    }
    buffer_.push_back(event);
  }
  cv_.notify_one();
}

void ProgressSubscription::close() {
  {
    std::scoped_lock lock(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::optional<ProgressEvent> ProgressSubscription::try_pop() {
  std::scoped_lock lock(mu_);
  if (buffer_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(buffer_.front());
  buffer_.pop_front();
  return event;
}

std::optional<ProgressEvent> ProgressSubscription::wait_pop(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mu_);
  cv_.wait_for(lock, timeout, [this]() { return closed_ || !buffer_.empty(); });
  if (buffer_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(buffer_.front());
  buffer_.pop_front();
  return event;
}

std::vector<ProgressEvent> ProgressSubscription::drain() {
  std::scoped_lock lock(mu_);
  std::vector<ProgressEvent> out(std::make_move_iterator(buffer_.begin()),
                                 std::make_move_iterator(buffer_.end()));
  buffer_.clear();
  return out;
}

uint64_t ProgressSubscription::dropped() const {
  std::scoped_lock lock(mu_);
  return dropped_;
}

bool ProgressSubscription::closed() const {
  std::scoped_lock lock(mu_);
  return closed_;
}

ProgressFeed::ProgressFeed(size_t default_capacity)
    : default_capacity_(default_capacity == 0 ? 1u : default_capacity) {}

std::shared_ptr<ProgressSubscription> ProgressFeed::subscribe(size_t capacity) {
  auto subscription =
      std::make_shared<ProgressSubscription>(capacity == 0 ? default_capacity_ : capacity);

  std::scoped_lock lock(mu_);
  if (closed_) {
    subscription->close();
  } else {
    subscribers_.push_back(subscription);
  }
  return subscription;
}

void ProgressFeed::unsubscribe(const std::shared_ptr<ProgressSubscription>& subscription) {
  std::scoped_lock lock(mu_);
  std::erase_if(subscribers_, [&](const std::weak_ptr<ProgressSubscription>& weak) {
    const auto live = weak.lock();
    return !live || live == subscription;
  });
}

void ProgressFeed::publish(const ProgressEvent& event) {
  std::vector<std::shared_ptr<ProgressSubscription>> live;
  {
    std::scoped_lock lock(mu_);
    if (closed_) {
      return;
    }
    std::erase_if(subscribers_, [](const std::weak_ptr<ProgressSubscription>& weak) {
      return weak.expired();
    });
    live.reserve(subscribers_.size());
    for (const auto& weak : subscribers_) {
      if (auto sub = weak.lock()) {
        live.push_back(std::move(sub));
      }
    }
  }

  for (const auto& sub : live) {
    sub->push(event);
  }
}

bool ProgressFeed::has_subscribers() const {
  std::scoped_lock lock(mu_);
  return std::any_of(subscribers_.begin(), subscribers_.end(),
                     [](const std::weak_ptr<ProgressSubscription>& weak) {
                       return !weak.expired();
                     });
}

void ProgressFeed::close() {
  std::vector<std::shared_ptr<ProgressSubscription>> live;
  {
    std::scoped_lock lock(mu_);
    if (closed_) {
      return;
    }
    closed_ = true;
    for (const auto& weak : subscribers_) {
      if (auto sub = weak.lock()) {
        live.push_back(std::move(sub));
      }
    }
    subscribers_.clear();
  }

  for (const auto& sub : live) {
    sub->close();
  }
}

bool ProgressFeed::closed() const {
  std::scoped_lock lock(mu_);
  return closed_;
}

}  // namespace dtx
