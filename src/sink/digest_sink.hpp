#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

namespace dtx::sink {

// Order-independent fingerprint over a stream of encoded items: each item's
// XXH64 is summed twice, once raw and once after a finalizer pass.
class DigestSink {
 public:
  explicit DigestSink(uint64_t seed);
  ~DigestSink() = default;

  DigestSink(const DigestSink&) = delete;
  DigestSink& operator=(const DigestSink&) = delete;

  void consume(std::string_view encoded);
  uint64_t digest() const;
  uint64_t bytes() const;
  uint64_t count() const;

 private:
  uint64_t seed_{0};
  std::atomic<uint64_t> bytes_{0};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_{0};
  std::atomic<uint64_t> spread_sum_{0};
};

}  // namespace dtx::sink
