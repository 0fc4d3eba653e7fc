#include "sink/digest_sink.hpp"

#include <array>

#include <xxhash.h>

namespace dtx::sink {

namespace {

// splitmix64 finalizer; spreads a per-item hash before it is summed.
uint64_t finalize(uint64_t x) {
  x ^= x >> 30;
  x *= 0xbf58476d1ce4e5b9ULL;
  x ^= x >> 27;
  x *= 0x94d049bb133111ebULL;
  x ^= x >> 31;
  return x;
}

}  // namespace

DigestSink::DigestSink(uint64_t seed) : seed_(seed) {}

void DigestSink::consume(std::string_view encoded) {
  const uint64_t h = XXH64(encoded.data(), encoded.size(), seed_);

  bytes_.fetch_add(encoded.size(), std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_.fetch_add(h, std::memory_order_relaxed);
  spread_sum_.fetch_add(finalize(h), std::memory_order_relaxed);
}

uint64_t DigestSink::digest() const {
  const std::array<uint64_t, 4> totals{
      count_.load(std::memory_order_relaxed),
      bytes_.load(std::memory_order_relaxed),
      sum_.load(std::memory_order_relaxed),
      spread_sum_.load(std::memory_order_relaxed),
  };
  return XXH64(totals.data(), sizeof(totals), seed_);
}

uint64_t DigestSink::bytes() const { return bytes_.load(std::memory_order_relaxed); }

uint64_t DigestSink::count() const { return count_.load(std::memory_order_relaxed); }

}  // namespace dtx::sink
