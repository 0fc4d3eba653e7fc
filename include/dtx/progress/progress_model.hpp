#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <json/json.h>

#include "dtx/core/types.hpp"

namespace dtx {

// Cumulative per-stage counters for one transfer. Counters only grow.
//
// The stage runner is the only writer; snapshots may be taken from any
// thread.
class ProgressModel {
 public:
  ProgressModel();

  ProgressModel(const ProgressModel&) = delete;
  ProgressModel& operator=(const ProgressModel&) = delete;

  // Counts one item for `stage`. When `aggregate_key` names a member of the
  // item, the item is also counted in the bucket named after that member's
  // value.
  void record(TransferStage stage, const Item& item,
              const std::optional<std::string>& aggregate_key = std::nullopt);

  std::shared_ptr<const TransferProgress> snapshot() const;
  std::optional<ProgressEntry> entry(TransferStage stage) const;

  // Length of the compact JSON encoding of `item`.
  uint64_t serialized_size(const Item& item) const;

 private:
  std::string encode(const Item& item) const;

  Json::StreamWriterBuilder writer_{};
  mutable std::mutex mu_;
  TransferProgress progress_{};
};

}  // namespace dtx
