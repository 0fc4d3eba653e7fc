#include "dtx/progress/progress_model.hpp"

#include <utility>

namespace dtx {

ProgressModel::ProgressModel() {
  writer_["indentation"] = "";
  writer_["commentStyle"] = "None";
  writer_["emitUTF8"] = true;
}

std::string ProgressModel::encode(const Item& item) const {
  return Json::writeString(writer_, item);
}

uint64_t ProgressModel::serialized_size(const Item& item) const {
  return static_cast<uint64_t>(encode(item).size());
}

void ProgressModel::record(TransferStage stage, const Item& item,
                           const std::optional<std::string>& aggregate_key) {
  const uint64_t size = serialized_size(item);

  std::optional<std::string> bucket;
  if (aggregate_key && item.isObject() && item.isMember(*aggregate_key)) {
    const Item& value = item[*aggregate_key];
    bucket = value.isString() ? value.asString() : encode(value);
  }

  std::scoped_lock lock(mu_);
  auto& entry = progress_[stage];
  entry.count += 1;
  entry.bytes += size;

  if (bucket) {
    auto& agg = entry.aggregates[*bucket];
    agg.count += 1;
    agg.bytes += size;
  }
}

std::shared_ptr<const TransferProgress> ProgressModel::snapshot() const {
  std::scoped_lock lock(mu_);
  return std::make_shared<const TransferProgress>(progress_);
}

std::optional<ProgressEntry> ProgressModel::entry(TransferStage stage) const {
  std::scoped_lock lock(mu_);
  const auto it = progress_.find(stage);
  if (it == progress_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace dtx
