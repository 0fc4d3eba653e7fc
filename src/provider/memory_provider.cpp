#include "dtx/provider/memory_provider.hpp"

#include <cstddef>
#include <exception>
#include <format>
#include <utility>

#include "dtx/core/error.hpp"
#include "sink/digest_sink.hpp"

namespace dtx {
namespace {

constexpr uint64_t kDigestSeed = 0x6474785f6d656dULL;

size_t index_of(TransferStage stage) { return static_cast<size_t>(stage); }

class VectorSource final : public IItemSource {
 public:
  VectorSource(std::shared_ptr<const MemoryDataset> owner, const std::vector<Item>& items,
               std::shared_ptr<std::atomic<uint64_t>> served)
      : owner_(std::move(owner)), items_(items), served_(std::move(served)) {}

  Expected<std::optional<Item>> next() noexcept override {
    if (pos_ >= items_.size()) {
      return std::optional<Item>{};
    }
    try {
      std::optional<Item> item{items_[pos_++]};
      served_->fetch_add(1, std::memory_order_relaxed);
      return item;
    } catch (const std::exception& ex) {
      return make_unexpected(Error{ErrorCode::SourceError, ex.what()});
    }
  }

 private:
  std::shared_ptr<const MemoryDataset> owner_;
  const std::vector<Item>& items_;
  std::shared_ptr<std::atomic<uint64_t>> served_;
  size_t pos_{0};
};

}  // namespace

MemorySourceProvider::MemorySourceProvider(std::string name, MemoryDataset dataset,
                                           std::optional<ProviderMetadata> metadata)
    : name_(std::move(name)),
      dataset_(std::make_shared<const MemoryDataset>(std::move(dataset))),
      metadata_(std::move(metadata)) {
  for (auto& counter : served_) {
    counter = std::make_shared<std::atomic<uint64_t>>(0);
  }
}

SourceCaps MemorySourceProvider::capabilities() const noexcept {
  SourceCaps caps{};
  caps.metadata = true;
  caps.schemas = true;
  caps.entities = true;
  caps.links = true;
  caps.configuration = true;
  return caps;
}

Json::Value MemorySourceProvider::results() const {
  Json::Value out(Json::objectValue);
  for (const auto stage : kTransferStages) {
    const auto served = served_[index_of(stage)]->load(std::memory_order_relaxed);
    if (served > 0) {
      out["stages"][stage_name(stage)]["count"] = Json::UInt64{served};
    }
  }
  return out;
}

Expected<std::optional<ProviderMetadata>> MemorySourceProvider::get_metadata() noexcept {
  return metadata_;
}

Expected<std::unique_ptr<IItemSource>> MemorySourceProvider::open(
    TransferStage stage, const std::vector<Item>& items) noexcept {
  try {
    return std::unique_ptr<IItemSource>(
        new VectorSource(dataset_, items, served_[index_of(stage)]));
  } catch (const std::exception& ex) {
    return make_unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

Expected<std::unique_ptr<IItemSource>> MemorySourceProvider::stream_schemas() noexcept {
  return open(TransferStage::Schemas, dataset_->schemas);
}

Expected<std::unique_ptr<IItemSource>> MemorySourceProvider::stream_entities() noexcept {
  return open(TransferStage::Entities, dataset_->entities);
}

Expected<std::unique_ptr<IItemSource>> MemorySourceProvider::stream_links() noexcept {
  return open(TransferStage::Links, dataset_->links);
}

Expected<std::unique_ptr<IItemSource>> MemorySourceProvider::stream_configuration() noexcept {
  return open(TransferStage::Configuration, dataset_->configuration);
}

class MemoryDestinationProvider::StageSink final : public IItemSink {
 public:
  StageSink(MemoryDestinationProvider& owner, TransferStage stage)
      : owner_(owner), stage_(stage) {}

  Expected<void> write(const Item& item) noexcept override {
    if (closed_) {
      return make_unexpected(Error{ErrorCode::DestinationError,
                                   std::format("{} stream is closed", stage_name(stage_))});
    }
    try {
      owner_.accept(stage_, item);
    } catch (const std::exception& ex) {
      return make_unexpected(Error{ErrorCode::DestinationError, ex.what()});
    }
    return {};
  }

  Expected<void> close() noexcept override {
    if (closed_) {
      return make_unexpected(Error{ErrorCode::DestinationError,
                                   std::format("{} stream closed twice", stage_name(stage_))});
    }
    closed_ = true;
    return {};
  }

 private:
  MemoryDestinationProvider& owner_;
  TransferStage stage_;
  bool closed_{false};
};

MemoryDestinationProvider::MemoryDestinationProvider(std::string name,
                                                     std::optional<ProviderMetadata> metadata)
    : name_(std::move(name)), metadata_(std::move(metadata)) {
  writer_["indentation"] = "";
  writer_["commentStyle"] = "None";
  writer_["emitUTF8"] = true;
  for (auto& digest : digests_) {
    digest = std::make_unique<sink::DigestSink>(kDigestSeed);
  }
}

MemoryDestinationProvider::~MemoryDestinationProvider() = default;

DestinationCaps MemoryDestinationProvider::capabilities() const noexcept {
  DestinationCaps caps{};
  caps.bootstrap = true;
  caps.close = true;
  caps.metadata = true;
  caps.schemas = true;
  caps.entities = true;
  caps.links = true;
  caps.configuration = true;
  return caps;
}

Json::Value MemoryDestinationProvider::results() const {
  std::scoped_lock lock(mu_);
  Json::Value out(Json::objectValue);
  for (const auto stage : kTransferStages) {
    const auto& digest = *digests_[index_of(stage)];
    if (digest.count() == 0) {
      continue;
    }
    auto& entry = out["stages"][stage_name(stage)];
    entry["count"] = Json::UInt64{digest.count()};
    entry["bytes"] = Json::UInt64{digest.bytes()};
    entry["digest"] = std::format("{:016x}", digest.digest());
  }
  return out;
}

Expected<void> MemoryDestinationProvider::bootstrap(const ProviderContext& ctx) noexcept {
  try {
    std::scoped_lock lock(mu_);
    conflict_strategy_ = ctx.conflict_strategy;
    bootstrapped_ = true;
  } catch (const std::exception& ex) {
    return make_unexpected(Error{ErrorCode::DestinationError, ex.what()});
  }
  return {};
}

Expected<void> MemoryDestinationProvider::close() noexcept {
  try {
    std::scoped_lock lock(mu_);
    closed_ = true;
  } catch (const std::exception& ex) {
    return make_unexpected(Error{ErrorCode::DestinationError, ex.what()});
  }
  return {};
}

Expected<std::optional<ProviderMetadata>> MemoryDestinationProvider::get_metadata() noexcept {
  return metadata_;
}

Expected<std::unique_ptr<IItemSink>> MemoryDestinationProvider::open(TransferStage stage) noexcept {
  try {
    return std::unique_ptr<IItemSink>(new StageSink(*this, stage));
  } catch (const std::exception& ex) {
    return make_unexpected(Error{ErrorCode::Internal, ex.what()});
  }
}

Expected<std::unique_ptr<IItemSink>> MemoryDestinationProvider::get_schemas_stream() noexcept {
  return open(TransferStage::Schemas);
}

Expected<std::unique_ptr<IItemSink>> MemoryDestinationProvider::get_entities_stream() noexcept {
  return open(TransferStage::Entities);
}

Expected<std::unique_ptr<IItemSink>> MemoryDestinationProvider::get_links_stream() noexcept {
  return open(TransferStage::Links);
}

Expected<std::unique_ptr<IItemSink>>
MemoryDestinationProvider::get_configuration_stream() noexcept {
  return open(TransferStage::Configuration);
}

void MemoryDestinationProvider::accept(TransferStage stage, const Item& item) {
  const auto encoded = Json::writeString(writer_, item);

  std::scoped_lock lock(mu_);
  received_[index_of(stage)].push_back(item);
  digests_[index_of(stage)]->consume(encoded);
}

std::vector<Item> MemoryDestinationProvider::items(TransferStage stage) const {
  std::scoped_lock lock(mu_);
  return received_[index_of(stage)];
}

uint64_t MemoryDestinationProvider::digest(TransferStage stage) const {
  std::scoped_lock lock(mu_);
  return digests_[index_of(stage)]->digest();
}

bool MemoryDestinationProvider::bootstrapped() const {
  std::scoped_lock lock(mu_);
  return bootstrapped_;
}

bool MemoryDestinationProvider::closed() const {
  std::scoped_lock lock(mu_);
  return closed_;
}

std::string MemoryDestinationProvider::conflict_strategy() const {
  std::scoped_lock lock(mu_);
  return conflict_strategy_;
}

}  // namespace dtx
