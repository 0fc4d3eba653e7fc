#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "dtx/core/types.hpp"
#include "dtx/provider/provider.hpp"

namespace dtx {

namespace sink {
class DigestSink;
}

struct MemoryDataset {
  std::vector<Item> schemas{};
  std::vector<Item> entities{};
  std::vector<Item> links{};
  std::vector<Item> configuration{};
};

// Serves a dataset held in memory. Streams share the dataset and keep it
// alive, so a stage can be streamed more than once.
class MemorySourceProvider final : public ISourceProvider {
 public:
  MemorySourceProvider(std::string name, MemoryDataset dataset,
                       std::optional<ProviderMetadata> metadata = std::nullopt);

  std::string name() const override { return name_; }
  SourceCaps capabilities() const noexcept override;
  Json::Value results() const override;

  Expected<std::optional<ProviderMetadata>> get_metadata() noexcept override;

  Expected<std::unique_ptr<IItemSource>> stream_schemas() noexcept override;
  Expected<std::unique_ptr<IItemSource>> stream_entities() noexcept override;
  Expected<std::unique_ptr<IItemSource>> stream_links() noexcept override;
  Expected<std::unique_ptr<IItemSource>> stream_configuration() noexcept override;

 private:
  Expected<std::unique_ptr<IItemSource>> open(TransferStage stage,
                                              const std::vector<Item>& items) noexcept;

  std::string name_;
  std::shared_ptr<const MemoryDataset> dataset_;
  std::optional<ProviderMetadata> metadata_;
  std::array<std::shared_ptr<std::atomic<uint64_t>>, kTransferStages.size()> served_{};
};

// Keeps everything it receives, per stage, along with an xxHash fingerprint
// of each stage.
class MemoryDestinationProvider final : public IDestinationProvider {
 public:
  explicit MemoryDestinationProvider(std::string name,
                                     std::optional<ProviderMetadata> metadata = std::nullopt);
  ~MemoryDestinationProvider() override;

  std::string name() const override { return name_; }
  DestinationCaps capabilities() const noexcept override;
  Json::Value results() const override;

  Expected<void> bootstrap(const ProviderContext& ctx) noexcept override;
  Expected<void> close() noexcept override;
  Expected<std::optional<ProviderMetadata>> get_metadata() noexcept override;

  Expected<std::unique_ptr<IItemSink>> get_schemas_stream() noexcept override;
  Expected<std::unique_ptr<IItemSink>> get_entities_stream() noexcept override;
  Expected<std::unique_ptr<IItemSink>> get_links_stream() noexcept override;
  Expected<std::unique_ptr<IItemSink>> get_configuration_stream() noexcept override;

  std::vector<Item> items(TransferStage stage) const;
  uint64_t digest(TransferStage stage) const;
  bool bootstrapped() const;
  bool closed() const;
  std::string conflict_strategy() const;

 private:
  class StageSink;

  Expected<std::unique_ptr<IItemSink>> open(TransferStage stage) noexcept;
  void accept(TransferStage stage, const Item& item);

  std::string name_;
  std::optional<ProviderMetadata> metadata_;
  Json::StreamWriterBuilder writer_{};

  mutable std::mutex mu_;
  std::array<std::vector<Item>, kTransferStages.size()> received_{};
  std::array<std::unique_ptr<sink::DigestSink>, kTransferStages.size()> digests_{};
  std::string conflict_strategy_{};
  bool bootstrapped_{false};
  bool closed_{false};
};

}  // namespace dtx
