#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "dtx/core/error.hpp"
#include "dtx/core/expected.hpp"
#include "dtx/core/types.hpp"
#include "dtx/provider/provider.hpp"

namespace dtx_test {

inline dtx::Item make_item(const std::string& id, const std::string& type = {}) {
  dtx::Item item(Json::objectValue);
  item["id"] = id;
  if (!type.empty()) {
    item["type"] = type;
  }
  return item;
}

inline std::vector<dtx::Item> make_items(const std::string& prefix, size_t n) {
  std::vector<dtx::Item> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    out.push_back(make_item(prefix + std::to_string(i)));
  }
  return out;
}

// Tracks how far a producer runs ahead of its consumer.
struct FlowMeter {
  std::atomic<uint64_t> produced{0};
  std::atomic<uint64_t> consumed{0};
  std::atomic<uint64_t> max_lead{0};

  void on_produced() {
    const uint64_t p = produced.fetch_add(1) + 1;
    const uint64_t c = consumed.load();
    const uint64_t lead = p > c ? p - c : 0;
    uint64_t prev = max_lead.load();
    while (lead > prev && !max_lead.compare_exchange_weak(prev, lead)) {
    }
  }

  void on_consumed() { consumed.fetch_add(1); }
};

struct SourceScript {
  std::vector<dtx::Item> items{};
  std::optional<size_t> fail_at{};
  std::shared_ptr<FlowMeter> meter{};
};

class ScriptedSource final : public dtx::IItemSource {
 public:
  explicit ScriptedSource(SourceScript script) : script_(std::move(script)) {}

  dtx::Expected<std::optional<dtx::Item>> next() noexcept override {
    if (script_.fail_at && pos_ == *script_.fail_at) {
      return dtx::make_unexpected(dtx::Error{dtx::ErrorCode::SourceError, "source exploded"});
    }
    if (pos_ >= script_.items.size()) {
      return std::optional<dtx::Item>{};
    }
    if (script_.meter) {
      script_.meter->on_produced();
    }
    return std::optional<dtx::Item>{script_.items[pos_++]};
  }

 private:
  SourceScript script_;
  size_t pos_{0};
};

struct SinkLog {
  std::mutex mu;
  std::vector<dtx::Item> items;
  int closes{0};

  std::vector<dtx::Item> snapshot() {
    std::scoped_lock lock(mu);
    return items;
  }
};

struct SinkScript {
  std::shared_ptr<SinkLog> log{std::make_shared<SinkLog>()};
  std::optional<size_t> fail_at{};
  bool fail_on_close{false};
  std::chrono::microseconds delay{0};
  std::shared_ptr<FlowMeter> meter{};
};

class ScriptedSink final : public dtx::IItemSink {
 public:
  explicit ScriptedSink(SinkScript script) : script_(std::move(script)) {}

  dtx::Expected<void> write(const dtx::Item& item) noexcept override {
    if (script_.fail_at && written_ == *script_.fail_at) {
      return dtx::make_unexpected(dtx::Error{dtx::ErrorCode::DestinationError, "sink rejected item"});
    }
    if (script_.delay.count() > 0) {
      std::this_thread::sleep_for(script_.delay);
    }
    {
      std::scoped_lock lock(script_.log->mu);
      script_.log->items.push_back(item);
    }
    if (script_.meter) {
      script_.meter->on_consumed();
    }
    ++written_;
    return {};
  }

  dtx::Expected<void> close() noexcept override {
    {
      std::scoped_lock lock(script_.log->mu);
      ++script_.log->closes;
    }
    if (script_.fail_on_close) {
      return dtx::make_unexpected(dtx::Error{dtx::ErrorCode::DestinationError, "drain failed"});
    }
    return {};
  }

 private:
  SinkScript script_;
  size_t written_{0};
};

inline dtx::SourceCaps all_source_caps() {
  dtx::SourceCaps caps{};
  caps.bootstrap = true;
  caps.close = true;
  caps.metadata = true;
  caps.schemas = true;
  caps.entities = true;
  caps.links = true;
  caps.configuration = true;
  return caps;
}

inline dtx::DestinationCaps all_destination_caps() {
  dtx::DestinationCaps caps{};
  caps.bootstrap = true;
  caps.close = true;
  caps.metadata = true;
  caps.schemas = true;
  caps.entities = true;
  caps.links = true;
  caps.configuration = true;
  return caps;
}

class FakeSource final : public dtx::ISourceProvider {
 public:
  dtx::SourceCaps caps{all_source_caps()};
  std::map<dtx::TransferStage, SourceScript> stages{};
  std::optional<dtx::ProviderMetadata> metadata{};
  std::atomic<int> bootstraps{0};
  std::atomic<int> closes{0};
  std::string last_strategy{};
  bool fail_bootstrap{false};
  bool fail_close{false};

  std::string name() const override { return "fake-source"; }
  dtx::SourceCaps capabilities() const noexcept override { return caps; }

  Json::Value results() const override {
    Json::Value out(Json::objectValue);
    out["provider"] = name();
    return out;
  }

  dtx::Expected<void> bootstrap(const dtx::ProviderContext& ctx) noexcept override {
    last_strategy = ctx.conflict_strategy;
    ++bootstraps;
    if (fail_bootstrap) {
      return dtx::make_unexpected(dtx::Error{dtx::ErrorCode::SourceError, "cannot open source"});
    }
    return {};
  }

  dtx::Expected<void> close() noexcept override {
    ++closes;
    if (fail_close) {
      return dtx::make_unexpected(dtx::Error{dtx::ErrorCode::SourceError, "source close failed"});
    }
    return {};
  }

  dtx::Expected<std::optional<dtx::ProviderMetadata>> get_metadata() noexcept override {
    return metadata;
  }

  dtx::Expected<std::unique_ptr<dtx::IItemSource>> stream_schemas() noexcept override {
    return open(dtx::TransferStage::Schemas);
  }
  dtx::Expected<std::unique_ptr<dtx::IItemSource>> stream_entities() noexcept override {
    return open(dtx::TransferStage::Entities);
  }
  dtx::Expected<std::unique_ptr<dtx::IItemSource>> stream_links() noexcept override {
    return open(dtx::TransferStage::Links);
  }
  dtx::Expected<std::unique_ptr<dtx::IItemSource>> stream_configuration() noexcept override {
    return open(dtx::TransferStage::Configuration);
  }

 private:
  dtx::Expected<std::unique_ptr<dtx::IItemSource>> open(dtx::TransferStage stage) {
    const auto it = stages.find(stage);
    SourceScript script = it == stages.end() ? SourceScript{} : it->second;
    return std::unique_ptr<dtx::IItemSource>(new ScriptedSource(std::move(script)));
  }
};

class FakeDestination final : public dtx::IDestinationProvider {
 public:
  dtx::DestinationCaps caps{all_destination_caps()};
  std::map<dtx::TransferStage, SinkScript> stages{};
  std::optional<dtx::ProviderMetadata> metadata{};
  std::atomic<int> bootstraps{0};
  std::atomic<int> closes{0};
  bool fail_bootstrap{false};
  bool fail_close{false};

  std::string name() const override { return "fake-destination"; }
  dtx::DestinationCaps capabilities() const noexcept override { return caps; }

  Json::Value results() const override {
    Json::Value out(Json::objectValue);
    out["provider"] = name();
    return out;
  }

  dtx::Expected<void> bootstrap(const dtx::ProviderContext&) noexcept override {
    ++bootstraps;
    if (fail_bootstrap) {
      return dtx::make_unexpected(dtx::Error{dtx::ErrorCode::DestinationError, "cannot connect"});
    }
    return {};
  }

  dtx::Expected<void> close() noexcept override {
    ++closes;
    if (fail_close) {
      return dtx::make_unexpected(
          dtx::Error{dtx::ErrorCode::DestinationError, "destination close failed"});
    }
    return {};
  }

  dtx::Expected<std::optional<dtx::ProviderMetadata>> get_metadata() noexcept override {
    return metadata;
  }

  dtx::Expected<std::unique_ptr<dtx::IItemSink>> get_schemas_stream() noexcept override {
    return open(dtx::TransferStage::Schemas);
  }
  dtx::Expected<std::unique_ptr<dtx::IItemSink>> get_entities_stream() noexcept override {
    return open(dtx::TransferStage::Entities);
  }
  dtx::Expected<std::unique_ptr<dtx::IItemSink>> get_links_stream() noexcept override {
    return open(dtx::TransferStage::Links);
  }
  dtx::Expected<std::unique_ptr<dtx::IItemSink>> get_configuration_stream() noexcept override {
    return open(dtx::TransferStage::Configuration);
  }

  std::vector<dtx::Item> received(dtx::TransferStage stage) { return script(stage).log->snapshot(); }

  SinkScript& script(dtx::TransferStage stage) { return stages[stage]; }

 private:
  dtx::Expected<std::unique_ptr<dtx::IItemSink>> open(dtx::TransferStage stage) {
    return std::unique_ptr<dtx::IItemSink>(new ScriptedSink(script(stage)));
  }
};

inline dtx::ProviderMetadata metadata_with_version(const std::string& version) {
  dtx::ProviderMetadata md{};
  md.platform_version = version;
  return md;
}

}  // namespace dtx_test
