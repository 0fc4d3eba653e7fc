#include "dtx/engine/transfer_engine.hpp"

#include <format>
#include <future>
#include <iostream>
#include <string>
#include <utility>

#include "dtx/core/error.hpp"
#include "dtx/engine/integrity.hpp"

namespace dtx {
namespace {

constexpr const char* kEntityAggregateKey = "type";

TransferOptions validated(TransferOptions options) {
  if (options.stage_window == 0) {
    throw Error{ErrorCode::InvalidArgument, "stage_window must be > 0"};
  }
  if (options.event_buffer == 0) {
    throw Error{ErrorCode::InvalidArgument, "event_buffer must be > 0"};
  }
  return options;
}

template <typename P>
std::shared_ptr<P> non_null(std::shared_ptr<P> provider, const char* side) {
  if (!provider) {
    throw Error{ErrorCode::InvalidArgument, std::format("{} provider must not be null", side)};
  }
  return provider;
}

// Runs both one-shot operations concurrently and waits for both. The source
// side's error wins when both fail.
template <typename SourceOp, typename DestinationOp>
void run_on_both(SourceOp&& source_op, DestinationOp&& destination_op) {
  auto source_done = std::async(std::launch::async, std::forward<SourceOp>(source_op));
  auto destination_done =
      std::async(std::launch::async, std::forward<DestinationOp>(destination_op));

  Expected<void> source_result = source_done.get();
  Expected<void> destination_result = destination_done.get();

  if (!source_result) {
    throw std::move(source_result).error();
  }
  if (!destination_result) {
    throw std::move(destination_result).error();
  }
}

std::optional<std::string> version_of(const std::optional<ProviderMetadata>& metadata) {
  if (!metadata) {
    return std::nullopt;
  }
  return metadata->platform_version;
}

}  // namespace

const char* to_string(EngineState state) noexcept {
  switch (state) {
    case EngineState::Constructed:
      return "constructed";
    case EngineState::Bootstrapping:
      return "bootstrapping";
    case EngineState::IntegrityChecking:
      return "integrity-checking";
    case EngineState::Running:
      return "running";
    case EngineState::Closing:
      return "closing";
    case EngineState::Succeeded:
      return "succeeded";
    case EngineState::Failed:
      return "failed";
  }
  return "unknown";
}

TransferEngine::TransferEngine(std::shared_ptr<ISourceProvider> source,
                               std::shared_ptr<IDestinationProvider> destination,
                               TransferOptions options)
    : source_(non_null(std::move(source), "source")),
      destination_(non_null(std::move(destination), "destination")),
      options_(validated(std::move(options))),
      feed_(options_.event_buffer),
      runner_(progress_, feed_, options_.stage_window) {}

TransferProgress TransferEngine::transfer_progress() const { return *progress_.snapshot(); }

std::optional<TransferStage> TransferEngine::current_stage() const noexcept {
  const int stage = stage_.load();
  if (stage < 0) {
    return std::nullopt;
  }
  return static_cast<TransferStage>(stage);
}

bool TransferEngine::excluded(TransferStage stage) const {
  return options_.exclude.contains(stage);
}

void TransferEngine::set_stage(TransferStage stage) noexcept {
  stage_.store(static_cast<int>(stage));
}

void TransferEngine::bootstrap() {
  const ProviderContext ctx{options_.conflict_strategy};
  const bool source_cap = source_->capabilities().bootstrap;
  const bool destination_cap = destination_->capabilities().bootstrap;

  run_on_both(
      [&]() -> Expected<void> {
        if (!source_cap) {
          return {};
        }
        return source_->bootstrap(ctx);
      },
      [&]() -> Expected<void> {
        if (!destination_cap) {
          return {};
        }
        return destination_->bootstrap(ctx);
      });
}

void TransferEngine::close() {
  const bool source_cap = source_->capabilities().close;
  const bool destination_cap = destination_->capabilities().close;

  run_on_both(
      [&]() -> Expected<void> {
        if (!source_cap) {
          return {};
        }
        return source_->close();
      },
      [&]() -> Expected<void> {
        if (!destination_cap) {
          return {};
        }
        return destination_->close();
      });
}

bool TransferEngine::integrity_check() {
  std::optional<ProviderMetadata> source_metadata;
  if (source_->capabilities().metadata) {
    auto fetched = source_->get_metadata();
    if (!fetched) {
      throw std::move(fetched).error();
    }
    source_metadata = std::move(*fetched);
  }

  std::optional<ProviderMetadata> destination_metadata;
  if (destination_->capabilities().metadata) {
    auto fetched = destination_->get_metadata();
    if (!fetched) {
      throw std::move(fetched).error();
    }
    destination_metadata = std::move(*fetched);
  }

  if (!source_metadata || !destination_metadata) {
    return true;
  }

  const auto verdict = check_version_integrity(version_of(source_metadata),
                                               version_of(destination_metadata),
                                               options_.version_matching);
  if (!verdict) {
    std::cerr << std::format("[error] integrity check failed: {}\n", verdict.error().what());
    return false;
  }
  return true;
}

TransferResults TransferEngine::transfer() {
  EngineState expected = EngineState::Constructed;
  if (!state_.compare_exchange_strong(expected, EngineState::Bootstrapping)) {
    throw Error{ErrorCode::InvalidArgument,
                std::format("transfer already started (state: {})", to_string(expected))};
  }

  // Marks the run failed unless it reaches the end, and always releases the
  // feed's readers.
  struct RunGuard {
    TransferEngine& engine;
    bool committed{false};

    ~RunGuard() {
      if (!committed) {
        engine.state_.store(EngineState::Failed);
      }
      engine.feed_.close();
    }
  } guard{*this};

  bootstrap();

  state_.store(EngineState::IntegrityChecking);
  if (!integrity_check()) {
    throw Error{ErrorCode::IntegrityMismatch,
                std::format("Unable to transfer the data between {} and {}", source_->name(),
                            destination_->name())};
  }

  state_.store(EngineState::Running);
  transfer_schemas();
  transfer_entities();
  transfer_links();
  transfer_media();
  transfer_configuration();

  // TODO: roll back the destination when a stage fails, once providers
  // expose a rollback operation.
  state_.store(EngineState::Closing);
  close();

  TransferResults results{source_->results(), destination_->results()};
  state_.store(EngineState::Succeeded);
  guard.committed = true;
  return results;
}

void TransferEngine::transfer_schemas() {
  const auto stage = TransferStage::Schemas;
  if (excluded(stage)) {
    return;
  }
  set_stage(stage);

  const auto source_caps = source_->capabilities();
  const auto destination_caps = destination_->capabilities();
  runner_.run_stage(
      stage,
      source_caps.schemas ? SourceFactory{[this]() { return source_->stream_schemas(); }}
                          : SourceFactory{},
      destination_caps.schemas
          ? SinkFactory{[this]() { return destination_->get_schemas_stream(); }}
          : SinkFactory{});
}

void TransferEngine::transfer_entities() {
  const auto stage = TransferStage::Entities;
  if (excluded(stage)) {
    return;
  }
  set_stage(stage);

  const auto source_caps = source_->capabilities();
  const auto destination_caps = destination_->capabilities();
  runner_.run_stage(
      stage,
      source_caps.entities ? SourceFactory{[this]() { return source_->stream_entities(); }}
                           : SourceFactory{},
      destination_caps.entities
          ? SinkFactory{[this]() { return destination_->get_entities_stream(); }}
          : SinkFactory{},
      std::string{kEntityAggregateKey});
}

void TransferEngine::transfer_links() {
  const auto stage = TransferStage::Links;
  if (excluded(stage)) {
    return;
  }
  set_stage(stage);

  const auto source_caps = source_->capabilities();
  const auto destination_caps = destination_->capabilities();
  runner_.run_stage(
      stage,
      source_caps.links ? SourceFactory{[this]() { return source_->stream_links(); }}
                        : SourceFactory{},
      destination_caps.links ? SinkFactory{[this]() { return destination_->get_links_stream(); }}
                             : SinkFactory{});
}

void TransferEngine::transfer_media() {
  const auto stage = TransferStage::Media;
  if (excluded(stage)) {
    return;
  }
  set_stage(stage);

  std::cerr << "[warn] media transfer is not implemented yet\n";
  runner_.run_empty_stage(stage);
}

void TransferEngine::transfer_configuration() {
  const auto stage = TransferStage::Configuration;
  if (excluded(stage)) {
    return;
  }
  set_stage(stage);

  const auto source_caps = source_->capabilities();
  const auto destination_caps = destination_->capabilities();
  runner_.run_stage(
      stage,
      source_caps.configuration
          ? SourceFactory{[this]() { return source_->stream_configuration(); }}
          : SourceFactory{},
      destination_caps.configuration
          ? SinkFactory{[this]() { return destination_->get_configuration_stream(); }}
          : SinkFactory{});
}

std::unique_ptr<TransferEngine> make_transfer_engine(std::shared_ptr<ISourceProvider> source,
                                                     std::shared_ptr<IDestinationProvider> destination,
                                                     TransferOptions options) {
  return std::make_unique<TransferEngine>(std::move(source), std::move(destination),
                                          std::move(options));
}

}  // namespace dtx
