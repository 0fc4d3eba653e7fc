#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "dtx/core/expected.hpp"
#include "dtx/core/types.hpp"
#include "dtx/provider/provider.hpp"

namespace dtx {

class ProgressFeed;
class ProgressModel;

// An empty factory means the provider lacks the capability.
using SourceFactory = std::function<Expected<std::unique_ptr<IItemSource>>()>;
using SinkFactory = std::function<Expected<std::unique_ptr<IItemSink>>()>;

class StageRunner {
 public:
  StageRunner(ProgressModel& model, ProgressFeed& feed, size_t window);

  // Streams one stage from source to sink, counting every item on the way.
  // Throws dtx::Error(MissingStream) before the start event if either side
  // is missing; rethrows the first source or sink error unchanged.
  void run_stage(TransferStage stage,
                 const SourceFactory& make_source,
                 const SinkFactory& make_sink,
                 const std::optional<std::string>& aggregate_key = std::nullopt);

  // Start/complete pair for a stage that moves nothing.
  void run_empty_stage(TransferStage stage);

  size_t window() const noexcept { return window_; }

 private:
  void publish(ProgressEventType type, TransferStage stage);

  ProgressModel& model_;
  ProgressFeed& feed_;
  size_t window_{1};
};

}  // namespace dtx
