#pragma once

#include <atomic>
#include <memory>
#include <optional>

#include "dtx/core/types.hpp"
#include "dtx/engine/stage_runner.hpp"
#include "dtx/progress/progress_feed.hpp"
#include "dtx/progress/progress_model.hpp"
#include "dtx/provider/provider.hpp"

namespace dtx {

enum class EngineState {
  Constructed,
  Bootstrapping,
  IntegrityChecking,
  Running,
  Closing,
  Succeeded,
  Failed,
};

const char* to_string(EngineState state) noexcept;

// Moves a dataset from one provider to another, stage by stage.
//
// transfer() is the only entry point that runs the whole sequence:
//   bootstrap -> integrity check -> schemas, entities, links, media,
//   configuration -> close.
// Every failure propagates to the caller as dtx::Error or as the provider's
// own error. Providers are left open on failure and nothing written to the
// destination is rolled back.
class TransferEngine {
 public:
  TransferEngine(std::shared_ptr<ISourceProvider> source,
                 std::shared_ptr<IDestinationProvider> destination,
                 TransferOptions options);

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  // Single use. The progress feed is closed when this returns or throws.
  TransferResults transfer();

  void bootstrap();
  bool integrity_check();
  void close();

  void transfer_schemas();
  void transfer_entities();
  void transfer_links();
  void transfer_media();
  void transfer_configuration();

  ProgressFeed& progress_stream() noexcept { return feed_; }
  TransferProgress transfer_progress() const;

  const TransferOptions& options() const noexcept { return options_; }
  EngineState state() const noexcept { return state_.load(); }
  std::optional<TransferStage> current_stage() const noexcept;

  ISourceProvider& source() noexcept { return *source_; }
  IDestinationProvider& destination() noexcept { return *destination_; }

 private:
  bool excluded(TransferStage stage) const;
  void set_stage(TransferStage stage) noexcept;

  std::shared_ptr<ISourceProvider> source_;
  std::shared_ptr<IDestinationProvider> destination_;
  const TransferOptions options_;

  ProgressModel progress_;
  ProgressFeed feed_;
  StageRunner runner_;

  std::atomic<EngineState> state_{EngineState::Constructed};
  std::atomic<int> stage_{-1};
};

// Throws dtx::Error(InvalidArgument) on null providers or zero-sized
// windows.
std::unique_ptr<TransferEngine> make_transfer_engine(std::shared_ptr<ISourceProvider> source,
                                                     std::shared_ptr<IDestinationProvider> destination,
                                                     TransferOptions options);

}  // namespace dtx
