#include <chrono>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "dtx/core/error.hpp"
#include "dtx/engine/stage_runner.hpp"
#include "dtx/progress/progress_feed.hpp"
#include "dtx/progress/progress_model.hpp"
#include "fake_providers.hpp"

namespace {

using dtx_test::SinkScript;
using dtx_test::SourceScript;

dtx::SourceFactory source_of(SourceScript script) {
  return [script]() -> dtx::Expected<std::unique_ptr<dtx::IItemSource>> {
    return std::unique_ptr<dtx::IItemSource>(new dtx_test::ScriptedSource(script));
  };
}

dtx::SinkFactory sink_of(SinkScript script) {
  return [script]() -> dtx::Expected<std::unique_ptr<dtx::IItemSink>> {
    return std::unique_ptr<dtx::IItemSink>(new dtx_test::ScriptedSink(script));
  };
}

bool test_items_arrive_in_order_and_are_counted() {
  dtx::ProgressModel model;
  dtx::ProgressFeed feed;
  auto events = feed.subscribe();
  dtx::StageRunner runner{model, feed, 4};

  SourceScript source{dtx_test::make_items("s", 50)};
  SinkScript sink{};
  runner.run_stage(dtx::TransferStage::Schemas, source_of(source), sink_of(sink));

  const auto received = sink.log->snapshot();
  if (received.size() != 50) {
    std::cerr << std::format("expected 50 items, got {}\n", received.size());
    return false;
  }
  for (size_t i = 0; i < received.size(); ++i) {
    if (received[i] != source.items[i]) {
      std::cerr << std::format("item {} out of order\n", i);
      return false;
    }
  }
  if (sink.log->closes != 1) {
    std::cerr << std::format("sink should be closed exactly once\n");
    return false;
  }

  const auto entry = model.entry(dtx::TransferStage::Schemas);
  uint64_t bytes = 0;
  for (const auto &item : received) {
    bytes += model.serialized_size(item);
  }
  if (!entry || entry->count != received.size() || entry->bytes != bytes) {
    std::cerr << std::format("progress does not match acknowledged items\n");
    return false;
  }

  const auto seen = events->drain();
  if (seen.size() != 52 || seen.front().type != dtx::ProgressEventType::Start ||
      seen.back().type != dtx::ProgressEventType::Complete) {
    std::cerr << std::format("expected start, 50 progress, complete; got {} events\n",
                             seen.size());
    return false;
  }
  if (seen.back().data->at(dtx::TransferStage::Schemas).count != 50) {
    std::cerr << std::format("complete snapshot should hold the final count\n");
    return false;
  }
  return true;
}

bool test_missing_streams_fail_before_start() {
  dtx::ProgressModel model;
  dtx::ProgressFeed feed;
  auto events = feed.subscribe();
  dtx::StageRunner runner{model, feed, 4};

  bool source_missing = false;
  try {
    runner.run_stage(dtx::TransferStage::Links, dtx::SourceFactory{}, sink_of(SinkScript{}));
  } catch (const dtx::Error &e) {
    source_missing = e.code() == dtx::ErrorCode::MissingStream &&
                     std::string{e.what()} == "Unable to transfer links, source stream is missing";
  }
  if (!source_missing) {
    std::cerr << std::format("expected missing source stream error\n");
    return false;
  }

  bool destination_missing = false;
  try {
    runner.run_stage(dtx::TransferStage::Configuration,
                     source_of(SourceScript{dtx_test::make_items("c", 2)}), dtx::SinkFactory{});
  } catch (const dtx::Error &e) {
    destination_missing =
        e.code() == dtx::ErrorCode::MissingStream &&
        std::string{e.what()} == "Unable to transfer configuration, destination stream is missing";
  }
  if (!destination_missing) {
    std::cerr << std::format("expected missing destination stream error\n");
    return false;
  }

  if (events->try_pop()) {
    std::cerr << std::format("no event may precede a missing stream error\n");
    return false;
  }
  return true;
}

bool test_source_error_aborts_stage() {
  dtx::ProgressModel model;
  dtx::ProgressFeed feed;
  auto events = feed.subscribe();
  dtx::StageRunner runner{model, feed, 2};

  SourceScript source{dtx_test::make_items("e", 10), 5};
  SinkScript sink{};

  bool aborted = false;
  try {
    runner.run_stage(dtx::TransferStage::Entities, source_of(source), sink_of(sink), "type");
  } catch (const dtx::Error &e) {
    aborted = e.code() == dtx::ErrorCode::SourceError;
  }
  if (!aborted) {
    std::cerr << std::format("expected the source error to surface\n");
    return false;
  }
  if (sink.log->snapshot().size() > 5 || sink.log->closes != 0) {
    std::cerr << std::format("sink received too much or was drained after a failure\n");
    return false;
  }
  for (const auto &ev : events->drain()) {
    if (ev.type == dtx::ProgressEventType::Complete) {
      std::cerr << std::format("failed stage must not complete\n");
      return false;
    }
  }
  return true;
}

bool test_sink_error_aborts_stage() {
  dtx::ProgressModel model;
  dtx::ProgressFeed feed;
  dtx::StageRunner runner{model, feed, 2};

  SinkScript sink{};
  sink.fail_at = 3;

  bool aborted = false;
  try {
    runner.run_stage(dtx::TransferStage::Links,
                     source_of(SourceScript{dtx_test::make_items("l", 1000)}), sink_of(sink));
  } catch (const dtx::Error &e) {
    aborted = e.code() == dtx::ErrorCode::DestinationError;
  }
  if (!aborted) {
    std::cerr << std::format("expected the sink error to surface\n");
    return false;
  }
  if (sink.log->snapshot().size() != 3) {
    std::cerr << std::format("items acknowledged before the failure must stay\n");
    return false;
  }

  SinkScript drain_fails{};
  drain_fails.fail_on_close = true;
  bool drain_aborted = false;
  try {
    runner.run_stage(dtx::TransferStage::Configuration,
                     source_of(SourceScript{dtx_test::make_items("c", 3)}), sink_of(drain_fails));
  } catch (const dtx::Error &e) {
    drain_aborted = e.code() == dtx::ErrorCode::DestinationError;
  }
  if (!drain_aborted) {
    std::cerr << std::format("expected the drain error to surface\n");
    return false;
  }
  return true;
}

bool test_slow_sink_bounds_producer_lead() {
  dtx::ProgressModel model;
  dtx::ProgressFeed feed;
  constexpr size_t kWindow = 4;
  dtx::StageRunner runner{model, feed, kWindow};

  auto meter = std::make_shared<dtx_test::FlowMeter>();
  SourceScript source{dtx_test::make_items("m", 200), std::nullopt, meter};
  SinkScript sink{};
  sink.delay = std::chrono::microseconds(200);
  sink.meter = meter;

  runner.run_stage(dtx::TransferStage::Entities, source_of(source), sink_of(sink), "type");

  if (meter->consumed.load() != 200) {
    std::cerr << std::format("expected 200 consumed items, got {}\n", meter->consumed.load());
    return false;
  }
  if (meter->max_lead.load() > kWindow + 2) {
    std::cerr << std::format("producer ran {} items ahead with a window of {}\n",
                             meter->max_lead.load(), kWindow);
    return false;
  }
  return true;
}

bool test_empty_stage_emits_pair() {
  dtx::ProgressModel model;
  dtx::ProgressFeed feed;
  auto events = feed.subscribe();
  dtx::StageRunner runner{model, feed, 1};

  runner.run_empty_stage(dtx::TransferStage::Media);
  const auto seen = events->drain();
  if (seen.size() != 2 || seen[0].type != dtx::ProgressEventType::Start ||
      seen[1].type != dtx::ProgressEventType::Complete ||
      seen[1].stage != dtx::TransferStage::Media) {
    std::cerr << std::format("expected a start/complete pair for media\n");
    return false;
  }
  if (model.entry(dtx::TransferStage::Media)) {
    std::cerr << std::format("empty stage must not record progress\n");
    return false;
  }
  return true;
}

} // namespace

int main() {
  if (!test_items_arrive_in_order_and_are_counted()) {
    return 1;
  }
  if (!test_missing_streams_fail_before_start()) {
    return 1;
  }
  if (!test_source_error_aborts_stage()) {
    return 1;
  }
  if (!test_sink_error_aborts_stage()) {
    return 1;
  }
  if (!test_slow_sink_bounds_producer_lead()) {
    return 1;
  }
  if (!test_empty_stage_emits_pair()) {
    return 1;
  }
  return 0;
}
