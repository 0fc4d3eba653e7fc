#include "dtx/engine/stage_runner.hpp"

#include <exception>
#include <format>
#include <thread>
#include <utility>

#include "dtx/core/error.hpp"
#include "dtx/progress/progress_feed.hpp"
#include "dtx/progress/progress_model.hpp"
#include "stream/bounded_channel.hpp"

namespace dtx {
namespace {

using ItemChannel = stream::BoundedChannel<Item>;

Error missing_stream(TransferStage stage, const char* side) {
  return Error{ErrorCode::MissingStream,
               std::format("Unable to transfer {}, {} stream is missing", stage_name(stage), side)};
}

// Drains `source` into `channel` until the source ends, fails, or the
// consumer cancels.
void pump(IItemSource& source, ItemChannel& channel) noexcept {
  try {
    for (;;) {
      auto next = source.next();
      if (!next) {
        channel.fail(std::move(next).error());
        return;
      }
      if (!next->has_value()) {
        channel.finish();
        return;
      }
      if (!channel.push(std::move(**next))) {
        return;
      }
    }
  } catch (const std::exception& ex) {
    channel.fail(Error{ErrorCode::Internal, ex.what()});
  }
}

// Owns the producer thread. Leaving scope cancels the channel and joins, so
// an aborted stage never leaves the producer running.
class ProducerThread {
 public:
  ProducerThread(IItemSource& source, ItemChannel& channel)
      : channel_(channel), thread_([&source, &channel]() { pump(source, channel); }) {}

  ~ProducerThread() {
    channel_.cancel();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  ProducerThread(const ProducerThread&) = delete;
  ProducerThread& operator=(const ProducerThread&) = delete;

 private:
  ItemChannel& channel_;
  std::thread thread_;
};

}  // namespace

StageRunner::StageRunner(ProgressModel& model, ProgressFeed& feed, size_t window)
    : model_(model), feed_(feed), window_(window == 0 ? 1u : window) {}

void StageRunner::publish(ProgressEventType type, TransferStage stage) {
  if (!feed_.has_subscribers()) {
    return;
  }
  feed_.publish(ProgressEvent{type, stage, model_.snapshot()});
}

void StageRunner::run_stage(TransferStage stage,
                            const SourceFactory& make_source,
                            const SinkFactory& make_sink,
                            const std::optional<std::string>& aggregate_key) {
  if (!make_source) {
    throw missing_stream(stage, "source");
  }
  if (!make_sink) {
    throw missing_stream(stage, "destination");
  }

  auto source = make_source();
  if (!source) {
    throw std::move(source).error();
  }
  if (!*source) {
    throw missing_stream(stage, "source");
  }

  auto sink = make_sink();
  if (!sink) {
    throw std::move(sink).error();
  }
  if (!*sink) {
    throw missing_stream(stage, "destination");
  }

  publish(ProgressEventType::Start, stage);

  ItemChannel channel{window_};
  {
    ProducerThread producer{**source, channel};

    for (;;) {
      auto next = channel.pop();
      if (!next) {
        throw std::move(next).error();
      }
      if (!next->has_value()) {
        break;
      }

      const Item& item = **next;
      model_.record(stage, item, aggregate_key);
      publish(ProgressEventType::Progress, stage);

      if (auto written = (*sink)->write(item); !written) {
        throw std::move(written).error();
      }
    }
  }

  if (auto closed = (*sink)->close(); !closed) {
    throw std::move(closed).error();
  }

  publish(ProgressEventType::Complete, stage);
}

void StageRunner::run_empty_stage(TransferStage stage) {
  publish(ProgressEventType::Start, stage);
  publish(ProgressEventType::Complete, stage);
}

}  // namespace dtx
