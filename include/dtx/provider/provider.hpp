#pragma once

#include <memory>
#include <optional>
#include <string>

#include <json/json.h>

#include "dtx/core/expected.hpp"
#include "dtx/core/types.hpp"

namespace dtx {

// Handed to providers at bootstrap; the engine does not interpret it.
struct ProviderContext {
  std::string conflict_strategy{};
};

struct ProviderMetadata {
  std::optional<std::string> platform_version{};
  Json::Value extra{};
};

// Lazy, finite, non-restartable sequence of items. An empty optional marks
// the end of the sequence.
class IItemSource {
 public:
  virtual ~IItemSource() = default;

  virtual Expected<std::optional<Item>> next() noexcept = 0;
};

// close() drains the sink and is called exactly once, after the last write.
class IItemSink {
 public:
  virtual ~IItemSink() = default;

  virtual Expected<void> write(const Item& item) noexcept = 0;
  virtual Expected<void> close() noexcept = 0;
};

struct SourceCaps {
  bool bootstrap{false};
  bool close{false};
  bool metadata{false};
  bool schemas{false};
  bool entities{false};
  bool links{false};
  bool configuration{false};
};

struct DestinationCaps {
  bool bootstrap{false};
  bool close{false};
  bool metadata{false};
  bool schemas{false};
  bool entities{false};
  bool links{false};
  bool configuration{false};
};

// Optional operations are only invoked when capabilities() advertises them.
class ISourceProvider {
 public:
  virtual ~ISourceProvider() = default;

  virtual std::string name() const = 0;
  virtual SourceCaps capabilities() const noexcept = 0;
  virtual Json::Value results() const = 0;

  virtual Expected<void> bootstrap(const ProviderContext& ctx) noexcept;
  virtual Expected<void> close() noexcept;
  virtual Expected<std::optional<ProviderMetadata>> get_metadata() noexcept;

  virtual Expected<std::unique_ptr<IItemSource>> stream_schemas() noexcept;
  virtual Expected<std::unique_ptr<IItemSource>> stream_entities() noexcept;
  virtual Expected<std::unique_ptr<IItemSource>> stream_links() noexcept;
  virtual Expected<std::unique_ptr<IItemSource>> stream_configuration() noexcept;
};

class IDestinationProvider {
 public:
  virtual ~IDestinationProvider() = default;

  virtual std::string name() const = 0;
  virtual DestinationCaps capabilities() const noexcept = 0;
  virtual Json::Value results() const = 0;

  virtual Expected<void> bootstrap(const ProviderContext& ctx) noexcept;
  virtual Expected<void> close() noexcept;
  virtual Expected<std::optional<ProviderMetadata>> get_metadata() noexcept;

  virtual Expected<std::unique_ptr<IItemSink>> get_schemas_stream() noexcept;
  virtual Expected<std::unique_ptr<IItemSink>> get_entities_stream() noexcept;
  virtual Expected<std::unique_ptr<IItemSink>> get_links_stream() noexcept;
  virtual Expected<std::unique_ptr<IItemSink>> get_configuration_stream() noexcept;
};

}  // namespace dtx
