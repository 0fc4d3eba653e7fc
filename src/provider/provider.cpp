#include "dtx/provider/provider.hpp"

#include <format>

namespace dtx {
namespace {

Error unsupported(const std::string& provider, const char* op) {
  return Error{ErrorCode::Unsupported,
               std::format("provider '{}' does not implement {}", provider, op)};
}

}  // namespace

Expected<void> ISourceProvider::bootstrap(const ProviderContext&) noexcept { return {}; }

Expected<void> ISourceProvider::close() noexcept { return {}; }

Expected<std::optional<ProviderMetadata>> ISourceProvider::get_metadata() noexcept {
  return std::optional<ProviderMetadata>{};
}

Expected<std::unique_ptr<IItemSource>> ISourceProvider::stream_schemas() noexcept {
  return make_unexpected(unsupported(name(), "stream_schemas"));
}

Expected<std::unique_ptr<IItemSource>> ISourceProvider::stream_entities() noexcept {
  return make_unexpected(unsupported(name(), "stream_entities"));
}

Expected<std::unique_ptr<IItemSource>> ISourceProvider::stream_links() noexcept {
  return make_unexpected(unsupported(name(), "stream_links"));
}

Expected<std::unique_ptr<IItemSource>> ISourceProvider::stream_configuration() noexcept {
  return make_unexpected(unsupported(name(), "stream_configuration"));
}

Expected<void> IDestinationProvider::bootstrap(const ProviderContext&) noexcept { return {}; }

Expected<void> IDestinationProvider::close() noexcept { return {}; }

Expected<std::optional<ProviderMetadata>> IDestinationProvider::get_metadata() noexcept {
  return std::optional<ProviderMetadata>{};
}

Expected<std::unique_ptr<IItemSink>> IDestinationProvider::get_schemas_stream() noexcept {
  return make_unexpected(unsupported(name(), "get_schemas_stream"));
}

Expected<std::unique_ptr<IItemSink>> IDestinationProvider::get_entities_stream() noexcept {
  return make_unexpected(unsupported(name(), "get_entities_stream"));
}

Expected<std::unique_ptr<IItemSink>> IDestinationProvider::get_links_stream() noexcept {
  return make_unexpected(unsupported(name(), "get_links_stream"));
}

Expected<std::unique_ptr<IItemSink>> IDestinationProvider::get_configuration_stream() noexcept {
  return make_unexpected(unsupported(name(), "get_configuration_stream"));
}

}  // namespace dtx
