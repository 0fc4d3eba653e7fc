#include "dtx/engine/integrity.hpp"

#include <cstddef>
#include <format>
#include <string_view>
#include <vector>

#include "dtx/core/error.hpp"

namespace dtx {
namespace {

std::vector<std::string_view> split_version(std::string_view version) {
  std::vector<std::string_view> tokens;
  for (;;) {
    const auto dot = version.find('.');
    tokens.push_back(version.substr(0, dot));
    if (dot == std::string_view::npos) {
      break;
    }
    version.remove_prefix(dot + 1);
  }
  return tokens;
}

size_t required_tokens(VersionMatching strategy) {
  switch (strategy) {
    case VersionMatching::Major:
      return 1;
    case VersionMatching::Minor:
      return 2;
    case VersionMatching::Patch:
      return 3;
    case VersionMatching::Ignore:
    case VersionMatching::Exact:
      break;
  }
  return 0;
}

bool leading_tokens_match(std::string_view lhs, std::string_view rhs, size_t count) {
  const auto a = split_version(lhs);
  const auto b = split_version(rhs);
  if (a.size() < count || b.size() < count) {
    return false;
  }
  for (size_t i = 0; i < count; ++i) {
    if (a[i] != b[i]) {
      return false;
    }
  }
  return true;
}

}  // namespace

Expected<void> check_version_integrity(const std::optional<std::string>& source_version,
                                       const std::optional<std::string>& destination_version,
                                       VersionMatching strategy) {
  // An empty version string counts as absent.
  if (!source_version || source_version->empty() || !destination_version ||
      destination_version->empty()) {
    return {};
  }

  bool ok = false;
  switch (strategy) {
    case VersionMatching::Ignore:
      ok = true;
      break;
    case VersionMatching::Exact:
      ok = *source_version == *destination_version;
      break;
    case VersionMatching::Major:
    case VersionMatching::Minor:
    case VersionMatching::Patch:
      ok = leading_tokens_match(*source_version, *destination_version, required_tokens(strategy));
      break;
  }

  if (ok) {
    return {};
  }
  return make_unexpected(Error{
      ErrorCode::IntegrityMismatch,
      std::format("versions don't match ({} check): {} does not match with {}",
                  to_string(strategy), *source_version, *destination_version)});
}

bool versions_compatible(const std::optional<std::string>& source_version,
                         const std::optional<std::string>& destination_version,
                         VersionMatching strategy) {
  return check_version_integrity(source_version, destination_version, strategy).has_value();
}

}  // namespace dtx
