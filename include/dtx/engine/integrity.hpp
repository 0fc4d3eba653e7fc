#pragma once

#include <optional>
#include <string>

#include "dtx/core/expected.hpp"
#include "dtx/core/types.hpp"

namespace dtx {

// Passes when either version is unknown. On mismatch the error is
// IntegrityMismatch and names both versions and the strategy.
Expected<void> check_version_integrity(const std::optional<std::string>& source_version,
                                       const std::optional<std::string>& destination_version,
                                       VersionMatching strategy);

bool versions_compatible(const std::optional<std::string>& source_version,
                         const std::optional<std::string>& destination_version,
                         VersionMatching strategy);

}  // namespace dtx
