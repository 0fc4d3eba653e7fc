#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dtx/core/types.hpp"

namespace dtx {

struct ReportRow {
  std::string label{};
  uint64_t count{};
  uint64_t bytes{};
  // Aggregate rows belong to the stage row preceding them.
  bool aggregate{false};
};

struct ProgressReport {
  std::vector<ReportRow> rows{};
  uint64_t total_items{};
  uint64_t total_bytes{};
};

// Stage rows in pipeline order, each followed by its aggregate rows.
ProgressReport summarize_progress(const TransferProgress& progress);

// 1536 -> "1.5 KB". Units step by 1024 up to TB.
std::string format_bytes(uint64_t bytes, int decimals = 1);

}  // namespace dtx
