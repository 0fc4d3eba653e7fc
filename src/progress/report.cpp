#include "dtx/progress/report.hpp"

#include <array>
#include <format>

namespace dtx {

ProgressReport summarize_progress(const TransferProgress& progress) {
  ProgressReport out{};

  for (const auto stage : kTransferStages) {
    const auto it = progress.find(stage);
    if (it == progress.end()) {
      continue;
    }
    const auto& entry = it->second;

    out.rows.push_back(ReportRow{stage_name(stage), entry.count, entry.bytes, false});
    for (const auto& [key, agg] : entry.aggregates) {
      out.rows.push_back(ReportRow{key, agg.count, agg.bytes, true});
    }

    out.total_items += entry.count;
    out.total_bytes += entry.bytes;
  }

  return out;
}

std::string format_bytes(uint64_t bytes, int decimals) {
  constexpr std::array<const char*, 5> kUnits{"B", "KB", "MB", "GB", "TB"};

  if (bytes < 1024) {
    return std::format("{} B", bytes);
  }

  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  const int precision = decimals < 0 ? 0 : decimals;
  return std::format("{:.{}f} {}", value, precision, kUnits[unit]);
}

}  // namespace dtx
