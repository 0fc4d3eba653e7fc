#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>

#include <json/json.h>

namespace dtx {

// Every record moved by the engine is a JSON value.
using Item = Json::Value;

enum class TransferStage { Schemas, Entities, Links, Media, Configuration };

inline constexpr std::array<TransferStage, 5> kTransferStages{
    TransferStage::Schemas,
    TransferStage::Entities,
    TransferStage::Links,
    TransferStage::Media,
    TransferStage::Configuration,
};

enum class VersionMatching { Ignore, Exact, Major, Minor, Patch };

enum class ProgressEventType { Start, Progress, Complete };

struct ProgressCounter {
  uint64_t count{};
  uint64_t bytes{};
};

struct ProgressEntry {
  uint64_t count{};
  uint64_t bytes{};
  std::map<std::string, ProgressCounter> aggregates{};
};

using TransferProgress = std::map<TransferStage, ProgressEntry>;

struct ProgressEvent {
  ProgressEventType type{ProgressEventType::Start};
  TransferStage stage{TransferStage::Schemas};
  std::shared_ptr<const TransferProgress> data{};
};

struct TransferOptions {
  std::string conflict_strategy{"restore"};
  VersionMatching version_matching{VersionMatching::Exact};
  std::set<TransferStage> exclude{};
  size_t stage_window{16};
  size_t event_buffer{4096};
};

struct TransferResults {
  Json::Value source{};
  Json::Value destination{};
};

const char* stage_name(TransferStage stage) noexcept;
const char* to_string(VersionMatching matching) noexcept;
const char* to_string(ProgressEventType type) noexcept;

// The parsers throw dtx::Error(InvalidArgument) on unknown tokens.
TransferStage parse_stage(std::string_view name);
VersionMatching parse_version_matching(std::string_view name);
std::set<TransferStage> parse_stage_list(std::string_view csv);

}  // namespace dtx
