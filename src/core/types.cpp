#include "dtx/core/types.hpp"

#include <format>
#include <string>

#include "dtx/core/error.hpp"

namespace dtx {
namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

}  // namespace

const char* stage_name(TransferStage stage) noexcept {
  switch (stage) {
    case TransferStage::Schemas:
      return "schemas";
    case TransferStage::Entities:
      return "entities";
    case TransferStage::Links:
      return "links";
    case TransferStage::Media:
      return "media";
    case TransferStage::Configuration:
      return "configuration";
  }
  return "unknown";
}

const char* to_string(VersionMatching matching) noexcept {
  switch (matching) {
    case VersionMatching::Ignore:
      return "ignore";
    case VersionMatching::Exact:
      return "exact";
    case VersionMatching::Major:
      return "major";
    case VersionMatching::Minor:
      return "minor";
    case VersionMatching::Patch:
      return "patch";
  }
  return "unknown";
}

const char* to_string(ProgressEventType type) noexcept {
  switch (type) {
    case ProgressEventType::Start:
      return "start";
    case ProgressEventType::Progress:
      return "progress";
    case ProgressEventType::Complete:
      return "complete";
  }
  return "unknown";
}

TransferStage parse_stage(std::string_view name) {
  const auto token = trim(name);
  for (const auto stage : kTransferStages) {
    if (token == stage_name(stage)) {
      return stage;
    }
  }
  throw Error{ErrorCode::InvalidArgument,
              std::format("unknown transfer stage '{}'", token)};
}

VersionMatching parse_version_matching(std::string_view name) {
  const auto token = trim(name);
  for (const auto matching : {VersionMatching::Ignore, VersionMatching::Exact,
                              VersionMatching::Major, VersionMatching::Minor,
                              VersionMatching::Patch}) {
    if (token == to_string(matching)) {
      return matching;
    }
  }
  throw Error{ErrorCode::InvalidArgument,
              std::format("unknown version matching strategy '{}'", token)};
}

std::set<TransferStage> parse_stage_list(std::string_view csv) {
  std::set<TransferStage> out;
  while (!csv.empty()) {
    const auto comma = csv.find(',');
    const auto token = trim(csv.substr(0, comma));
    if (!token.empty()) {
      out.insert(parse_stage(token));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    csv.remove_prefix(comma + 1);
  }
  return out;
}

}  // namespace dtx
