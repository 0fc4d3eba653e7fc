#include "dtx/core/error.hpp"

namespace dtx {

const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::MissingStream:
      return "missing_stream";
    case ErrorCode::IntegrityMismatch:
      return "integrity_mismatch";
    case ErrorCode::SourceError:
      return "source_error";
    case ErrorCode::DestinationError:
      return "destination_error";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::Internal:
      return "internal";
  }
  return "unknown";
}

}  // namespace dtx
