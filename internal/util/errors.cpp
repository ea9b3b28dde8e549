#include "errors.hpp"

namespace pano::util {

ErrorCode ErrorCodeOf(const std::exception& e) {
  if (dynamic_cast<const NotFound*>(&e)) {
    return ErrorCode::NotFound;
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return ErrorCode::InvalidState;
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return ErrorCode::InvalidArgument;
  }
  if (dynamic_cast<const MetadataUnavailable*>(&e)) {
    return ErrorCode::MetadataUnavailable;
  }
  // StorageCorrupt before its base class.
  if (dynamic_cast<const StorageCorrupt*>(&e)) {
    return ErrorCode::StorageCorrupt;
  }
  if (dynamic_cast<const StorageError*>(&e)) {
    return ErrorCode::StorageError;
  }
  if (dynamic_cast<const IndexOutOfRange*>(&e)) {
    return ErrorCode::IndexOutOfRange;
  }
  if (dynamic_cast<const ExternalToolFailure*>(&e)) {
    return ErrorCode::ExternalToolFailure;
  }

  return ErrorCode::InternalError;
}

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::InvalidState:
      return "invalid_state";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
    case ErrorCode::MetadataUnavailable:
      return "metadata_unavailable";
    case ErrorCode::StorageCorrupt:
      return "storage_corrupt";
    case ErrorCode::StorageError:
      return "storage_error";
    case ErrorCode::IndexOutOfRange:
      return "index_out_of_range";
    case ErrorCode::ExternalToolFailure:
      return "external_tool_failure";
    case ErrorCode::InternalError:
      return "internal";
  }
  return "internal";
}

} // namespace pano::util
