#include "registry/registry_client.hpp"

namespace modelpush::registry {

const char* ToString(const RecordState state) {
  switch (state) {
  case RecordState::kCreated:
    return "CREATED";
  case RecordState::kUploading:
    return "UPLOADING";
  case RecordState::kUploaded:
    return "UPLOADED";
  case RecordState::kFailed:
    return "FAILED";
  case RecordState::kExpired:
    return "EXPIRED";
  }
  return "CREATED";
}

bool AcceptsChunks(const RecordState state) {
  return state == RecordState::kCreated || state == RecordState::kUploading;
}

} // namespace modelpush::registry
