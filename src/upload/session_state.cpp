#include "upload/session_state.hpp"

namespace modelpush::upload {

const char* ToString(const SessionState state) {
  switch (state) {
  case SessionState::kInit:
    return "INIT";
  case SessionState::kHashing:
    return "HASHING";
  case SessionState::kRegistering:
    return "REGISTERING";
  case SessionState::kUploading:
    return "UPLOADING";
  case SessionState::kFinalizing:
    return "FINALIZING";
  case SessionState::kDone:
    return "DONE";
  case SessionState::kFailed:
    return "FAILED";
  }
  return "INIT";
}

bool ParseSessionState(std::string_view text, SessionState& state) {
  for (const SessionState candidate :
       {SessionState::kInit, SessionState::kHashing, SessionState::kRegistering,
        SessionState::kUploading, SessionState::kFinalizing, SessionState::kDone,
        SessionState::kFailed}) {
    if (text == ToString(candidate)) {
      state = candidate;
      return true;
    }
  }
  return false;
}

bool IsTerminal(const SessionState state) {
  return state == SessionState::kDone || state == SessionState::kFailed;
}

bool IsValidTransition(const SessionState from, const SessionState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == SessionState::kFailed) {
    return true;
  }
  switch (from) {
  case SessionState::kInit:
    return to == SessionState::kHashing;
  case SessionState::kHashing:
    return to == SessionState::kRegistering;
  case SessionState::kRegistering:
    return to == SessionState::kUploading;
  case SessionState::kUploading:
    return to == SessionState::kUploading || to == SessionState::kFinalizing;
  case SessionState::kFinalizing:
    return to == SessionState::kDone;
  case SessionState::kDone:
  case SessionState::kFailed:
    return false;
  }
  return false;
}

} // namespace modelpush::upload
