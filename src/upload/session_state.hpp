#pragma once

#include <string_view>

namespace modelpush::upload {

// Upload session lifecycle:
//
//   INIT -> HASHING -> REGISTERING -> UPLOADING(index) -> FINALIZING -> DONE
//                                          |
//                                          v
//                                       FAILED
//
// UPLOADING loops on itself once per acknowledged index. Every non-terminal
// state may move to FAILED; DONE and FAILED are terminal.
enum class SessionState {
  kInit,
  kHashing,
  kRegistering,
  kUploading,
  kFinalizing,
  kDone,
  kFailed,
};

const char* ToString(SessionState state);
bool ParseSessionState(std::string_view text, SessionState& state);

bool IsTerminal(SessionState state);
bool IsValidTransition(SessionState from, SessionState to);

} // namespace modelpush::upload
