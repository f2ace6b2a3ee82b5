#include "upload/upload_summary_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/time_utils.hpp"
#include "upload/orchestrator.hpp"

#include <chrono>
#include <sstream>

namespace modelpush::upload {

bool WriteUploadSummaryJson(const registry::ModelMetadata& metadata, const UploadOutcome& outcome,
                            const std::filesystem::path& output_dir, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  using core::json::EscapeJson;
  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(outcome.finished_at -
                                                            outcome.started_at)
          .count();

  std::ostringstream out;
  out << "{\n"
      << "  \"schema_version\": \"1.0\",\n"
      << "  \"session_id\": \"" << EscapeJson(outcome.session_id) << "\",\n"
      << "  \"outcome\": \"" << ToString(outcome.state) << "\",\n"
      << "  \"model_name\": \"" << EscapeJson(metadata.name) << "\",\n"
      << "  \"model_version\": " << metadata.version << ",\n"
      << "  \"model_format\": \"" << registry::ToString(metadata.model_format) << "\",\n"
      << "  \"model_id\": \"" << EscapeJson(outcome.model_id) << "\",\n"
      << "  \"digest_sha256\": \"" << EscapeJson(outcome.digest_hex) << "\",\n"
      << "  \"size_bytes\": " << outcome.size_bytes << ",\n"
      << "  \"chunk_size_bytes\": " << outcome.chunk_size_bytes << ",\n"
      << "  \"total_chunks\": " << outcome.total_chunks << ",\n"
      << "  \"acknowledged_count\": " << outcome.acknowledged_count << ",\n"
      << "  \"resumed\": " << (outcome.resumed ? "true" : "false") << ",\n"
      << "  \"reused_registration\": " << (outcome.reused_registration ? "true" : "false")
      << ",\n"
      << "  \"chunk_attempts\": [";
  for (std::size_t i = 0; i < outcome.chunk_attempts.size(); ++i) {
    if (i > 0U) {
      out << ',';
    }
    out << outcome.chunk_attempts[i];
  }
  out << "],\n"
      << "  \"started_at_utc\": \"" << core::FormatUtcTimestamp(outcome.started_at) << "\",\n"
      << "  \"finished_at_utc\": \"" << core::FormatUtcTimestamp(outcome.finished_at) << "\",\n"
      << "  \"duration_ms\": " << duration_ms << ",\n";

  if (outcome.error.has_value()) {
    const core::errors::UploadError& failure = outcome.error.value();
    out << "  \"error\": {\n"
        << "    \"code\": \"" << core::errors::ToStableErrorCode(failure.kind) << "\",\n"
        << "    \"message\": \"" << EscapeJson(failure.message) << "\",\n"
        << "    \"detail\": \"" << EscapeJson(failure.detail) << "\",\n"
        << "    \"resumable\": " << (core::errors::IsResumable(failure.kind) ? "true" : "false");
    if (failure.chunk_index.has_value()) {
      out << ",\n    \"index\": " << failure.chunk_index.value();
    }
    if (failure.attempts > 0U) {
      out << ",\n    \"attempts\": " << failure.attempts;
    }
    out << "\n  }\n";
  } else {
    out << "  \"error\": null\n";
  }
  out << "}\n";

  return core::WriteTextFileAtomic(output_dir / kUploadSummaryFileName, out.str(), error);
}

} // namespace modelpush::upload
