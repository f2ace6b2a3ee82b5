#pragma once

#include "registry/model_metadata.hpp"

#include <filesystem>
#include <string>

namespace modelpush::upload {

struct UploadOutcome;

constexpr const char* kUploadSummaryFileName = "upload_summary.json";

// Writes `<output_dir>/upload_summary.json`: terminal state, model identity,
// digest, chunk geometry, per-index attempts and the failure (if any).
bool WriteUploadSummaryJson(const registry::ModelMetadata& metadata, const UploadOutcome& outcome,
                            const std::filesystem::path& output_dir, std::string& error);

} // namespace modelpush::upload
