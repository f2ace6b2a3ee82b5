#ifndef MODELPUSH_TESTS_COMMON_UPLOAD_FIXTURES_HPP_
#define MODELPUSH_TESTS_COMMON_UPLOAD_FIXTURES_HPP_

#include "artifact/artifact.hpp"
#include "registry/model_metadata.hpp"
#include "upload/orchestrator.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace modelpush::tests::common {

inline registry::ModelMetadata MakeTestMetadata(std::string name = "all-MiniLM-L6-v2",
                                                std::uint32_t version = 1) {
  registry::ModelMetadata metadata;
  metadata.name = std::move(name);
  metadata.version = version;
  metadata.model_format = registry::ModelFormat::kTorchScript;
  metadata.model_task_type = registry::ModelTaskType::kTextEmbedding;
  metadata.description = "smoke test model";
  metadata.model_config.model_type = "bert";
  metadata.model_config.embedding_dimension = 384;
  metadata.model_config.framework_type = registry::FrameworkType::kSentenceTransformers;
  metadata.model_config.all_config = R"({"architectures":["BertModel"]})";
  return metadata;
}

// Deterministic, non-repeating-per-chunk byte pattern so misordered chunks
// change the digest.
inline std::vector<std::uint8_t> MakePatternBytes(std::size_t size, std::uint32_t seed = 7U) {
  std::vector<std::uint8_t> bytes(size);
  std::uint32_t state = seed;
  for (std::size_t i = 0; i < size; ++i) {
    state = state * 1'103'515'245U + 12'345U;
    bytes[i] = static_cast<std::uint8_t>(state >> 16U);
  }
  return bytes;
}

inline artifact::Artifact MakeTestArtifact(std::size_t size, std::uint32_t seed = 7U) {
  return artifact::Artifact("memory://model.zip", MakePatternBytes(size, seed));
}

// Retry waits are recorded instead of slept so tests stay fast.
struct RecordingSleeper {
  std::vector<std::chrono::milliseconds> waits;

  upload::Sleeper AsSleeper() {
    return [this](std::chrono::milliseconds delay) { waits.push_back(delay); };
  }
};

inline upload::UploadOptions MakeTestUploadOptions(std::uint64_t chunk_size,
                                                   std::filesystem::path output_dir = {}) {
  upload::UploadOptions options;
  options.chunk_size_bytes = chunk_size;
  options.retry.max_attempts = 5U;
  options.retry.initial_backoff = std::chrono::milliseconds(10);
  options.retry.max_backoff = std::chrono::milliseconds(40);
  options.output_dir = std::move(output_dir);
  return options;
}

} // namespace modelpush::tests::common

#endif // MODELPUSH_TESTS_COMMON_UPLOAD_FIXTURES_HPP_
