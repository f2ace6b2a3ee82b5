#pragma once

#include "hashing/digest.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace modelpush::registry {

enum class ModelFormat {
  kTorchScript,
  kOnnx,
};

enum class ModelTaskType {
  kTextEmbedding,
};

enum class FrameworkType {
  kSentenceTransformers,
  kHuggingFaceTransformers,
};

// Wire spellings used by the registry, e.g. "TORCH_SCRIPT".
const char* ToString(ModelFormat format);
const char* ToString(ModelTaskType task_type);
const char* ToString(FrameworkType framework_type);

bool ParseModelFormat(std::string_view raw, ModelFormat& format, std::string& error);
bool ParseModelTaskType(std::string_view raw, ModelTaskType& task_type, std::string& error);
bool ParseFrameworkType(std::string_view raw, FrameworkType& framework_type, std::string& error);

// Archive member extension expected for a given model format.
const char* ModelFileExtension(ModelFormat format);

struct ModelConfig {
  std::string model_type;
  std::uint32_t embedding_dimension = 0;
  FrameworkType framework_type = FrameworkType::kSentenceTransformers;
  // Opaque full configuration document, forwarded verbatim.
  std::string all_config;
};

struct ModelMetadata {
  std::string name;
  std::uint32_t version = 0;
  ModelFormat model_format = ModelFormat::kTorchScript;
  ModelTaskType model_task_type = ModelTaskType::kTextEmbedding;
  std::optional<std::string> description;
  ModelConfig model_config;
};

// Everything sent with one registration call. Digest, size and chunk count
// describe the exact artifact about to be uploaded.
struct RegistrationRequest {
  ModelMetadata metadata;
  hashing::Digest digest;
  std::uint64_t size_bytes = 0;
  std::uint64_t total_chunks = 0;
};

bool ValidateModelMetadata(const ModelMetadata& metadata, std::string& error);

// Checks metadata plus the artifact description (non-empty artifact, chunk
// count in [1, size_bytes]).
bool ValidateRegistrationRequest(const RegistrationRequest& request, std::string& error);

// Registration body:
//   {"description":...,"model_config":{"all_config":...,"embedding_dimension":...,
//    "framework_type":...,"model_type":...},"model_content_hash_value":"<hex>",
//    "model_content_size_in_bytes":N,"model_format":...,"model_task_type":...,
//    "name":...,"total_chunks":N,"version":N}
std::string BuildRegistrationJson(const RegistrationRequest& request);

} // namespace modelpush::registry
