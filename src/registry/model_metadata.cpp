#include "registry/model_metadata.hpp"

#include "core/json_dom.hpp"

namespace modelpush::registry {

namespace json = core::json;

const char* ToString(const ModelFormat format) {
  switch (format) {
  case ModelFormat::kTorchScript:
    return "TORCH_SCRIPT";
  case ModelFormat::kOnnx:
    return "ONNX";
  }
  return "TORCH_SCRIPT";
}

const char* ToString(const ModelTaskType task_type) {
  switch (task_type) {
  case ModelTaskType::kTextEmbedding:
    return "TEXT_EMBEDDING";
  }
  return "TEXT_EMBEDDING";
}

const char* ToString(const FrameworkType framework_type) {
  switch (framework_type) {
  case FrameworkType::kSentenceTransformers:
    return "SENTENCE_TRANSFORMERS";
  case FrameworkType::kHuggingFaceTransformers:
    return "HUGGINGFACE_TRANSFORMERS";
  }
  return "SENTENCE_TRANSFORMERS";
}

bool ParseModelFormat(std::string_view raw, ModelFormat& format, std::string& error) {
  if (raw == "TORCH_SCRIPT") {
    format = ModelFormat::kTorchScript;
    return true;
  }
  if (raw == "ONNX") {
    format = ModelFormat::kOnnx;
    return true;
  }
  error = "unsupported model_format '" + std::string(raw) + "' (expected TORCH_SCRIPT|ONNX)";
  return false;
}

bool ParseModelTaskType(std::string_view raw, ModelTaskType& task_type, std::string& error) {
  if (raw == "TEXT_EMBEDDING") {
    task_type = ModelTaskType::kTextEmbedding;
    return true;
  }
  error = "unsupported model_task_type '" + std::string(raw) + "' (expected TEXT_EMBEDDING)";
  return false;
}

bool ParseFrameworkType(std::string_view raw, FrameworkType& framework_type, std::string& error) {
  if (raw == "SENTENCE_TRANSFORMERS") {
    framework_type = FrameworkType::kSentenceTransformers;
    return true;
  }
  if (raw == "HUGGINGFACE_TRANSFORMERS") {
    framework_type = FrameworkType::kHuggingFaceTransformers;
    return true;
  }
  error = "unsupported framework_type '" + std::string(raw) +
          "' (expected SENTENCE_TRANSFORMERS|HUGGINGFACE_TRANSFORMERS)";
  return false;
}

const char* ModelFileExtension(const ModelFormat format) {
  switch (format) {
  case ModelFormat::kTorchScript:
    return ".pt";
  case ModelFormat::kOnnx:
    return ".onnx";
  }
  return ".pt";
}

bool ValidateModelMetadata(const ModelMetadata& metadata, std::string& error) {
  if (metadata.name.empty()) {
    error = "model name cannot be empty";
    return false;
  }
  if (metadata.version == 0U) {
    error = "model version must be >= 1";
    return false;
  }
  if (metadata.model_config.model_type.empty()) {
    error = "model_config.model_type cannot be empty";
    return false;
  }
  if (metadata.model_config.embedding_dimension == 0U) {
    error = "model_config.embedding_dimension must be greater than 0";
    return false;
  }
  return true;
}

bool ValidateRegistrationRequest(const RegistrationRequest& request, std::string& error) {
  if (!ValidateModelMetadata(request.metadata, error)) {
    return false;
  }
  if (request.size_bytes == 0U) {
    error = "model_content_size_in_bytes must be greater than 0";
    return false;
  }
  if (request.total_chunks == 0U || request.total_chunks > request.size_bytes) {
    error = "total_chunks " + std::to_string(request.total_chunks) +
            " is inconsistent with an artifact of " + std::to_string(request.size_bytes) +
            " bytes";
    return false;
  }
  return true;
}

std::string BuildRegistrationJson(const RegistrationRequest& request) {
  const ModelMetadata& metadata = request.metadata;

  json::Value model_config = json::Value::MakeObject();
  model_config.object_value["model_type"] = json::Value::MakeString(metadata.model_config.model_type);
  model_config.object_value["embedding_dimension"] =
      json::Value::MakeNumber(static_cast<double>(metadata.model_config.embedding_dimension));
  model_config.object_value["framework_type"] =
      json::Value::MakeString(ToString(metadata.model_config.framework_type));
  model_config.object_value["all_config"] = json::Value::MakeString(metadata.model_config.all_config);

  json::Value body = json::Value::MakeObject();
  body.object_value["name"] = json::Value::MakeString(metadata.name);
  body.object_value["version"] = json::Value::MakeNumber(static_cast<double>(metadata.version));
  body.object_value["model_format"] = json::Value::MakeString(ToString(metadata.model_format));
  body.object_value["model_task_type"] = json::Value::MakeString(ToString(metadata.model_task_type));
  body.object_value["model_content_hash_value"] =
      json::Value::MakeString(hashing::ToHex(request.digest));
  body.object_value["model_content_size_in_bytes"] =
      json::Value::MakeNumber(static_cast<double>(request.size_bytes));
  body.object_value["total_chunks"] = json::Value::MakeNumber(static_cast<double>(request.total_chunks));
  body.object_value["model_config"] = std::move(model_config);
  if (metadata.description.has_value()) {
    body.object_value["description"] = json::Value::MakeString(metadata.description.value());
  }

  return json::Serialize(body);
}

} // namespace modelpush::registry
