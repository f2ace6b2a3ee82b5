#include "hashing/digest.hpp"
#include "registry/sim_registry.hpp"

#include "../common/assertions.hpp"
#include "../common/upload_fixtures.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace {

using modelpush::registry::ChunkAck;
using modelpush::registry::FinalizeResult;
using modelpush::registry::RecordState;
using modelpush::registry::RegistrationRecord;
using modelpush::registry::RegistrationRequest;
using modelpush::registry::RegistryError;
using modelpush::registry::RegistryErrorCode;
using modelpush::registry::SimRegistry;
using modelpush::tests::common::AssertContains;
using modelpush::tests::common::Fail;

constexpr std::size_t kChunkSize = 4'096U;

RegistrationRequest MakeRequest(const std::vector<std::uint8_t>& bytes) {
  RegistrationRequest request;
  request.metadata = modelpush::tests::common::MakeTestMetadata();
  std::string error;
  if (!modelpush::hashing::ComputeDigest(bytes, request.digest, error)) {
    Fail("digest failed: " + error);
  }
  request.size_bytes = bytes.size();
  request.total_chunks = (bytes.size() + kChunkSize - 1U) / kChunkSize;
  return request;
}

std::span<const std::uint8_t> Slice(const std::vector<std::uint8_t>& bytes, std::uint64_t index) {
  const std::size_t offset = static_cast<std::size_t>(index) * kChunkSize;
  const std::size_t size = std::min(kChunkSize, bytes.size() - offset);
  return std::span<const std::uint8_t>(bytes.data() + offset, size);
}

void UploadOrFail(SimRegistry& registry, const std::string& model_id,
                  const std::vector<std::uint8_t>& bytes, std::uint64_t index, ChunkAck& ack) {
  RegistryError error;
  if (!registry.UploadChunk(model_id, index, Slice(bytes, index), ack, error)) {
    Fail("upload of index " + std::to_string(index) + " failed: " + error.message);
  }
}

void RunIdempotentAckAndFinalizeContract() {
  const std::vector<std::uint8_t> bytes = modelpush::tests::common::MakePatternBytes(10'000U);
  SimRegistry registry;
  std::string model_id;
  RegistryError error;
  if (!registry.Register(MakeRequest(bytes), model_id, error)) {
    Fail("register failed: " + error.message);
  }

  RegistrationRecord record;
  if (!registry.QueryStatus(model_id, record, error) || record.state != RecordState::kCreated ||
      record.total_chunks != 3U) {
    Fail("a fresh registration must be CREATED with 3 chunks");
  }

  ChunkAck first;
  UploadOrFail(registry, model_id, bytes, 0U, first);
  if (first.status != "Uploaded" || first.size_bytes != kChunkSize) {
    Fail("chunk 0 acknowledgment is wrong");
  }

  // Finalize before every index is acknowledged must be refused.
  FinalizeResult result;
  if (registry.Finalize(model_id, result, error)) {
    Fail("finalize must fail while indices are missing");
  }
  if (error.code != RegistryErrorCode::kInvalidState) {
    Fail("premature finalize must report an invalid state");
  }

  // A repeated index returns the original ack and stores nothing new.
  ChunkAck repeated;
  UploadOrFail(registry, model_id, bytes, 0U, repeated);
  if (!(repeated == first) || registry.StoredChunkCount(model_id) != 1U) {
    Fail("re-uploading an acknowledged index must be idempotent");
  }
  if (registry.UploadAttempts(model_id, 0U) != 2U) {
    Fail("sim registry must count every upload attempt");
  }

  ChunkAck ack;
  UploadOrFail(registry, model_id, bytes, 2U, ack);
  UploadOrFail(registry, model_id, bytes, 1U, ack);
  if (ack.size_bytes != kChunkSize) {
    Fail("middle chunk must be full size");
  }

  if (registry.UploadChunk(model_id, 3U, Slice(bytes, 2U), ack, error) ||
      error.code != RegistryErrorCode::kRejected) {
    Fail("an out-of-range index must be rejected");
  }

  if (!registry.Finalize(model_id, result, error) || result.state != RecordState::kUploaded) {
    Fail("finalize must succeed once every index is acknowledged: " + error.message);
  }
  if (!registry.QueryStatus(model_id, record, error) || record.state != RecordState::kUploaded ||
      record.acknowledged_chunks != 3U) {
    Fail("finalized record must be UPLOADED");
  }
  if (!registry.Finalize(model_id, result, error) || result.detail != "already finalized") {
    Fail("finalize must be idempotent on an UPLOADED record");
  }

  std::string expire_error;
  if (registry.ExpireRecord(model_id, expire_error)) {
    Fail("an UPLOADED record cannot expire");
  }
}

void RunDuplicateAndExpiryContract() {
  const std::vector<std::uint8_t> bytes = modelpush::tests::common::MakePatternBytes(5'000U);
  SimRegistry registry;
  std::string model_id;
  RegistryError error;
  if (!registry.Register(MakeRequest(bytes), model_id, error)) {
    Fail("register failed: " + error.message);
  }
  std::string duplicate_id;
  if (registry.Register(MakeRequest(bytes), duplicate_id, error) ||
      error.code != RegistryErrorCode::kDuplicate || error.http_status != 409) {
    Fail("a second live registration for the same name/version must be a duplicate");
  }
  AssertContains(error.message, model_id);

  std::optional<RegistrationRecord> found;
  if (!registry.FindRegistration("all-MiniLM-L6-v2", 1U, found, error) || !found.has_value() ||
      found->model_id != model_id) {
    Fail("lookup must find the live registration");
  }
  if (!registry.FindRegistration("all-MiniLM-L6-v2", 2U, found, error) || found.has_value()) {
    Fail("lookup of an unknown version must report no record");
  }

  std::string expire_error;
  if (!registry.ExpireRecord(model_id, expire_error)) {
    Fail("expire failed: " + expire_error);
  }
  ChunkAck ack;
  if (registry.UploadChunk(model_id, 0U, Slice(bytes, 0U), ack, error) ||
      error.code != RegistryErrorCode::kInvalidState) {
    Fail("an expired record must refuse chunks");
  }

  // The expired record no longer blocks a fresh registration.
  std::string replacement_id;
  if (!registry.Register(MakeRequest(bytes), replacement_id, error) ||
      replacement_id == model_id || registry.RecordCount() != 2U) {
    Fail("registration after expiry must create a new record");
  }

  RegistrationRequest empty = MakeRequest(bytes);
  empty.size_bytes = 0U;
  if (registry.Register(empty, duplicate_id, error) ||
      error.code != RegistryErrorCode::kRejected) {
    Fail("an empty artifact registration must be rejected");
  }
}

void RunCorruptionContract() {
  const std::vector<std::uint8_t> bytes = modelpush::tests::common::MakePatternBytes(9'000U);
  modelpush::registry::SimFaultPlan plan;
  plan.corrupt_on_finalize = true;
  SimRegistry registry(plan);
  std::string model_id;
  RegistryError error;
  if (!registry.Register(MakeRequest(bytes), model_id, error)) {
    Fail("register failed: " + error.message);
  }
  ChunkAck ack;
  for (std::uint64_t index = 0; index < 3U; ++index) {
    UploadOrFail(registry, model_id, bytes, index, ack);
  }

  FinalizeResult result;
  if (registry.Finalize(model_id, result, error) ||
      error.code != RegistryErrorCode::kDigestMismatch) {
    Fail("corrupted content must fail finalize with a digest mismatch");
  }
  RegistrationRecord record;
  if (!registry.QueryStatus(model_id, record, error) || record.state != RecordState::kFailed) {
    Fail("a digest mismatch must leave the record FAILED");
  }
  if (registry.Finalize(model_id, result, error) ||
      error.code != RegistryErrorCode::kDigestMismatch) {
    Fail("a FAILED record must never become UPLOADED");
  }
}

} // namespace

int main() {
  RunIdempotentAckAndFinalizeContract();
  RunDuplicateAndExpiryContract();
  RunCorruptionContract();
  std::cout << "sim_registry_contract_smoke: ok\n";
  return 0;
}
