#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace modelpush::chunking {

// Default slice size for one `upload_chunk` call. Matches the registry's
// documented per-request ceiling of 10 MB.
constexpr std::uint64_t kDefaultChunkSizeBytes = 10'000'000ULL;

// One slice of the archive. `payload` views the artifact owned by the
// orchestrator and is valid only while that artifact is alive.
struct Chunk {
  std::uint64_t index = 0;
  std::uint64_t total_count = 0;
  std::span<const std::uint8_t> payload;
};

// ceil(artifact_size / chunk_size). Returns 0 when chunk_size is 0.
std::uint64_t ComputeChunkCount(std::uint64_t artifact_size, std::uint64_t chunk_size);

bool ValidateChunkSize(std::uint64_t chunk_size, std::string& error);

// Lazy, restartable view of an artifact as fixed-size chunks.
//
// The chunk size is mutable only until the first chunk has been produced (or
// until Lock() is called at registration time); afterwards the count sent to
// the registry is frozen and SetChunkSize reports a configuration error.
class Chunker {
public:
  Chunker(std::span<const std::uint8_t> bytes, std::uint64_t chunk_size);

  bool SetChunkSize(std::uint64_t chunk_size, std::string& error);
  void Lock();
  bool IsLocked() const;

  std::uint64_t ChunkSize() const;
  std::uint64_t TotalCount() const;
  std::uint64_t NextIndex() const;
  bool HasNext() const;

  // Produces the chunk at the cursor and advances it. Returns false once all
  // chunks have been produced.
  bool Next(Chunk& chunk);

  // Moves the cursor so the next call to Next() yields `index`. Seeking to
  // TotalCount() is allowed and leaves the sequence exhausted.
  bool Seek(std::uint64_t index, std::string& error);

  // Rewinds to index 0. The chunk size stays locked.
  void Reset();

  // Random access without moving the cursor.
  bool ChunkAt(std::uint64_t index, Chunk& chunk, std::string& error);

private:
  Chunk MakeChunk(std::uint64_t index) const;

  std::span<const std::uint8_t> bytes_;
  std::uint64_t chunk_size_ = kDefaultChunkSizeBytes;
  std::uint64_t total_count_ = 0;
  std::uint64_t cursor_ = 0;
  bool locked_ = false;
};

} // namespace modelpush::chunking
