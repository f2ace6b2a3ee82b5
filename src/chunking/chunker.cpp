#include "chunking/chunker.hpp"

#include <algorithm>

namespace modelpush::chunking {

std::uint64_t ComputeChunkCount(const std::uint64_t artifact_size, const std::uint64_t chunk_size) {
  if (chunk_size == 0U) {
    return 0U;
  }
  return artifact_size / chunk_size + (artifact_size % chunk_size == 0U ? 0U : 1U);
}

bool ValidateChunkSize(const std::uint64_t chunk_size, std::string& error) {
  if (chunk_size == 0U) {
    error = "chunk size must be greater than 0 bytes";
    return false;
  }
  return true;
}

Chunker::Chunker(std::span<const std::uint8_t> bytes, const std::uint64_t chunk_size)
    : bytes_(bytes), chunk_size_(chunk_size),
      total_count_(ComputeChunkCount(bytes.size(), chunk_size)) {}

bool Chunker::SetChunkSize(const std::uint64_t chunk_size, std::string& error) {
  if (locked_) {
    if (chunk_size == chunk_size_) {
      return true;
    }
    error = "chunk size cannot change once an upload session has started (current " +
            std::to_string(chunk_size_) + ", requested " + std::to_string(chunk_size) + ")";
    return false;
  }
  if (!ValidateChunkSize(chunk_size, error)) {
    return false;
  }
  chunk_size_ = chunk_size;
  total_count_ = ComputeChunkCount(bytes_.size(), chunk_size_);
  cursor_ = 0;
  return true;
}

void Chunker::Lock() {
  locked_ = true;
}

bool Chunker::IsLocked() const {
  return locked_;
}

std::uint64_t Chunker::ChunkSize() const {
  return chunk_size_;
}

std::uint64_t Chunker::TotalCount() const {
  return total_count_;
}

std::uint64_t Chunker::NextIndex() const {
  return cursor_;
}

bool Chunker::HasNext() const {
  return cursor_ < total_count_;
}

bool Chunker::Next(Chunk& chunk) {
  if (!HasNext()) {
    return false;
  }
  locked_ = true;
  chunk = MakeChunk(cursor_);
  ++cursor_;
  return true;
}

bool Chunker::Seek(const std::uint64_t index, std::string& error) {
  if (index > total_count_) {
    error = "chunk index " + std::to_string(index) + " is out of range [0, " +
            std::to_string(total_count_) + "]";
    return false;
  }
  locked_ = true;
  cursor_ = index;
  return true;
}

void Chunker::Reset() {
  cursor_ = 0;
}

bool Chunker::ChunkAt(const std::uint64_t index, Chunk& chunk, std::string& error) {
  if (index >= total_count_) {
    error = "chunk index " + std::to_string(index) + " is out of range [0, " +
            std::to_string(total_count_) + ")";
    return false;
  }
  locked_ = true;
  chunk = MakeChunk(index);
  return true;
}

Chunk Chunker::MakeChunk(const std::uint64_t index) const {
  const std::uint64_t offset = index * chunk_size_;
  const std::uint64_t remaining = static_cast<std::uint64_t>(bytes_.size()) - offset;
  const std::uint64_t length = std::min(remaining, chunk_size_);
  Chunk chunk;
  chunk.index = index;
  chunk.total_count = total_count_;
  chunk.payload = bytes_.subspan(static_cast<std::size_t>(offset), static_cast<std::size_t>(length));
  return chunk;
}

} // namespace modelpush::chunking
