#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace modelpush::hashing {

// SHA-256 is what the model registry stores as `model_content_hash_value`,
// so the digest algorithm is fixed rather than configurable.
constexpr std::size_t kDigestSizeBytes = 32;

struct Digest {
  std::array<std::uint8_t, kDigestSizeBytes> bytes{};

  bool operator==(const Digest&) const = default;
};

// Pure function over in-memory bytes. Returns false only if the crypto
// library itself fails (allocation / provider errors).
bool ComputeDigest(std::span<const std::uint8_t> data, Digest& digest, std::string& error);

// Streams a file through the hasher in fixed-size blocks so a multi-gigabyte
// archive never needs to be resident twice. Open/read failures are reported
// in `error` and are treated by callers as artifact read errors.
bool ComputeFileDigest(const std::filesystem::path& path, Digest& digest, std::string& error);

// Lowercase hex, 64 characters.
std::string ToHex(const Digest& digest);

// Accepts upper or lower case; rejects anything but exactly 64 hex digits.
bool ParseHex(std::string_view hex, Digest& digest, std::string& error);

} // namespace modelpush::hashing
