#include "hashing/digest.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <memory>
#include <vector>

namespace modelpush::hashing {

namespace {

constexpr std::size_t kFileReadBlockBytes = 1U << 20U;

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string LastOpenSslError(std::string_view operation) {
  const unsigned long code = ERR_get_error();
  if (code == 0UL) {
    return std::string(operation) + " failed";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return std::string(operation) + " failed: " + buffer.data();
}

// RAII wrapper around one EVP SHA-256 context.
class Sha256Hasher {
public:
  bool Init(std::string& error) {
    ctx_.reset(EVP_MD_CTX_new());
    if (!ctx_) {
      error = LastOpenSslError("EVP_MD_CTX_new");
      return false;
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
      error = LastOpenSslError("EVP_DigestInit_ex");
      return false;
    }
    return true;
  }

  bool Update(const void* data, std::size_t size, std::string& error) {
    if (size == 0U) {
      return true;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
      error = LastOpenSslError("EVP_DigestUpdate");
      return false;
    }
    return true;
  }

  bool Final(Digest& digest, std::string& error) {
    unsigned int written = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), digest.bytes.data(), &written) != 1) {
      error = LastOpenSslError("EVP_DigestFinal_ex");
      return false;
    }
    if (written != kDigestSizeBytes) {
      error = "unexpected SHA-256 output length " + std::to_string(written);
      return false;
    }
    return true;
  }

private:
  EvpMdCtxPtr ctx_;
};

int HexNibble(const char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

bool ComputeDigest(std::span<const std::uint8_t> data, Digest& digest, std::string& error) {
  Sha256Hasher hasher;
  if (!hasher.Init(error)) {
    return false;
  }
  if (!hasher.Update(data.data(), data.size(), error)) {
    return false;
  }
  return hasher.Final(digest, error);
}

bool ComputeFileDigest(const std::filesystem::path& path, Digest& digest, std::string& error) {
  std::ifstream in_file(path, std::ios::binary);
  if (!in_file) {
    error = "unable to open artifact for hashing: " + path.string();
    return false;
  }

  Sha256Hasher hasher;
  if (!hasher.Init(error)) {
    return false;
  }

  std::vector<char> buffer(kFileReadBlockBytes);
  while (in_file.good()) {
    in_file.read(buffer.data(), static_cast<std::streamsize>(kFileReadBlockBytes));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      continue;
    }
    if (!hasher.Update(buffer.data(), static_cast<std::size_t>(read_count), error)) {
      return false;
    }
  }

  if (!in_file.eof()) {
    error = "failed while reading artifact for hashing: " + path.string();
    return false;
  }

  return hasher.Final(digest, error);
}

std::string ToHex(const Digest& digest) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(kDigestSizeBytes * 2U);
  for (const std::uint8_t byte : digest.bytes) {
    hex.push_back(kHexDigits[(byte >> 4U) & 0x0FU]);
    hex.push_back(kHexDigits[byte & 0x0FU]);
  }
  return hex;
}

bool ParseHex(std::string_view hex, Digest& digest, std::string& error) {
  if (hex.size() != kDigestSizeBytes * 2U) {
    error = "digest hex must be exactly " + std::to_string(kDigestSizeBytes * 2U) +
            " characters (got " + std::to_string(hex.size()) + ")";
    return false;
  }

  Digest parsed;
  for (std::size_t i = 0; i < kDigestSizeBytes; ++i) {
    const int high = HexNibble(hex[i * 2U]);
    const int low = HexNibble(hex[i * 2U + 1U]);
    if (high < 0 || low < 0) {
      error = "digest hex contains a non-hex character near offset " + std::to_string(i * 2U);
      return false;
    }
    parsed.bytes[i] = static_cast<std::uint8_t>((high << 4) | low);
  }

  digest = parsed;
  return true;
}

} // namespace modelpush::hashing
