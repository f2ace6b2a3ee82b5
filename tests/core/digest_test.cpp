#include "chunking/chunker.hpp"
#include "hashing/digest.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace {

std::vector<std::uint8_t> BytesOf(std::string_view text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

} // namespace

TEST_CASE("ComputeDigest matches SHA-256 reference vectors", "[core][hashing]") {
  modelpush::hashing::Digest digest;
  std::string error;

  const auto abc = BytesOf("abc");
  REQUIRE(modelpush::hashing::ComputeDigest(abc, digest, error));
  REQUIRE(modelpush::hashing::ToHex(digest) ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  REQUIRE(modelpush::hashing::ComputeDigest(std::span<const std::uint8_t>(), digest, error));
  REQUIRE(modelpush::hashing::ToHex(digest) ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("ParseHex accepts lowercase and uppercase and rejects bad input", "[core][hashing]") {
  const std::string hex = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
  modelpush::hashing::Digest lower;
  modelpush::hashing::Digest upper;
  std::string error;
  REQUIRE(modelpush::hashing::ParseHex(hex, lower, error));

  std::string upper_hex = hex;
  for (char& c : upper_hex) {
    if (c >= 'a' && c <= 'f') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  REQUIRE(modelpush::hashing::ParseHex(upper_hex, upper, error));
  REQUIRE(lower == upper);

  modelpush::hashing::Digest ignored;
  REQUIRE_FALSE(modelpush::hashing::ParseHex(hex.substr(2), ignored, error));
  REQUIRE_FALSE(modelpush::hashing::ParseHex("zz" + hex.substr(2), ignored, error));
}

TEST_CASE("Chunk count is the ceiling of size over chunk size", "[core][chunking]") {
  REQUIRE(modelpush::chunking::ComputeChunkCount(0U, 10U) == 0U);
  REQUIRE(modelpush::chunking::ComputeChunkCount(1U, 10U) == 1U);
  REQUIRE(modelpush::chunking::ComputeChunkCount(10U, 10U) == 1U);
  REQUIRE(modelpush::chunking::ComputeChunkCount(11U, 10U) == 2U);
  REQUIRE(modelpush::chunking::ComputeChunkCount(25'000'000U,
                                                 modelpush::chunking::kDefaultChunkSizeBytes) == 3U);
}
