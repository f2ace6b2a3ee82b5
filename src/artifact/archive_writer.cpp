#include "artifact/archive_writer.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace modelpush::artifact {

namespace {

constexpr std::uint32_t kLocalFileHeaderSignature = 0x04034b50U;
constexpr std::uint32_t kCentralDirectoryHeaderSignature = 0x02014b50U;
constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50U;
constexpr std::uint16_t kZipVersion = 20; // 2.0
constexpr std::uint16_t kCompressionMethodStore = 0;
constexpr std::size_t kEndOfCentralDirectorySize = 22;
constexpr std::size_t kCentralDirectoryHeaderSize = 46;
constexpr std::size_t kMaxZipCommentSize = 0xFFFF;

constexpr std::uint32_t kCrc32Init = 0xFFFFFFFFU;
constexpr std::uint32_t kCrc32FinalXor = 0xFFFFFFFFU;

struct PendingMember {
  fs::path source;
  ArchiveMember member;
  std::uint32_t local_header_offset = 0;
};

void WriteU16(std::ofstream& out_file, std::uint16_t value) {
  const std::array<char, 2> bytes = {
      static_cast<char>(value & 0xFFU),
      static_cast<char>((value >> 8) & 0xFFU),
  };
  out_file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

void WriteU32(std::ofstream& out_file, std::uint32_t value) {
  const std::array<char, 4> bytes = {
      static_cast<char>(value & 0xFFU),
      static_cast<char>((value >> 8) & 0xFFU),
      static_cast<char>((value >> 16) & 0xFFU),
      static_cast<char>((value >> 24) & 0xFFU),
  };
  out_file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

std::uint16_t ReadU16(const std::vector<char>& buffer, std::size_t offset) {
  return static_cast<std::uint16_t>(static_cast<std::uint8_t>(buffer[offset]) |
                                    (static_cast<std::uint8_t>(buffer[offset + 1]) << 8));
}

std::uint32_t ReadU32(const std::vector<char>& buffer, std::size_t offset) {
  return static_cast<std::uint32_t>(static_cast<std::uint8_t>(buffer[offset])) |
         (static_cast<std::uint32_t>(static_cast<std::uint8_t>(buffer[offset + 1])) << 8) |
         (static_cast<std::uint32_t>(static_cast<std::uint8_t>(buffer[offset + 2])) << 16) |
         (static_cast<std::uint32_t>(static_cast<std::uint8_t>(buffer[offset + 3])) << 24);
}

const std::array<std::uint32_t, 256>& Crc32Table() {
  static const std::array<std::uint32_t, 256> table = [] {
    std::array<std::uint32_t, 256> generated{};
    for (std::uint32_t i = 0; i < 256U; ++i) {
      std::uint32_t c = i;
      for (int bit = 0; bit < 8; ++bit) {
        c = (c & 1U) != 0U ? 0xEDB88320U ^ (c >> 1) : c >> 1;
      }
      generated[i] = c;
    }
    return generated;
  }();
  return table;
}

std::uint32_t Crc32Update(std::uint32_t crc, const char* data, std::size_t size) {
  const auto& table = Crc32Table();
  for (std::size_t i = 0; i < size; ++i) {
    crc = table[(crc ^ static_cast<std::uint8_t>(data[i])) & 0xFFU] ^ (crc >> 8);
  }
  return crc;
}

bool ScanSourceFile(const fs::path& path, ArchiveMember& member, std::string& error) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "archive input is not a regular file: " + path.string();
    return false;
  }

  std::ifstream in_file(path, std::ios::binary);
  if (!in_file) {
    error = "failed to open archive input: " + path.string();
    return false;
  }

  std::uint32_t crc = kCrc32Init;
  std::uint64_t total_size = 0;
  std::array<char, 8192> buffer{};
  while (in_file.good()) {
    in_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      continue;
    }
    crc = Crc32Update(crc, buffer.data(), static_cast<std::size_t>(read_count));
    total_size += static_cast<std::uint64_t>(read_count);
  }

  if (!in_file.eof()) {
    error = "failed while reading archive input: " + path.string();
    return false;
  }
  if (total_size == 0U) {
    error = "archive input is empty: " + path.string();
    return false;
  }
  if (total_size > 0xFFFFFFFFULL) {
    error = "archive input too large for zip32: " + path.string();
    return false;
  }

  member.crc32 = crc ^ kCrc32FinalXor;
  member.size_bytes = static_cast<std::uint32_t>(total_size);
  return true;
}

bool CopyFileToStream(const fs::path& path, std::ofstream& out_file, std::string& error) {
  std::ifstream in_file(path, std::ios::binary);
  if (!in_file) {
    error = "failed to open archive input for copy: " + path.string();
    return false;
  }

  std::array<char, 8192> buffer{};
  while (in_file.good()) {
    in_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize read_count = in_file.gcount();
    if (read_count <= 0) {
      continue;
    }
    out_file.write(buffer.data(), read_count);
    if (!out_file) {
      error = "failed while writing archive payload for: " + path.string();
      return false;
    }
  }

  if (!in_file.eof()) {
    error = "failed while reading archive input for copy: " + path.string();
    return false;
  }
  return true;
}

bool CheckedOffset(std::ofstream& out_file, std::uint32_t& offset, std::string_view what,
                   std::string& error) {
  const std::streamoff position = out_file.tellp();
  if (position < 0 || static_cast<std::uint64_t>(position) > 0xFFFFFFFFULL) {
    error = "zip offset overflow while writing " + std::string(what);
    return false;
  }
  offset = static_cast<std::uint32_t>(position);
  return true;
}

bool WriteArchiveBody(std::vector<PendingMember>& pending, std::ofstream& out_file,
                      std::string& error) {
  for (auto& entry : pending) {
    if (!CheckedOffset(out_file, entry.local_header_offset, "local file headers", error)) {
      return false;
    }
    const ArchiveMember& member = entry.member;
    WriteU32(out_file, kLocalFileHeaderSignature);
    WriteU16(out_file, kZipVersion);
    WriteU16(out_file, 0); // general purpose bit flag
    WriteU16(out_file, kCompressionMethodStore);
    WriteU16(out_file, 0); // last mod file time
    WriteU16(out_file, 0); // last mod file date
    WriteU32(out_file, member.crc32);
    WriteU32(out_file, member.size_bytes); // compressed size (store)
    WriteU32(out_file, member.size_bytes);
    WriteU16(out_file, static_cast<std::uint16_t>(member.name.size()));
    WriteU16(out_file, 0); // extra field length
    out_file.write(member.name.data(), static_cast<std::streamsize>(member.name.size()));
    if (!out_file) {
      error = "failed while writing zip local file header";
      return false;
    }
    if (!CopyFileToStream(entry.source, out_file, error)) {
      return false;
    }
  }

  std::uint32_t central_dir_offset = 0;
  if (!CheckedOffset(out_file, central_dir_offset, "central directory", error)) {
    return false;
  }

  for (const auto& entry : pending) {
    const ArchiveMember& member = entry.member;
    WriteU32(out_file, kCentralDirectoryHeaderSignature);
    WriteU16(out_file, kZipVersion); // version made by
    WriteU16(out_file, kZipVersion); // version needed to extract
    WriteU16(out_file, 0);
    WriteU16(out_file, kCompressionMethodStore);
    WriteU16(out_file, 0);
    WriteU16(out_file, 0);
    WriteU32(out_file, member.crc32);
    WriteU32(out_file, member.size_bytes);
    WriteU32(out_file, member.size_bytes);
    WriteU16(out_file, static_cast<std::uint16_t>(member.name.size()));
    WriteU16(out_file, 0); // extra field length
    WriteU16(out_file, 0); // file comment length
    WriteU16(out_file, 0); // disk number start
    WriteU16(out_file, 0); // internal file attributes
    WriteU32(out_file, 0); // external file attributes
    WriteU32(out_file, entry.local_header_offset);
    out_file.write(member.name.data(), static_cast<std::streamsize>(member.name.size()));
    if (!out_file) {
      error = "failed while writing zip central directory";
      return false;
    }
  }

  std::uint32_t central_dir_end = 0;
  if (!CheckedOffset(out_file, central_dir_end, "end of central directory", error)) {
    return false;
  }

  WriteU32(out_file, kEndOfCentralDirectorySignature);
  WriteU16(out_file, 0); // number of this disk
  WriteU16(out_file, 0); // disk holding the central directory
  WriteU16(out_file, static_cast<std::uint16_t>(pending.size()));
  WriteU16(out_file, static_cast<std::uint16_t>(pending.size()));
  WriteU32(out_file, central_dir_end - central_dir_offset);
  WriteU32(out_file, central_dir_offset);
  WriteU16(out_file, 0); // zip file comment length

  if (!out_file) {
    error = "failed while finalizing archive";
    return false;
  }
  return true;
}

bool ValidateMemberLayout(const std::vector<ArchiveMember>& members, std::string& error) {
  if (members.size() != 2U) {
    error = "archive must contain exactly 2 members (model binary + " +
            std::string(kTokenizerMemberName) + "), found " + std::to_string(members.size());
    return false;
  }
  const auto tokenizer_count =
      std::count_if(members.begin(), members.end(), [](const ArchiveMember& member) {
        return member.name == kTokenizerMemberName;
      });
  if (tokenizer_count != 1) {
    error = "archive must contain exactly one '" + std::string(kTokenizerMemberName) + "' member";
    return false;
  }
  return true;
}

} // namespace

bool WriteModelArchive(const fs::path& model_path, const fs::path& tokenizer_path,
                       const fs::path& archive_path, std::vector<ArchiveMember>& members,
                       std::string& error) {
  members.clear();
  if (model_path.empty() || tokenizer_path.empty() || archive_path.empty()) {
    error = "model, tokenizer and archive paths are all required";
    return false;
  }

  const std::string model_member_name = model_path.filename().string();
  if (model_member_name.empty() || model_member_name == kTokenizerMemberName) {
    error = "model file name '" + model_member_name + "' cannot be used as an archive member";
    return false;
  }

  std::vector<PendingMember> pending(2);
  pending[0].source = model_path;
  pending[0].member.name = model_member_name;
  pending[1].source = tokenizer_path;
  pending[1].member.name = kTokenizerMemberName;
  for (auto& entry : pending) {
    if (entry.member.name.size() > 0xFFFFU) {
      error = "zip member name too long: " + entry.member.name;
      return false;
    }
    if (!ScanSourceFile(entry.source, entry.member, error)) {
      return false;
    }
  }

  if (!core::EnsureParentDirectory(archive_path, error)) {
    return false;
  }

  const fs::path temp_path = core::detail::BuildAtomicTempPath(archive_path);
  bool written = false;
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open archive output: " + temp_path.string();
      return false;
    }
    written = WriteArchiveBody(pending, out_file, error);
  }

  std::error_code ec;
  if (!written) {
    (void)fs::remove(temp_path, ec);
    return false;
  }

  fs::rename(temp_path, archive_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    (void)fs::remove(temp_path, cleanup_ec);
    error = "failed to publish archive '" + archive_path.string() + "': " + ec.message();
    return false;
  }

  for (const auto& entry : pending) {
    members.push_back(entry.member);
  }
  return true;
}

bool InspectModelArchive(const fs::path& archive_path, std::vector<ArchiveMember>& members,
                         std::string& error) {
  members.clear();

  std::error_code ec;
  const std::uintmax_t file_size = fs::file_size(archive_path, ec);
  if (ec) {
    error = "unable to stat archive '" + archive_path.string() + "': " + ec.message();
    return false;
  }
  if (file_size < kEndOfCentralDirectorySize) {
    error = "archive too small to be a zip file: " + archive_path.string();
    return false;
  }

  std::ifstream in_file(archive_path, std::ios::binary);
  if (!in_file) {
    error = "failed to open archive: " + archive_path.string();
    return false;
  }

  // The end-of-central-directory record sits within the trailing
  // 22 + max-comment bytes.
  const std::size_t tail_size = static_cast<std::size_t>(
      std::min<std::uintmax_t>(file_size, kEndOfCentralDirectorySize + kMaxZipCommentSize));
  std::vector<char> tail(tail_size);
  in_file.seekg(static_cast<std::streamoff>(file_size - tail_size));
  in_file.read(tail.data(), static_cast<std::streamsize>(tail_size));
  if (in_file.gcount() != static_cast<std::streamsize>(tail_size)) {
    error = "failed while reading archive trailer: " + archive_path.string();
    return false;
  }

  std::size_t eocd = tail_size - kEndOfCentralDirectorySize + 1U;
  bool found = false;
  while (eocd > 0U) {
    --eocd;
    if (ReadU32(tail, eocd) == kEndOfCentralDirectorySignature) {
      found = true;
      break;
    }
  }
  if (!found) {
    error = "archive has no end-of-central-directory record: " + archive_path.string();
    return false;
  }

  const std::uint16_t entry_count = ReadU16(tail, eocd + 10U);
  const std::uint32_t central_dir_size = ReadU32(tail, eocd + 12U);
  const std::uint32_t central_dir_offset = ReadU32(tail, eocd + 16U);
  if (static_cast<std::uintmax_t>(central_dir_offset) + central_dir_size > file_size) {
    error = "archive central directory lies outside the file: " + archive_path.string();
    return false;
  }

  std::vector<char> directory(central_dir_size);
  in_file.clear();
  in_file.seekg(static_cast<std::streamoff>(central_dir_offset));
  in_file.read(directory.data(), static_cast<std::streamsize>(directory.size()));
  if (in_file.gcount() != static_cast<std::streamsize>(directory.size())) {
    error = "failed while reading archive central directory: " + archive_path.string();
    return false;
  }

  std::size_t cursor = 0;
  for (std::uint16_t i = 0; i < entry_count; ++i) {
    if (cursor + kCentralDirectoryHeaderSize > directory.size() ||
        ReadU32(directory, cursor) != kCentralDirectoryHeaderSignature) {
      error = "archive central directory entry " + std::to_string(i) + " is malformed";
      return false;
    }
    const std::uint16_t name_size = ReadU16(directory, cursor + 28U);
    const std::uint16_t extra_size = ReadU16(directory, cursor + 30U);
    const std::uint16_t comment_size = ReadU16(directory, cursor + 32U);
    if (cursor + kCentralDirectoryHeaderSize + name_size > directory.size()) {
      error = "archive central directory entry " + std::to_string(i) + " name is truncated";
      return false;
    }

    ArchiveMember member;
    member.crc32 = ReadU32(directory, cursor + 16U);
    member.size_bytes = ReadU32(directory, cursor + 24U);
    member.name.assign(directory.data() + cursor + kCentralDirectoryHeaderSize, name_size);
    members.push_back(std::move(member));

    cursor += kCentralDirectoryHeaderSize + name_size + extra_size + comment_size;
  }

  return ValidateMemberLayout(members, error);
}

} // namespace modelpush::artifact
