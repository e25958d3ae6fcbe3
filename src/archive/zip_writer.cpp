#include "archive/zip_writer.hpp"

#include "core/fs_utils.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <set>
#include <utility>

namespace permitpack::archive {

namespace {

constexpr std::uint32_t kLocalFileHeaderSignature = 0x04034b50U;
constexpr std::uint32_t kCentralDirectoryHeaderSignature = 0x02014b50U;
constexpr std::uint32_t kEndOfCentralDirectorySignature = 0x06054b50U;
constexpr std::uint16_t kZipVersion = 20; // 2.0
constexpr std::uint16_t kFlagUtf8Names = 0x0800U;
constexpr std::uint16_t kCompressionMethodStore = 0;
constexpr std::uint16_t kCompressionMethodDeflate = 8;
constexpr std::uint16_t kDosTimeMidnight = 0;
constexpr std::uint16_t kDosDate1980Jan1 = (0U << 9U) | (1U << 5U) | 1U;
constexpr std::uint64_t kZip32Limit = 0xFFFFFFFFULL;

struct PreparedEntry {
  std::string_view name;
  std::string_view raw;
  std::string deflated;
  bool use_deflate = false;
  std::uint32_t crc32 = 0;
  std::uint32_t local_header_offset = 0;

  std::string_view Payload() const {
    return use_deflate ? std::string_view(deflated) : raw;
  }
  std::uint16_t Method() const {
    return use_deflate ? kCompressionMethodDeflate : kCompressionMethodStore;
  }
};

void AppendU16(std::string& out, std::uint16_t value) {
  out.push_back(static_cast<char>(value & 0xFFU));
  out.push_back(static_cast<char>((value >> 8) & 0xFFU));
}

void AppendU32(std::string& out, std::uint32_t value) {
  out.push_back(static_cast<char>(value & 0xFFU));
  out.push_back(static_cast<char>((value >> 8) & 0xFFU));
  out.push_back(static_cast<char>((value >> 16) & 0xFFU));
  out.push_back(static_cast<char>((value >> 24) & 0xFFU));
}

std::uint32_t ComputeCrc32(std::string_view bytes) {
  uLong crc = crc32(0L, Z_NULL, 0);
  std::size_t offset = 0;
  // zlib takes uInt lengths; feed large payloads in slices.
  while (offset < bytes.size()) {
    const std::size_t slice =
        std::min<std::size_t>(bytes.size() - offset, std::numeric_limits<uInt>::max());
    crc = crc32(crc, reinterpret_cast<const Bytef*>(bytes.data() + offset),
                static_cast<uInt>(slice));
    offset += slice;
  }
  return static_cast<std::uint32_t>(crc);
}

// Raw DEFLATE (no zlib header), as the zip format expects.
bool DeflateRaw(std::string_view input, int level, std::string& output, std::string& error) {
  z_stream stream{};
  int rc = deflateInit2(&stream, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) {
    error = "zlib deflateInit2 failed (code " + std::to_string(rc) + ")";
    return false;
  }

  output.assign(deflateBound(&stream, static_cast<uLong>(input.size())), '\0');
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
  stream.avail_in = static_cast<uInt>(input.size());
  stream.next_out = reinterpret_cast<Bytef*>(output.data());
  stream.avail_out = static_cast<uInt>(output.size());

  rc = deflate(&stream, Z_FINISH);
  const uLong produced = stream.total_out;
  deflateEnd(&stream);
  if (rc != Z_STREAM_END) {
    error = "zlib deflate did not finish (code " + std::to_string(rc) + ")";
    return false;
  }
  output.resize(static_cast<std::size_t>(produced));
  return true;
}

bool ValidateEntryName(std::string_view name, std::set<std::string_view>& seen,
                       std::string& error) {
  if (name.empty()) {
    error = "zip entry name cannot be empty";
    return false;
  }
  if (name.size() > 0xFFFFU) {
    error = "zip entry name too long: " + std::string(name.substr(0, 64)) + "...";
    return false;
  }
  if (name.front() == '/' || name.front() == '\\') {
    error = "zip entry name must be relative: " + std::string(name);
    return false;
  }
  if (name == ".." || name.rfind("../", 0) == 0U || name.find("/../") != std::string_view::npos ||
      (name.size() >= 3U && name.substr(name.size() - 3U) == "/..")) {
    error = "zip entry name escapes the archive root: " + std::string(name);
    return false;
  }
  if (!seen.insert(name).second) {
    error = "duplicate zip entry name: " + std::string(name);
    return false;
  }
  return true;
}

void AppendLocalHeader(std::string& out, const PreparedEntry& entry) {
  AppendU32(out, kLocalFileHeaderSignature);
  AppendU16(out, kZipVersion);
  AppendU16(out, kFlagUtf8Names);
  AppendU16(out, entry.Method());
  AppendU16(out, kDosTimeMidnight);
  AppendU16(out, kDosDate1980Jan1);
  AppendU32(out, entry.crc32);
  AppendU32(out, static_cast<std::uint32_t>(entry.Payload().size())); // compressed size
  AppendU32(out, static_cast<std::uint32_t>(entry.raw.size()));       // uncompressed size
  AppendU16(out, static_cast<std::uint16_t>(entry.name.size()));
  AppendU16(out, 0); // extra field length
  out.append(entry.name);
}

void AppendCentralHeader(std::string& out, const PreparedEntry& entry) {
  AppendU32(out, kCentralDirectoryHeaderSignature);
  AppendU16(out, kZipVersion); // version made by
  AppendU16(out, kZipVersion); // version needed to extract
  AppendU16(out, kFlagUtf8Names);
  AppendU16(out, entry.Method());
  AppendU16(out, kDosTimeMidnight);
  AppendU16(out, kDosDate1980Jan1);
  AppendU32(out, entry.crc32);
  AppendU32(out, static_cast<std::uint32_t>(entry.Payload().size()));
  AppendU32(out, static_cast<std::uint32_t>(entry.raw.size()));
  AppendU16(out, static_cast<std::uint16_t>(entry.name.size()));
  AppendU16(out, 0); // extra field length
  AppendU16(out, 0); // file comment length
  AppendU16(out, 0); // disk number start
  AppendU16(out, 0); // internal file attributes
  AppendU32(out, 0); // external file attributes
  AppendU32(out, entry.local_header_offset);
  out.append(entry.name);
}

} // namespace

bool DeflateAvailable() {
  z_stream stream{};
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    return false;
  }
  deflateEnd(&stream);
  return true;
}

bool BuildZipArchive(const std::vector<ZipEntryView>& entries, const ZipOptions& options,
                     std::string& archive_bytes, std::string& error) {
  if (entries.empty()) {
    error = "zip archive needs at least one entry";
    return false;
  }
  if (entries.size() > 0xFFFFU) {
    error = "too many entries for zip32 support";
    return false;
  }
  if (options.deflate && (options.level < 0 || options.level > 9)) {
    error = "zip compression level must be within 0..9";
    return false;
  }

  std::set<std::string_view> seen_names;
  std::vector<PreparedEntry> prepared;
  prepared.reserve(entries.size());
  for (const auto& entry : entries) {
    if (!ValidateEntryName(entry.name, seen_names, error)) {
      return false;
    }
    if (entry.bytes.size() > kZip32Limit) {
      error = "entry too large for zip32 support: " + std::string(entry.name);
      return false;
    }

    PreparedEntry item;
    item.name = entry.name;
    item.raw = entry.bytes;
    item.crc32 = ComputeCrc32(entry.bytes);
    if (options.deflate && !entry.bytes.empty()) {
      if (!DeflateRaw(entry.bytes, options.level, item.deflated, error)) {
        error = "failed to compress '" + std::string(entry.name) + "': " + error;
        return false;
      }
      item.use_deflate = item.deflated.size() < entry.bytes.size();
      if (!item.use_deflate) {
        item.deflated.clear();
      }
    }
    prepared.push_back(std::move(item));
  }

  std::string out;
  // Local file headers + file data.
  for (auto& entry : prepared) {
    if (out.size() > kZip32Limit) {
      error = "zip offset overflow while writing local file headers";
      return false;
    }
    entry.local_header_offset = static_cast<std::uint32_t>(out.size());
    AppendLocalHeader(out, entry);
    out.append(entry.Payload());
  }

  if (out.size() > kZip32Limit) {
    error = "zip central directory offset overflow";
    return false;
  }
  const auto central_dir_offset = static_cast<std::uint32_t>(out.size());
  for (const auto& entry : prepared) {
    AppendCentralHeader(out, entry);
  }
  if (out.size() > kZip32Limit) {
    error = "zip central directory size overflow";
    return false;
  }
  const auto central_dir_size = static_cast<std::uint32_t>(out.size() - central_dir_offset);

  // End of central directory record.
  AppendU32(out, kEndOfCentralDirectorySignature);
  AppendU16(out, 0); // number of this disk
  AppendU16(out, 0); // disk where the central directory starts
  AppendU16(out, static_cast<std::uint16_t>(prepared.size()));
  AppendU16(out, static_cast<std::uint16_t>(prepared.size()));
  AppendU32(out, central_dir_size);
  AppendU32(out, central_dir_offset);
  AppendU16(out, 0); // zip file comment length

  archive_bytes = std::move(out);
  return true;
}

bool WriteZipArchive(const std::vector<ZipEntryView>& entries, const ZipOptions& options,
                     const std::filesystem::path& output_path, std::string& error) {
  std::string archive_bytes;
  if (!BuildZipArchive(entries, options, archive_bytes, error)) {
    return false;
  }
  return core::WriteFileAtomic(output_path, archive_bytes, error);
}

} // namespace permitpack::archive
