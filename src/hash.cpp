#include "kiln/hash.hpp"

// Hash authority for fingerprints.
//
// to_hex() uses a lookup table instead of snprintf("%02x"); fingerprints of
// large classpaths hash thousands of files, so the per-digest cost matters.
//
// EXTENSION_POINT: classpath_digest_cache
//   Every fingerprint re-hashes its classpath. A cache keyed by
//   (path, size, mtime) would avoid re-reading unchanged jars between builds.

#include <algorithm>
#include <array>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

extern "C" {
#include <blake3.h>
}

namespace fs = std::filesystem;

namespace kiln {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

std::string finalize_hex(blake3_hasher& hasher) {
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

// Feeds the file into `hasher`. Returns false if it cannot be opened.
bool update_from_file(blake3_hasher& hasher, const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) return false;

  constexpr std::size_t buffer_size = 65536;
  std::vector<char> buffer(buffer_size);
  while (file.good()) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize count = file.gcount();
    if (count > 0) {
      blake3_hasher_update(&hasher, buffer.data(), static_cast<size_t>(count));
    }
  }
  return !file.bad();
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.primitive = "blake3";
  info.version = blake3_version();
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

std::string hash_file_blake3_hex(const std::string& path) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  if (!update_from_file(hasher, path)) return {};
  return finalize_hex(hasher);
}

std::string hash_tree_blake3_hex(const std::string& path) {
  std::error_code ec;
  if (!fs::is_directory(path, ec)) return {};

  // Directory iteration order is filesystem-specific; collect and sort first.
  std::vector<std::string> files;
  fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
  if (ec) return {};
  const fs::recursive_directory_iterator end{};
  for (; it != end; it.increment(ec)) {
    if (ec) return {};
    std::error_code type_ec;
    if (it->is_regular_file(type_ec)) {
      files.push_back(fs::relative(it->path(), path, type_ec).generic_string());
    }
  }
  std::sort(files.begin(), files.end());

  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  for (const auto& rel : files) {
    std::string file_digest = hash_file_blake3_hex((fs::path(path) / rel).string());
    if (file_digest.empty()) file_digest = "unreadable";
    blake3_hasher_update(&hasher, rel.data(), rel.size());
    blake3_hasher_update(&hasher, "\0", 1);
    blake3_hasher_update(&hasher, file_digest.data(), file_digest.size());
    blake3_hasher_update(&hasher, "\n", 1);
  }
  return finalize_hex(hasher);
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  return finalize_hex(hasher);
}

}  // namespace kiln
