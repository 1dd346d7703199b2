#pragma once

// kiln/hash.hpp - BLAKE3 hashing used for content identity.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the only hash primitive. Digests are 64-char lower-case hex.
//   2. Domain separation: every digest that feeds a Fingerprint is computed with
//      a short prefix ("cp:", "cpe:", "fp:") so digests from different contexts
//      can never be confused with each other.
//   3. Hashing a path never throws. Unreadable input maps to an empty digest and
//      callers decide how to represent it.

#include <string>
#include <string_view>

namespace kiln {

struct HashRuntimeInfo {
  std::string primitive;
  std::string version;
};

HashRuntimeInfo hash_runtime_info();

// Hex digest of an in-memory payload.
std::string blake3_hex(std::string_view payload);

// Stream-hash a file in 64 KB chunks. Returns the hex digest, or "" if the file
// cannot be opened.
std::string hash_file_blake3_hex(const std::string& path);

// Hex digest of a directory tree: every regular file below `path` contributes
// "<relative path>\0<file digest>\n", visited in sorted order so the result is
// independent of directory iteration order. Returns "" if `path` is not a
// readable directory.
std::string hash_tree_blake3_hex(const std::string& path);

// Domain-separated hex digest.
std::string hash_domain(std::string_view domain, std::string_view payload);

}  // namespace kiln
