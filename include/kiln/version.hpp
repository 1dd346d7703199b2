#pragma once

// kiln/version.hpp - Version manifest for the host/worker protocol surfaces.
//
// PURPOSE:
//   The host and kiln-worker are separate executables. A worker built from a
//   different source tree may speak another frame schema or derive fingerprints
//   differently, so every versioned format has a constant here.
//
// INVARIANT:
//   All version constants are compile-time. The host rejects a ready frame whose
//   protocol field differs from PROTOCOL_FRAMING_VERSION; the worker is then
//   treated as a failed spawn.
//
// EXTENSION_POINT: version_negotiation
//   Current: hard-fail on mismatch.
//   Upgrade path: let the ready frame carry a range of supported versions and
//   pick the highest common one.

#include <cstdint>
#include <string>

namespace kiln {
namespace version {

// ---------------------------------------------------------------------------
// PROTOCOL_FRAMING_VERSION
// NDJSON frames exchanged over the worker channel (ready/action/result/stop).
// Adding or removing required fields in any frame type requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t PROTOCOL_FRAMING_VERSION = 1;

// ---------------------------------------------------------------------------
// FINGERPRINT_VERSION
// Layout of the canonical fingerprint serialization hashed into
// Fingerprint::digest. Changing entry markers or field order requires a bump.
// ---------------------------------------------------------------------------
constexpr uint32_t FINGERPRINT_VERSION = 1;

// ---------------------------------------------------------------------------
// HASH_ALGORITHM_VERSION
// Version 1 = BLAKE3, 32-byte output, hex-encoded to 64 chars.
// ---------------------------------------------------------------------------
constexpr uint32_t HASH_ALGORITHM_VERSION = 1;

struct VersionManifest {
  uint32_t protocol_framing{PROTOCOL_FRAMING_VERSION};
  uint32_t fingerprint{FINGERPRINT_VERSION};
  uint32_t hash_algorithm{HASH_ALGORITHM_VERSION};
  std::string semver;           // from the CMake project version
  std::string hash_primitive;   // "blake3"
  std::string hash_version;     // BLAKE3 library version string
  std::string build_timestamp;  // from __DATE__/__TIME__
};

VersionManifest current_manifest(const std::string& semver = "");

std::string manifest_to_json(const VersionManifest& m);

struct CompatibilityResult {
  bool ok{true};
  std::string error_code;   // empty if ok
  std::string description;
  uint32_t required_protocol{PROTOCOL_FRAMING_VERSION};
  uint32_t actual_protocol{PROTOCOL_FRAMING_VERSION};
};

// Checks the protocol version announced by a worker's ready frame.
CompatibilityResult check_protocol(uint32_t worker_protocol_version);

}  // namespace version
}  // namespace kiln
