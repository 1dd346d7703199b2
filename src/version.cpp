#include "kiln/version.hpp"

#include <sstream>

#include "kiln/hash.hpp"
#include "kiln/jsonlite.hpp"

namespace kiln {
namespace version {

VersionManifest current_manifest(const std::string& semver) {
  VersionManifest m;
  m.semver = semver.empty() ? "0.1.0" : semver;
  const HashRuntimeInfo info = hash_runtime_info();
  m.hash_primitive = info.primitive;
  m.hash_version = info.version;
  m.build_timestamp = std::string(__DATE__) + "T" + std::string(__TIME__);
  return m;
}

std::string manifest_to_json(const VersionManifest& m) {
  std::ostringstream o;
  o << "{"
    << "\"protocol_framing\":" << m.protocol_framing
    << ",\"fingerprint\":" << m.fingerprint
    << ",\"hash_algorithm\":" << m.hash_algorithm
    << ",\"semver\":\"" << jsonlite::escape(m.semver) << "\""
    << ",\"hash_primitive\":\"" << jsonlite::escape(m.hash_primitive) << "\""
    << ",\"hash_version\":\"" << jsonlite::escape(m.hash_version) << "\""
    << ",\"build_timestamp\":\"" << m.build_timestamp << "\""
    << "}";
  return o.str();
}

CompatibilityResult check_protocol(uint32_t worker_protocol_version) {
  CompatibilityResult r;
  if (worker_protocol_version != PROTOCOL_FRAMING_VERSION) {
    r.ok = false;
    r.error_code = "protocol_mismatch";
    r.description = "worker speaks protocol " + std::to_string(worker_protocol_version) +
                    ", host requires " + std::to_string(PROTOCOL_FRAMING_VERSION) +
                    ". Rebuild kiln-worker from the same tree as the host.";
    r.actual_protocol = worker_protocol_version;
  }
  return r;
}

}  // namespace version
}  // namespace kiln
