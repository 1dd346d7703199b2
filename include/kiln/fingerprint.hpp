#pragma once

// kiln/fingerprint.hpp - Requirement fingerprints and work items.
//
// A Fingerprint is the complete identity of the process a work item needs:
// two items may share a worker daemon if and only if their fingerprints are
// equal.
//
// DESIGN INVARIANTS:
//   1. Classpath entries form a set. Each entry is identified by its normalized
//      absolute path plus a BLAKE3 digest of its content (file bytes, or the
//      sorted listing of a directory tree), so order does not matter but adding
//      an entry or editing a class does.
//   2. VM arguments form a list. Their order is part of identity.
//   3. fingerprint() reads the filesystem and nothing else; given the same
//      files it always returns an equal value with the same digest.
//   4. operator== compares components, never just digests. digest exists for
//      logging, hashing and JSON.

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "kiln/types.hpp"

namespace kiln {

struct WorkRequirements {
  std::vector<std::string> classpath;
  std::vector<std::string> vm_args;
  LogLevel log_level{LogLevel::lifecycle};
  std::string kind;
};

struct Fingerprint {
  // Normalized absolute paths, sorted and de-duplicated. Used to launch the worker.
  std::vector<std::string> classpath;
  // Domain "cp:" digest over every entry's path and content.
  std::string classpath_digest;
  std::vector<std::string> vm_args;
  LogLevel log_level{LogLevel::lifecycle};
  std::string kind;
  // Domain "fp:" digest over the canonical serialization of all of the above.
  std::string digest;

  bool operator==(const Fingerprint& other) const {
    return classpath_digest == other.classpath_digest && vm_args == other.vm_args &&
           log_level == other.log_level && kind == other.kind &&
           classpath == other.classpath;
  }
  bool operator!=(const Fingerprint& other) const { return !(*this == other); }

  // Short form for log lines: first 12 hex chars of digest.
  std::string short_digest() const { return digest.substr(0, 12); }
};

Fingerprint fingerprint(const WorkRequirements& requirements);

std::string to_json(const Fingerprint& fp);

// Parses {"classpath":[...],"vm_args":[...],"log_level":"..","kind":".."}.
// Missing keys keep their defaults. Returns false and fills *error on an
// unknown log level.
bool requirements_from_json(const std::string& json, WorkRequirements* out, std::string* error);

// ---------------------------------------------------------------------------
// WorkItem - requirements plus the action, fingerprinted once at construction.
// ---------------------------------------------------------------------------
struct WorkItem {
  WorkRequirements requirements;
  Action action;
  Fingerprint fingerprint;
};

WorkItem make_work_item(WorkRequirements requirements, Action action);

}  // namespace kiln

template <>
struct std::hash<kiln::Fingerprint> {
  std::size_t operator()(const kiln::Fingerprint& fp) const noexcept {
    return std::hash<std::string>{}(fp.digest);
  }
};
