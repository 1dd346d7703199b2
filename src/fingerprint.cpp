#include "kiln/fingerprint.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "kiln/hash.hpp"
#include "kiln/jsonlite.hpp"
#include "kiln/version.hpp"

namespace fs = std::filesystem;

namespace kiln {

namespace {

std::string normalize_path(const std::string& entry) {
  std::error_code ec;
  fs::path p = fs::absolute(fs::path(entry), ec);
  if (ec) p = fs::path(entry);
  std::string out = p.lexically_normal().generic_string();
  // "/a/b/" and "/a/b" name the same entry.
  while (out.size() > 1 && out.back() == '/') out.pop_back();
  return out;
}

// Content marker of one classpath entry. Never empty.
std::string content_marker(const std::string& path) {
  std::error_code ec;
  const fs::file_status st = fs::status(path, ec);
  if (ec || !fs::exists(st)) return "missing";
  if (fs::is_directory(st)) {
    const std::string d = hash_tree_blake3_hex(path);
    return d.empty() ? "unreadable" : "dir:" + d;
  }
  const std::string d = hash_file_blake3_hex(path);
  return d.empty() ? "unreadable" : "file:" + d;
}

// Length-prefixed so that no two distinct argument lists serialize alike.
void append_field(std::string& out, const std::string& value) {
  out += std::to_string(value.size());
  out += ':';
  out += value;
}

}  // namespace

Fingerprint fingerprint(const WorkRequirements& requirements) {
  Fingerprint fp;
  fp.vm_args = requirements.vm_args;
  fp.log_level = requirements.log_level;
  fp.kind = requirements.kind;

  for (const auto& entry : requirements.classpath) {
    if (entry.empty()) continue;
    fp.classpath.push_back(normalize_path(entry));
  }
  std::sort(fp.classpath.begin(), fp.classpath.end());
  fp.classpath.erase(std::unique(fp.classpath.begin(), fp.classpath.end()), fp.classpath.end());

  std::string cp_payload;
  for (const auto& path : fp.classpath) {
    std::string entry;
    append_field(entry, path);
    append_field(entry, content_marker(path));
    cp_payload += hash_domain("cpe:", entry);
    cp_payload += '\n';
  }
  fp.classpath_digest = hash_domain("cp:", cp_payload);

  std::string canonical = "v" + std::to_string(version::FINGERPRINT_VERSION) + "\n";
  canonical += "cp=" + fp.classpath_digest + "\n";
  canonical += "vm=";
  canonical += std::to_string(fp.vm_args.size());
  for (const auto& arg : fp.vm_args) {
    canonical += ',';
    append_field(canonical, arg);
  }
  canonical += "\nlog=";
  canonical += to_string(fp.log_level);
  canonical += "\nkind=";
  append_field(canonical, fp.kind);
  canonical += '\n';
  fp.digest = hash_domain("fp:", canonical);
  return fp;
}

std::string to_json(const Fingerprint& fp) {
  std::ostringstream o;
  o << "{\"digest\":\"" << fp.digest << "\""
    << ",\"classpath_digest\":\"" << fp.classpath_digest << "\""
    << ",\"classpath\":" << jsonlite::string_array(fp.classpath)
    << ",\"vm_args\":" << jsonlite::string_array(fp.vm_args)
    << ",\"log_level\":\"" << to_string(fp.log_level) << "\""
    << ",\"kind\":\"" << jsonlite::escape(fp.kind) << "\""
    << "}";
  return o.str();
}

bool requirements_from_json(const std::string& json, WorkRequirements* out, std::string* error) {
  WorkRequirements r;
  r.classpath = jsonlite::get_string_array(json, "classpath");
  r.vm_args = jsonlite::get_string_array(json, "vm_args");
  r.kind = jsonlite::get_string(json, "kind");
  if (jsonlite::has_key(json, "log_level")) {
    const std::string text = jsonlite::get_string(json, "log_level");
    auto level = parse_log_level(text);
    if (!level) {
      if (error) *error = "unknown log_level: " + text;
      return false;
    }
    r.log_level = *level;
  }
  *out = std::move(r);
  return true;
}

WorkItem make_work_item(WorkRequirements requirements, Action action) {
  WorkItem item;
  item.fingerprint = fingerprint(requirements);
  item.requirements = std::move(requirements);
  item.action = std::move(action);
  return item;
}

}  // namespace kiln
