#pragma once

// kiln/jsonlite.hpp - Minimal flat-object JSON helpers.
//
// Scope: frames, configs and requirement files are flat objects whose values
// are strings, booleans, unsigned integers or arrays of strings. Nested objects
// travel as escaped strings (an action payload is opaque to the host).
//
// Lookups scan for the first `"key"` followed by `:`. A key that appears inside
// an escaped string value is preceded by a backslash-escaped quote and can never
// match, so payload contents cannot shadow frame fields.

#include <cstdint>
#include <cstdio>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace kiln::jsonlite {

inline void append_utf8(std::string& o, uint32_t cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

inline std::string escape(const std::string& s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '"': o += "\\\""; break;
      case '\\': o += "\\\\"; break;
      case '\n': o += "\\n"; break;
      case '\r': o += "\\r"; break;
      case '\t': o += "\\t"; break;
      case '\b': o += "\\b"; break;
      case '\f': o += "\\f"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o += buf;
        } else {
          o += c;
        }
    }
  }
  return o;
}

// Reads a JSON string body starting just after its opening quote. On success
// stores the decoded text in `out`, advances `i` past the closing quote and
// returns true.
inline bool read_string_at(const std::string& s, size_t& i, std::string& out) {
  out.clear();
  while (i < s.size()) {
    const char c = s[i++];
    if (c == '"') return true;
    if (c != '\\') {
      out += c;
      continue;
    }
    if (i >= s.size()) return false;
    const char n = s[i++];
    switch (n) {
      case 'n': out += '\n'; break;
      case 't': out += '\t'; break;
      case 'r': out += '\r'; break;
      case 'b': out += '\b'; break;
      case 'f': out += '\f'; break;
      case 'u': {
        if (i + 4 > s.size()) return false;
        uint32_t cp = 0;
        for (int k = 0; k < 4; ++k) {
          const char h = s[i++];
          cp <<= 4;
          if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
          else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
          else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
          else return false;
        }
        append_utf8(out, cp);
        break;
      }
      default: out += n;
    }
  }
  return false;
}

inline std::string unescape(const std::string& in) {
  std::string body = in + "\"";
  size_t i = 0;
  std::string out;
  if (!read_string_at(body, i, out)) return in;
  return out;
}

// Position just after `"key"\s*:\s*`, or npos.
inline size_t value_pos(const std::string& s, const std::string& key) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*");
  std::smatch m;
  if (!std::regex_search(s, m, re)) return std::string::npos;
  return static_cast<size_t>(m.position(0) + m.length(0));
}

inline bool has_key(const std::string& s, const std::string& key) {
  return value_pos(s, key) != std::string::npos;
}

inline std::string get_string(const std::string& s, const std::string& key, const std::string& def = "") {
  size_t i = value_pos(s, key);
  if (i == std::string::npos || i >= s.size() || s[i] != '"') return def;
  ++i;
  std::string out;
  if (!read_string_at(s, i, out)) return def;
  return out;
}

inline bool get_bool(const std::string& s, const std::string& key, bool def = false) {
  const size_t i = value_pos(s, key);
  if (i == std::string::npos) return def;
  if (s.compare(i, 4, "true") == 0) return true;
  if (s.compare(i, 5, "false") == 0) return false;
  return def;
}

inline unsigned long long get_u64(const std::string& s, const std::string& key, unsigned long long def = 0) {
  std::regex re("\\\"" + key + "\\\"\\s*:\\s*([0-9]+)");
  std::smatch m;
  if (!std::regex_search(s, m, re)) return def;
  try {
    return std::stoull(m[1].str());
  } catch (const std::out_of_range&) {
    return def;
  }
}

inline std::vector<std::string> get_string_array(const std::string& s, const std::string& key) {
  std::vector<std::string> out;
  size_t i = value_pos(s, key);
  if (i == std::string::npos || i >= s.size() || s[i] != '[') return out;
  ++i;
  while (i < s.size()) {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\n' || s[i] == '\t' || s[i] == '\r' || s[i] == ',')) ++i;
    if (i >= s.size() || s[i] == ']') break;
    if (s[i] != '"') break;
    ++i;
    std::string item;
    if (!read_string_at(s, i, item)) break;
    out.push_back(std::move(item));
  }
  return out;
}

inline std::string string_array(const std::vector<std::string>& items) {
  std::string o = "[";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) o += ',';
    o += '"';
    o += escape(items[i]);
    o += '"';
  }
  o += ']';
  return o;
}

}  // namespace kiln::jsonlite
