#include "delim_ingest/json_writer.hpp"
#include "delim_ingest/record.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace di {

// Length of the well-formed UTF-8 sequence starting at s[i], or 0 if the
// bytes there are not valid UTF-8 (overlongs and surrogates included).
static std::size_t utf8_len(const std::string& s, std::size_t i) {
  auto b = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
  const unsigned char c = b(i);
  std::size_t n;
  unsigned char lo = 0x80, hi = 0xBF;  // bounds for the second byte
  if (c >= 0xC2 && c <= 0xDF) n = 2;
  else if (c >= 0xE0 && c <= 0xEF) {
    n = 3;
    if (c == 0xE0) lo = 0xA0;
    if (c == 0xED) hi = 0x9F;
  } else if (c >= 0xF0 && c <= 0xF4) {
    n = 4;
    if (c == 0xF0) lo = 0x90;
    if (c == 0xF4) hi = 0x8F;
  } else {
    return 0;
  }
  if (i + n > s.size()) return 0;
  if (b(i + 1) < lo || b(i + 1) > hi) return 0;
  for (std::size_t k = 2; k < n; ++k)
    if (b(i + k) < 0x80 || b(i + k) > 0xBF) return 0;
  return n;
}

// JSON string literal. Bytes that are not valid UTF-8 become U+FFFD.
static void esc(std::string& o, const std::string& s) {
  static const char* hex = "0123456789abcdef";
  o += '"';
  for (std::size_t i = 0; i < s.size();) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c >= 0x80) {
      std::size_t n = utf8_len(s, i);
      if (n) o.append(s, i, n);
      else   o += "\\ufffd";
      i += n ? n : 1;
      continue;
    }
    switch (c) {
      case '\\': o += "\\\\"; break;
      case '"':  o += "\\\""; break;
      case '\n': o += "\\n";  break;
      case '\r': o += "\\r";  break;
      case '\t': o += "\\t";  break;
      case '\b': o += "\\b";  break;
      case '\f': o += "\\f";  break;
      default:
        if (c < 0x20) {
          o += "\\u00"; o += hex[c >> 4]; o += hex[c & 0xF];
        } else {
          o += static_cast<char>(c);
        }
        break;
    }
    ++i;
  }
  o += '"';
}

static void append_double(std::string& o, double x) {
  char tmp[64];
  int n = std::snprintf(tmp, sizeof(tmp), "%.17g", x);
  o.append(tmp, (n > 0) ? static_cast<std::size_t>(n) : 0);
}

static inline double safe_num(double v) { return std::isfinite(v) ? v : 0.0; }

void append_json(std::string& out, const Document& doc) {
  out += '{';
  bool first = true;
  for (const auto& f : doc) {
    if (!first) out += ',';
    first = false;
    esc(out, f.name);
    out += ':';
    switch (f.value.kind) {
      case ValueKind::Int:    out += std::to_string(f.value.i); break;
      case ValueKind::Double: append_double(out, safe_num(f.value.d)); break;
      case ValueKind::String: esc(out, f.value.raw); break;
    }
  }
  out += '}';
}

std::string to_json(const Document& doc) {
  std::string out;
  append_json(out, doc);
  return out;
}

std::string RunJsonWriter::to_json(const RunSummary& s) {
  std::string q;
  std::ostringstream o;
  auto str = [&](const std::string& v) { q.clear(); esc(q, v); return q; };

  o << "{";
  o << "\"documents\":" << s.documents << ",";
  o << "\"records\":" << s.records << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"filename\":" << str(s.filename) << ",";
  o << "\"format\":" << str(s.format) << ",";
  o << "\"ordered\":" << (s.ordered ? "true" : "false") << ",";
  o << "\"workers\":" << s.workers << ",";
  o << "\"ok\":" << (s.ok ? "true" : "false");
  if (!s.ok) {
    o << ",\"error_kind\":" << str(s.error_kind);
    o << ",\"error\":" << str(s.error);
    o << ",\"error_record\":" << s.error_record;
  }
  o << "}";
  return o.str();
}

}
