#include "grapheme.hpp"
#include <boost/locale/boundary.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <boost/locale/generator.hpp>
#include <locale>

namespace lb = boost::locale::boundary;

static const std::locale& segmentation_locale() {
  static const std::locale loc = boost::locale::generator()("en_US.UTF-8");
  return loc;
}

static bool is_ascii(std::string_view s) {
  for (unsigned char c : s) if (c >= 0x80) return false;
  return true;
}

// Length of the well-formed UTF-8 sequence at s[i], or 0 when the bytes there
// are not one (stray continuation, overlong form, surrogate, truncation).
static size_t utf8_sequence_length(std::string_view s, size_t i) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  if (c < 0x80) return 1;
  size_t n = 0;
  unsigned char lo = 0x80, hi = 0xBF;
  if (c >= 0xC2 && c <= 0xDF) n = 2;
  else if (c == 0xE0) { n = 3; lo = 0xA0; }
  else if (c == 0xED) { n = 3; hi = 0x9F; }
  else if (c >= 0xE1 && c <= 0xEF) n = 3;
  else if (c == 0xF0) { n = 4; lo = 0x90; }
  else if (c >= 0xF1 && c <= 0xF3) n = 4;
  else if (c == 0xF4) { n = 4; hi = 0x8F; }
  else return 0;
  if (i + n > s.size()) return 0;
  for (size_t k = 1; k < n; ++k) {
    unsigned char b = static_cast<unsigned char>(s[i + k]);
    if (b < (k == 1 ? lo : 0x80) || b > (k == 1 ? hi : 0xBF)) return 0;
  }
  return n;
}

// Appends the cluster ends of a well-formed run that starts at byte base.
static void append_clusters(std::string_view run, size_t base, std::vector<size_t>& out) {
  // ASCII has one cluster per byte except CR LF, which UAX #29 keeps together.
  if (is_ascii(run)) {
    for (size_t i = 1; i < run.size(); ++i) {
      if (run[i - 1] == '\r' && run[i] == '\n') continue;
      out.push_back(base + i);
    }
    out.push_back(base + run.size());
    return;
  }
  const char* b = run.data();
  const char* e = b + run.size();
  lb::boundary_point_index<const char*> index(lb::character, b, e, segmentation_locale());
  for (auto it = index.begin(); it != index.end(); ++it) {
    size_t off = static_cast<size_t>(it->iterator() - b);
    if (off != 0 && base + off != out.back()) out.push_back(base + off);
  }
  if (out.back() != base + run.size()) out.push_back(base + run.size());
}

std::vector<size_t> grapheme_bounds(std::string_view s) {
  std::vector<size_t> out;
  out.reserve(s.size() + 1);
  out.push_back(0);
  size_t i = 0;
  while (i < s.size()) {
    size_t start = i;
    while (i < s.size()) {
      size_t n = utf8_sequence_length(s, i);
      if (n == 0) break;
      i += n;
    }
    if (i > start) append_clusters(s.substr(start, i - start), start, out);
    // a byte that is not valid UTF-8 is a unit of its own
    if (i < s.size()) out.push_back(++i);
  }
  return out;
}

size_t grapheme_count(std::string_view s) {
  return grapheme_bounds(s).size() - 1;
}

std::string to_utf8(wchar_t ch) {
  std::wstring w(1, ch);
  return boost::locale::conv::utf_to_utf<char>(w);
}
