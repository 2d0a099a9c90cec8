#include "highlighter.hpp"
#include "filetype.hpp"
#include "row.hpp"
#include <cassert>
#include <string>
#include <vector>

// One letter per grapheme so expectations read like the source line.
static char code(HighlightType t) {
  switch (t) {
    case HighlightType::None: return '.';
    case HighlightType::Number: return 'n';
    case HighlightType::Match: return 'm';
    case HighlightType::String: return 's';
    case HighlightType::Character: return 'c';
    case HighlightType::Comment: return '/';
    case HighlightType::MultilineComment: return '*';
    case HighlightType::PrimaryKeyword: return 'k';
    case HighlightType::SecondaryKeyword: return 't';
  }
  return '?';
}

static std::string codes(const std::vector<HighlightType>& tags) {
  std::string out;
  for (HighlightType t : tags) out.push_back(code(t));
  return out;
}

static std::string scan(const HighlightingOptions& opts, const std::string& line,
                        bool start_with_comment = false, bool* open = nullptr) {
  Row row(line);
  std::vector<HighlightType> tags;
  bool o = Highlighter(opts).scan(row, start_with_comment, tags);
  assert(tags.size() == row.len());
  if (open) *open = o;
  return codes(tags);
}

static void test_separators() {
  assert(is_separator(","));
  assert(is_separator(" "));
  assert(is_separator("\t"));
  assert(!is_separator("a"));
  assert(!is_separator("7"));
  assert(!is_separator("\xC3\xA9"));
  assert(!is_separator(""));
}

static void test_keywords_and_numbers(const HighlightingOptions& rust) {
  assert(scan(rust, "let x = 1;") == "kkk.....n.");
  assert(scan(rust, "letter = 1;") == ".........n.");
  assert(scan(rust, "let n: i32") == "kkk....ttt");
  assert(scan(rust, "a5") == "..");
  assert(scan(rust, " 5") == ".n");
  assert(scan(rust, "x=5") == "..n");
  assert(scan(rust, "3.14") == "nnnn");
  assert(scan(rust, "fn(x)") == "kk...");
}

static void test_literals(const HighlightingOptions& rust) {
  assert(scan(rust, "x = 'a';") == "....ccc.");
  assert(scan(rust, "'\\n'") == "cccc");
  assert(scan(rust, "'/'") == "ccc");
  assert(scan(rust, "\"str\" x") == "sssss..");
  assert(scan(rust, "\"abc") == "ssss");
  assert(scan(rust, "\"//\"") == "ssss");
  assert(scan(rust, "\"h\xC3\xA9\"") == "ssss");
}

static void test_comments(const HighlightingOptions& rust) {
  assert(scan(rust, "// hi") == "/////");
  assert(scan(rust, "x // \"a\"") == "..//////");

  bool open = true;
  assert(scan(rust, "/* a */ b", false, &open) == "*******..");
  assert(!open);
  assert(scan(rust, "/*/", false, &open) == "***");
  assert(open);
  assert(scan(rust, "a /* b", false, &open) == "..****");
  assert(open);

  // carried in from the previous row
  assert(scan(rust, "a */ let", true, &open) == "****.kkk");
  assert(!open);
  assert(scan(rust, "still open", true, &open) == "**********");
  assert(open);
  assert(scan(rust, "", true, &open).empty());
  assert(open);
}

static void test_disabled_rules() {
  HighlightingOptions opts;
  opts.comments = true;
  bool open = true;
  assert(scan(opts, "/* x", false, &open) == "....");
  assert(!open);
  assert(scan(opts, "1 \"a\" 'b'") == ".........");

  HighlightingOptions none;
  assert(scan(none, "let x = 1; // c") == "...............");
}

static void test_match_overlay(const HighlightingOptions& rust) {
  Row r("let x = xx;");
  std::vector<HighlightType> tags;
  Highlighter(rust).scan(r, false, tags);
  Highlighter::highlight_match(r, "x", tags);
  assert(codes(tags) == "kkk.m...mm.");

  Row u("\xC3\xA9 \xC3\xA9");
  Highlighter(rust).scan(u, false, tags);
  Highlighter::highlight_match(u, "\xC3\xA9", tags);
  assert(codes(tags) == "m.m");

  Highlighter(rust).scan(r, false, tags);
  Highlighter::highlight_match(r, "", tags);
  assert(codes(tags) == "kkk........");

  // a word ending in a combining mark matches whole clusters only
  Row accent("cafe\xCC\x81 cafe");
  Highlighter(rust).scan(accent, false, tags);
  Highlighter::highlight_match(accent, "e\xCC\x81", tags);
  assert(codes(tags) == "...m.....");
  Highlighter(rust).scan(accent, false, tags);
  Highlighter::highlight_match(accent, "cafe\xCC\x81", tags);
  assert(codes(tags) == "mmmm.....");
  Highlighter(rust).scan(accent, false, tags);
  Highlighter::highlight_match(accent, "cafe", tags);
  assert(codes(tags) == ".....mmmm");
}

static void test_invalid_utf8(const HighlightingOptions& rust) {
  // a Latin-1 byte is its own unit, so the space after it still separates
  assert(scan(rust, "caf\xE9 let x = 1;") == ".....kkk.....n.");
  assert(scan(rust, "\xFF1") == "..");
  assert(scan(rust, "\"\xFF\"") == "sss");
}

int main() {
  FileType rust = FileType::from_path("main.rs");
  assert(rust.name() == "Rust");
  test_separators();
  test_keywords_and_numbers(rust.options());
  test_literals(rust.options());
  test_comments(rust.options());
  test_disabled_rules();
  test_match_overlay(rust.options());
  test_invalid_utf8(rust.options());
  return 0;
}
