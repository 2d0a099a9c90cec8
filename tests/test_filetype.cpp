#include "filetype.hpp"
#include <algorithm>
#include <cassert>
#include <string>
#include <vector>

static bool has(const std::vector<std::string>& words, const std::string& w) {
  return std::find(words.begin(), words.end(), w) != words.end();
}

int main() {
  FileType none;
  assert(none.name() == "No filetype");
  assert(!none.options().numbers);
  assert(!none.options().strings);
  assert(!none.options().multiline_comments);
  assert(none.options().primary_keywords.empty());

  assert(FileType::from_path("src/main.rs").name() == "Rust");
  assert(FileType::from_path("LIB.RS").name() == "Rust");
  assert(FileType::from_path("a.c").name() == "C");
  assert(FileType::from_path("a.h").name() == "C");
  assert(FileType::from_path("a.cpp").name() == "C++");
  assert(FileType::from_path("a.hpp").name() == "C++");
  assert(FileType::from_path("a.cc").name() == "C++");
  assert(FileType::from_path("main.go").name() == "Go");
  assert(FileType::from_path("notes.txt").name() == "No filetype");
  assert(FileType::from_path("Makefile").name() == "No filetype");
  assert(FileType::from_path(".rs").name() == "No filetype");

  FileType rs = FileType::from_path("x.rs");
  const HighlightingOptions& rust = rs.options();
  assert(rust.numbers && rust.strings && rust.characters);
  assert(rust.comments && rust.multiline_comments);
  assert(has(rust.primary_keywords, "fn"));
  assert(has(rust.primary_keywords, "let"));
  assert(has(rust.secondary_keywords, "usize"));
  assert(!has(rust.primary_keywords, "usize"));

  FileType cpp = FileType::from_path("x.cpp");
  assert(has(cpp.options().primary_keywords, "nullptr"));
  assert(has(cpp.options().secondary_keywords, "int"));

  FileType go = FileType::from_path("x.go");
  assert(has(go.options().primary_keywords, "func"));
  assert(has(go.options().secondary_keywords, "rune"));
  return 0;
}
