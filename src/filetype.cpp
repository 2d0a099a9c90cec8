#include "filetype.hpp"
#include <algorithm>
#include <cctype>

static std::string to_lower(std::string s){ for(char& c: s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); return s; }

static HighlightingOptions c_like(std::vector<std::string> primary, std::vector<std::string> secondary) {
  HighlightingOptions o;
  o.numbers = true;
  o.strings = true;
  o.characters = true;
  o.comments = true;
  o.multiline_comments = true;
  o.primary_keywords = std::move(primary);
  o.secondary_keywords = std::move(secondary);
  return o;
}

static FileType rust() {
  return FileType("Rust", c_like(
    {
      "as", "break", "const", "continue", "crate", "else", "enum", "extern", "false", "fn", "for",
      "if", "impl", "in", "let", "loop", "match", "mod", "move", "mut", "pub", "ref", "return",
      "self", "Self", "static", "struct", "super", "trait", "true", "type", "unsafe", "use",
      "where", "while", "dyn", "abstract", "become", "box", "do", "final", "macro", "override",
      "priv", "typeof", "unsized", "virtual", "yield", "async", "await", "try"
    },
    {
      "bool", "char", "i8", "i16", "i32", "i64", "isize", "u8", "u16", "u32", "u64", "usize",
      "f32", "f64"
    }));
}

static FileType cxx(const char* name) {
  return FileType(name, c_like(
    {
      "if", "else", "for", "while", "do", "return", "switch", "case", "default", "break",
      "continue", "goto", "struct", "class", "union", "public", "private", "protected", "const",
      "constexpr", "static", "extern", "inline", "virtual", "override", "enum", "sizeof",
      "typedef", "namespace", "using", "template", "typename", "new", "delete", "true", "false",
      "nullptr", "NULL", "this", "try", "catch", "throw", "noexcept", "include", "define"
    },
    {
      "void", "bool", "int", "char", "float", "double", "long", "short", "signed", "unsigned",
      "auto", "size_t", "int8_t", "int16_t", "int32_t", "int64_t", "uint8_t", "uint16_t",
      "uint32_t", "uint64_t"
    }));
}

static FileType go() {
  return FileType("Go", c_like(
    {
      "package", "import", "func", "var", "const", "type", "struct", "interface", "if", "else",
      "for", "range", "return", "go", "defer", "select", "switch", "case", "default", "break",
      "continue", "fallthrough", "goto", "map", "chan", "true", "false", "nil"
    },
    {
      "bool", "byte", "rune", "string", "error", "int", "int8", "int16", "int32", "int64",
      "uint", "uint8", "uint16", "uint32", "uint64", "uintptr", "float32", "float64",
      "complex64", "complex128"
    }));
}

FileType::FileType() : name_("No filetype") {}

FileType::FileType(std::string name, HighlightingOptions opts)
  : name_(std::move(name)), opts_(std::move(opts)) {}

FileType FileType::from_path(const std::filesystem::path& path) {
  auto e = path.extension().string();
  if (!e.empty() && e[0] == '.') e = e.substr(1);
  e = to_lower(e);
  if (e == "rs") return rust();
  if (e == "c" || e == "h") return cxx("C");
  if (e == "cpp" || e == "cxx" || e == "cc" || e == "hpp" || e == "hxx" || e == "hh") return cxx("C++");
  if (e == "go") return go();
  return FileType();
}
