#pragma once
/*
 * FileType
 *
 * Purpose: language profile (display name + highlighting rules/keywords).
 * Usage: FileType::from_path(path) picks a built-in profile by extension;
 *        FileType() is "No filetype" with every rule disabled.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

struct HighlightingOptions {
  bool numbers = false;
  bool strings = false;
  bool characters = false;
  bool comments = false;
  bool multiline_comments = false;
  std::vector<std::string> primary_keywords;
  std::vector<std::string> secondary_keywords;
};

class FileType {
public:
  FileType();
  FileType(std::string name, HighlightingOptions opts);

  static FileType from_path(const std::filesystem::path& path);

  const std::string& name() const { return name_; }
  const HighlightingOptions& options() const { return opts_; }

private:
  std::string name_;
  HighlightingOptions opts_;
};
