#pragma once
/*
 * Document
 *
 * Purpose: ordered rows of one file, cross-row edits, search, highlighting.
 * Feature: safe writes (write .tmp → fdatasync → atomic rename).
 * Note: positions count graphemes; invalid positions are silent no-ops.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "filetype.hpp"
#include "row.hpp"
#include "types.hpp"

class Document {
public:
  Document() = default;

  static Document open(const std::filesystem::path& path, std::string& msg, bool& ok);
  void init_from_lines(const std::vector<std::string>& lines);

  const Row* row(size_t index) const;
  size_t len() const { return rows_.size(); }
  bool is_empty() const { return rows_.empty(); }
  bool is_dirty() const { return dirty_; }

  const std::optional<std::filesystem::path>& file_name() const { return file_name_; }
  void set_file_name(const std::filesystem::path& path);
  const FileType& file_type() const { return file_type_; }
  void set_file_type(FileType ft) { file_type_ = std::move(ft); unhighlight_rows(0); }

  // unit is one grapheme (UTF-8); "\n" splits the row at pos.
  void insert(const Position& pos, std::string_view unit);
  // At the end of a row joins the next row; otherwise removes one grapheme.
  void remove(const Position& pos);

  std::optional<Position> find(std::string_view query, const Position& from, SearchDirection direction) const;

  // Rescans rows [0, until + 1) (all rows when until is unset), carrying the
  // multi-line comment state from row 0. Returns the number of rows rescanned.
  size_t highlight(std::string_view word, std::optional<size_t> until);
  void unhighlight_rows(size_t start);

  bool save(std::string& msg);
  bool save_as(const std::filesystem::path& path, std::string& msg);

private:
  std::vector<Row> rows_;
  std::optional<std::filesystem::path> file_name_;
  bool dirty_ = false;
  FileType file_type_;
};
