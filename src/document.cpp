#include "document.hpp"
#include "file_io.hpp"
#include <glog/logging.h>

Document Document::open(const std::filesystem::path& path, std::string& msg, bool& ok) {
  Document d;
  d.file_name_ = path;
  d.file_type_ = FileType::from_path(path);
  std::vector<std::string> ls;
  ok = read_lines(path, ls, msg);
  if (!ok) {
    LOG(WARNING) << msg;
    return d;
  }
  d.init_from_lines(ls);
  LOG(INFO) << "opened " << path.string() << ": " << d.len() << " rows, filetype " << d.file_type_.name();
  return d;
}

void Document::init_from_lines(const std::vector<std::string>& lines) {
  rows_.clear();
  rows_.reserve(lines.size());
  for (const auto& s : lines) rows_.emplace_back(s);
  dirty_ = false;
}

const Row* Document::row(size_t index) const {
  if (index >= rows_.size()) return nullptr;
  return &rows_[index];
}

void Document::set_file_name(const std::filesystem::path& path) {
  file_name_ = path;
  set_file_type(FileType::from_path(path));
}

void Document::insert(const Position& pos, std::string_view unit) {
  if (pos.y > rows_.size()) return;
  dirty_ = true;
  if (unit == "\n") {
    if (pos.y == rows_.size()) {
      rows_.emplace_back();
    } else {
      Row tail = rows_[pos.y].split(pos.x);
      rows_.insert(rows_.begin() + static_cast<std::ptrdiff_t>(pos.y) + 1, std::move(tail));
    }
  } else if (pos.y == rows_.size()) {
    Row r;
    r.insert(0, unit);
    rows_.push_back(std::move(r));
  } else {
    rows_[pos.y].insert(pos.x, unit);
  }
  unhighlight_rows(pos.y);
}

void Document::remove(const Position& pos) {
  size_t len = rows_.size();
  if (pos.y >= len) return;
  if (pos.x == rows_[pos.y].len() && pos.y + 1 < len) {
    Row next = std::move(rows_[pos.y + 1]);
    rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(pos.y) + 1);
    rows_[pos.y].append(next);
  } else if (pos.x < rows_[pos.y].len()) {
    rows_[pos.y].remove(pos.x);
  } else {
    return;
  }
  dirty_ = true;
  unhighlight_rows(pos.y);
}

std::optional<Position> Document::find(std::string_view query, const Position& from, SearchDirection direction) const {
  if (from.y >= rows_.size()) return std::nullopt;
  Position pos = from;
  size_t steps = direction == SearchDirection::Forward ? rows_.size() - from.y : from.y + 1;
  for (size_t i = 0; i < steps; ++i) {
    if (auto x = rows_[pos.y].find(query, pos.x, direction)) {
      pos.x = *x;
      return pos;
    }
    if (direction == SearchDirection::Forward) {
      pos.y += 1;
      pos.x = 0;
    } else {
      if (pos.y == 0) break;
      pos.y -= 1;
      pos.x = rows_[pos.y].len();
    }
  }
  return std::nullopt;
}

size_t Document::highlight(std::string_view word, std::optional<size_t> until) {
  size_t end = rows_.size();
  if (until && *until < end) end = *until + 1;
  const HighlightingOptions& opts = file_type_.options();
  bool start_with_comment = false;
  size_t rescanned = 0;
  for (size_t i = 0; i < end; ++i) {
    if (rows_[i].highlight_state() != HighlightState::Fresh) ++rescanned;
    start_with_comment = rows_[i].highlight(opts, word, start_with_comment);
  }
  VLOG(2) << "highlight: " << rescanned << " of " << end << " rows rescanned";
  return rescanned;
}

void Document::unhighlight_rows(size_t start) {
  start = start > 0 ? start - 1 : 0;
  for (size_t i = start; i < rows_.size(); ++i) rows_[i].unhighlight();
}

bool Document::save(std::string& msg) {
  if (!file_name_) { msg = "no file name, use save as"; return false; }
  std::vector<std::string_view> lines;
  lines.reserve(rows_.size());
  for (const auto& r : rows_) lines.push_back(r.string());
  if (!write_lines(*file_name_, lines, msg)) {
    LOG(WARNING) << msg;
    return false;
  }
  dirty_ = false;
  LOG(INFO) << msg;
  return true;
}

bool Document::save_as(const std::filesystem::path& path, std::string& msg) {
  set_file_name(path);
  return save(msg);
}
