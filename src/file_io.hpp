#pragma once
/*
 * FileIO
 *
 * Purpose: read a file via mmap and split into lines; write lines back safely.
 * Read: '\n' delimited, one trailing '\r' stripped per line, no extra empty
 *       line after a final terminator, empty file yields zero lines.
 * Write: every line followed by '\n', into <path>.tmp → fdatasync → rename.
 * Errors: return false with msg naming the operation, path and errno text.
 */
#include <vector>
#include <string>
#include <string_view>
#include <filesystem>

bool read_lines(const std::filesystem::path& path,
                std::vector<std::string>& out_lines,
                std::string& msg);

bool write_lines(const std::filesystem::path& path,
                 const std::vector<std::string_view>& lines,
                 std::string& msg);
