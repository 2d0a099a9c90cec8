#pragma once
/*
 * Config
 *
 * Purpose: compile-time defaults plus runtime options read from ~/.scriberc.
 * Format: one `set <name> [value]` per line; '#' or '"' start a comment.
 */
#include <filesystem>
#include <string>

/*compile-time defaults, override with -D*/

#ifndef SCRIBE_QUIT_TIMES
#define SCRIBE_QUIT_TIMES 3
#endif

#ifndef SCRIBE_MESSAGE_TIMEOUT_SECS
#define SCRIBE_MESSAGE_TIMEOUT_SECS 5
#endif

#ifndef SCRIBE_WRITE_CHUNK_SIZE
#define SCRIBE_WRITE_CHUNK_SIZE (1 << 16)
#endif

#ifndef SCRIBE_VERSION
#define SCRIBE_VERSION "0.1.0"
#endif

#define SCRIBE_TAB_RENDER "  "
#define SCRIBE_RC_NAME ".scriberc"

struct EditorConfig {
  bool show_line_numbers = false;
  bool enable_color = true;
  int quit_times = SCRIBE_QUIT_TIMES;
};

// Applies one rc line ("set number on", ":set quittimes 2", ...) to cfg.
// Returns false with msg set when the line names an unknown or malformed option.
bool apply_rc_line(EditorConfig& cfg, const std::string& line, std::string& msg);

// Reads every line of path into cfg. A missing file is not an error.
bool load_rc(const std::filesystem::path& path, EditorConfig& cfg, std::string& msg);

std::filesystem::path default_rc_path();
