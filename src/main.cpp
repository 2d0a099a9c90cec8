#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "editor.hpp"
#include "config.hpp"
#include <glog/logging.h>
#include <optional>
#include <filesystem>

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  // the screen belongs to curses; log to files only
  FLAGS_stderrthreshold = google::GLOG_FATAL;

  std::optional<std::filesystem::path> path;
  if (argc >= 2) path = std::filesystem::path(argv[1]);

  EditorConfig cfg;
  std::string rc_msg;
  bool rc_ok = load_rc(default_rc_path(), cfg, rc_msg);

  Terminal term;
  NcursesTerminal nterm(cfg.enable_color);
  Editor ed(nterm, path, cfg);
  if (!rc_ok) ed.set_status_message("ERR: " + rc_msg);
  ed.run();
  LOG(INFO) << "exiting";
  return 0;
}
