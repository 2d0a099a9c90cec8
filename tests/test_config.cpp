#include "config.hpp"
#include "cmd_registry.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static void test_registry() {
  CommandRegistry r;
  int calls = 0;
  r.register_command("set x", [&calls](const std::vector<std::string>& args, std::string& msg) {
    ++calls;
    msg = args.empty() ? "none" : args[0];
    return true;
  });
  std::string msg;
  assert(r.contains("set x"));
  assert(r.execute("set x", {"1"}, msg));
  assert(msg == "1");
  assert(calls == 1);
  assert(!r.execute("set y", {}, msg));
  assert(msg.find("unknown option") != std::string::npos);
}

static void test_rc_lines() {
  EditorConfig cfg;
  std::string msg;
  assert(!cfg.show_line_numbers);
  assert(cfg.enable_color);
  assert(cfg.quit_times == SCRIBE_QUIT_TIMES);

  assert(apply_rc_line(cfg, "set number on", msg));
  assert(cfg.show_line_numbers);
  assert(apply_rc_line(cfg, "  :set number off  ", msg));
  assert(!cfg.show_line_numbers);
  assert(apply_rc_line(cfg, "set number", msg));
  assert(cfg.show_line_numbers);
  assert(apply_rc_line(cfg, "set color=off", msg));
  assert(!cfg.enable_color);
  assert(apply_rc_line(cfg, "set quittimes 0", msg));
  assert(cfg.quit_times == 0);

  assert(apply_rc_line(cfg, "", msg));
  assert(apply_rc_line(cfg, "# comment", msg));
  assert(apply_rc_line(cfg, "\" vim style comment", msg));

  assert(!apply_rc_line(cfg, "set quittimes x", msg));
  assert(!apply_rc_line(cfg, "set quittimes -1", msg));
  assert(!apply_rc_line(cfg, "set number maybe", msg));
  assert(!apply_rc_line(cfg, "set bogus on", msg));
  assert(!apply_rc_line(cfg, "map jj <esc>", msg));
  assert(cfg.quit_times == 0);
}

static void test_load_rc() {
  auto dir = std::filesystem::temp_directory_path() / ("scribe_test_config_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);
  EditorConfig cfg;
  std::string msg;
  assert(load_rc(dir / "absent", cfg, msg));

  {
    std::ofstream out(dir / "rc");
    out << "# scribe\nset number on\nset quittimes 1\n";
  }
  assert(load_rc(dir / "rc", cfg, msg));
  assert(cfg.show_line_numbers);
  assert(cfg.quit_times == 1);

  {
    std::ofstream out(dir / "bad");
    out << "set color off\nset nope\n";
  }
  EditorConfig other;
  assert(!load_rc(dir / "bad", other, msg));
  assert(!other.enable_color);
  assert(msg.find(":2:") != std::string::npos);

  std::filesystem::remove_all(dir);
}

int main() {
  test_registry();
  test_rc_lines();
  test_load_rc();
  return 0;
}
