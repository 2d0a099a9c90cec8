#include "config.hpp"
#include "cmd_registry.hpp"
#include "file_io.hpp"
#include <glog/logging.h>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <vector>

static bool parse_switch(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  if (args[0] == "on") { out = true; return true; }
  if (args[0] == "off") { out = false; return true; }
  return false;
}

static CommandRegistry make_registry(EditorConfig& cfg) {
  CommandRegistry registry;
  registry.register_command("set number", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (!parse_switch(args, cfg.show_line_numbers, cfg.show_line_numbers)) {
      msg = "set number: use set number on|off";
      return false;
    }
    msg = cfg.show_line_numbers ? "number on" : "number off";
    return true;
  });
  registry.register_command("set color", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (!parse_switch(args, cfg.enable_color, cfg.enable_color)) {
      msg = "set color: use set color on|off";
      return false;
    }
    msg = cfg.enable_color ? "color on" : "color off";
    return true;
  });
  registry.register_command("set quittimes", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.size() != 1) { msg = "set quittimes: use set quittimes N"; return false; }
    int n = 0;
    try {
      size_t used = 0;
      n = std::stoi(args[0], &used);
      if (used != args[0].size()) throw std::invalid_argument(args[0]);
    } catch (const std::exception&) {
      msg = "set quittimes: not a number: " + args[0];
      return false;
    }
    if (n < 0) { msg = "set quittimes: must not be negative"; return false; }
    cfg.quit_times = n;
    msg = "quittimes " + std::to_string(n);
    return true;
  });
  return registry;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

bool apply_rc_line(EditorConfig& cfg, const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty() || s[0] == '#' || s[0] == '"') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd != "set" || args.empty()) { msg = "unknown command: " + s; return false; }
  // "set name=value" is the same as "set name value"
  std::string name = args[0];
  std::vector<std::string> subargs;
  size_t eq = name.find('=');
  if (eq != std::string::npos) {
    subargs.push_back(name.substr(eq + 1));
    name = name.substr(0, eq);
  }
  subargs.insert(subargs.end(), args.begin() + 1, args.end());
  CommandRegistry registry = make_registry(cfg);
  return registry.execute("set " + name, subargs, msg);
}

bool load_rc(const std::filesystem::path& path, EditorConfig& cfg, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines;
  if (!read_lines(path, lines, msg)) {
    LOG(WARNING) << msg;
    return false;
  }
  bool ok = true;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string m;
    if (!apply_rc_line(cfg, lines[i], m)) {
      msg = path.string() + ":" + std::to_string(i + 1) + ": " + m;
      LOG(WARNING) << "rc option rejected: " << msg;
      ok = false;
    }
  }
  return ok;
}

std::filesystem::path default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return {};
  return std::filesystem::path(home) / SCRIBE_RC_NAME;
}
