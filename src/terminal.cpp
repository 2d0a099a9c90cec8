#include "terminal.hpp"
#include <ncurses.h>
#include <csignal>
#include <cstdlib>
#include <initializer_list>
#include <locale.h>

static volatile std::sig_atomic_t g_active = 0;

static void on_fatal_signal(int sig) {
  Terminal::restore();
  std::signal(sig, SIG_DFL);
  std::raise(sig);
}

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  g_active = 1;
  static bool hooks_installed = false;
  if (!hooks_installed) {
    std::atexit(&Terminal::restore);
    for (int sig : {SIGTERM, SIGHUP, SIGSEGV, SIGABRT, SIGBUS, SIGFPE}) std::signal(sig, on_fatal_signal);
    hooks_installed = true;
  }
}

Terminal::~Terminal() {
  restore();
}

void Terminal::restore() {
  if (!g_active) return;
  g_active = 0;
  endwin();
}
