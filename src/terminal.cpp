#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal(int refresh_ms) {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  timeout(refresh_ms);
}

Terminal::~Terminal() {
  endwin();
}
