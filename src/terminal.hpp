#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main after configuration is loaded; destructor restores terminal.
 * Note: getch() times out every refresh_ms so the screen follows the miner.
 */
#include <ncurses.h>

class Terminal {
public:
  explicit Terminal(int refresh_ms);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
