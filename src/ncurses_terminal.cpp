#include "ncurses_terminal.hpp"

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(1, COLOR_YELLOW, -1); // recited text: default background
      init_pair(3, COLOR_CYAN, -1);
    } else {
      init_pair(1, COLOR_YELLOW, COLOR_BLACK); // fallback
      init_pair(3, COLOR_CYAN, COLOR_BLACK);
    }
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_reversed(int row, int col, const std::string& text) {
  int cols = getSize().cols;
  std::string padded = text;
  if ((int)padded.size() < cols - col) padded.append(cols - col - padded.size(), ' ');
  attron(A_REVERSE);
  mvaddnstr(row, col, padded.c_str(), (int)padded.size());
  attroff(A_REVERSE);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::refresh() { ::refresh(); }
