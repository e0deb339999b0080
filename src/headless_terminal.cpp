#include "headless_terminal.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols), grid_(rows, std::string(cols, ' ')), reversed_(rows, false) {}

void HeadlessTerminal::clear() {
  for (auto& r : grid_) r.assign(cols_, ' ');
  reversed_.assign(rows_, false);
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  if (row < 0 || row >= rows_ || col < 0) return;
  std::string& r = grid_[row];
  for (size_t i = 0; i < text.size() && col + (int)i < cols_; ++i) r[col + i] = text[i];
}

void HeadlessTerminal::draw_reversed(int row, int col, const std::string& text) {
  draw_text(row, col, text);
  if (row >= 0 && row < rows_) reversed_[row] = true;
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int) {
  draw_text(row, col, text);
}

std::string HeadlessTerminal::line(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  const std::string& r = grid_[row];
  size_t end = r.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : r.substr(0, end + 1);
}

bool HeadlessTerminal::row_reversed(int row) const {
  return row >= 0 && row < rows_ && reversed_[row];
}
