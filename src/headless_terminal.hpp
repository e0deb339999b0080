#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal recording drawn text per row, for renderer tests.
 * Note: one char per column; text past the right edge is dropped.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_reversed(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void refresh() override { refreshes_++; }

  // row content with trailing blanks stripped
  std::string line(int row) const;
  bool row_reversed(int row) const;
  int refreshes() const { return refreshes_; }

private:
  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::vector<bool> reversed_;
  int refreshes_ = 0;
};
