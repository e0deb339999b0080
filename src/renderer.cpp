#include "renderer.hpp"
#include <algorithm>
#include <sstream>

static constexpr int TEXT_COLOR_PAIR = 1;
static constexpr int HELP_COLOR_PAIR = 3;
static const char* HELP = "p/space pause/resume  r reset  s start  q quit";

static inline bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

std::vector<std::string> wrap_tail(const std::string& text, int width, int max_rows) {
  std::vector<std::string> rows;
  if (width <= 0 || max_rows <= 0) return rows;
  std::string cur;
  int cols = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c == '\n') { rows.push_back(std::move(cur)); cur.clear(); cols = 0; continue; }
    if (!is_continuation(c)) {
      if (cols == width) { rows.push_back(std::move(cur)); cur.clear(); cols = 0; }
      cols++;
    }
    cur += text[i];
  }
  if (!cur.empty() || rows.empty()) rows.push_back(std::move(cur));
  if ((int)rows.size() > max_rows) rows.erase(rows.begin(), rows.end() - max_rows);
  return rows;
}

std::string clip_columns(const std::string& s, int cols) {
  if (cols <= 0) return std::string();
  int seen = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    if (is_continuation(static_cast<unsigned char>(s[i]))) continue;
    if (seen == cols) return s.substr(0, i);
    seen++;
  }
  return s;
}

std::string status_line(const MinerStatus& st) {
  std::ostringstream oss;
  oss << "mminer [" << state_name(st.state) << "]"
      << "  round " << (st.rounds_done + (st.state == WorkerState::Stopped ? 0 : 1)) << "/";
  if (st.rounds_total) oss << *st.rounds_total; else oss << "inf";
  oss << "  unit " << st.cursor << "/" << st.sequence_len
      << "  emitted " << st.emitted
      << "  rate " << st.rate_ms << "ms";
  return oss.str();
}

void Renderer::render(ITerminal& term, const MinerStatus& st) {
  TermSize sz = term.getSize();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (rows <= 0 || cols <= 0) { term.refresh(); return; }
  term.draw_reversed(0, 0, clip_columns(status_line(st), cols));
  int text_rows = std::max(0, rows - 2);
  auto lines = wrap_tail(st.text, cols, text_rows);
  for (int i = 0; i < (int)lines.size(); ++i) {
    term.draw_colored(1 + i, 0, lines[i], TEXT_COLOR_PAIR);
  }
  if (rows >= 2) {
    if (!st.message.empty()) term.draw_text(rows - 1, 0, clip_columns(st.message, cols));
    else term.draw_colored(rows - 1, 0, clip_columns(HELP, cols), HELP_COLOR_PAIR);
  }
  term.refresh();
}
