#pragma once
/*
 * Renderer
 *
 * Purpose: render miner status bar, the tail of the recitation and a message line.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a MinerStatus snapshot from MinerApp.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "iterminal.hpp"

struct MinerStatus {
  WorkerState state = WorkerState::Idle;
  size_t rounds_done = 0;
  std::optional<size_t> rounds_total;
  size_t cursor = 0;
  size_t sequence_len = 0;
  size_t emitted = 0;
  long long rate_ms = 0;
  std::string text;
  std::string message;
};

// hard-wrap text to width columns (one UTF-8 code point per column), keep the last max_rows rows
std::vector<std::string> wrap_tail(const std::string& text, int width, int max_rows);
// first cols code points of s
std::string clip_columns(const std::string& s, int cols);
std::string status_line(const MinerStatus& st);

class Renderer {
public:
  void render(ITerminal& term, const MinerStatus& st);
};
