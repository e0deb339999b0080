#include "types.hpp"
#include <utility>

std::string_view state_name(WorkerState s) {
  switch (s) {
    case WorkerState::Idle: return "idle";
    case WorkerState::Running: return "running";
    case WorkerState::Paused: return "paused";
    case WorkerState::Stopped: return "stopped";
  }
  return "unknown";
}

std::string_view split_name(UnitSplit s) {
  return s == UnitSplit::Word ? "word" : "char";
}

MinerOptions MinerOptions::single(std::string mantra,
                                  std::optional<std::string> preparation,
                                  std::optional<std::string> conclusion,
                                  std::optional<size_t> rounds,
                                  std::chrono::milliseconds rate) {
  MinerOptions o;
  o.preparation = std::move(preparation);
  o.mantras.push_back(Mantra{std::move(mantra), 1});
  o.conclusion = std::move(conclusion);
  o.rounds = rounds;
  o.rate = rate;
  return o;
}
