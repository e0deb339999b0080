#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (TextUnit/Mantra/MinerOptions/WorkerState).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "config.hpp"

enum class WorkerState { Idle, Running, Paused, Stopped };
enum class UnitSplit { Word, Character };

std::string_view state_name(WorkerState s);
std::string_view split_name(UnitSplit s);

struct TextUnit {
  std::string text;
  std::string lead; // written before text unless the buffer is empty
};

struct Mantra {
  std::string text;
  size_t repeats = 1;
};

struct MinerOptions {
  std::optional<std::string> preparation;
  std::vector<Mantra> mantras;
  std::optional<std::string> conclusion;
  // nullopt: repeat the whole sequence until stopped
  std::optional<size_t> rounds = 1;
  std::chrono::milliseconds rate{MM_DEFAULT_RATE_MS};
  UnitSplit split = MM_DEFAULT_SPLIT == MM_SPLIT_WORD ? UnitSplit::Word : UnitSplit::Character;

  static MinerOptions single(std::string mantra,
                             std::optional<std::string> preparation,
                             std::optional<std::string> conclusion,
                             std::optional<size_t> rounds,
                             std::chrono::milliseconds rate);
};
