#pragma once
/*
 * Sequence
 *
 * Purpose: immutable ordered list of TextUnit for one round of recitation.
 * Layout: preparation units, each mantra's units times its repeats, conclusion units.
 * Split rule: mantras on ASCII whitespace; preparation/conclusion per UnitSplit
 * (Character = one unit per UTF-8 code point, whitespace runs collapsed).
 */
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "types.hpp"

class Sequence {
public:
  using const_iterator = std::vector<TextUnit>::const_iterator;

  explicit Sequence(std::vector<TextUnit> units) : units_(std::move(units)) {}

  size_t size() const { return units_.size(); }
  bool empty() const { return units_.empty(); }
  const TextUnit& operator[](size_t i) const { return units_[i]; }
  const_iterator begin() const { return units_.begin(); }
  const_iterator end() const { return units_.end(); }

  // text of the first n units as appended to an empty buffer
  std::string text(size_t n) const;
  std::string text() const { return text(units_.size()); }

private:
  std::vector<TextUnit> units_;
};

std::vector<TextUnit> split_words(std::string_view s);
std::vector<TextUnit> split_chars(std::string_view s);

// throws ConfigurationError on a missing/empty mantra or a zero repeat/round count
Sequence build_sequence(const MinerOptions& opts);
