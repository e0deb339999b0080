#pragma once
/*
 * RecitationBuffer
 *
 * Purpose: append-only text store shared between the miner (sole writer) and readers.
 * Atomicity: per unit; snapshot() never observes half of an append.
 */
#include <cstddef>
#include <mutex>
#include <string>
#include "types.hpp"

class RecitationBuffer {
public:
  void append(const TextUnit& unit);
  std::string snapshot() const;
  void reset();
  size_t size() const;
  size_t units() const;

private:
  mutable std::mutex mutex_;
  std::string data_;
  size_t units_ = 0;
};
