#pragma once
/*
 * MantraMiner
 *
 * Purpose: background worker that appends one TextUnit per interval to a RecitationBuffer.
 * States: Idle -> Running <-> Paused -> Stopped (terminal).
 * Stopped by natural completion means the loop has exited; the thread is joined by
 * the next stop() or the destructor, which then return without waiting.
 * Control: start/resume/pause throw on illegal transitions; stop() never throws and is idempotent.
 * Ticks run under the control mutex: once pause()/stop() return, no further unit is appended.
 * stop() wakes the worker through the condition variable, so it blocks at most
 * for an in-flight tick, never for the rest of the interval.
 */
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <spdlog/spdlog.h>
#include "types.hpp"
#include "sequence.hpp"
#include "recitation_buffer.hpp"

class MantraMiner {
public:
  // throws ConfigurationError
  MantraMiner(MinerOptions options,
              std::shared_ptr<RecitationBuffer> buffer,
              std::shared_ptr<spdlog::logger> logger = nullptr);
  ~MantraMiner();
  MantraMiner(const MantraMiner&) = delete;
  MantraMiner& operator=(const MantraMiner&) = delete;

  void start();
  void pause();
  void resume();
  void stop();

  WorkerState state() const;
  bool is_running() const { return state() == WorkerState::Running; }
  // true if Stopped was reached within timeout
  bool wait_until_stopped(std::chrono::milliseconds timeout) const;

  size_t cursor() const { return cursor_.load(); }
  size_t emitted() const { return emitted_.load(); }
  size_t count() const { return count_.load(); }
  const Sequence& sequence() const { return sequence_; }
  const MinerOptions& options() const { return options_; }
  const std::shared_ptr<RecitationBuffer>& buffer() const { return buffer_; }

private:
  using Clock = std::chrono::steady_clock;
  enum class Control { Run, Pause, Stop };

  void run();
  // appends one unit; false when the last round is done. Caller holds mutex_.
  bool tick();

  MinerOptions options_;
  Sequence sequence_;
  std::shared_ptr<RecitationBuffer> buffer_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  WorkerState state_ = WorkerState::Idle;
  Control control_ = Control::Run;

  std::mutex join_mutex_;
  std::thread worker_;

  std::atomic<size_t> cursor_{0};
  std::atomic<size_t> emitted_{0};
  std::atomic<size_t> count_{0};
};
