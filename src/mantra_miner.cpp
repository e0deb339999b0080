#include "mantra_miner.hpp"
#include <string>
#include <utility>
#include "errors.hpp"

MantraMiner::MantraMiner(MinerOptions options,
                         std::shared_ptr<RecitationBuffer> buffer,
                         std::shared_ptr<spdlog::logger> logger)
  : options_(std::move(options)),
    sequence_(build_sequence(options_)),
    buffer_(std::move(buffer)),
    logger_(std::move(logger)) {
  if (!buffer_) throw ConfigurationError("miner needs a buffer");
  if (options_.rate.count() < 0 || options_.rate.count() > MM_MAX_RATE_MS)
    throw ConfigurationError("rate must be between 0 and " + std::to_string(MM_MAX_RATE_MS) + " ms");
}

MantraMiner::~MantraMiner() { stop(); }

void MantraMiner::start() {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ == WorkerState::Running || state_ == WorkerState::Paused)
      throw AlreadyStartedError("miner already started");
    if (state_ == WorkerState::Stopped)
      throw InvalidTransitionError("miner is stopped and cannot be restarted");
    control_ = Control::Run;
    worker_ = std::thread(&MantraMiner::run, this);
    state_ = WorkerState::Running;
  }
  if (logger_) {
    logger_->debug("miner started: {} units, rate {}ms, rounds {}, split {}", sequence_.size(), options_.rate.count(),
                   options_.rounds ? std::to_string(*options_.rounds) : std::string("inf"), split_name(options_.split));
  }
}

void MantraMiner::pause() {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ == WorkerState::Paused) return;
    if (state_ != WorkerState::Running)
      throw InvalidTransitionError(std::string("cannot pause a ") + std::string(state_name(state_)) + " miner");
    control_ = Control::Pause;
    state_ = WorkerState::Paused;
  }
  cv_.notify_all();
  if (logger_) logger_->debug("miner paused at unit {}", cursor());
}

void MantraMiner::resume() {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ != WorkerState::Paused)
      throw InvalidTransitionError(std::string("cannot resume a ") + std::string(state_name(state_)) + " miner");
    control_ = Control::Run;
    state_ = WorkerState::Running;
  }
  cv_.notify_all();
  if (logger_) logger_->debug("miner resumed at unit {}", cursor());
}

void MantraMiner::stop() {
  bool was_idle = false;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ == WorkerState::Idle) {
      state_ = WorkerState::Stopped;
      was_idle = true;
    }
    control_ = Control::Stop;
  }
  cv_.notify_all();
  {
    std::lock_guard<std::mutex> jl(join_mutex_);
    if (worker_.joinable()) {
      worker_.join();
      if (logger_) logger_->debug("miner stopped: {} units emitted, {} rounds", emitted(), count());
    }
  }
  if (was_idle && logger_) logger_->debug("miner stopped before start");
}

WorkerState MantraMiner::state() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return state_;
}

bool MantraMiner::wait_until_stopped(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mutex_);
  return cv_.wait_for(lk, timeout, [this]{ return state_ == WorkerState::Stopped; });
}

void MantraMiner::run() {
  const auto interval = options_.rate;
  auto next = Clock::now() + interval;
  bool finished = false;
  std::unique_lock<std::mutex> lk(mutex_);
  while (control_ != Control::Stop) {
    if (cv_.wait_until(lk, next, [this]{ return control_ != Control::Run; })) {
      if (control_ == Control::Pause) {
        cv_.wait(lk, [this]{ return control_ != Control::Pause; });
        next = Clock::now() + interval;
      }
      continue;
    }
    if (!tick()) { finished = true; break; }
    next += interval;
  }
  if (finished && logger_) logger_->info("recitation complete: {} rounds, {} units", count(), emitted());
  state_ = WorkerState::Stopped;
  lk.unlock();
  cv_.notify_all();
}

bool MantraMiner::tick() {
  size_t c = cursor_.load();
  const TextUnit& unit = sequence_[c];
  buffer_->append(unit);
  emitted_++;
  if (logger_) logger_->trace("unit {}/{}: '{}'", c + 1, sequence_.size(), unit.text);
  c++;
  if (c < sequence_.size()) {
    cursor_ = c;
    return true;
  }
  size_t done = ++count_;
  if (logger_) logger_->info("round {} complete", done);
  if (options_.rounds && done >= *options_.rounds) {
    cursor_ = c;
    return false;
  }
  cursor_ = 0;
  return true;
}
