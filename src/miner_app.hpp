#pragma once
/*
 * MinerApp
 *
 * Purpose: terminal host; owns the miner session, polls keys and renders status.
 * Sessions: 's' on a stopped miner resets the buffer and starts a fresh MantraMiner
 * with the same options.
 */
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "types.hpp"
#include "mantra_miner.hpp"
#include "recitation_buffer.hpp"
#include "renderer.hpp"
#include "input.hpp"
#include "iterminal.hpp"

class MinerApp {
public:
  MinerApp(ITerminal& term,
           std::unique_ptr<MantraMiner> miner,
           std::shared_ptr<spdlog::logger> logger,
           std::string message);
  // blocks until the user quits; next_key returns -1 on timeout
  template <typename KeySource>
  void run(KeySource next_key) {
    while (!should_quit_) {
      render();
      handle_key(next_key());
    }
    miner_->stop();
  }

  void handle_key(int ch);
  void render();
  MinerStatus status() const;
  const MantraMiner& miner() const { return *miner_; }
  bool should_quit() const { return should_quit_; }

private:
  void toggle_pause();
  void start_session();

  ITerminal& term_;
  std::unique_ptr<MantraMiner> miner_;
  std::shared_ptr<RecitationBuffer> buffer_;
  std::shared_ptr<spdlog::logger> logger_;
  Renderer renderer_;
  Input input_;
  std::string message_;
  bool should_quit_ = false;
};
