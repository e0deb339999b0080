#include "miner_app.hpp"
#include <utility>
#include "errors.hpp"

MinerApp::MinerApp(ITerminal& term,
                   std::unique_ptr<MantraMiner> miner,
                   std::shared_ptr<spdlog::logger> logger,
                   std::string message)
  : term_(term),
    miner_(std::move(miner)),
    buffer_(miner_->buffer()),
    logger_(std::move(logger)),
    message_(std::move(message)) {}

void MinerApp::handle_key(int ch) {
  if (ch < 0) return;
  switch (input_.consume(ch)) {
    case KeyAction::TogglePause: toggle_pause(); break;
    case KeyAction::Reset:
      buffer_->reset();
      message_ = "buffer cleared";
      break;
    case KeyAction::Start: start_session(); break;
    case KeyAction::Quit:
      should_quit_ = true;
      break;
    case KeyAction::None: break;
  }
}

void MinerApp::toggle_pause() {
  try {
    if (miner_->state() == WorkerState::Paused) { miner_->resume(); message_ = "resumed"; }
    else { miner_->pause(); message_ = "paused"; }
  } catch (const InvalidTransitionError& e) {
    message_ = e.what();
  }
}

void MinerApp::start_session() {
  try {
    if (miner_->state() == WorkerState::Stopped) {
      miner_->stop();
      buffer_->reset();
      miner_ = std::make_unique<MantraMiner>(miner_->options(), buffer_, logger_);
      if (logger_) logger_->info("new session");
    }
    miner_->start();
    message_ = "started";
  } catch (const MinerException& e) {
    message_ = e.what();
    if (logger_) logger_->warn("start failed: {}", e.what());
  }
}

MinerStatus MinerApp::status() const {
  MinerStatus st;
  st.state = miner_->state();
  st.rounds_done = miner_->count();
  st.rounds_total = miner_->options().rounds;
  st.cursor = miner_->cursor();
  st.sequence_len = miner_->sequence().size();
  st.emitted = miner_->emitted();
  st.rate_ms = miner_->options().rate.count();
  st.text = buffer_->snapshot();
  st.message = message_;
  return st;
}

void MinerApp::render() {
  renderer_.render(term_, status());
}
