#include "renderer.hpp"
#include "headless_terminal.hpp"
#include "miner_app.hpp"
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static void test_wrap_tail() {
  auto rows = wrap_tail("abcdefghij", 4, 10);
  assert(rows.size() == 3);
  assert(rows[0] == "abcd");
  assert(rows[2] == "ij");
  rows = wrap_tail("abcdefghij", 4, 2);
  assert(rows.size() == 2);
  assert(rows[0] == "efgh");
  assert(rows[1] == "ij");
  rows = wrap_tail("", 4, 3);
  assert(rows.size() == 1 && rows[0].empty());
  rows = wrap_tail("ab\ncd", 10, 5);
  assert(rows.size() == 2 && rows[1] == "cd");
  // two-byte code points take one column each
  rows = wrap_tail("\xC3\xB4\xC3\xB4\xC3\xB4", 2, 5);
  assert(rows.size() == 2);
  assert(rows[0] == "\xC3\xB4\xC3\xB4");
  assert(wrap_tail("abc", 0, 3).empty());
}

static void test_clip_columns() {
  assert(clip_columns("abcdef", 3) == "abc");
  assert(clip_columns("ab", 5) == "ab");
  assert(clip_columns("abc", 0).empty());
  // "mô mô" clipped to 3 columns keeps whole code points
  assert(clip_columns("m\xC3\xB4 m\xC3\xB4", 3) == "m\xC3\xB4 ");
  assert(clip_columns("\xC3\xB4\xC3\xB4", 1) == "\xC3\xB4");
}

static void test_render_layout() {
  HeadlessTerminal term(5, 24);
  MinerStatus st;
  st.state = WorkerState::Running;
  st.rounds_done = 1;
  st.rounds_total = 3;
  st.cursor = 2;
  st.sequence_len = 4;
  st.emitted = 6;
  st.rate_ms = 250;
  st.text = "om mani padme hum om mani";
  Renderer r;
  r.render(term, st);
  assert(term.refreshes() == 1);
  assert(term.row_reversed(0));
  assert(term.line(0).rfind("mminer [running]", 0) == 0);
  assert(term.line(1) == "om mani padme hum om man");
  assert(term.line(2) == "i");
  assert(term.line(4).rfind("p/space", 0) == 0);
  st.message = "paused";
  r.render(term, st);
  assert(term.line(4) == "paused");
  assert(status_line(st).find("round 2/3") != std::string::npos);
  st.rounds_total.reset();
  st.state = WorkerState::Stopped;
  assert(status_line(st).find("round 1/inf") != std::string::npos);
}

static void test_app_keys() {
  HeadlessTerminal term(6, 40);
  auto buf = std::make_shared<RecitationBuffer>();
  auto miner = std::make_unique<MantraMiner>(
      MinerOptions::single("om ah hum", std::nullopt, std::nullopt, 1, 2ms), buf);
  MinerApp app(term, std::move(miner), nullptr, "ready");
  assert(app.status().state == WorkerState::Idle);
  app.handle_key('p');
  assert(app.status().message.find("cannot pause") != std::string::npos);
  app.handle_key('s');
  assert(app.miner().wait_until_stopped(2000ms));
  assert(app.status().text == "om ah hum");
  app.handle_key('r');
  assert(app.status().text.empty());
  assert(app.status().message == "buffer cleared");
  // a stopped session restarts from a fresh miner
  app.handle_key('s');
  assert(app.miner().wait_until_stopped(2000ms));
  assert(app.status().text == "om ah hum");
  assert(app.status().emitted == 3);

  std::vector<int> keys = {-1, 'x', -1, 'q'};
  size_t i = 0;
  app.run([&]{ return keys[i++]; });
  assert(app.should_quit());
  assert(i == keys.size());
  assert(term.refreshes() >= 4);
}

int main() {
  test_wrap_tail();
  test_clip_columns();
  test_render_layout();
  test_app_keys();
  return 0;
}
