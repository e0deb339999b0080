#include "recitation_buffer.hpp"
#include <cassert>
#include <string>
#include <thread>
#include <vector>

static void test_append_snapshot_reset() {
  RecitationBuffer b;
  assert(b.snapshot().empty());
  b.append(TextUnit{"om", " "});
  assert(b.snapshot() == "om");
  b.append(TextUnit{"mani", " "});
  b.append(TextUnit{"!", ""});
  assert(b.snapshot() == "om mani!");
  assert(b.units() == 3);
  assert(b.size() == 8);
  b.reset();
  assert(b.snapshot().empty());
  assert(b.units() == 0);
  b.append(TextUnit{"hum", " "});
  assert(b.snapshot() == "hum");
}

// every snapshot must hold whole units only
static bool whole_units(const std::string& s, const std::string& unit) {
  if (s.empty()) return true;
  size_t pos = 0;
  while (true) {
    if (s.compare(pos, unit.size(), unit) != 0) return false;
    pos += unit.size();
    if (pos == s.size()) return true;
    if (s[pos] != '|') return false;
    pos++;
  }
}

static void test_no_torn_reads() {
  RecitationBuffer b;
  const std::string unit(64, 'x');
  const int n = 2000;
  std::thread writer([&]{
    for (int i = 0; i < n; ++i) b.append(TextUnit{unit, "|"});
  });
  std::vector<std::thread> readers;
  std::vector<int> bad(4, 0);
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&, r]{
      for (int i = 0; i < n; ++i) {
        if (!whole_units(b.snapshot(), unit)) bad[r]++;
      }
    });
  }
  writer.join();
  for (auto& t : readers) t.join();
  for (int v : bad) assert(v == 0);
  assert(b.units() == (size_t)n);
  assert(b.size() == (size_t)n * unit.size() + (size_t)(n - 1));
}

int main() {
  test_append_snapshot_reset();
  test_no_torn_reads();
  return 0;
}
