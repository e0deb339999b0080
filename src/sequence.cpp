#include "sequence.hpp"
#include <algorithm>
#include <iterator>
#include "errors.hpp"

static inline bool is_space(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// length of the UTF-8 sequence starting with lead byte c; 1 for stray bytes
static size_t utf8_len(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c & 0xE0) == 0xC0) return 2;
  if ((c & 0xF0) == 0xE0) return 3;
  if ((c & 0xF8) == 0xF0) return 4;
  return 1;
}

static bool utf8_valid_tail(std::string_view s, size_t pos, size_t len) {
  if (pos + len > s.size()) return false;
  for (size_t k = 1; k < len; ++k) {
    if ((static_cast<unsigned char>(s[pos + k]) & 0xC0) != 0x80) return false;
  }
  return true;
}

std::string Sequence::text(size_t n) const {
  std::string out;
  n = std::min(n, units_.size());
  for (size_t i = 0; i < n; ++i) {
    if (!out.empty()) out += units_[i].lead;
    out += units_[i].text;
  }
  return out;
}

std::vector<TextUnit> split_words(std::string_view s) {
  std::vector<TextUnit> out;
  size_t i = 0, n = s.size();
  while (i < n) {
    while (i < n && is_space(static_cast<unsigned char>(s[i]))) i++;
    size_t st = i;
    while (i < n && !is_space(static_cast<unsigned char>(s[i]))) i++;
    if (i > st) out.push_back(TextUnit{std::string(s.substr(st, i - st)), " "});
  }
  return out;
}

std::vector<TextUnit> split_chars(std::string_view s) {
  std::vector<TextUnit> out;
  size_t i = 0, n = s.size();
  while (i < n && is_space(static_cast<unsigned char>(s[i]))) i++;
  while (n > i && is_space(static_cast<unsigned char>(s[n - 1]))) n--;
  bool prev_space = false;
  while (i < n) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (is_space(c)) {
      if (!prev_space) out.push_back(TextUnit{" ", ""});
      prev_space = true;
      i++;
      continue;
    }
    prev_space = false;
    size_t len = utf8_len(c);
    if (!utf8_valid_tail(s, i, len)) len = 1;
    out.push_back(TextUnit{std::string(s.substr(i, len)), ""});
    i += len;
  }
  // a character-split text starts a new word in the buffer
  if (!out.empty()) out.front().lead = " ";
  return out;
}

static void append_units(std::vector<TextUnit>& dst, std::vector<TextUnit>&& src) {
  dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
}

Sequence build_sequence(const MinerOptions& opts) {
  if (opts.mantras.empty()) throw ConfigurationError("no mantra configured");
  if (opts.rounds && *opts.rounds == 0) throw ConfigurationError("rounds must be >= 1");
  auto split = [&](const std::string& s) {
    return opts.split == UnitSplit::Word ? split_words(s) : split_chars(s);
  };
  std::vector<TextUnit> units;
  if (opts.preparation) append_units(units, split(*opts.preparation));
  for (size_t m = 0; m < opts.mantras.size(); ++m) {
    const Mantra& mantra = opts.mantras[m];
    auto syllables = split_words(mantra.text);
    if (syllables.empty()) throw ConfigurationError("mantra " + std::to_string(m + 1) + " is empty");
    if (mantra.repeats == 0) throw ConfigurationError("mantra " + std::to_string(m + 1) + " has repeat count 0");
    units.reserve(units.size() + syllables.size() * mantra.repeats);
    for (size_t r = 0; r < mantra.repeats; ++r) {
      units.insert(units.end(), syllables.begin(), syllables.end());
    }
  }
  if (opts.conclusion) append_units(units, split(*opts.conclusion));
  return Sequence(std::move(units));
}
