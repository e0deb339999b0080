#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch rc-file commands.
 * Design: map name → {usage, handler}; a handler returns false with msg to reject its args.
 */
#include <algorithm>
#include <string>
#include <unordered_map>
#include <functional>
#include <utility>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  enum class Result { Ok, Rejected, Unknown };

  void register_command(const std::string& name, std::string usage, Handler h) {
    map_[name] = Entry{std::move(usage), std::move(h)};
  }

  Result execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return Result::Unknown; }
    msg.clear();
    if (it->second.handler(args, msg)) return Result::Ok;
    if (msg.empty()) msg = name + ": use " + it->second.usage;
    return Result::Rejected;
  }

  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
  }

private:
  struct Entry {
    std::string usage;
    Handler handler;
  };
  std::unordered_map<std::string, Entry> map_;
};
