#include "config_loader.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <spdlog/sinks/basic_file_sink.h>
#include "file_reader.hpp"

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

static std::string join_args(const std::vector<std::string>& args) {
  std::string out;
  for (const auto& a : args) {
    if (!out.empty()) out += ' ';
    out += a;
  }
  return out;
}

static std::string to_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static bool parse_count(const std::string& s, size_t& out) {
  if (s.empty()) return false;
  for (unsigned char c : s) if (!std::isdigit(c)) return false;
  try { out = static_cast<size_t>(std::stoull(s)); } catch (const std::exception&) { return false; }
  return true;
}

ConfigLoader::ConfigLoader(MinerOptions& opts, HostSettings& host) : opts_(opts), host_(host) {
  register_commands();
}

void ConfigLoader::register_commands() {
  registry_.register_command("preparation", "preparation <text>",
    [this](const std::vector<std::string>& args, std::string&) {
      if (args.empty()) return false;
      opts_.preparation = join_args(args);
      return true;
    });
  registry_.register_command("conclusion", "conclusion <text>",
    [this](const std::vector<std::string>& args, std::string&) {
      if (args.empty()) return false;
      opts_.conclusion = join_args(args);
      return true;
    });
  registry_.register_command("mantra", "mantra <text>",
    [this](const std::vector<std::string>& args, std::string&) {
      if (args.empty()) return false;
      opts_.mantras.push_back(Mantra{join_args(args), 1});
      return true;
    });
  registry_.register_command("repeat", "repeat <n>",
    [this](const std::vector<std::string>& args, std::string& msg) {
      if (opts_.mantras.empty()) { msg = "repeat: no mantra to repeat yet"; return false; }
      size_t n = 0;
      if (args.size() != 1 || !parse_count(args[0], n)) return false;
      if (n < 1) { msg = "repeat: count must be >= 1"; return false; }
      opts_.mantras.back().repeats = n;
      return true;
    });
  registry_.register_command("set rate", "set rate <ms>",
    [this](const std::vector<std::string>& args, std::string& msg) {
      size_t ms = 0;
      if (args.size() != 1 || !parse_count(args[0], ms)) return false;
      if (ms > static_cast<size_t>(MM_MAX_RATE_MS)) {
        msg = "set rate: at most " + std::to_string(MM_MAX_RATE_MS) + " ms";
        return false;
      }
      opts_.rate = std::chrono::milliseconds(static_cast<long long>(ms));
      return true;
    });
  registry_.register_command("set rounds", "set rounds <n>|inf",
    [this](const std::vector<std::string>& args, std::string& msg) {
      if (args.size() != 1) return false;
      std::string v = to_lower(args[0]);
      if (v == "inf" || v == "infinite" || v == "forever") { opts_.rounds.reset(); return true; }
      size_t n = 0;
      if (!parse_count(v, n)) return false;
      if (n < 1) { msg = "set rounds: count must be >= 1"; return false; }
      opts_.rounds = n;
      return true;
    });
  registry_.register_command("set split", "set split word|char",
    [this](const std::vector<std::string>& args, std::string&) {
      if (args.size() != 1) return false;
      std::string v = to_lower(args[0]);
      if (v == "word") opts_.split = UnitSplit::Word;
      else if (v == "char" || v == "character") opts_.split = UnitSplit::Character;
      else return false;
      return true;
    });
  registry_.register_command("set loglevel", "set loglevel trace|debug|info|warn|error|off",
    [this](const std::vector<std::string>& args, std::string&) {
      if (args.size() != 1) return false;
      std::string v = to_lower(args[0]);
      if (v == "trace") host_.log_level = spdlog::level::trace;
      else if (v == "debug") host_.log_level = spdlog::level::debug;
      else if (v == "info") host_.log_level = spdlog::level::info;
      else if (v == "warn" || v == "warning") host_.log_level = spdlog::level::warn;
      else if (v == "error") host_.log_level = spdlog::level::err;
      else if (v == "off") host_.log_level = spdlog::level::off;
      else return false;
      return true;
    });
  registry_.register_command("set logfile", "set logfile <path>",
    [this](const std::vector<std::string>& args, std::string&) {
      if (args.empty()) return false;
      host_.log_file = join_args(args);
      return true;
    });
}

bool ConfigLoader::execute_line(const std::string& raw) {
  message_.clear();
  std::string s = trim(raw);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  std::string name = cmd;
  if (cmd == "set") {
    if (args.empty()) { message_ = "set: missing option"; return false; }
    std::string opt = args[0];
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      value = opt.substr(eq + 1);
      opt = opt.substr(0, eq);
    }
    name = "set " + opt;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    args = std::move(subargs);
  }
  return registry_.execute(name, args, message_) == CommandRegistry::Result::Ok;
}

bool ConfigLoader::load_file(const std::filesystem::path& path, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  warnings_.clear();
  for (size_t i = 0; i < lines.size(); ++i) {
    if (!execute_line(lines[i])) {
      warnings_.push_back(path.filename().string() + ":" + std::to_string(i + 1) + ": " + message_);
    }
  }
  msg = std::string("loaded config: ") + path.string();
  if (!warnings_.empty()) msg += " (" + std::to_string(warnings_.size()) + " bad lines)";
  return true;
}

std::optional<std::filesystem::path> default_config_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / MM_RC_NAME;
}

bool prepare_host(const std::optional<std::filesystem::path>& explicit_rc,
                  const std::optional<std::filesystem::path>& default_rc,
                  MinerOptions& opts,
                  HostSettings& host,
                  std::vector<std::string>& warnings,
                  std::string& msg) {
  ConfigLoader loader(opts, host);
  msg.clear();
  warnings.clear();
  if (explicit_rc) {
    if (!loader.load_file(*explicit_rc, msg)) return false;
  } else if (default_rc) {
    std::error_code ec;
    if (std::filesystem::exists(*default_rc, ec) && !loader.load_file(*default_rc, msg)) return false;
  }
  warnings = loader.warnings();
  if (opts.mantras.empty()) opts.mantras.push_back(Mantra{MM_DEFAULT_MANTRA, 1});
  return true;
}

std::shared_ptr<spdlog::logger> make_file_logger(const std::string& name, const HostSettings& host, std::string& msg) {
  try {
    auto logger = spdlog::basic_logger_mt(name, host.log_file.string());
    logger->set_level(host.log_level);
    logger->flush_on(spdlog::level::info);
    return logger;
  } catch (const spdlog::spdlog_ex& e) {
    msg = std::string("logging disabled: ") + e.what();
    return nullptr;
  }
}
