#pragma once
/*
 * ConfigLoader
 *
 * Purpose: apply rc-file commands (preparation/mantra/repeat/conclusion/set ...) to
 * MinerOptions and HostSettings.
 * Errors: bad lines are reported as messages and skipped; only an unreadable file fails.
 */
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include "types.hpp"
#include "cmd_registry.hpp"

struct HostSettings {
  std::filesystem::path log_file = MM_DEFAULT_LOG_FILE;
  spdlog::level::level_enum log_level = spdlog::level::info;
};

class ConfigLoader {
public:
  ConfigLoader(MinerOptions& opts, HostSettings& host);

  // one rc line; false (with message()) when the line was rejected
  bool execute_line(const std::string& line);
  bool load_file(const std::filesystem::path& path, std::string& msg);

  const std::string& message() const { return message_; }
  const std::vector<std::string>& warnings() const { return warnings_; }

private:
  void register_commands();

  MinerOptions& opts_;
  HostSettings& host_;
  CommandRegistry registry_;
  std::string message_;
  std::vector<std::string> warnings_;
};

// $HOME/.mminerrc, or nullopt without HOME
std::optional<std::filesystem::path> default_config_path();

// Loads explicit_rc (must be readable) or else default_rc (skipped when absent),
// then falls back to MM_DEFAULT_MANTRA when no mantra was configured.
// false with msg when the rc file cannot be read.
bool prepare_host(const std::optional<std::filesystem::path>& explicit_rc,
                  const std::optional<std::filesystem::path>& default_rc,
                  MinerOptions& opts,
                  HostSettings& host,
                  std::vector<std::string>& warnings,
                  std::string& msg);

// file logger on host.log_file at host.log_level; nullptr with msg if the file cannot be opened
std::shared_ptr<spdlog::logger> make_file_logger(const std::string& name, const HostSettings& host, std::string& msg);
