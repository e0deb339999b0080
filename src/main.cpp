#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "miner_app.hpp"
#include "config_loader.hpp"
#include "errors.hpp"
#include <filesystem>
#include <iostream>
#include <optional>

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> rc;
  if (argc >= 2) rc = std::filesystem::path(argv[1]);
  MinerOptions opts;
  HostSettings host;
  std::vector<std::string> warnings;
  std::string msg;
  if (!prepare_host(rc, default_config_path(), opts, host, warnings, msg)) {
    std::cerr << "mminer: " << msg << "\n";
    return 1;
  }

  std::string log_msg;
  auto logger = make_file_logger("mminer", host, log_msg);
  if (!logger) std::cerr << "mminer: " << log_msg << "\n";
  else for (const auto& w : warnings) logger->warn("{}", w);

  auto buffer = std::make_shared<RecitationBuffer>();
  std::unique_ptr<MantraMiner> miner;
  try {
    miner = std::make_unique<MantraMiner>(opts, buffer, logger);
  } catch (const ConfigurationError& e) {
    std::cerr << "mminer: " << e.what() << "\n";
    return 1;
  }
  miner->start();

  Terminal term(MM_UI_REFRESH_MS);
  NcursesTerminal nterm;
  MinerApp app(nterm, std::move(miner), logger, msg);
  app.run([]{ return getch(); });
  return 0;
}
