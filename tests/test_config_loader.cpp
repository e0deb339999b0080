#include "config_loader.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>
#include <string>

static void test_commands() {
  MinerOptions o;
  HostSettings h;
  ConfigLoader l(o, h);
  assert(l.execute_line(""));
  assert(l.execute_line("   # comment"));
  assert(l.execute_line("\" vim style comment"));
  assert(l.execute_line("// comment"));
  assert(l.execute_line("preparation I take refuge"));
  assert(o.preparation && *o.preparation == "I take refuge");
  assert(l.execute_line(":mantra om mani   padme hum"));
  assert(l.execute_line("repeat 108"));
  assert(l.execute_line("mantra gate gate"));
  assert(o.mantras.size() == 2);
  assert(o.mantras[0].text == "om mani padme hum");
  assert(o.mantras[0].repeats == 108);
  assert(o.mantras[1].repeats == 1);
  assert(l.execute_line("conclusion may all beings benefit"));
  assert(o.conclusion && *o.conclusion == "may all beings benefit");
  assert(l.execute_line("set rate=40"));
  assert(o.rate.count() == 40);
  assert(l.execute_line("set rate 15"));
  assert(o.rate.count() == 15);
  assert(l.execute_line("set rounds inf"));
  assert(!o.rounds);
  assert(l.execute_line("set rounds=3"));
  assert(o.rounds && *o.rounds == 3);
  assert(l.execute_line("set split word"));
  assert(o.split == UnitSplit::Word);
  assert(l.execute_line("set loglevel debug"));
  assert(h.log_level == spdlog::level::debug);
  assert(l.execute_line("set logfile /tmp/mm.log"));
  assert(h.log_file == std::filesystem::path("/tmp/mm.log"));
}

static void test_rejections() {
  MinerOptions o;
  HostSettings h;
  ConfigLoader l(o, h);
  assert(!l.execute_line("repeat 3"));
  assert(l.message().find("no mantra") != std::string::npos);
  assert(!l.execute_line("chant om"));
  assert(l.message() == "unknown command: chant");
  assert(!l.execute_line("set colour on"));
  assert(l.message() == "unknown command: set colour");
  assert(!l.execute_line("set rate fast"));
  assert(l.message() == "set rate: use set rate <ms>");
  assert(!l.execute_line("set rounds 0"));
  assert(l.message().find(">= 1") != std::string::npos);
  assert(!l.execute_line("set rate 10000000000000"));
  assert(l.message().find("at most") != std::string::npos);
  assert(!l.execute_line("set rate 86400001"));
  assert(l.execute_line("set rate 86400000"));
  assert(o.rate.count() == MM_MAX_RATE_MS);
  assert(l.execute_line("set rate 250"));
  assert(!l.execute_line("set split syllable"));
  assert(!l.execute_line("set"));
  assert(!l.execute_line("mantra"));
  assert(o.mantras.empty());
  assert(o.rate.count() == MM_DEFAULT_RATE_MS);
}

static void test_load_file() {
  auto path = std::filesystem::temp_directory_path() / "mminer_test_rc";
  {
    std::ofstream f(path);
    f << "# practice\r\n";
    f << "mantra om ah hum\n";
    f << "repeat 2\n";
    f << "bogus line\n";
    f << "set rate 5\n";
    f << "set rounds twice";
  }
  MinerOptions o;
  HostSettings h;
  ConfigLoader l(o, h);
  std::string msg;
  assert(l.load_file(path, msg));
  assert(o.mantras.size() == 1);
  assert(o.mantras[0].repeats == 2);
  assert(o.rate.count() == 5);
  assert(l.warnings().size() == 2);
  assert(l.warnings()[0] == "mminer_test_rc:4: unknown command: bogus");
  assert(l.warnings()[1].rfind("mminer_test_rc:6:", 0) == 0);
  assert(msg.find("2 bad lines") != std::string::npos);
  std::filesystem::remove(path);

  MinerOptions o2;
  ConfigLoader l2(o2, h);
  assert(!l2.load_file(path, msg));
  assert(msg.find("can not open file") != std::string::npos);
}

static std::filesystem::path write_rc(const std::string& name, const std::string& body) {
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream f(path);
  f << body;
  return path;
}

static void test_prepare_host() {
  auto missing = std::filesystem::temp_directory_path() / "mminer_no_such_rc";
  std::filesystem::remove(missing);
  std::vector<std::string> warnings;
  std::string msg;

  // missing default rc: defaults plus the fallback mantra
  MinerOptions o;
  HostSettings h;
  assert(prepare_host(std::nullopt, missing, o, h, warnings, msg));
  assert(o.mantras.size() == 1);
  assert(o.mantras[0].text == MM_DEFAULT_MANTRA);
  assert(warnings.empty());

  // no HOME at all
  MinerOptions o_home;
  assert(prepare_host(std::nullopt, std::nullopt, o_home, h, warnings, msg));
  assert(o_home.mantras.size() == 1);

  // an explicit rc must be readable
  MinerOptions o2;
  assert(!prepare_host(missing, std::nullopt, o2, h, warnings, msg));
  assert(msg.find("can not open file") != std::string::npos);
  MinerOptions o3;
  assert(!prepare_host(std::filesystem::temp_directory_path(), std::nullopt, o3, h, warnings, msg));

  // configured mantras replace the fallback; warnings come back to the caller
  auto rc = write_rc("mminer_host_rc", "mantra gate gate\nnonsense\nset loglevel warn\n");
  MinerOptions o4;
  HostSettings h4;
  assert(prepare_host(rc, missing, o4, h4, warnings, msg));
  assert(o4.mantras.size() == 1);
  assert(o4.mantras[0].text == "gate gate");
  assert(h4.log_level == spdlog::level::warn);
  assert(warnings.size() == 1);
  assert(warnings[0] == "mminer_host_rc:2: unknown command: nonsense");

  // the default rc is used when no explicit one is given
  MinerOptions o5;
  HostSettings h5;
  assert(prepare_host(std::nullopt, rc, o5, h5, warnings, msg));
  assert(o5.mantras[0].text == "gate gate");
  std::filesystem::remove(rc);
}

static void test_file_logger() {
  HostSettings h;
  h.log_file = std::filesystem::temp_directory_path() / "mminer_test.log";
  h.log_level = spdlog::level::debug;
  std::filesystem::remove(h.log_file);
  std::string msg;
  auto logger = make_file_logger("mminer_test_file", h, msg);
  assert(logger);
  assert(logger->level() == spdlog::level::debug);
  logger->debug("debug line");
  logger->info("round {} complete", 1);
  logger->flush();
  std::ifstream in(h.log_file);
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(text.find("round 1 complete") != std::string::npos);
  assert(text.find("debug line") != std::string::npos);
  spdlog::drop("mminer_test_file");
  std::filesystem::remove(h.log_file);

  HostSettings bad;
  // parent is a regular file, so the sink cannot create the log
  auto blocker = write_rc("mminer_log_blocker", "x");
  bad.log_file = blocker / "x.log";
  assert(!make_file_logger("mminer_test_bad", bad, msg));
  assert(msg.rfind("logging disabled:", 0) == 0);
  std::filesystem::remove(blocker);
}

static void test_default_path() {
  auto p = default_config_path();
  if (p) assert(p->filename() == MM_RC_NAME);
}

int main() {
  test_commands();
  test_rejections();
  test_load_file();
  test_prepare_host();
  test_file_logger();
  test_default_path();
  return 0;
}
