#include "config.hpp"
#include "file_io.hpp"
#include "log.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

static void test_lines() {
  SelectorConfig cfg;
  std::string msg;
  assert(apply_config_line(cfg, "", msg));
  assert(apply_config_line(cfg, "# comment", msg));
  assert(apply_config_line(cfg, "\" vim style comment", msg));
  assert(apply_config_line(cfg, "// c style comment", msg));

  assert(apply_config_line(cfg, "set editor code -w", msg));
  assert(cfg.editor == "code -w");
  assert(apply_config_line(cfg, ":set agent=aider", msg));
  assert(cfg.agent == "aider");
  assert(apply_config_line(cfg, "  set statusseconds 5  ", msg));
  assert(cfg.status_seconds == 5);
  assert(apply_config_line(cfg, "set user carol", msg));
  assert(cfg.user == "carol");

  assert(cfg.hide_resolved);
  assert(apply_config_line(cfg, "set hideresolved off", msg));
  assert(!cfg.hide_resolved);
  assert(apply_config_line(cfg, "set hideresolved", msg));
  assert(cfg.hide_resolved && msg == "hideresolved on");
  assert(!apply_config_line(cfg, "set debug maybe", msg));
  assert(msg == "set debug: use set debug on|off");
  assert(!cfg.debug);
}

static void test_bad_lines() {
  SelectorConfig cfg;
  std::string msg;
  assert(!apply_config_line(cfg, "map x y", msg));
  assert(msg == "unknown command: map");
  assert(!apply_config_line(cfg, "set colour on", msg));
  assert(msg == "unknown setting: colour");
  assert(!apply_config_line(cfg, "set statusseconds 0", msg));
  assert(!apply_config_line(cfg, "set statusseconds soon", msg));
  assert(cfg.status_seconds == MS_STATUS_SECONDS);
  assert(!apply_config_line(cfg, "set editor", msg));
  assert(cfg.editor == MS_DEFAULT_EDITOR);
}

static void test_file() {
  std::filesystem::path dir = std::filesystem::temp_directory_path() / "mselect-config-test";
  std::filesystem::create_directories(dir);
  std::filesystem::path rc = dir / MS_RC_NAME;
  std::string msg;
  bool ok = write_file_atomic(rc, "# settings\nset agent claude --print\nset bogus 1\nset log /tmp/x.log\n", msg);
  assert(ok);

  SelectorConfig cfg;
  std::vector<std::string> messages;
  assert(!load_config_file(rc, cfg, messages));
  assert(messages.size() == 1);
  assert(messages[0] == std::string(MS_RC_NAME) + ":3: unknown setting: bogus");
  // the good lines around the bad one still apply
  assert(cfg.agent == "claude --print");
  assert(cfg.log_path == "/tmp/x.log");

  messages.clear();
  assert(load_config_file(dir / "missing", cfg, messages));
  assert(messages.empty());
  std::filesystem::remove_all(dir);
}

static void test_environment() {
  SelectorConfig cfg;
  setenv("EDITOR", "nano", 1);
  setenv(MS_ENV_AGENT, "my-agent", 1);
  setenv(MS_ENV_USER, "dana", 1);
  unsetenv(MS_ENV_LOG);
  apply_environment(cfg);
  assert(cfg.editor == "nano");
  assert(cfg.agent == "my-agent");
  assert(cfg.user == "dana");
  assert(cfg.log_path.empty());

  SelectorConfig fallback;
  unsetenv(MS_ENV_USER);
  setenv("USER", "erin", 1);
  apply_environment(fallback);
  assert(fallback.user == "erin");
  unsetenv("USER");
  SelectorConfig none;
  apply_environment(none);
  assert(none.user == MS_DEFAULT_USER);
}

static void test_logging() {
  std::string msg;
  assert(init_logging("", false, msg));
  auto log = category_logger("review");
  assert(log->name() == "review");
  assert(log->level() == spdlog::level::info);

  std::filesystem::path file = std::filesystem::temp_directory_path() / "mselect-test.log";
  std::filesystem::remove(file);
  assert(init_logging(file.string(), true, msg));
  auto dbg = category_logger("selector");
  assert(dbg->level() == spdlog::level::debug);
  dbg->warn("written");
  assert(std::filesystem::exists(file));
  std::string text;
  assert(read_file_text(file, text, msg));
  assert(text.find("[selector] [warning] written") != std::string::npos);

  assert(!init_logging("/dev/null/mselect.log", false, msg));
  assert(msg.rfind("log disabled: ", 0) == 0);
  std::filesystem::remove(file);
}

int main() {
  test_lines();
  test_bad_lines();
  test_file();
  test_environment();
  test_logging();
  return 0;
}
