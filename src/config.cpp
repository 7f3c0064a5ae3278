#include "config.hpp"
#include "file_io.hpp"
#include "setting_registry.hpp"
#include <cctype>
#include <cstdlib>
#include <sstream>

static bool parse_on_off(const std::string& name,
                         const std::vector<std::string>& args,
                         bool& out,
                         std::string& msg) {
  if (args.empty()) { out = !out; msg = name + (out ? " on" : " off"); return true; }
  if (args[0] == "on") { out = true; msg = name + " on"; return true; }
  if (args[0] == "off") { out = false; msg = name + " off"; return true; }
  msg = "set " + name + ": use set " + name + " on|off";
  return false;
}

static SettingRegistry make_registry(SelectorConfig& cfg) {
  SettingRegistry registry;
  registry.register_setting("editor", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set editor: use set editor <command>"; return false; }
    std::string joined;
    for (size_t i = 0; i < args.size(); ++i) { if (i) joined += ' '; joined += args[i]; }
    cfg.editor = joined;
    msg = "editor " + joined;
    return true;
  });
  registry.register_setting("agent", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set agent: use set agent <command>"; return false; }
    std::string joined;
    for (size_t i = 0; i < args.size(); ++i) { if (i) joined += ' '; joined += args[i]; }
    cfg.agent = joined;
    msg = "agent " + joined;
    return true;
  });
  registry.register_setting("log", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set log: use set log <path>"; return false; }
    cfg.log_path = args[0];
    msg = "log " + args[0];
    return true;
  });
  registry.register_setting("user", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set user: use set user <name>"; return false; }
    cfg.user = args[0];
    msg = "user " + args[0];
    return true;
  });
  registry.register_setting("statusseconds", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { msg = "set statusseconds: use set statusseconds <seconds>"; return false; }
    const std::string& s = args[0];
    bool digits = !s.empty();
    for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) { digits = false; break; }
    if (!digits || s.size() > 6) { msg = "set statusseconds: value must be a number"; return false; }
    int v = std::stoi(s);
    if (v < 1) { msg = "set statusseconds: value must be >= 1"; return false; }
    cfg.status_seconds = v;
    msg = "statusseconds " + s;
    return true;
  });
  registry.register_setting("hideresolved", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    return parse_on_off("hideresolved", args, cfg.hide_resolved, msg);
  });
  registry.register_setting("debug", [&cfg](const std::vector<std::string>& args, std::string& msg) {
    return parse_on_off("debug", args, cfg.debug, msg);
  });
  return registry;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

bool apply_config_line(SelectorConfig& cfg, const std::string& line, std::string& msg) {
  std::string s = trim(line);
  msg.clear();
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());

  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd != "set" || args.empty()) { msg = "unknown command: " + cmd; return false; }

  std::string name = args[0];
  std::string value;
  size_t eq = name.find('=');
  if (eq != std::string::npos) {
    value = name.substr(eq + 1);
    name = name.substr(0, eq);
  }
  std::vector<std::string> subargs;
  if (!value.empty()) subargs.push_back(value);
  for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);

  SettingRegistry registry = make_registry(cfg);
  return registry.execute(name, subargs, msg);
}

bool load_config_file(const std::filesystem::path& path,
                      SelectorConfig& cfg,
                      std::vector<std::string>& messages) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines; std::string msg;
  if (!read_file_lines(path, lines, msg)) { messages.push_back(msg); return false; }
  bool all_ok = true;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string m;
    if (!apply_config_line(cfg, lines[i], m)) {
      messages.push_back(path.filename().string() + ":" + std::to_string(i + 1) + ": " + m);
      all_ok = false;
    }
  }
  return all_ok;
}

void apply_environment(SelectorConfig& cfg) {
  if (const char* ed = std::getenv("EDITOR"); ed && *ed) cfg.editor = ed;
  if (const char* ag = std::getenv(MS_ENV_AGENT); ag && *ag) cfg.agent = ag;
  if (const char* lg = std::getenv(MS_ENV_LOG); lg && *lg) cfg.log_path = lg;
  if (const char* us = std::getenv(MS_ENV_USER); us && *us) cfg.user = us;
  if (cfg.user.empty()) {
    const char* login = std::getenv("USER");
    cfg.user = (login && *login) ? login : MS_DEFAULT_USER;
  }
}

SelectorConfig load_config(std::vector<std::string>& messages) {
  SelectorConfig cfg;
  if (const char* home = std::getenv("HOME"); home && *home) {
    load_config_file(std::filesystem::path(home) / MS_RC_NAME, cfg, messages);
  }
  apply_environment(cfg);
  return cfg;
}
