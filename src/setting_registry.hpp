#pragma once
/*
 * SettingRegistry
 *
 * Purpose: register and dispatch `set <name>` lines from the rc file.
 * Design: map name -> handler (args vector, message out); loader parses and routes.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class SettingRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_setting(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool has(const std::string& name) const { return map_.count(name) != 0; }
  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown setting: " + name; return false; }
    return it->second(args, msg);
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
