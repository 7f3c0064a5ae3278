#pragma once
/*
 * KeyMap
 *
 * Purpose: bind key codes to actions and dispatch them.
 * Design: map key -> handler(View it was pressed in); only enabled actions get a binding,
 *         so an unbound key is a silent no-op.
 */
#include "types.hpp"
#include <functional>
#include <string>
#include <unordered_map>

class KeyMap {
public:
  using Handler = std::function<void(View)>;
  void bind(int key, std::string action, Handler h) {
    map_[key] = Entry{std::move(action), std::move(h)};
  }
  bool bound(int key) const { return map_.count(key) != 0; }
  // action name for logging; empty when unbound
  std::string action(int key) const {
    auto it = map_.find(key);
    return it == map_.end() ? std::string() : it->second.action;
  }
  bool dispatch(int key, View view) const {
    auto it = map_.find(key);
    if (it == map_.end()) return false;
    it->second.handler(view);
    return true;
  }
  size_t size() const { return map_.size(); }
private:
  struct Entry { std::string action; Handler handler; };
  std::unordered_map<int, Entry> map_;
};
