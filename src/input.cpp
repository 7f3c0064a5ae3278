#include "input.hpp"

std::string key_name(int key) {
  switch (key) {
    case keys::None: return "";
    case keys::CtrlB: return "ctrl+b";
    case keys::CtrlC: return "ctrl+c";
    case keys::CtrlF: return "ctrl+f";
    case keys::Tab: return "tab";
    case keys::Enter: return "enter";
    case keys::Esc: return "esc";
    case keys::Backspace: return "backspace";
    case keys::Up: return "up";
    case keys::Down: return "down";
    case keys::Left: return "left";
    case keys::Right: return "right";
    case keys::PageUp: return "pgup";
    case keys::PageDown: return "pgdown";
    case keys::Home: return "home";
    case keys::End: return "end";
    case keys::Resize: return "resize";
    default: break;
  }
  if (key == ' ') return "space";
  if (is_printable_key(key)) return std::string(1, static_cast<char>(key));
  return "key(" + std::to_string(key) + ")";
}

int key_from_name(const std::string& name) {
  if (name.empty()) return keys::None;
  if (name.size() == 1) return static_cast<unsigned char>(name[0]);
  static const int candidates[] = {
    keys::CtrlB, keys::CtrlC, keys::CtrlF, keys::Tab, keys::Enter, keys::Esc, keys::Backspace,
    keys::Up, keys::Down, keys::Left, keys::Right, keys::PageUp, keys::PageDown, keys::Home, keys::End,
  };
  for (int k : candidates) if (key_name(k) == name) return k;
  if (name == "space") return ' ';
  return keys::None;
}

bool is_printable_key(int key) {
  return key >= 0x20 && key < 0x7f;
}

Input::Result Input::consume(int key) {
  if (key == keys::Enter) return Result::Accepted;
  if (key == keys::Esc) { text_.clear(); return Result::Cancelled; }
  if (key == keys::Backspace) {
    if (!text_.empty()) text_.pop_back();
    return Result::Editing;
  }
  if (is_printable_key(key)) text_.push_back(static_cast<char>(key));
  return Result::Editing;
}
