#pragma once
/*
 * Input
 *
 * Purpose: backend-independent key codes plus the small line editor used by the `/` filter.
 * Codes: printable ASCII as itself, control keys as their byte, special keys above 0x10000.
 */
#include <string>

namespace keys {
constexpr int None = -1;
constexpr int CtrlB = 2;
constexpr int CtrlC = 3;
constexpr int CtrlF = 6;
constexpr int Tab = 9;
constexpr int Enter = '\n';
constexpr int Esc = 27;
constexpr int Backspace = 127;
constexpr int Up = 0x10001;
constexpr int Down = 0x10002;
constexpr int Left = 0x10003;
constexpr int Right = 0x10004;
constexpr int PageUp = 0x10005;
constexpr int PageDown = 0x10006;
constexpr int Home = 0x10007;
constexpr int End = 0x10008;
constexpr int Resize = 0x10009;
}

// "enter", "esc", "ctrl+c", "up", ... or the character itself
std::string key_name(int key);

// Inverse of key_name for option labels: "tab" -> keys::Tab, "r" -> 'r', unknown -> keys::None.
int key_from_name(const std::string& name);

bool is_printable_key(int key);

class Input {
public:
  enum class Result { Editing, Accepted, Cancelled };
  // Printable keys append, Backspace deletes, Enter accepts, Esc cancels (and clears).
  Result consume(int key);
  const std::string& text() const { return text_; }
  void set_text(const std::string& s) { text_ = s; }
  void reset() { text_.clear(); }
private:
  std::string text_;
};
