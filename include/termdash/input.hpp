#pragma once

#include <string>
#include <vector>

namespace termdash {

enum class KeyCode {
    Char,
    Up,
    Down,
    Left,
    Right,
    Enter,
    Escape,
    Backspace,
    Delete,
    Tab,
    Unknown
};

enum class KeyKind {
    Press,
    Release
};

struct KeyEvent {
    KeyCode code = KeyCode::Unknown;
    char ch = '\0';                          // Set for KeyCode::Char; may be one byte of UTF-8
    KeyKind kind = KeyKind::Press;

    static KeyEvent character(char c) { return {KeyCode::Char, c, KeyKind::Press}; }
    static KeyEvent key(KeyCode code) { return {code, '\0', KeyKind::Press}; }
};

// Decode every key in a burst of raw-mode terminal input, in order.
// A sequence cut off at the end decodes as Escape for a lone ESC and as
// Unknown otherwise.
std::vector<KeyEvent> decode_keys(const std::string& bytes);

// True if `bytes` ends inside an escape sequence: a lone ESC, or ESC [ / ESC O
// still waiting for its final byte
bool has_partial_escape(const std::string& bytes);

} // namespace termdash
