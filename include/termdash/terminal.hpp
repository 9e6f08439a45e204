#pragma once

#include "termdash/input.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>
#include <termios.h>

namespace termdash {

class TerminalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TerminalSize {
    int rows = 24;
    int cols = 80;
};

// Owns raw input mode, the hidden cursor and the alternate screen.
// The destructor puts all of it back; restore_terminal() does the same from
// signal handlers and atexit.
class TerminalSession {
public:
    TerminalSession();
    ~TerminalSession();

    TerminalSession(const TerminalSession&) = delete;
    TerminalSession& operator=(const TerminalSession&) = delete;

    // Wait up to `timeout` for input and return every key it held.
    // Empty on timeout or interruption.
    std::vector<KeyEvent> poll_keys(std::chrono::milliseconds timeout);

    void write(const std::string& data);

    TerminalSize size() const;

private:
    termios saved_{};
};

// How long a trailing ESC waits for the rest of its sequence
constexpr std::chrono::milliseconds kEscapeWait{25};

// Wait up to `timeout` for input on `fd`, read the burst and decode all of it.
// A burst ending inside an escape sequence is completed by reads of up to
// kEscapeWait each. Throws TerminalError on read errors or hangup.
std::vector<KeyEvent> read_keys(int fd, std::chrono::milliseconds timeout);

// Async-signal-safe: leave the alternate screen, show the cursor, restore termios
void restore_terminal();

// Restore the terminal before the default action of fatal signals
void install_crash_handlers();

} // namespace termdash
