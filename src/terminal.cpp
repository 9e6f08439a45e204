#include "termdash/terminal.hpp"
#include "termdash/metrics_collector.hpp"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace termdash {

namespace {

std::atomic<bool> g_session_active{false};
termios g_saved_termios{};

constexpr char kEnterScreen[] = "\033[?1049h\033[?25l\033[2J\033[H";
constexpr char kLeaveScreen[] = "\033[0m\033[?25h\033[?1049l";

void best_effort_write(const char* buf, size_t len) {
    if (::write(STDOUT_FILENO, buf, len) < 0) { /* nothing left to report to */ }
}

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

// False on timeout or interruption
bool wait_readable(int fd, std::chrono::milliseconds timeout) {
    struct pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int rv = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rv < 0) {
        if (errno == EINTR) {
            return false;
        }
        throw TerminalError(errno_message("poll"));
    }
    if (rv == 0) {
        return false;
    }
    // Buffered input is still read after the other end hangs up
    if (pfd.revents & POLLIN) {
        return true;
    }
    throw TerminalError("terminal input closed");
}

// Append what is available to `pending`; false if nothing was read
bool read_available(int fd, std::string& pending) {
    char buf[64];
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return false;
        }
        throw TerminalError(errno_message("read"));
    }
    pending.append(buf, static_cast<size_t>(n));
    return n > 0;
}

void on_fatal_signal(int signal) {
    restore_terminal();
    std::signal(signal, SIG_DFL);
    std::raise(signal);
}

} // namespace

std::vector<KeyEvent> read_keys(int fd, std::chrono::milliseconds timeout) {
    std::string pending;
    if (!wait_readable(fd, timeout) || !read_available(fd, pending)) {
        return {};
    }

    // Arrow keys can arrive split across reads
    while (has_partial_escape(pending) && wait_readable(fd, kEscapeWait)) {
        if (!read_available(fd, pending)) {
            break;
        }
    }
    return decode_keys(pending);
}

void restore_terminal() {
    if (!g_session_active.exchange(false)) {
        return;
    }
    best_effort_write(kLeaveScreen, sizeof(kLeaveScreen) - 1);
    tcsetattr(STDIN_FILENO, TCSANOW, &g_saved_termios);
}

void install_crash_handlers() {
    for (int signal : {SIGSEGV, SIGABRT, SIGBUS, SIGFPE, SIGILL}) {
        std::signal(signal, on_fatal_signal);
    }
    std::atexit(restore_terminal);
}

TerminalSession::TerminalSession() {
    if (::isatty(STDIN_FILENO) != 1 || ::isatty(STDOUT_FILENO) != 1) {
        throw TerminalError("stdin and stdout must be a terminal");
    }
    if (tcgetattr(STDIN_FILENO, &saved_) != 0) {
        throw TerminalError(errno_message("tcgetattr"));
    }

    // Keep ISIG so Ctrl+C still arrives as SIGINT
    termios raw = saved_;
    raw.c_lflag &= ~(ICANON | ECHO | IEXTEN);
    raw.c_iflag &= ~(IXON | ICRNL);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
        throw TerminalError(errno_message("tcsetattr"));
    }

    g_saved_termios = saved_;
    g_session_active = true;
    best_effort_write(kEnterScreen, sizeof(kEnterScreen) - 1);
    DebugLogger::log("terminal: raw mode and alternate screen on");
}

TerminalSession::~TerminalSession() {
    restore_terminal();
    DebugLogger::log("terminal: restored");
}

std::vector<KeyEvent> TerminalSession::poll_keys(std::chrono::milliseconds timeout) {
    return read_keys(STDIN_FILENO, timeout);
}

void TerminalSession::write(const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::write(STDOUT_FILENO, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw TerminalError(errno_message("write"));
        }
        offset += static_cast<size_t>(n);
    }
}

TerminalSize TerminalSession::size() const {
    TerminalSize size;
    struct winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
        size.rows = ws.ws_row;
        size.cols = ws.ws_col;
    }
    return size;
}

} // namespace termdash
