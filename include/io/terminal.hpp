#pragma once

#include <string>

#include <termios.h>

namespace branchsweep::io {

bool isTerminal(int fd);

// True when stdout is a terminal that understands ANSI escapes and the user
// has not opted out through NO_COLOR.
bool supportsColor();

unsigned int terminalRows();
unsigned int terminalColumns();

// Puts a terminal descriptor in non-canonical, no-echo mode for the guard's
// lifetime. Signals are disabled too, so Ctrl-C arrives as a byte.
class RawModeGuard {
public:
    explicit RawModeGuard(int fd);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard &) = delete;
    RawModeGuard &operator=(const RawModeGuard &) = delete;

    bool active() const { return active_; }

private:
    int fd_;
    bool active_ = false;
    termios saved_{};
};

// Reads one keypress. Escape sequences (arrows) are returned whole; an empty
// string means end of input.
std::string readKeySequence(int fd);

} // namespace branchsweep::io
