#pragma once

namespace platform {

// Get terminal dimensions.
int term_width();
int term_height();

// True when stdin and stdout are both attached to a terminal.
bool is_interactive();

// RAII guard for key-at-a-time input.
// Constructor saves the current mode and turns off canonical mode and echo
// (signals stay enabled; see watch_interrupts).
// Destructor restores the saved mode.
struct RawModeGuard {
    RawModeGuard();
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Poll stdin for input readability with a timeout.
// Returns true if stdin has data to read.
bool poll_stdin(int timeout_ms);

// Read one byte from stdin. Returns -1 on EOF or error.
int read_byte();

// Flush any pending input from stdin.
void flush_stdin();

// SIGWINCH tracking. take_resize() returns true once per resize.
void watch_terminal_resize();
void unwatch_terminal_resize();
bool take_resize();

// SIGINT/SIGTERM tracking, so Ctrl+C ends the input loop and the screen
// guards still run. interrupted() stays true once set.
void watch_interrupts();
void unwatch_interrupts();
bool interrupted();

} // namespace platform
