#include "terminal.hpp"

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <poll.h>
#include <signal.h>
#include <cerrno>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

int term_height() {
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    return 24;
}

bool is_interactive() {
    return isatty(STDIN_FILENO) && isatty(STDOUT_FILENO);
}

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
    bool saved = false;
};

RawModeGuard::RawModeGuard() : impl_(new Impl) {
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) return;
    impl_->saved = true;
    struct termios raw = impl_->old_term;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        if (impl_->saved)
            tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

// ── stdin ────────────────────────────────────────────────────

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN);
}

int read_byte() {
    unsigned char c;
    ssize_t n;
    do {
        n = read(STDIN_FILENO, &c, 1);
    } while (n < 0 && errno == EINTR);
    return n == 1 ? c : -1;
}

void flush_stdin() {
    tcflush(STDIN_FILENO, TCIFLUSH);
}

// ── Resize tracking ──────────────────────────────────────────

static volatile sig_atomic_t g_resize_flag = 0;
static struct sigaction g_old_sa;

static void sigwinch_handler(int) {
    g_resize_flag = 1;
}

void watch_terminal_resize() {
    g_resize_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigwinch_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGWINCH, &sa, &g_old_sa);
}

void unwatch_terminal_resize() {
    sigaction(SIGWINCH, &g_old_sa, nullptr);
}

bool take_resize() {
    if (!g_resize_flag) return false;
    g_resize_flag = 0;
    return true;
}

// ── Interrupt tracking ───────────────────────────────────────

static volatile sig_atomic_t g_interrupt_flag = 0;
static struct sigaction g_old_int_sa;
static struct sigaction g_old_term_sa;

static void interrupt_handler(int) {
    g_interrupt_flag = 1;
}

void watch_interrupts() {
    g_interrupt_flag = 0;

    struct sigaction sa;
    sa.sa_handler = interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &g_old_int_sa);
    sigaction(SIGTERM, &sa, &g_old_term_sa);
}

void unwatch_interrupts() {
    sigaction(SIGINT, &g_old_int_sa, nullptr);
    sigaction(SIGTERM, &g_old_term_sa, nullptr);
}

bool interrupted() {
    return g_interrupt_flag != 0;
}

} // namespace platform
