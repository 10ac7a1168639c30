#include "ansi_screen.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <iostream>

namespace {

constexpr const char* kEnterAltScreen = "\033[?1049h\033[H\033[2J";
constexpr const char* kLeaveAltScreen = "\033[?1049l";
constexpr const char* kHideCursor     = "\033[?25l";
constexpr const char* kShowCursor     = "\033[?25h";
constexpr const char* kReset          = "\033[0m";

std::string sgr_for(unsigned attrs) {
    std::string sgr;
    if (attrs & kAttrUnderline) sgr += "\033[4m";
    if (attrs & kAttrStandout)  sgr += "\033[7m";
    return sgr;
}

} // namespace

AnsiScreen::AnsiScreen() {
    platform::flush_stdin();
    platform::watch_terminal_resize();
    platform::watch_interrupts();
    std::cout << kEnterAltScreen << kHideCursor << std::flush;
}

AnsiScreen::~AnsiScreen() {
    platform::unwatch_interrupts();
    platform::unwatch_terminal_resize();
    std::cout << kReset << kShowCursor << kLeaveAltScreen << std::flush;
}

void AnsiScreen::move(int row, int col) {
    pending_ += fmt::format("\033[{};{}H", row + 1, col + 1);
}

void AnsiScreen::clear_to_eol() {
    pending_ += "\033[K";
}

void AnsiScreen::clear_to_bottom() {
    pending_ += "\033[J";
}

void AnsiScreen::write(const std::string& text, unsigned attrs) {
    if (attrs == kAttrNone) {
        pending_ += text;
        return;
    }
    pending_ += sgr_for(attrs);
    pending_ += text;
    pending_ += kReset;
}

void AnsiScreen::write_at(int row, int col, const std::string& text, int width,
                          unsigned attrs) {
    int room = std::min(width, cols() - col);
    if (room <= 0 || row >= rows()) return;
    move(row, col);
    write(utf8_prefix(text, static_cast<size_t>(room)), attrs);
}

void AnsiScreen::refresh() {
    if (pending_.empty()) return;
    std::cout << pending_ << std::flush;
    pending_.clear();
}

int AnsiScreen::read_char(int timeout_ms) {
    if (platform::interrupted()) return kKeyEof;
    if (platform::take_resize()) return kKeyResize;
    if (!platform::poll_stdin(timeout_ms)) {
        if (platform::interrupted()) return kKeyEof;
        return platform::take_resize() ? kKeyResize : kKeyNone;
    }
    int c = platform::read_byte();
    return c < 0 ? kKeyEof : c;
}

int AnsiScreen::rows() const {
    return platform::term_height();
}

int AnsiScreen::cols() const {
    return platform::term_width();
}
