#pragma once

#include <string>
#include <platform/terminal.hpp>
#include "screen.hpp"

// Screen over a real terminal using ANSI escape sequences.
//
// Construction enters the alternate screen, hides the cursor and switches
// stdin to key-at-a-time input; destruction restores all three. Output is
// buffered and written to stdout in one piece on refresh().
class AnsiScreen : public Screen {
public:
    AnsiScreen();
    ~AnsiScreen() override;

    AnsiScreen(const AnsiScreen&) = delete;
    AnsiScreen& operator=(const AnsiScreen&) = delete;

    void move(int row, int col) override;
    void clear_to_eol() override;
    void clear_to_bottom() override;
    void write(const std::string& text, unsigned attrs = kAttrNone) override;
    void write_at(int row, int col, const std::string& text, int width,
                  unsigned attrs = kAttrNone) override;
    void refresh() override;

    int read_char(int timeout_ms) override;

    int rows() const override;
    int cols() const override;

private:
    platform::RawModeGuard raw_;
    std::string pending_;
};
