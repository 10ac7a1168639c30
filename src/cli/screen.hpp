#pragma once

#include <string>

// Text attributes understood by every Screen.
constexpr unsigned kAttrNone      = 0;
constexpr unsigned kAttrUnderline = 1u << 0;
constexpr unsigned kAttrStandout  = 1u << 1;

// Pseudo keys returned by read_char()
constexpr int kKeyNone   = -1;   // timed out
constexpr int kKeyEof    = -2;   // input closed or interrupted
constexpr int kKeyResize = -3;   // terminal size changed

// Terminal capability surface the dashboard draws through. Rows and columns
// are zero-based. Nothing becomes visible until refresh().
class Screen {
public:
    virtual ~Screen() = default;

    virtual void move(int row, int col) = 0;
    virtual void clear_to_eol() = 0;
    // Clear from the cursor to the end of the screen.
    virtual void clear_to_bottom() = 0;
    // Write at the cursor, advancing it.
    virtual void write(const std::string& text, unsigned attrs = kAttrNone) = 0;
    // Write at most `width` characters (code points) of text starting at
    // (row, col). A multi-byte character is never cut.
    virtual void write_at(int row, int col, const std::string& text, int width,
                          unsigned attrs = kAttrNone) = 0;
    virtual void refresh() = 0;

    // Wait up to timeout_ms for a key. Returns the key, or one of the
    // kKey* pseudo keys.
    virtual int read_char(int timeout_ms) = 0;

    virtual int rows() const = 0;
    virtual int cols() const = 0;
};
