#pragma once

#include <algorithm>
#include <deque>
#include <string>
#include <vector>
#include <cli/screen.hpp>
#include <core/utils.hpp>

// In-memory Screen: a byte grid plus a scripted key queue. Attributes are
// not stored on cells; underlined and standout writes are recorded. Every
// write is also kept in `writes`, so multi-byte text can be checked whole.
class FakeScreen : public Screen {
public:
    explicit FakeScreen(int rows = 30, int cols = 120)
        : rows_(rows), cols_(cols), grid_(rows, std::string(cols, ' ')) {}

    void move(int row, int col) override {
        row_ = row;
        col_ = col;
    }

    void clear_to_eol() override {
        if (row_ < 0 || row_ >= rows_ || col_ >= cols_) return;
        std::fill(grid_[row_].begin() + col_, grid_[row_].end(), ' ');
    }

    void clear_to_bottom() override {
        clear_to_eol();
        for (int r = row_ + 1; r < rows_; ++r) {
            grid_[r].assign(cols_, ' ');
        }
    }

    void write(const std::string& text, unsigned attrs = kAttrNone) override {
        writes.push_back(text);
        if (attrs & kAttrUnderline) underlined.push_back(text);
        if (attrs & kAttrStandout) standout.push_back(text);
        for (char ch : text) {
            if (row_ >= 0 && row_ < rows_ && col_ >= 0 && col_ < cols_) {
                grid_[row_][col_] = ch;
            }
            ++col_;
        }
    }

    void write_at(int row, int col, const std::string& text, int width,
                  unsigned attrs = kAttrNone) override {
        int room = std::min(width, cols_ - col);
        if (room <= 0) return;
        move(row, col);
        write(utf8_prefix(text, static_cast<size_t>(room)), attrs);
    }

    void refresh() override { ++refreshes; }

    int read_char(int) override {
        if (keys.empty()) return kKeyEof;
        int k = keys.front();
        keys.pop_front();
        return k;
    }

    int rows() const override { return rows_; }
    int cols() const override { return cols_; }

    // Row contents with trailing blanks removed.
    std::string row_text(int row) const {
        std::string s = grid_.at(row);
        s.erase(s.find_last_not_of(' ') + 1);
        return s;
    }

    // Text in [col, col + width) of a row, trailing blanks removed.
    std::string cell(int row, int col, int width) const {
        std::string s = grid_.at(row).substr(col, width);
        s.erase(s.find_last_not_of(' ') + 1);
        return s;
    }

    // Non-blank rows from `first` to the bottom.
    int non_blank_rows(int first) const {
        int n = 0;
        for (int r = first; r < rows_; ++r) {
            if (!row_text(r).empty()) ++n;
        }
        return n;
    }

    void fill_row(int row, const std::string& text) {
        grid_.at(row).replace(0, std::min<size_t>(text.size(), cols_), text);
    }

    std::deque<int> keys;
    std::vector<std::string> underlined;
    std::vector<std::string> standout;
    std::vector<std::string> writes;
    int refreshes = 0;

private:
    int rows_;
    int cols_;
    int row_ = 0;
    int col_ = 0;
    std::vector<std::string> grid_;
};
