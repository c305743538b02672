#pragma once

/**
 * Renderer - full redraw of the pager screen
 *
 * Layout for a terminal of R rows and C columns:
 *   rows 0 .. R-3   tail of the filtered view, "<label> <text>" per row
 *   row  R-2        separator
 *   row  R-1        prompt: "filter> " + filter text + cursor marker,
 *                   padded to C or cut with "..."
 *
 * Labels are zero-padded to the digit count of the whole buffer so they line
 * up while the filter changes.
 */

#include "line_buffer.hpp"
#include "../terminal/terminal.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace pipeview {
namespace pager {

struct RenderOptions {
    std::string prompt = "filter> ";
    std::string cursor_marker = "_";
    int tab_width = 4;
};

// Number of code points; every code point is taken as one column
size_t display_width(const std::string& text);

// Longest prefix of `text` that fits in `cols` columns, cut on a code point boundary
std::string truncate_to_width(const std::string& text, size_t cols);

// Tabs expanded to `tab_width` columns, other control bytes shown as '?'
std::string sanitize(const std::string& text, int tab_width);

std::string format_label(size_t index, int width);

std::string format_prompt(const std::string& prompt, const std::string& filter, const std::string& cursor_marker,
                          int cols);

// Rows of the filtered view that fit above the separator and prompt
size_t visible_count(size_t view_size, int rows);

class Renderer {
public:
    Renderer(terminal::Screen& screen, RenderOptions options) : screen_(screen), options_(std::move(options)) {}

    void draw(const LineBuffer& buffer, const std::vector<size_t>& view, const std::string& filter,
              const terminal::TermSize& size);

    uint64_t frames() const { return frames_; }

private:
    terminal::Screen& screen_;
    RenderOptions options_;
    uint64_t frames_ = 0;

    void draw_entry(int row, const LineEntry& entry, int label_width, int cols);
};

}  // namespace pager
}  // namespace pipeview
