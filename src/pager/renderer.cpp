#include "../../include/pager/renderer.hpp"
#include "../../include/config/defaults.hpp"

#include <algorithm>
#include <cstdio>

namespace pipeview::pager {

namespace {
constexpr const char* SEPARATOR = "─";

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}
} // namespace

size_t display_width(const std::string& text) {
    size_t width = 0;
    for (unsigned char c : text) {
        if (!is_continuation(c)) ++width;
    }
    return width;
}

std::string truncate_to_width(const std::string& text, size_t cols) {
    size_t width = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (is_continuation(static_cast<unsigned char>(text[i]))) continue;
        if (width == cols) return text.substr(0, i);
        ++width;
    }
    return text;
}

std::string sanitize(const std::string& text, int tab_width) {
    std::string out;
    out.reserve(text.size());

    size_t column = 0;
    for (unsigned char c : text) {
        if (c == '\t' && tab_width > 0) {
            size_t pad = static_cast<size_t>(tab_width) - (column % static_cast<size_t>(tab_width));
            out.append(pad, ' ');
            column += pad;
            continue;
        }
        if (c < 32 || c == 127) {
            out.push_back('?');
        } else {
            out.push_back(static_cast<char>(c));
        }
        if (!is_continuation(c)) ++column;
    }
    return out;
}

std::string format_label(size_t index, int width) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%0*zu", width, index);
    return buf;
}

std::string format_prompt(const std::string& prompt, const std::string& filter, const std::string& cursor_marker,
                          int cols) {
    if (cols <= 0) return std::string();

    std::string full = prompt + filter + cursor_marker;
    size_t width = display_width(full);
    size_t limit = static_cast<size_t>(cols);

    if (width > limit) {
        const std::string ellipsis = config::display::ELLIPSIS;
        if (limit <= ellipsis.size()) return truncate_to_width(full, limit);
        return truncate_to_width(full, limit - ellipsis.size()) + ellipsis;
    }
    return full + std::string(limit - width, ' ');
}

size_t visible_count(size_t view_size, int rows) {
    if (rows <= 2) return 0;
    return std::min(view_size, static_cast<size_t>(rows - 2));
}

void Renderer::draw(const LineBuffer& buffer, const std::vector<size_t>& view, const std::string& filter,
                    const terminal::TermSize& size) {
    screen_.clear();

    const int label_width = buffer.label_width();
    const size_t count = visible_count(view.size(), size.rows);
    const size_t first = view.size() - count;

    for (size_t i = 0; i < count; ++i) {
        draw_entry(static_cast<int>(i), buffer.at(view[first + i]), label_width, size.cols);
    }

    if (size.rows >= 2) {
        screen_.move_to(size.rows - 2, 0);
        std::string rule;
        rule.reserve(static_cast<size_t>(std::max(size.cols, 0)) * 3);
        for (int c = 0; c < size.cols; ++c) rule += SEPARATOR;
        screen_.dim();
        screen_.write(rule);
        screen_.reset();
    }

    if (size.rows >= 1) {
        screen_.move_to(size.rows - 1, 0);
        screen_.write(format_prompt(options_.prompt, filter, options_.cursor_marker, size.cols));
    }

    screen_.flush();
    ++frames_;
}

void Renderer::draw_entry(int row, const LineEntry& entry, int label_width, int cols) {
    if (cols <= 0) return;

    screen_.move_to(row, 0);

    std::string label = format_label(entry.index, label_width);
    screen_.dim();
    screen_.write(truncate_to_width(label, static_cast<size_t>(cols)));
    screen_.reset();

    int text_cols = cols - label_width - 1;
    if (text_cols <= 0) return;

    screen_.write(" ");
    std::string text = truncate_to_width(sanitize(entry.text, options_.tab_width), static_cast<size_t>(text_cols));
    if (entry.end_marker) {
        screen_.reverse();
        screen_.bold();
        screen_.write(text);
        screen_.reset();
    } else {
        screen_.write(text);
    }
}

}  // namespace pipeview::pager
