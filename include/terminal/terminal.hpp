#pragma once

/**
 * Terminal output collaborator
 *
 * Thin wrapper over VT100/xterm escape sequences. Everything is written to a
 * caller-supplied std::ostream so rendering can be captured in tests.
 * Coordinates are 0-based; the escape sequences are 1-based.
 */

#include <ostream>
#include <string>

namespace pipeview {
namespace terminal {

namespace term {
constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* DIM = "\033[2m";
constexpr const char* REVERSE = "\033[7m";
constexpr const char* CLEAR = "\033[2J";
constexpr const char* HOME = "\033[H";
constexpr const char* HIDE_CURSOR = "\033[?25l";
constexpr const char* SHOW_CURSOR = "\033[?25h";
constexpr const char* SAVE_CURSOR = "\0337";
constexpr const char* RESTORE_CURSOR = "\0338";
constexpr const char* ALT_SCREEN_ON = "\033[?1049h";
constexpr const char* ALT_SCREEN_OFF = "\033[?1049l";
} // namespace term

struct TermSize {
    int rows;
    int cols;
};

/**
 * Query the size of the terminal behind `fd` (TIOCGWINSZ).
 * Returns false and leaves `out` untouched if `fd` is not a terminal.
 */
bool query_size(int fd, TermSize& out);

/**
 * Size of `fd`, or the configured fallback (24x80) when it cannot be queried.
 */
TermSize query_size_or_default(int fd);

class Screen {
public:
    explicit Screen(std::ostream& out, bool use_colors = true) : out_(out), use_colors_(use_colors) {}

    void enter_alternate_screen() { out_ << term::ALT_SCREEN_ON; }
    void exit_alternate_screen() { out_ << term::ALT_SCREEN_OFF; }
    void hide_cursor() { out_ << term::HIDE_CURSOR; }
    void show_cursor() { out_ << term::SHOW_CURSOR; }
    void save_cursor() { out_ << term::SAVE_CURSOR; }
    void restore_cursor() { out_ << term::RESTORE_CURSOR; }
    void clear() { out_ << term::CLEAR << term::HOME; }

    void move_to(int row, int col) { out_ << "\033[" << (row + 1) << ';' << (col + 1) << 'H'; }

    // Attribute codes are suppressed when colors are off
    void bold() { attr(term::BOLD); }
    void dim() { attr(term::DIM); }
    void reverse() { attr(term::REVERSE); }
    void reset() { attr(term::RESET); }

    void write(const std::string& text) { out_ << text; }
    void flush() { out_.flush(); }

    bool use_colors() const { return use_colors_; }

private:
    std::ostream& out_;
    bool use_colors_;

    void attr(const char* code) {
        if (use_colors_) out_ << code;
    }
};

/**
 * Alternate screen + hidden cursor for the lifetime of the object.
 *
 * restore() is idempotent and also runs from the destructor, so the user's
 * screen comes back on every exit path that unwinds the stack.
 */
class ScreenSession {
public:
    explicit ScreenSession(Screen& screen);
    ~ScreenSession();

    ScreenSession(const ScreenSession&) = delete;
    ScreenSession& operator=(const ScreenSession&) = delete;

    void restore();
    bool active() const { return active_; }

private:
    Screen& screen_;
    bool active_;
};

}  // namespace terminal
}  // namespace pipeview
