#include "../../include/terminal/terminal.hpp"
#include "../../include/config/defaults.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

namespace pipeview::terminal {

bool query_size(int fd, TermSize& out) {
    struct winsize w {};
    if (ioctl(fd, TIOCGWINSZ, &w) != 0) return false;
    if (w.ws_row == 0 || w.ws_col == 0) return false;

    out.rows = w.ws_row;
    out.cols = w.ws_col;
    return true;
}

TermSize query_size_or_default(int fd) {
    TermSize size{config::display::FALLBACK_ROWS, config::display::FALLBACK_COLS};
    query_size(fd, size);
    return size;
}

// =============================================================================
// ScreenSession
// =============================================================================

ScreenSession::ScreenSession(Screen& screen)
    : screen_(screen)
    , active_(true)
{
    screen_.save_cursor();
    screen_.enter_alternate_screen();
    screen_.hide_cursor();
    screen_.clear();
    screen_.flush();
}

ScreenSession::~ScreenSession() {
    restore();
}

void ScreenSession::restore() {
    if (!active_) return;
    active_ = false;

    screen_.reset();
    screen_.show_cursor();
    screen_.exit_alternate_screen();
    screen_.restore_cursor();
    screen_.flush();
}

}  // namespace pipeview::terminal
