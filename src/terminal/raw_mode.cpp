#include "../../include/terminal/raw_mode.hpp"

#include <cerrno>
#include <unistd.h>

namespace pipeview::terminal {

RawModeGuard::RawModeGuard(int fd)
    : fd_(fd)
    , active_(false)
{
    if (tcgetattr(fd_, &saved_) != 0) return;

    struct termios raw = saved_;
    raw.c_lflag &= ~(ICANON | ECHO | IEXTEN);
    raw.c_iflag &= ~(IXON | ICRNL);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;

    if (tcsetattr(fd_, TCSANOW, &raw) == 0) {
        active_ = true;
    }
}

RawModeGuard::~RawModeGuard() {
    restore();
}

bool RawModeGuard::restore() {
    if (!active_) return true;

    // Retry on EINTR; any other failure leaves nothing more to try
    int rc;
    do {
        rc = tcsetattr(fd_, TCSANOW, &saved_);
    } while (rc != 0 && errno == EINTR);

    active_ = false;
    return rc == 0;
}

}  // namespace pipeview::terminal
