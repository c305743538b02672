#pragma once

#include <termios.h>

namespace pipeview {
namespace terminal {

/**
 * Scope-bound raw mode for one terminal fd.
 *
 * The constructor saves the current mode and switches to unbuffered, unechoed
 * input; the destructor puts the saved mode back. Signal keys (Ctrl+C) still
 * raise SIGINT so an interrupt reaches the controller.
 *
 * On a non-terminal fd nothing is changed and active() is false.
 */
class RawModeGuard {
public:
    explicit RawModeGuard(int fd);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    bool active() const { return active_; }

    // Restore now instead of at scope exit; false if tcsetattr failed
    bool restore();

private:
    int fd_;
    bool active_;
    struct termios saved_ {};
};

}  // namespace terminal
}  // namespace pipeview
