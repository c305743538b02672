#pragma once

/**
 * System utilities for pipeview
 *
 * Process-level checks and terminal device access. Linux/POSIX only.
 */

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <unistd.h>

namespace pipeview {
namespace util {

/**
 * True if `fd` is connected to a terminal.
 *
 * The pager needs stdin to be a pipe or a redirected file; an interactive
 * stdin is a usage error.
 */
inline bool is_interactive(int fd) {
    return isatty(fd) == 1;
}

/**
 * Open the controlling terminal for keyboard input while stdin carries data.
 *
 * @return fd opened read-only with O_CLOEXEC, or -1 (reason on stderr)
 */
inline int open_controlling_tty(const char* path = "/dev/tty") {
    int fd = ::open(path, O_RDONLY | O_CLOEXEC | O_NOCTTY);
    if (fd < 0) {
        std::cerr << "pipeview: cannot open " << path << ": " << std::strerror(errno) << "\n";
    }
    return fd;
}

/**
 * Closes an fd on scope exit.
 */
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) ::close(fd_);
    }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

}  // namespace util
}  // namespace pipeview
