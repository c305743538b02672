#include "../../include/input/key_reader.hpp"
#include "../../include/terminal/raw_mode.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace pipeview::input {

namespace LogCategory = logging::LogCategory;

KeyReader::KeyReader(int tty_fd, events::EventBus& bus, const events::CancellationToken& token,
                     logging::AsyncLogger* logger, int poll_interval_ms)
    : Producer(bus, token, logger, poll_interval_ms)
    , fd_(tty_fd)
    , keys_published_(0)
{}

void KeyReader::run() {
    PV_LOG_INFO(logger_, LogCategory::Keyboard, "key reader started on fd %d", fd_);

    while (!cancelled()) {
        if (!read_one()) break;
    }

    PV_LOG_INFO(logger_, LogCategory::Keyboard, "key reader stopped after %lu keys",
                static_cast<unsigned long>(keys_published_.load()));
}

bool KeyReader::read_one() {
    unsigned char byte = 0;
    {
        terminal::RawModeGuard raw(fd_);
        if (!raw.active() && !warned_not_tty_) {
            warned_not_tty_ = true;
            PV_LOG_WARN(logger_, LogCategory::Keyboard, "fd %d is not a terminal, reading bytes as-is", fd_);
        }

        struct pollfd pfd {};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int rc = ::poll(&pfd, 1, poll_interval_ms_);
        if (rc < 0) {
            if (errno == EINTR) return true;
            PV_LOG_ERROR(logger_, LogCategory::Keyboard, "poll failed: %s", std::strerror(errno));
            return false;
        }
        if (rc == 0) {
            decoder_.idle();
            return true;
        }
        if (pfd.revents & POLLNVAL) {
            PV_LOG_ERROR(logger_, LogCategory::Keyboard, "fd %d is not open", fd_);
            return false;
        }

        ssize_t n = ::read(fd_, &byte, 1);
        if (n == 0) {
            PV_LOG_WARN(logger_, LogCategory::Keyboard, "terminal input closed");
            return false;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return true;
            PV_LOG_ERROR(logger_, LogCategory::Keyboard, "read failed: %s", std::strerror(errno));
            return false;
        }

        if (!raw.restore()) {
            PV_LOG_ERROR(logger_, LogCategory::Keyboard, "could not restore terminal mode: %s",
                         std::strerror(errno));
        }
    }

    if (decoder_.feed(byte)) {
        // Counted before publishing so a consumer never sees the event ahead of the count
        keys_published_.fetch_add(1, std::memory_order_relaxed);
        bus_.publish(events::KeyEvent{byte});
    }
    return true;
}

}  // namespace pipeview::input
