#include "../../include/input/signal_notifier.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace pipeview::input {

namespace LogCategory = logging::LogCategory;

namespace {
// Write end of the active notifier's pipe; read from the signal handler
std::atomic<int> g_signal_write_fd{-1};
static_assert(std::atomic<int>::is_always_lock_free, "signal handler needs a lock-free fd slot");
} // namespace

void SignalNotifier::on_signal(int sig) {
    int saved_errno = errno;
    int fd = g_signal_write_fd.load(std::memory_order_relaxed);
    if (fd >= 0) {
        unsigned char tag = static_cast<unsigned char>(sig);
        // Pipe full means a wake-up is already pending
        ssize_t ignored = ::write(fd, &tag, 1);
        (void)ignored;
    }
    errno = saved_errno;
}

SignalNotifier::SignalNotifier(events::EventBus& bus, const events::CancellationToken& token,
                               logging::AsyncLogger* logger, int poll_interval_ms)
    : Producer(bus, token, logger, poll_interval_ms)
{
    if (::pipe2(pipe_fds_, O_NONBLOCK | O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("signal pipe creation failed: ") + std::strerror(errno));
    }

    int expected = -1;
    if (!g_signal_write_fd.compare_exchange_strong(expected, pipe_fds_[1])) {
        ::close(pipe_fds_[0]);
        ::close(pipe_fds_[1]);
        throw std::runtime_error("another SignalNotifier is already installed");
    }

    struct sigaction sa {};
    sa.sa_handler = &SignalNotifier::on_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    for (int i = 0; i < WATCHED_COUNT; ++i) {
        if (sigaction(WATCHED[i], &sa, &previous_[i]) != 0) {
            int err = errno;
            for (int j = 0; j < i; ++j) sigaction(WATCHED[j], &previous_[j], nullptr);
            g_signal_write_fd.store(-1);
            ::close(pipe_fds_[0]);
            ::close(pipe_fds_[1]);
            throw std::runtime_error(std::string("sigaction failed: ") + std::strerror(err));
        }
    }
    installed_ = true;
}

SignalNotifier::~SignalNotifier() {
    join();
    uninstall();
    if (pipe_fds_[0] >= 0) ::close(pipe_fds_[0]);
    if (pipe_fds_[1] >= 0) ::close(pipe_fds_[1]);
}

void SignalNotifier::uninstall() {
    if (!installed_) return;
    installed_ = false;

    for (int i = 0; i < WATCHED_COUNT; ++i) {
        if (sigaction(WATCHED[i], &previous_[i], nullptr) != 0) {
            PV_LOG_ERROR(logger_, LogCategory::Signal, "could not restore handler for signal %d: %s", WATCHED[i],
                         std::strerror(errno));
        }
    }
    g_signal_write_fd.store(-1);
}

void SignalNotifier::run() {
    PV_LOG_INFO(logger_, LogCategory::Signal, "signal notifier started");

    while (!cancelled()) {
        struct pollfd pfd {};
        pfd.fd = pipe_fds_[0];
        pfd.events = POLLIN;

        int rc = ::poll(&pfd, 1, poll_interval_ms_);
        if (rc < 0) {
            if (errno == EINTR) continue;
            PV_LOG_ERROR(logger_, LogCategory::Signal, "poll failed: %s", std::strerror(errno));
            return;
        }
        if (rc > 0) {
            drain_and_publish();
        }
    }

    PV_LOG_INFO(logger_, LogCategory::Signal, "signal notifier stopped");
}

void SignalNotifier::drain_and_publish() {
    unsigned char tags[64];
    bool resized = false;

    for (;;) {
        ssize_t n = ::read(pipe_fds_[0], tags, sizeof(tags));
        if (n <= 0) {
            if (n < 0 && errno == EINTR) continue;
            break;
        }

        for (ssize_t i = 0; i < n; ++i) {
            int sig = tags[i];
            if (sig == SIGWINCH) {
                resized = true;
            } else {
                PV_LOG_WARN(logger_, LogCategory::Signal, "received signal %d", sig);
                bus_.publish(events::InterruptEvent{sig});
            }
        }
    }

    if (resized) {
        PV_LOG_DEBUG(logger_, LogCategory::Signal, "terminal resized");
        bus_.publish(events::ResizeEvent{});
    }
}

}  // namespace pipeview::input
