#pragma once

#include "producer.hpp"

#include <csignal>

namespace pipeview {
namespace input {

/**
 * SignalNotifier - SIGWINCH and termination signals to bus events
 *
 * The handlers only write() the signal number into a non-blocking self-pipe.
 * The notifier thread polls the read end, then publishes:
 *   SIGWINCH        -> ResizeEvent (a burst collapses to one event)
 *   SIGINT, SIGTERM, SIGQUIT, SIGHUP -> InterruptEvent
 *
 * Raw mode keeps ISIG, so Ctrl+C and Ctrl+\ arrive here and go through the
 * controller's shutdown instead of killing the process with the tty raw.
 *
 * Handlers are installed by the constructor so signals arriving before
 * start() are kept in the pipe. uninstall() (also run by the destructor)
 * puts the previous dispositions back. One instance at a time.
 */
class SignalNotifier : public Producer {
public:
    SignalNotifier(events::EventBus& bus, const events::CancellationToken& token, logging::AsyncLogger* logger,
                   int poll_interval_ms);
    ~SignalNotifier() override;

    const char* name() const override { return "signal"; }

    void uninstall();
    bool installed() const { return installed_; }

protected:
    void run() override;

private:
    static constexpr int WATCHED[] = {SIGWINCH, SIGINT, SIGTERM, SIGQUIT, SIGHUP};
    static constexpr int WATCHED_COUNT = sizeof(WATCHED) / sizeof(WATCHED[0]);

    int pipe_fds_[2] = {-1, -1};
    struct sigaction previous_[WATCHED_COUNT] {};
    bool installed_ = false;

    static void on_signal(int sig);
    void drain_and_publish();
};

}  // namespace input
}  // namespace pipeview
