#pragma once

#include <atomic>

namespace pipeview {
namespace events {

/**
 * Cancellation token shared by the controller and the producers.
 *
 * Written once by the controller (cancel()), polled by every producer at least
 * once per poll interval.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_release); }

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_;
};

}  // namespace events
}  // namespace pipeview
