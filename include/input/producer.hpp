#pragma once

#include "../events/cancellation.hpp"
#include "../events/event_bus.hpp"
#include "../logging/async_logger.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <thread>

namespace pipeview {
namespace input {

/**
 * Producer - one thread turning one asynchronous source into bus events
 *
 * run() must return within one poll interval after the token is cancelled.
 * Derived classes call join() from their destructor so the thread never
 * outlives their members.
 */
class Producer {
public:
    Producer(events::EventBus& bus, const events::CancellationToken& token, logging::AsyncLogger* logger,
             int poll_interval_ms)
        : bus_(bus)
        , token_(token)
        , logger_(logger)
        , poll_interval_ms_(poll_interval_ms)
        , running_(false)
    {}

    virtual ~Producer() { join(); }

    Producer(const Producer&) = delete;
    Producer& operator=(const Producer&) = delete;

    virtual const char* name() const = 0;

    void start() {
        if (thread_.joinable()) return;

        running_.store(true);
        thread_ = std::thread([this]() {
            try {
                run();
            } catch (const std::exception& e) {
                PV_LOG_ERROR(logger_, logging::LogCategory::System, "%s producer failed: %s", name(), e.what());
            } catch (...) {
                PV_LOG_ERROR(logger_, logging::LogCategory::System, "%s producer failed: unknown exception", name());
            }
            running_.store(false);
        });
    }

    // Block until the thread has returned
    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool running() const { return running_.load(); }
    int poll_interval_ms() const { return poll_interval_ms_; }

protected:
    virtual void run() = 0;

    bool cancelled() const { return token_.is_cancelled(); }

    events::EventBus& bus_;
    const events::CancellationToken& token_;
    logging::AsyncLogger* logger_;
    int poll_interval_ms_;

private:
    std::atomic<bool> running_;
    std::thread thread_;
};

}  // namespace input
}  // namespace pipeview
