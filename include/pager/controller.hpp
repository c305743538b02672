#pragma once

/**
 * Controller - the single consumer of the event bus
 *
 * Owns the line buffer, the filter and the viewport size; no other thread
 * touches them. Each iteration of run():
 *   consume() one event -> apply it -> recompute the filtered view -> redraw
 *
 * State machine:
 *   Running      events are applied and rendered
 *   Terminating  entered on the quit sequence, an InterruptEvent, or an
 *                exception; restores the terminal, cancels the token and
 *                joins every producer
 *   Terminated   run() has returned; no producer thread is left
 */

#include "filter.hpp"
#include "line_buffer.hpp"
#include "renderer.hpp"
#include "../events/cancellation.hpp"
#include "../events/event_bus.hpp"
#include "../input/producer.hpp"
#include "../logging/async_logger.hpp"
#include "../terminal/terminal.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace pipeview {
namespace pager {

enum class ControllerState { Running, Terminating, Terminated };

enum class ExitReason { None, QuitCommand, Interrupted, Fault };

inline const char* exit_reason_to_string(ExitReason reason) {
    switch (reason) {
    case ExitReason::None: return "none";
    case ExitReason::QuitCommand: return "quit command";
    case ExitReason::Interrupted: return "interrupted";
    case ExitReason::Fault: return "fault";
    }
    return "unknown";
}

struct ControllerOptions {
    std::string quit_sequence = "jj";
    std::string end_marker = "(END)";
};

class Controller {
public:
    using SizeQuery = std::function<terminal::TermSize()>;
    using RestoreHook = std::function<void()>;

    Controller(events::EventBus& bus, events::CancellationToken& token, Renderer& renderer, SizeQuery size_query,
               const ControllerOptions& options, logging::AsyncLogger* logger = nullptr);

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // Producers joined during Terminating; not owned
    void add_producer(input::Producer* producer) { producers_.push_back(producer); }

    // Terminal restoration run first thing in Terminating
    void set_restore_hook(RestoreHook hook) { restore_hook_ = std::move(hook); }

    /**
     * Event loop. Returns the process exit code: 0 after the quit sequence
     * or an interrupt, 1 after a fault.
     */
    int run();

    /**
     * Apply one event. Returns false if the event moved the controller to
     * Terminating (the caller stops consuming).
     */
    bool handle(const events::Event& event);

    void redraw();

    // Restore terminal, cancel producers, join them. Idempotent.
    void terminate();

    ControllerState state() const { return state_; }
    ExitReason exit_reason() const { return exit_reason_; }
    const LineBuffer& buffer() const { return buffer_; }
    const FilterState& filter() const { return filter_; }
    const std::vector<size_t>& view() const { return view_; }
    const terminal::TermSize& size() const { return size_; }
    uint64_t events_handled() const { return events_handled_; }

private:
    events::EventBus& bus_;
    events::CancellationToken& token_;
    Renderer& renderer_;
    SizeQuery size_query_;
    logging::AsyncLogger* logger_;
    RestoreHook restore_hook_;
    std::vector<input::Producer*> producers_;

    LineBuffer buffer_;
    FilterState filter_;
    std::vector<size_t> view_;
    terminal::TermSize size_;

    ControllerState state_ = ControllerState::Running;
    ExitReason exit_reason_ = ExitReason::None;
    uint64_t events_handled_ = 0;

    bool on_event(const events::LineEvent& e);
    bool on_event(const events::KeyEvent& e);
    bool on_event(const events::ResizeEvent& e);
    bool on_event(const events::InterruptEvent& e);

    void begin_terminating(ExitReason reason);
};

}  // namespace pager
}  // namespace pipeview
