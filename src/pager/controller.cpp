#include "../../include/pager/controller.hpp"

#include <exception>
#include <variant>

namespace pipeview::pager {

namespace LogCategory = logging::LogCategory;

Controller::Controller(events::EventBus& bus, events::CancellationToken& token, Renderer& renderer,
                       SizeQuery size_query, const ControllerOptions& options, logging::AsyncLogger* logger)
    : bus_(bus)
    , token_(token)
    , renderer_(renderer)
    , size_query_(std::move(size_query))
    , logger_(logger)
    , buffer_(options.end_marker)
    , filter_(options.quit_sequence)
    , size_(size_query_())
{}

int Controller::run() {
    PV_LOG_INFO(logger_, LogCategory::System, "controller running (%dx%d, %zu producers)", size_.rows, size_.cols,
                producers_.size());

    try {
        view_ = compute_view(buffer_, filter_.text());
        redraw();

        while (state_ == ControllerState::Running) {
            events::Event event = bus_.consume();
            if (!handle(event)) break;
            redraw();
        }
    } catch (const std::exception& e) {
        PV_LOG_ERROR(logger_, LogCategory::System, "render loop fault: %s", e.what());
        begin_terminating(ExitReason::Fault);
    } catch (...) {
        PV_LOG_ERROR(logger_, LogCategory::System, "render loop fault: unknown exception");
        begin_terminating(ExitReason::Fault);
    }

    terminate();
    return exit_reason_ == ExitReason::Fault ? 1 : 0;
}

bool Controller::handle(const events::Event& event) {
    if (state_ != ControllerState::Running) return false;

    ++events_handled_;
    bool keep_running = std::visit([this](const auto& e) { return on_event(e); }, event);
    if (!keep_running) return false;

    view_ = compute_view(buffer_, filter_.text());
    return true;
}

void Controller::redraw() {
    renderer_.draw(buffer_, view_, filter_.text(), size_);
}

bool Controller::on_event(const events::LineEvent& e) {
    if (!e.is_terminal) {
        if (buffer_.append(e.text) == 0) {
            PV_LOG_WARN(logger_, LogCategory::Stream, "line after end of input ignored");
        }
        return true;
    }

    if (buffer_.append_end_marker()) {
        PV_LOG_INFO(logger_, LogCategory::Stream, "end of input, %zu lines", buffer_.line_count());
    } else {
        PV_LOG_WARN(logger_, LogCategory::Stream, "duplicate end-of-input ignored");
    }
    return true;
}

bool Controller::on_event(const events::KeyEvent& e) {
    KeyOutcome outcome = filter_.apply_key(e);
    if (outcome == KeyOutcome::Quit) {
        PV_LOG_INFO(logger_, LogCategory::Keyboard, "quit sequence typed");
        begin_terminating(ExitReason::QuitCommand);
        return false;
    }
    return true;
}

bool Controller::on_event(const events::ResizeEvent&) {
    size_ = size_query_();
    PV_LOG_DEBUG(logger_, LogCategory::Render, "resized to %dx%d", size_.rows, size_.cols);
    return true;
}

bool Controller::on_event(const events::InterruptEvent& e) {
    PV_LOG_WARN(logger_, LogCategory::System, "interrupted by signal %d", e.signal);
    begin_terminating(ExitReason::Interrupted);
    return false;
}

void Controller::begin_terminating(ExitReason reason) {
    if (state_ != ControllerState::Running) return;
    state_ = ControllerState::Terminating;
    exit_reason_ = reason;
}

void Controller::terminate() {
    if (state_ == ControllerState::Terminated) return;
    if (state_ == ControllerState::Running) {
        begin_terminating(ExitReason::None);
    }

    if (restore_hook_) {
        try {
            restore_hook_();
        } catch (const std::exception& e) {
            PV_LOG_ERROR(logger_, LogCategory::System, "terminal restore failed: %s", e.what());
        } catch (...) {
            PV_LOG_ERROR(logger_, LogCategory::System, "terminal restore failed: unknown exception");
        }
    }

    token_.cancel();
    for (auto* producer : producers_) {
        producer->join();
        PV_LOG_DEBUG(logger_, LogCategory::System, "%s producer joined", producer->name());
    }

    state_ = ControllerState::Terminated;
    PV_LOG_INFO(logger_, LogCategory::System, "controller terminated (%s)", exit_reason_to_string(exit_reason_));
}

}  // namespace pipeview::pager
