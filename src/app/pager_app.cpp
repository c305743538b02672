#include "../../include/app/pager_app.hpp"
#include "../../include/events/cancellation.hpp"
#include "../../include/events/event_bus.hpp"
#include "../../include/input/key_reader.hpp"
#include "../../include/input/signal_notifier.hpp"
#include "../../include/input/stream_reader.hpp"
#include "../../include/logging/async_logger.hpp"
#include "../../include/logging/log_file.hpp"
#include "../../include/pager/controller.hpp"
#include "../../include/pager/renderer.hpp"
#include "../../include/terminal/terminal.hpp"
#include "../../include/util/system.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <unistd.h>

namespace pipeview::app {

namespace LogCategory = logging::LogCategory;

namespace {

// Cancels the token when unwinding so producer destructors can join
class CancelOnExit {
public:
    explicit CancelOnExit(events::CancellationToken& token) : token_(token) {}
    ~CancelOnExit() { token_.cancel(); }

    CancelOnExit(const CancelOnExit&) = delete;
    CancelOnExit& operator=(const CancelOnExit&) = delete;

private:
    events::CancellationToken& token_;
};

} // namespace

int PagerApp::run() {
    if (util::is_interactive(STDIN_FILENO)) {
        std::cerr << "pipeview: stdin is a terminal; pipe or redirect input, e.g. `dmesg | pipeview`\n";
        std::cerr << "Use --help for usage information.\n";
        return EXIT_USAGE;
    }

    util::FdGuard tty(util::open_controlling_tty());
    if (tty.get() < 0) {
        return EXIT_USAGE;
    }

    // Logging: only with --log; components get nullptr otherwise
    std::unique_ptr<logging::LogFile> log_file;
    logging::AsyncLogger logger;
    logging::AsyncLogger* log = nullptr;
    if (args_.log) {
        try {
            log_file = std::make_unique<logging::LogFile>();
        } catch (const std::runtime_error& e) {
            std::cerr << "pipeview: " << e.what() << "\n";
            return EXIT_USAGE;
        }
        logger.set_min_level(config_.log_level);
        logger.set_output_callback(logging::make_file_sink(log_file->get()));
        logger.start();
        log = &logger;
    }

    PV_LOG_INFO(log, LogCategory::System, "pipeview %s starting (poll %d ms, batch %d)", PIPEVIEW_VERSION,
                config_.poll_interval_ms, config_.batch_lines);

    events::EventBus bus;
    events::CancellationToken token;

    input::SignalNotifier signals(bus, token, log, config_.poll_interval_ms);

    terminal::Screen screen(std::cout, config_.use_colors);
    terminal::ScreenSession session(screen);

    pager::RenderOptions render_options;
    render_options.prompt = config_.prompt;
    render_options.cursor_marker = config_.cursor_marker;
    render_options.tab_width = config_.tab_width;
    pager::Renderer renderer(screen, render_options);

    pager::ControllerOptions controller_options;
    controller_options.quit_sequence = config_.quit_sequence;
    controller_options.end_marker = config_.end_marker;

    const int tty_fd = tty.get();
    pager::Controller controller(
        bus, token, renderer, [tty_fd]() { return terminal::query_size_or_default(tty_fd); }, controller_options, log);
    controller.set_restore_hook([&session]() { session.restore(); });

    input::StreamReaderOptions stream_options{config_.poll_interval_ms, config_.batch_lines, config_.idle_sleep_ms};
    input::StreamReader stream(STDIN_FILENO, bus, token, log, stream_options);
    input::KeyReader keys(tty_fd, bus, token, log, config_.poll_interval_ms);
    CancelOnExit cancel_on_exit(token);

    controller.add_producer(&stream);
    controller.add_producer(&keys);
    controller.add_producer(&signals);

    stream.start();
    keys.start();
    signals.start();

    int code = controller.run();
    signals.uninstall();

    PV_LOG_INFO(log, LogCategory::System, "exiting with code %d after %lu events (%s)", code,
                static_cast<unsigned long>(controller.events_handled()),
                pager::exit_reason_to_string(controller.exit_reason()));
    logger.stop();

    if (log_file) {
        std::cerr << "pipeview: log written to " << log_file->path() << "\n";
    }
    return code;
}

}  // namespace pipeview::app
