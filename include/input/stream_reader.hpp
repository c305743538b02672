#pragma once

/**
 * StreamReader - piped input to LineEvents
 *
 * Reads newline-terminated records from a file descriptor (stdin in the app).
 * Each cycle:
 *   1. publish up to batch_lines complete lines already buffered
 *   2. if the buffer ran dry, poll() the fd for at most one poll interval
 *      and read one chunk
 *   3. sleep idle_sleep_ms
 *
 * End-of-input publishes the unterminated tail (if any) as a normal line,
 * then exactly one LineEvent::end_of_input(), and the thread returns.
 * A read error is logged and handled the same way.
 */

#include "producer.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace pipeview {
namespace input {

struct StreamReaderOptions {
    int poll_interval_ms;
    int batch_lines;
    int idle_sleep_ms;
};

class StreamReader : public Producer {
public:
    StreamReader(int fd, events::EventBus& bus, const events::CancellationToken& token,
                 logging::AsyncLogger* logger, const StreamReaderOptions& options);
    ~StreamReader() override { join(); }

    const char* name() const override { return "stream"; }

    uint64_t lines_published() const { return lines_published_.load(); }
    bool reached_end() const { return reached_end_.load(); }

    // Strip one trailing "\n" or "\r\n"
    static std::string strip_terminator(std::string line);

protected:
    void run() override;

private:
    enum class ReadResult { Data, NoData, EndOfInput, Error };

    int fd_;
    int batch_lines_;
    int idle_sleep_ms_;

    std::string pending_;
    size_t head_ = 0;  // start of unconsumed data in pending_

    std::atomic<uint64_t> lines_published_;
    std::atomic<bool> reached_end_;

    bool take_line(std::string& line);
    ReadResult wait_and_read();
    void publish_line(std::string line);
    void finish();
};

}  // namespace input
}  // namespace pipeview
