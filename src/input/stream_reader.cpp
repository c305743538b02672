#include "../../include/input/stream_reader.hpp"
#include "../../include/config/defaults.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace pipeview::input {

namespace LogCategory = logging::LogCategory;

StreamReader::StreamReader(int fd, events::EventBus& bus, const events::CancellationToken& token,
                           logging::AsyncLogger* logger, const StreamReaderOptions& options)
    : Producer(bus, token, logger, options.poll_interval_ms)
    , fd_(fd)
    , batch_lines_(options.batch_lines > 0 ? options.batch_lines : 1)
    , idle_sleep_ms_(options.idle_sleep_ms)
    , lines_published_(0)
    , reached_end_(false)
{}

std::string StreamReader::strip_terminator(std::string line) {
    if (!line.empty() && line.back() == '\n') line.pop_back();
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

void StreamReader::run() {
    PV_LOG_INFO(logger_, LogCategory::Stream, "stream reader started on fd %d (batch %d, poll %d ms)", fd_,
                batch_lines_, poll_interval_ms_);

    std::string line;
    while (!cancelled()) {
        int published = 0;
        while (published < batch_lines_ && take_line(line)) {
            publish_line(std::move(line));
            ++published;
        }

        // Buffer ran dry: wait for more input
        if (published < batch_lines_) {
            ReadResult result = wait_and_read();
            if (result == ReadResult::EndOfInput || result == ReadResult::Error) {
                finish();
                return;
            }
        }

        if (idle_sleep_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(idle_sleep_ms_));
        }
    }

    PV_LOG_INFO(logger_, LogCategory::Stream, "stream reader cancelled after %lu lines",
                static_cast<unsigned long>(lines_published_.load()));
}

bool StreamReader::take_line(std::string& line) {
    size_t nl = pending_.find('\n', head_);
    if (nl == std::string::npos) return false;

    line = strip_terminator(pending_.substr(head_, nl - head_ + 1));
    head_ = nl + 1;
    return true;
}

StreamReader::ReadResult StreamReader::wait_and_read() {
    struct pollfd pfd {};
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int rc = ::poll(&pfd, 1, poll_interval_ms_);
    if (rc < 0) {
        if (errno == EINTR) return ReadResult::NoData;
        PV_LOG_ERROR(logger_, LogCategory::Stream, "poll failed: %s", std::strerror(errno));
        return ReadResult::Error;
    }
    if (rc == 0) return ReadResult::NoData;

    if (pfd.revents & POLLNVAL) {
        PV_LOG_ERROR(logger_, LogCategory::Stream, "fd %d is not open", fd_);
        return ReadResult::Error;
    }

    // Compact before appending
    if (head_ > 0) {
        pending_.erase(0, head_);
        head_ = 0;
    }

    char chunk[config::stream::READ_CHUNK_BYTES];
    ssize_t n = ::read(fd_, chunk, sizeof(chunk));
    if (n > 0) {
        pending_.append(chunk, static_cast<size_t>(n));
        return ReadResult::Data;
    }
    if (n == 0) {
        return ReadResult::EndOfInput;
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        return ReadResult::NoData;
    }

    PV_LOG_ERROR(logger_, LogCategory::Stream, "read failed: %s", std::strerror(errno));
    return ReadResult::Error;
}

void StreamReader::publish_line(std::string line) {
    lines_published_.fetch_add(1, std::memory_order_relaxed);
    bus_.publish(events::LineEvent::line(std::move(line)));
}

void StreamReader::finish() {
    // Flush complete lines left behind by a read error, then the unterminated tail
    std::string line;
    while (take_line(line)) {
        publish_line(std::move(line));
    }
    if (head_ < pending_.size()) {
        publish_line(strip_terminator(pending_.substr(head_)));
    }
    pending_.clear();
    head_ = 0;

    bus_.publish(events::LineEvent::end_of_input());
    reached_end_.store(true);

    PV_LOG_INFO(logger_, LogCategory::Stream, "end of input after %lu lines",
                static_cast<unsigned long>(lines_published_.load()));
}

}  // namespace pipeview::input
