/**
 * Stream Reader Tests
 *
 * Feeds the reader through a pipe():
 * - lines arrive in input order with terminators stripped
 * - an unterminated last record still becomes a line
 * - exactly one end-of-input event
 * - batching limits lines per cycle
 * - cancellation while idle, with no end-of-input event
 * - read errors end the stream like end-of-input
 */

#include "../include/input/stream_reader.hpp"

#include <cassert>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace pipeview;
using namespace pipeview::events;
using namespace pipeview::input;

#define TEST(name) void name()
#define RUN_TEST(name)                                                                                                 \
    do {                                                                                                               \
        std::cout << "Running " << #name << "... ";                                                                    \
        name();                                                                                                        \
        std::cout << "PASSED\n";                                                                                       \
    } while (0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_LE(a, b) assert((a) <= (b))

struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() { assert(::pipe(fds) == 0); }
    ~Pipe() {
        close_read();
        close_write();
    }

    int read_end() const { return fds[0]; }

    void write(const std::string& data) {
        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = ::write(fds[1], data.data() + off, data.size() - off);
            assert(n > 0);
            off += static_cast<size_t>(n);
        }
    }

    void close_write() {
        if (fds[1] >= 0) ::close(fds[1]);
        fds[1] = -1;
    }
    void close_read() {
        if (fds[0] >= 0) ::close(fds[0]);
        fds[0] = -1;
    }
};

// Collect line events until the end-of-input event (or timeout)
std::vector<LineEvent> collect_until_end(EventBus& bus, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    std::vector<LineEvent> out;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto e = bus.try_consume_for(std::chrono::milliseconds(50));
        if (!e) continue;
        assert(std::holds_alternative<LineEvent>(*e));
        out.push_back(std::get<LineEvent>(*e));
        if (out.back().is_terminal) break;
    }
    return out;
}

StreamReaderOptions fast_options() {
    return StreamReaderOptions{33, 10, 0};
}

TEST(test_strip_terminator) {
    ASSERT_EQ(std::string("abc"), StreamReader::strip_terminator("abc\n"));
    ASSERT_EQ(std::string("abc"), StreamReader::strip_terminator("abc\r\n"));
    ASSERT_EQ(std::string("abc"), StreamReader::strip_terminator("abc"));
    ASSERT_EQ(std::string(""), StreamReader::strip_terminator("\n"));
    ASSERT_EQ(std::string("a\nb"), StreamReader::strip_terminator("a\nb\n"));
}

TEST(test_lines_in_order_then_single_end_event) {
    Pipe pipe;
    pipe.write("alpha\nbeta\r\n\ngamma");
    pipe.close_write();

    EventBus bus;
    CancellationToken token;
    StreamReader reader(pipe.read_end(), bus, token, nullptr, fast_options());
    reader.start();

    auto events = collect_until_end(bus);
    reader.join();

    ASSERT_EQ(5u, events.size());
    ASSERT_EQ(std::string("alpha"), events[0].text);
    ASSERT_EQ(std::string("beta"), events[1].text);
    ASSERT_EQ(std::string(""), events[2].text);
    ASSERT_EQ(std::string("gamma"), events[3].text);
    for (size_t i = 0; i < 4; ++i) ASSERT_FALSE(events[i].is_terminal);
    ASSERT_TRUE(events[4].is_terminal);

    // Nothing after the end-of-input event
    ASSERT_FALSE(bus.try_consume_for(std::chrono::milliseconds(50)).has_value());
    ASSERT_EQ(4u, reader.lines_published());
    ASSERT_TRUE(reader.reached_end());
    ASSERT_FALSE(reader.running());
}

TEST(test_count_covers_every_consumed_line) {
    Pipe pipe;  // writer stays open so the reader keeps running
    EventBus bus;
    CancellationToken token;
    StreamReader reader(pipe.read_end(), bus, token, nullptr, fast_options());
    reader.start();

    for (int i = 1; i <= 200; ++i) {
        pipe.write("l" + std::to_string(i) + "\n");
        auto e = bus.try_consume_for(std::chrono::seconds(2));
        ASSERT_TRUE(e.has_value());
        // Checked while the reader thread is still live
        ASSERT_TRUE(reader.lines_published() >= static_cast<uint64_t>(i));
    }

    token.cancel();
    reader.join();
    ASSERT_EQ(200u, reader.lines_published());
}

TEST(test_large_input_keeps_order) {
    Pipe pipe;
    EventBus bus;
    CancellationToken token;
    StreamReader reader(pipe.read_end(), bus, token, nullptr, fast_options());
    reader.start();

    constexpr int LINES = 20000;
    std::thread writer([&pipe]() {
        for (int i = 1; i <= LINES; ++i) {
            pipe.write("line " + std::to_string(i) + "\n");
        }
        pipe.close_write();
    });

    auto events = collect_until_end(bus, std::chrono::seconds(30));
    writer.join();
    reader.join();

    ASSERT_EQ(static_cast<size_t>(LINES + 1), events.size());
    for (int i = 0; i < LINES; ++i) {
        ASSERT_EQ("line " + std::to_string(i + 1), events[i].text);
    }
    ASSERT_TRUE(events.back().is_terminal);
}

TEST(test_batch_limits_lines_per_cycle) {
    Pipe pipe;
    std::string data;
    for (int i = 0; i < 25; ++i) data += "x" + std::to_string(i) + "\n";
    pipe.write(data);
    pipe.close_write();

    EventBus bus;
    CancellationToken token;
    // Long idle sleep makes each cycle observable: 0, 10, 10, 5+end
    StreamReader reader(pipe.read_end(), bus, token, nullptr, StreamReaderOptions{33, 10, 200});
    reader.start();

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    ASSERT_EQ(10u, reader.lines_published());
    ASSERT_FALSE(reader.reached_end());

    auto events = collect_until_end(bus);
    reader.join();
    ASSERT_EQ(26u, events.size());
    ASSERT_TRUE(reader.reached_end());
}

TEST(test_cancel_while_idle) {
    Pipe pipe;  // writer stays open, no data
    EventBus bus;
    CancellationToken token;
    StreamReader reader(pipe.read_end(), bus, token, nullptr, fast_options());
    reader.start();

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_TRUE(reader.running());

    auto start = std::chrono::steady_clock::now();
    token.cancel();
    reader.join();
    auto elapsed = std::chrono::steady_clock::now() - start;

    // One poll interval plus scheduling slack
    ASSERT_LE(elapsed, std::chrono::milliseconds(500));
    ASSERT_FALSE(reader.reached_end());
    ASSERT_TRUE(bus.empty());
}

TEST(test_invalid_fd_ends_stream) {
    Pipe pipe;
    int fd = pipe.read_end();
    pipe.close_read();  // fd now invalid

    EventBus bus;
    CancellationToken token;
    StreamReader reader(fd, bus, token, nullptr, fast_options());
    reader.start();

    auto events = collect_until_end(bus);
    reader.join();

    ASSERT_EQ(1u, events.size());
    ASSERT_TRUE(events[0].is_terminal);
    ASSERT_TRUE(reader.reached_end());
}

int main() {
    std::cout << "=== Stream Reader Tests ===\n";

    RUN_TEST(test_strip_terminator);
    RUN_TEST(test_lines_in_order_then_single_end_event);
    RUN_TEST(test_count_covers_every_consumed_line);
    RUN_TEST(test_large_input_keeps_order);
    RUN_TEST(test_batch_limits_lines_per_cycle);
    RUN_TEST(test_cancel_while_idle);
    RUN_TEST(test_invalid_fd_ends_stream);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
