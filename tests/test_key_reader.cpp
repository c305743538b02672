/**
 * Keystroke Reader Tests
 *
 * KeyDecoder byte classification, and KeyReader driven through a pipe
 * (not a terminal, so raw mode is skipped and bytes are read as-is).
 */

#include "../include/input/key_reader.hpp"

#include <cassert>
#include <chrono>
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

std::string decode_all(KeyDecoder& decoder, const std::string& bytes) {
    std::string out;
    for (unsigned char c : bytes) {
        if (decoder.feed(c)) out.push_back(static_cast<char>(c));
    }
    return out;
}

TEST(test_decoder_accepts_printable_and_backspace) {
    KeyDecoder decoder;
    ASSERT_EQ(std::string("abc XYZ~"), decode_all(decoder, "abc XYZ~"));
    ASSERT_TRUE(decoder.feed(127));
    ASSERT_TRUE(decoder.feed(' '));
}

TEST(test_decoder_drops_control_bytes) {
    KeyDecoder decoder;
    ASSERT_EQ(std::string("ab"), decode_all(decoder, std::string("a\r\n\t\x01\x03\x1f") + "b"));
    ASSERT_FALSE(decoder.feed(0));
}

TEST(test_decoder_swallows_escape_sequences) {
    KeyDecoder decoder;
    // Up arrow, F5, SS3 right arrow, then a real key
    ASSERT_EQ(std::string("q"), decode_all(decoder, "\x1b[A\x1b[15~\x1bOCq"));
    ASSERT_FALSE(decoder.in_sequence());

    // Alt+x drops the x
    ASSERT_EQ(std::string("y"), decode_all(decoder, "\x1bxy"));
}

TEST(test_decoder_lone_escape_then_idle) {
    KeyDecoder decoder;
    ASSERT_FALSE(decoder.feed(27));
    ASSERT_TRUE(decoder.in_sequence());
    decoder.idle();
    ASSERT_FALSE(decoder.in_sequence());
    ASSERT_TRUE(decoder.feed('a'));
}

TEST(test_reader_publishes_accepted_keys_in_order) {
    int fds[2];
    assert(::pipe(fds) == 0);

    EventBus bus;
    CancellationToken token;
    KeyReader reader(fds[0], bus, token, nullptr, 33);
    reader.start();

    std::string typed = std::string("f\x01") + "a\x1b[B" + "\x7f";
    ASSERT_EQ(static_cast<ssize_t>(typed.size()), ::write(fds[1], typed.data(), typed.size()));

    std::vector<unsigned char> keys;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (keys.size() < 3 && std::chrono::steady_clock::now() < deadline) {
        auto e = bus.try_consume_for(std::chrono::milliseconds(50));
        if (!e) continue;
        ASSERT_TRUE(std::holds_alternative<KeyEvent>(*e));
        keys.push_back(std::get<KeyEvent>(*e).ch);
        // The count never trails what has been consumed
        ASSERT_TRUE(reader.keys_published() >= keys.size());
    }

    ASSERT_EQ(3u, keys.size());
    ASSERT_EQ('f', keys[0]);
    ASSERT_EQ('a', keys[1]);
    ASSERT_EQ(KeyEvent::BACKSPACE, keys[2]);
    ASSERT_EQ(3u, reader.keys_published());

    token.cancel();
    reader.join();
    ::close(fds[0]);
    ::close(fds[1]);
}

TEST(test_reader_stops_within_poll_interval) {
    int fds[2];
    assert(::pipe(fds) == 0);

    EventBus bus;
    CancellationToken token;
    KeyReader reader(fds[0], bus, token, nullptr, 33);
    reader.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_TRUE(reader.running());

    auto start = std::chrono::steady_clock::now();
    token.cancel();
    reader.join();
    ASSERT_LE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(500));
    ASSERT_FALSE(reader.running());

    ::close(fds[0]);
    ::close(fds[1]);
}

TEST(test_reader_stops_on_hangup) {
    int fds[2];
    assert(::pipe(fds) == 0);

    EventBus bus;
    CancellationToken token;
    KeyReader reader(fds[0], bus, token, nullptr, 33);
    reader.start();

    ::close(fds[1]);
    reader.join();  // returns without cancellation
    ASSERT_FALSE(token.is_cancelled());
    ASSERT_TRUE(bus.empty());

    ::close(fds[0]);
}

int main() {
    std::cout << "=== Keystroke Reader Tests ===\n";

    RUN_TEST(test_decoder_accepts_printable_and_backspace);
    RUN_TEST(test_decoder_drops_control_bytes);
    RUN_TEST(test_decoder_swallows_escape_sequences);
    RUN_TEST(test_decoder_lone_escape_then_idle);
    RUN_TEST(test_reader_publishes_accepted_keys_in_order);
    RUN_TEST(test_reader_stops_within_poll_interval);
    RUN_TEST(test_reader_stops_on_hangup);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
