#pragma once

#include "producer.hpp"

#include <atomic>
#include <cstdint>

namespace pipeview {
namespace input {

/**
 * KeyDecoder - byte classification for the keystroke reader
 *
 * Accepts printable bytes (>= 32, including 127 backspace). Drops other
 * control bytes, and swallows escape sequences (arrow keys, function keys,
 * Alt+key) so their trailing printable bytes never reach the filter.
 */
class KeyDecoder {
public:
    // Returns true if `byte` is an accepted keystroke
    bool feed(unsigned char byte) {
        switch (state_) {
        case State::Ground:
            if (byte == ESC) {
                state_ = State::Escape;
                return false;
            }
            return byte >= 32;
        case State::Escape:
            // CSI ("ESC [") and SS3 ("ESC O") continue; anything else was Alt+key
            state_ = (byte == '[' || byte == 'O') ? State::Sequence : State::Ground;
            return false;
        case State::Sequence:
            // Final byte ends the sequence; parameters are skipped
            if (byte >= 0x40 && byte <= 0x7E) state_ = State::Ground;
            return false;
        }
        return false;
    }

    // No byte followed within one poll interval: a lone ESC press
    void idle() { state_ = State::Ground; }

    bool in_sequence() const { return state_ != State::Ground; }

private:
    static constexpr unsigned char ESC = 27;
    enum class State { Ground, Escape, Sequence };
    State state_ = State::Ground;
};

/**
 * KeyReader - controlling terminal to KeyEvents
 *
 * Each cycle enters raw mode through a RawModeGuard, waits up to one poll
 * interval for a byte, reads it, and leaves raw mode again when the guard
 * goes out of scope. Returns when cancelled or when the terminal hangs up.
 */
class KeyReader : public Producer {
public:
    KeyReader(int tty_fd, events::EventBus& bus, const events::CancellationToken& token,
              logging::AsyncLogger* logger, int poll_interval_ms);
    ~KeyReader() override { join(); }

    const char* name() const override { return "keyboard"; }

    uint64_t keys_published() const { return keys_published_.load(); }

protected:
    void run() override;

private:
    int fd_;
    KeyDecoder decoder_;
    bool warned_not_tty_ = false;
    std::atomic<uint64_t> keys_published_;

    // false when the reader should stop (hang-up or unrecoverable error)
    bool read_one();
};

}  // namespace input
}  // namespace pipeview
