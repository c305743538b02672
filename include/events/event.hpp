#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace pipeview {
namespace events {

/**
 * Events published by the producers and consumed by the pager controller.
 *
 * Value types: immutable after construction. The bus owns an event once it is
 * published, the controller owns it after consume().
 */

// One ingested line, or the end-of-input sentinel (is_terminal = true)
struct LineEvent {
    std::string text;
    bool is_terminal = false;

    static LineEvent line(std::string t) { return LineEvent{std::move(t), false}; }
    static LineEvent end_of_input() { return LineEvent{std::string(), true}; }
};

// One accepted keystroke byte (>= 32, 127 is backspace)
struct KeyEvent {
    static constexpr unsigned char BACKSPACE = 127;

    unsigned char ch = 0;

    bool is_backspace() const { return ch == BACKSPACE; }
};

// Terminal size changed; no payload, the controller re-queries
struct ResizeEvent {};

// SIGINT / SIGTERM arrived; the controller shuts down in order
struct InterruptEvent {
    int signal = 0;
};

using Event = std::variant<LineEvent, KeyEvent, ResizeEvent, InterruptEvent>;

inline const char* event_name(const Event& e) {
    return std::visit(
        [](const auto& ev) -> const char* {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, LineEvent>) {
                return ev.is_terminal ? "line(end)" : "line";
            } else if constexpr (std::is_same_v<T, KeyEvent>) {
                return "key";
            } else if constexpr (std::is_same_v<T, ResizeEvent>) {
                return "resize";
            } else {
                return "interrupt";
            }
        },
        e);
}

}  // namespace events
}  // namespace pipeview
