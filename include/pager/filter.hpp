#pragma once

#include "line_buffer.hpp"
#include "../events/event.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pipeview {
namespace pager {

enum class KeyOutcome {
    Edited,     // filter text changed
    Unchanged,  // backspace on empty filter
    Quit        // filter text became the quit sequence
};

/**
 * FilterState - the filter text typed at the prompt
 *
 * Backspace removes the last character (a whole UTF-8 sequence), any other
 * key appends its byte. When the text becomes exactly the quit sequence the
 * outcome is Quit and the text must not be used for filtering.
 */
class FilterState {
public:
    explicit FilterState(std::string quit_sequence = "jj") : quit_sequence_(std::move(quit_sequence)) {}

    KeyOutcome apply_key(const events::KeyEvent& key) {
        if (key.is_backspace()) {
            if (text_.empty()) return KeyOutcome::Unchanged;
            pop_last_char();
        } else {
            text_.push_back(static_cast<char>(key.ch));
        }
        return text_ == quit_sequence_ ? KeyOutcome::Quit : KeyOutcome::Edited;
    }

    const std::string& text() const { return text_; }
    bool empty() const { return text_.empty(); }
    void clear() { text_.clear(); }

private:
    std::string text_;
    std::string quit_sequence_;

    void pop_last_char() {
        // Drop continuation bytes (10xxxxxx), then the lead byte
        while (!text_.empty() && (static_cast<unsigned char>(text_.back()) & 0xC0) == 0x80) {
            text_.pop_back();
        }
        if (!text_.empty()) text_.pop_back();
    }
};

/**
 * Positions (into buffer.entries()) of entries whose text contains `needle`.
 * An empty needle selects every entry.
 */
inline std::vector<size_t> compute_view(const LineBuffer& buffer, const std::string& needle) {
    const auto& entries = buffer.entries();
    std::vector<size_t> view;
    view.reserve(needle.empty() ? entries.size() : entries.size() / 4);

    for (size_t i = 0; i < entries.size(); ++i) {
        if (needle.empty() || entries[i].text.find(needle) != std::string::npos) {
            view.push_back(i);
        }
    }
    return view;
}

}  // namespace pager
}  // namespace pipeview
