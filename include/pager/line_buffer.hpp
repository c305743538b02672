#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pipeview {
namespace pager {

struct LineEntry {
    size_t index;       // 1-based, no gaps
    std::string text;
    bool end_marker;    // true only for the end-of-stream entry
};

/**
 * LineBuffer - append-only record of every ingested line
 *
 * Entries are never modified or reordered. After end of input one marker
 * entry is appended with the next index; later appends are rejected.
 */
class LineBuffer {
public:
    explicit LineBuffer(std::string end_marker_text = "(END)") : end_marker_text_(std::move(end_marker_text)) {}

    // Returns the new entry's index, or 0 if the stream already ended
    size_t append(std::string text) {
        if (ended_) return 0;
        entries_.push_back(LineEntry{entries_.size() + 1, std::move(text), false});
        return entries_.back().index;
    }

    // Returns false if the marker was already appended
    bool append_end_marker() {
        if (ended_) return false;
        entries_.push_back(LineEntry{entries_.size() + 1, end_marker_text_, true});
        ended_ = true;
        return true;
    }

    const std::vector<LineEntry>& entries() const { return entries_; }
    const LineEntry& at(size_t pos) const { return entries_.at(pos); }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    bool ended() const { return ended_; }

    // Lines ingested, not counting the marker
    size_t line_count() const { return ended_ ? entries_.size() - 1 : entries_.size(); }

    // Digits needed for the largest index (at least 1)
    int label_width() const {
        int width = 1;
        for (size_t n = entries_.size(); n >= 10; n /= 10) ++width;
        return width;
    }

private:
    std::vector<LineEntry> entries_;
    std::string end_marker_text_;
    bool ended_ = false;
};

}  // namespace pager
}  // namespace pipeview
