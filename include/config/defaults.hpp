#pragma once

#include <cstdint>

/**
 * Centralized configuration defaults for the pager.
 *
 * All default values are defined here to avoid duplication across:
 * - PagerConfig
 * - the producers (poll interval, batch size)
 * - the renderer (prompt, markers)
 *
 * Naming:
 * - _MS suffix: milliseconds
 */

namespace pipeview::config {

// =============================================================================
// Producer timing
// =============================================================================
namespace timing {
// Bounded wait of every producer; also the worst-case shutdown latency.
// ~30 Hz keeps keystroke latency below what a user notices.
constexpr int POLL_INTERVAL_MS = 33;

// Pause between stream reader cycles
constexpr int IDLE_SLEEP_MS = 1;

constexpr int MIN_POLL_INTERVAL_MS = 1;
constexpr int MAX_POLL_INTERVAL_MS = 1000;
} // namespace timing

// =============================================================================
// Stream ingestion
// =============================================================================
namespace stream {
// Lines published per cycle before yielding
constexpr int BATCH_LINES = 10;

// read() chunk size
constexpr int READ_CHUNK_BYTES = 4096;
} // namespace stream

// =============================================================================
// Display
// =============================================================================
namespace display {
constexpr const char* PROMPT = "filter> ";
constexpr const char* CURSOR_MARKER = "_";
constexpr const char* END_MARKER = "(END)";
constexpr const char* ELLIPSIS = "...";
constexpr int TAB_WIDTH = 4;

// Used when the size query fails (not a terminal)
constexpr int FALLBACK_ROWS = 24;
constexpr int FALLBACK_COLS = 80;
} // namespace display

// =============================================================================
// Controller
// =============================================================================
namespace control {
// Filter text that quits instead of filtering
constexpr const char* QUIT_SEQUENCE = "jj";
} // namespace control

} // namespace pipeview::config
