#pragma once

#include "defaults.hpp"
#include "../logging/async_logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace pipeview {
namespace config {

using json = nlohmann::json;

/**
 * Pager configuration
 *
 * Compiled-in defaults (defaults.hpp), optionally overridden by a JSON file:
 * {
 *   "poll_interval_ms": 33,
 *   "batch_lines": 10,
 *   "idle_sleep_ms": 1,
 *   "quit_sequence": "jj",
 *   "prompt": "filter> ",
 *   "cursor_marker": "_",
 *   "end_marker": "(END)",
 *   "tab_width": 4,
 *   "use_colors": true,
 *   "log_level": "debug"
 * }
 */
struct PagerConfig {
    int poll_interval_ms = timing::POLL_INTERVAL_MS;
    int batch_lines = stream::BATCH_LINES;
    int idle_sleep_ms = timing::IDLE_SLEEP_MS;

    std::string quit_sequence = control::QUIT_SEQUENCE;
    std::string prompt = display::PROMPT;
    std::string cursor_marker = display::CURSOR_MARKER;
    std::string end_marker = display::END_MARKER;
    int tab_width = display::TAB_WIDTH;
    bool use_colors = true;

    logging::LogLevel log_level = logging::LogLevel::Debug;
};

class ConfigLoader {
public:
    static PagerConfig load(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open config file: " + filename);
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return parse(buffer.str());
    }

    static PagerConfig parse(const std::string& text) {
        json doc;
        try {
            doc = json::parse(text);
        } catch (const json::parse_error& e) {
            throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
        }
        return from_json(doc);
    }

    static PagerConfig from_json(const json& doc) {
        if (!doc.is_object()) {
            throw std::runtime_error("Config root must be a JSON object");
        }

        PagerConfig cfg;
        read_int(doc, "poll_interval_ms", cfg.poll_interval_ms, timing::MIN_POLL_INTERVAL_MS,
                 timing::MAX_POLL_INTERVAL_MS);
        read_int(doc, "batch_lines", cfg.batch_lines, 1, 100000);
        read_int(doc, "idle_sleep_ms", cfg.idle_sleep_ms, 0, 1000);
        read_int(doc, "tab_width", cfg.tab_width, 1, 16);

        read_string(doc, "quit_sequence", cfg.quit_sequence);
        read_string(doc, "prompt", cfg.prompt);
        read_string(doc, "cursor_marker", cfg.cursor_marker);
        read_string(doc, "end_marker", cfg.end_marker);

        if (doc.contains("use_colors")) {
            const auto& v = doc.at("use_colors");
            if (!v.is_boolean()) {
                throw std::runtime_error("Config key 'use_colors' must be a boolean");
            }
            cfg.use_colors = v.get<bool>();
        }

        std::string level;
        if (read_string(doc, "log_level", level) && !logging::parse_level(level, cfg.log_level)) {
            throw std::runtime_error("Config key 'log_level' has unknown level: " + level);
        }

        if (cfg.quit_sequence.empty()) {
            throw std::runtime_error("Config key 'quit_sequence' must not be empty");
        }
        return cfg;
    }

private:
    static void read_int(const json& doc, const char* key, int& out, int min, int max) {
        if (!doc.contains(key)) return;

        const auto& v = doc.at(key);
        if (!v.is_number_integer()) {
            throw std::runtime_error(std::string("Config key '") + key + "' must be an integer");
        }
        auto value = v.get<long long>();
        if (value < min || value > max) {
            throw std::runtime_error(std::string("Config key '") + key + "' out of range [" +
                                     std::to_string(min) + ", " + std::to_string(max) + "]");
        }
        out = static_cast<int>(value);
    }

    static bool read_string(const json& doc, const char* key, std::string& out) {
        if (!doc.contains(key)) return false;

        const auto& v = doc.at(key);
        if (!v.is_string()) {
            throw std::runtime_error(std::string("Config key '") + key + "' must be a string");
        }
        out = v.get<std::string>();
        return true;
    }
};

}  // namespace config
}  // namespace pipeview
