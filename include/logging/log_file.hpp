#pragma once

/**
 * Diagnostic log file
 *
 * Named <tmpdir>/pipeview-YYYYMMDD-HHMMSS.log. If that exists the name gets
 * a "-1", "-2", ... suffix before ".log". Files are created exclusively so two
 * instances started in the same second never share a file.
 */

#include "../util/time_utils.hpp"

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace pipeview {
namespace logging {

inline std::string log_file_path(const std::string& dir, const std::string& stamp, int attempt) {
    std::string name = "pipeview-" + stamp;
    if (attempt > 0) name += "-" + std::to_string(attempt);
    name += ".log";
    return (std::filesystem::path(dir) / name).string();
}

class LogFile {
public:
    static constexpr int MAX_ATTEMPTS = 1000;

    /**
     * Create a new log file in `dir` (default: the system temp directory).
     * Throws std::runtime_error if no file could be created.
     */
    explicit LogFile(const std::string& dir = std::string(), const std::string& stamp = util::file_timestamp()) {
        std::string base = dir.empty() ? std::filesystem::temp_directory_path().string() : dir;

        for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
            std::string candidate = log_file_path(base, stamp, attempt);
            file_ = std::fopen(candidate.c_str(), "wx");
            if (file_) {
                path_ = candidate;
                return;
            }
            if (errno != EEXIST) {
                throw std::runtime_error("Cannot create log file: " + candidate);
            }
        }
        throw std::runtime_error("Cannot create log file: too many files named pipeview-" + stamp + "*.log");
    }

    ~LogFile() {
        if (file_) std::fclose(file_);
    }

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

    std::FILE* get() const { return file_; }
    const std::string& path() const { return path_; }

private:
    std::FILE* file_ = nullptr;
    std::string path_;
};

}  // namespace logging
}  // namespace pipeview
