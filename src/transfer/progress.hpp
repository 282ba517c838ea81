#pragma once

#include <string>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <ostream>

// Byte and file counters shared by every worker of one transfer.
//
// The byte total is an estimate (for archives it is the uncompressed size),
// so bytes past max_bytes are absorbed: bytes() never exceeds max_bytes().
// The file counter advances once per finished unit, whatever its outcome.
//
// When `render` is set a single-line bar is redrawn on `out` at most every
// PROGRESS_REDRAW_MS; otherwise the accounter only counts.
class ProgressAccounter {
public:
    ProgressAccounter(std::string description, int64_t max_bytes, int total_files,
                      bool render, std::ostream& out);
    ProgressAccounter(std::string description, int64_t max_bytes, int total_files);

    ProgressAccounter(const ProgressAccounter&) = delete;
    ProgressAccounter& operator=(const ProgressAccounter&) = delete;

    void add_bytes(int64_t n);
    void file_done();

    // Draw the final state and end the line.
    void finish();

    int64_t bytes() const;
    int64_t max_bytes() const { return max_bytes_; }
    int files_done() const;
    int total_files() const { return total_files_; }

    // "[3/10] Uploading  42% 1.2 MiB / 2.9 MiB"
    std::string render_line() const;

private:
    std::string render_line_locked() const;
    void redraw_locked(bool force);

    std::string description_;
    const int64_t max_bytes_;
    const int total_files_;
    const bool render_;
    std::ostream& out_;

    mutable std::mutex mu_;
    int64_t bytes_ = 0;
    int files_done_ = 0;
    bool finished_ = false;
    std::chrono::steady_clock::time_point last_draw_;
};
