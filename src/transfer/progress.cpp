#include "progress.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <iostream>

ProgressAccounter::ProgressAccounter(std::string description, int64_t max_bytes,
                                     int total_files, bool render, std::ostream& out)
    : description_(std::move(description)),
      max_bytes_(std::max<int64_t>(0, max_bytes)),
      total_files_(std::max(0, total_files)),
      render_(render),
      out_(out) {}

ProgressAccounter::ProgressAccounter(std::string description, int64_t max_bytes,
                                     int total_files)
    : ProgressAccounter(std::move(description), max_bytes, total_files, false, std::cout) {}

void ProgressAccounter::add_bytes(int64_t n) {
    if (n <= 0) return;
    std::lock_guard<std::mutex> lock(mu_);
    // Saturate instead of overflowing past the estimate
    if (n >= max_bytes_ - bytes_) {
        bytes_ = max_bytes_;
    } else {
        bytes_ += n;
    }
    redraw_locked(false);
}

void ProgressAccounter::file_done() {
    std::lock_guard<std::mutex> lock(mu_);
    if (files_done_ < total_files_) files_done_++;
    redraw_locked(false);
}

void ProgressAccounter::finish() {
    std::lock_guard<std::mutex> lock(mu_);
    if (finished_) return;
    finished_ = true;
    if (!render_) return;
    redraw_locked(true);
    out_ << "\n";
    out_.flush();
}

int64_t ProgressAccounter::bytes() const {
    std::lock_guard<std::mutex> lock(mu_);
    return bytes_;
}

int ProgressAccounter::files_done() const {
    std::lock_guard<std::mutex> lock(mu_);
    return files_done_;
}

std::string ProgressAccounter::render_line() const {
    std::lock_guard<std::mutex> lock(mu_);
    return render_line_locked();
}

std::string ProgressAccounter::render_line_locked() const {
    int pct = max_bytes_ > 0 ? static_cast<int>((bytes_ * 100) / max_bytes_) : 0;
    if (max_bytes_ == 0 && total_files_ > 0 && files_done_ == total_files_) pct = 100;
    return fmt::format("[{}/{}] {} {:>3}% {} / {}", files_done_, total_files_, description_,
                       pct, format_bytes(bytes_), format_bytes(max_bytes_));
}

void ProgressAccounter::redraw_locked(bool force) {
    if (!render_ || (finished_ && !force)) return;

    auto now = std::chrono::steady_clock::now();
    if (!force && now - last_draw_ < std::chrono::milliseconds(PROGRESS_REDRAW_MS)) return;
    last_draw_ = now;

    std::string line = render_line_locked();
    size_t width = static_cast<size_t>(std::max(20, platform::term_width() - 1));
    if (line.size() > width) line.resize(width);
    out_ << "\r\033[K" << line;
    out_.flush();
}
