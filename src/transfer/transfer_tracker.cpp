#include "transfer_tracker.hpp"
#include <cli/console.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

TransferTracker::TransferTracker(TransferDirection direction, std::string target,
                                 Console& console, bool per_file_lines)
    : direction_(direction),
      target_(std::move(target)),
      console_(console),
      per_file_lines_(per_file_lines),
      start_(std::chrono::steady_clock::now()) {}

void TransferTracker::print_header(int total_files, int64_t total_bytes) {
    const char* action = direction_ == TransferDirection::Upload ? "Uploading to" : "Downloading from";
    console_.step(fmt::format("{} {}", action, target_));
    console_.detail(fmt::format("Total files: {}, total size: {}", total_files,
                                format_bytes(total_bytes)));
}

void TransferTracker::record(const TransferOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        outcomes_.push_back(outcome);
    }

    switch (outcome.kind) {
        case TransferOutcome::Kind::Uploaded:
        case TransferOutcome::Kind::Downloaded:
            if (per_file_lines_)
                console_.ok(fmt::format("{} ({})", outcome.path, format_bytes(outcome.size_bytes)));
            break;
        case TransferOutcome::Kind::Skipped:
            if (per_file_lines_)
                console_.info(fmt::format("{} (skipped{})", outcome.path,
                                          outcome.detail.empty() ? "" : ": " + outcome.detail));
            break;
        case TransferOutcome::Kind::Failed:
            console_.error(fmt::format("{}: {}", outcome.path, outcome.detail));
            break;
    }
}

void TransferTracker::record_deleted(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        deleted_++;
    }
    console_.detail(fmt::format("deleted {}", path));
}

TransferSummary TransferTracker::summary() const {
    std::lock_guard<std::mutex> lock(mu_);
    TransferSummary s;
    for (const auto& o : outcomes_) {
        switch (o.kind) {
            case TransferOutcome::Kind::Uploaded:
            case TransferOutcome::Kind::Downloaded: s.succeeded++; break;
            case TransferOutcome::Kind::Skipped:    s.skipped++; break;
            case TransferOutcome::Kind::Failed:     s.failed++; break;
        }
    }
    s.deleted = deleted_;
    return s;
}

int64_t TransferTracker::transferred_bytes() const {
    std::lock_guard<std::mutex> lock(mu_);
    int64_t total = 0;
    for (const auto& o : outcomes_) {
        if (o.succeeded()) total += o.size_bytes;
    }
    return total;
}

std::string TransferTracker::summary_line() const {
    TransferSummary s = summary();
    int64_t bytes = transferred_bytes();
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();

    std::string line = fmt::format("Files {}: {}",
                                   direction_ == TransferDirection::Upload ? "uploaded" : "downloaded",
                                   s.succeeded);
    if (s.skipped > 0) line += fmt::format(", skipped: {}", s.skipped);
    if (s.deleted > 0) line += fmt::format(", deleted: {}", s.deleted);
    if (s.failed > 0) line += fmt::format(", failed: {}", s.failed);
    line += fmt::format(", size: {}, time: {}", format_bytes(bytes), format_duration(elapsed));
    if (elapsed > 0 && bytes > 0) {
        line += fmt::format(", speed: {}/s", format_bytes(static_cast<int64_t>(bytes / elapsed)));
    }
    return line;
}

void TransferTracker::print_summary() {
    if (console_.quiet()) return;
    console_.result(summary_line());
}
