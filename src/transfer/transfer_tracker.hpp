#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <core/types.hpp>

class Console;

enum class TransferDirection { Upload, Download };

// Collects per-unit outcomes from concurrent workers and renders the final
// one-line summary. Completion order is irrelevant to every query.
class TransferTracker {
public:
    // `per_file_lines` prints one line per recorded unit (used when no
    // progress bar is drawn).
    TransferTracker(TransferDirection direction, std::string target, Console& console,
                    bool per_file_lines);

    void print_header(int total_files, int64_t total_bytes);

    void record(const TransferOutcome& outcome);
    void record_deleted(const std::string& path);

    TransferSummary summary() const;
    int64_t transferred_bytes() const;

    // "Files downloaded: 3, skipped: 1, size: 1.2 MiB, time: 320ms, speed: 3.8 MiB/s"
    std::string summary_line() const;
    void print_summary();

private:
    TransferDirection direction_;
    std::string target_;
    Console& console_;
    bool per_file_lines_;
    std::chrono::steady_clock::time_point start_;

    mutable std::mutex mu_;
    std::vector<TransferOutcome> outcomes_;
    int deleted_ = 0;
};
