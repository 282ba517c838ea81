#include "streams.hpp"
#include "progress.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cstring>
#include <vector>

namespace fs = std::filesystem;

int64_t copy_stream(ByteSource& src, ByteSink& dst) {
    std::vector<char> buf(IO_CHUNK_SIZE);
    int64_t total = 0;
    for (;;) {
        size_t n = src.read(buf.data(), buf.size());
        if (n == 0) break;
        dst.write(buf.data(), n);
        total += static_cast<int64_t>(n);
    }
    return total;
}

// ── Files ──────────────────────────────────────────────────

FileSink::FileSink(const fs::path& path) : path_(path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw FilesystemError(fmt::format("cannot create {}: {}",
                                              path.parent_path().string(), ec.message()));
        }
    }
    out_.open(path, std::ios::binary | std::ios::trunc);
    if (!out_) {
        throw FilesystemError(fmt::format("cannot open {} for writing", path.string()));
    }
}

void FileSink::write(const char* data, size_t len) {
    out_.write(data, static_cast<std::streamsize>(len));
    if (!out_) {
        throw FilesystemError(fmt::format("write failed: {}", path_.string()));
    }
}

void FileSink::close() {
    if (!out_.is_open()) return;
    out_.flush();
    bool good = static_cast<bool>(out_);
    out_.close();
    if (!good || out_.fail()) {
        throw FilesystemError(fmt::format("write failed: {}", path_.string()));
    }
}

FileSource::FileSource(const fs::path& path) : path_(path), in_(path, std::ios::binary) {
    if (!in_) {
        throw FilesystemError(fmt::format("cannot open {} for reading", path.string()));
    }
}

size_t FileSource::read(char* buf, size_t len) {
    in_.read(buf, static_cast<std::streamsize>(len));
    auto got = in_.gcount();
    if (in_.bad()) {
        throw FilesystemError(fmt::format("read failed: {}", path_.string()));
    }
    return static_cast<size_t>(got);
}

// ── Memory ─────────────────────────────────────────────────

size_t StringSource::read(char* buf, size_t len) {
    size_t n = std::min(len, data_.size() - pos_);
    if (n > 0) {
        std::memcpy(buf, data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

// ── Progress taps ──────────────────────────────────────────

void ProgressSink::write(const char* data, size_t len) {
    inner_.write(data, len);
    if (progress_) progress_->add_bytes(static_cast<int64_t>(len));
}

size_t ProgressSource::read(char* buf, size_t len) {
    size_t n = inner_.read(buf, len);
    if (progress_) progress_->add_bytes(static_cast<int64_t>(n));
    return n;
}
