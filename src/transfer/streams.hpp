#pragma once

#include <string>
#include <fstream>
#include <cstddef>
#include <cstdint>
#include <filesystem>

class ProgressAccounter;

// Push side of a byte stream. write() either consumes all of len or throws.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual void write(const char* data, size_t len) = 0;
};

// Pull side of a byte stream. read() returns 0 only at end of stream.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read(char* buf, size_t len) = 0;
};

// Copy src into dst in IO_CHUNK_SIZE pieces. Returns bytes copied.
int64_t copy_stream(ByteSource& src, ByteSink& dst);

// ── Files ──────────────────────────────────────────────────

class FileSink : public ByteSink {
public:
    // Creates parent directories. Throws FilesystemError.
    explicit FileSink(const std::filesystem::path& path);

    void write(const char* data, size_t len) override;

    // Flush and close; throws if the data did not reach the file.
    void close();

private:
    std::filesystem::path path_;
    std::ofstream out_;
};

class FileSource : public ByteSource {
public:
    explicit FileSource(const std::filesystem::path& path);

    size_t read(char* buf, size_t len) override;

private:
    std::filesystem::path path_;
    std::ifstream in_;
};

// ── Memory ─────────────────────────────────────────────────

class StringSink : public ByteSink {
public:
    void write(const char* data, size_t len) override { data_.append(data, len); }
    const std::string& data() const { return data_; }

private:
    std::string data_;
};

class StringSource : public ByteSource {
public:
    explicit StringSource(std::string data) : data_(std::move(data)) {}
    size_t read(char* buf, size_t len) override;

private:
    std::string data_;
    size_t pos_ = 0;
};

// ── Progress taps ──────────────────────────────────────────

class ProgressSink : public ByteSink {
public:
    ProgressSink(ByteSink& inner, ProgressAccounter* progress)
        : inner_(inner), progress_(progress) {}
    void write(const char* data, size_t len) override;

private:
    ByteSink& inner_;
    ProgressAccounter* progress_;
};

class ProgressSource : public ByteSource {
public:
    ProgressSource(ByteSource& inner, ProgressAccounter* progress)
        : inner_(inner), progress_(progress) {}
    size_t read(char* buf, size_t len) override;

private:
    ByteSource& inner_;
    ProgressAccounter* progress_;
};
