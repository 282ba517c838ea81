#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

class ByteSink;
class ByteSource;
class GlobFilter;
class ProgressAccounter;

enum class ArchiveFormat { Gzip, Zstd, Zip };

// "gzip"/"gz", "zstd"/"zst", "zip" (case-insensitive). Throws ConfigurationError.
ArchiveFormat parse_archive_format(const std::string& name);

// By suffix: .tar.gz, .tar.zst, .zip. Anything else is gzip.
ArchiveFormat detect_archive_format(const std::string& filename);

std::string archive_extension(ArchiveFormat format);
std::string archive_format_name(ArchiveFormat format);

struct ArchiveEntry {
    std::string relative_path;
    int64_t size = 0;
    unsigned int mode = 0;
    int64_t mod_time = 0;
    bool is_directory = false;
};

// Streaming tar+gzip / tar+zstd / zip codec over libarchive. Neither side
// holds more than one IO chunk of file data in memory.
class ArchiveCodec {
public:
    explicit ArchiveCodec(ArchiveFormat format) : format_(format) {}

    ArchiveFormat format() const { return format_; }

    // Archive every file under source_dir that passes `filter`. Entry names
    // are slash-separated paths relative to source_dir. Returns the entries
    // written, in archive order.
    std::vector<ArchiveEntry> write(const fs::path& source_dir, ByteSink& dest,
                                    const GlobFilter& filter,
                                    ProgressAccounter* progress = nullptr) const;

    // Extract into dest_dir. An entry resolving outside dest_dir throws
    // PathTraversalError before anything is written for it. Symlinks and
    // other special entries are skipped. Consumes `src` to end of stream.
    std::vector<ArchiveEntry> read(ByteSource& src, const fs::path& dest_dir,
                                   ProgressAccounter* progress = nullptr) const;

    // dest_dir / entry_name, or PathTraversalError when it escapes dest_dir.
    static fs::path safe_destination(const fs::path& dest_dir, const std::string& entry_name);

private:
    ArchiveFormat format_;
};
