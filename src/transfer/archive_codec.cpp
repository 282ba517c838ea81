#include "archive_codec.hpp"
#include "glob_filter.hpp"
#include "progress.hpp"
#include "streams.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>
#include <sys/stat.h>
#include <cerrno>
#include <exception>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

// ── Format selection ───────────────────────────────────────

ArchiveFormat parse_archive_format(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "gzip" || n == "gz") return ArchiveFormat::Gzip;
    if (n == "zstd" || n == "zst") return ArchiveFormat::Zstd;
    if (n == "zip") return ArchiveFormat::Zip;
    throw ConfigurationError(fmt::format(
        "unsupported compression format '{}' (expected gzip, zstd or zip)", name));
}

ArchiveFormat detect_archive_format(const std::string& filename) {
    std::string n = to_lower(filename);
    if (ends_with(n, ".tar.zst")) return ArchiveFormat::Zstd;
    if (ends_with(n, ".zip")) return ArchiveFormat::Zip;
    return ArchiveFormat::Gzip;
}

std::string archive_extension(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Gzip: return ".tar.gz";
        case ArchiveFormat::Zstd: return ".tar.zst";
        case ArchiveFormat::Zip:  return ".zip";
    }
    return ".tar.gz";
}

std::string archive_format_name(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Gzip: return "gzip";
        case ArchiveFormat::Zstd: return "zstd";
        case ArchiveFormat::Zip:  return "zip";
    }
    return "gzip";
}

// ── libarchive plumbing ────────────────────────────────────

namespace {

struct WriteFree {
    void operator()(struct archive* a) const { archive_write_free(a); }
};
struct ReadFree {
    void operator()(struct archive* a) const { archive_read_free(a); }
};
struct EntryFree {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

using WriteHandle = std::unique_ptr<struct archive, WriteFree>;
using ReadHandle = std::unique_ptr<struct archive, ReadFree>;
using EntryHandle = std::unique_ptr<struct archive_entry, EntryFree>;

// Exceptions must not cross libarchive's C frames; they are parked here and
// rethrown once the failing call returns.
struct SinkClient {
    ByteSink* sink;
    std::exception_ptr error;
};

struct SourceClient {
    ByteSource* source;
    std::vector<char> buffer;
    std::exception_ptr error;
};

la_ssize_t sink_write_cb(struct archive* a, void* client, const void* buf, size_t len) {
    auto* c = static_cast<SinkClient*>(client);
    try {
        c->sink->write(static_cast<const char*>(buf), len);
        return static_cast<la_ssize_t>(len);
    } catch (...) {
        c->error = std::current_exception();
        archive_set_error(a, EIO, "output stream failed");
        return -1;
    }
}

la_ssize_t source_read_cb(struct archive* a, void* client, const void** buf) {
    auto* c = static_cast<SourceClient*>(client);
    try {
        size_t n = c->source->read(c->buffer.data(), c->buffer.size());
        *buf = c->buffer.data();
        return static_cast<la_ssize_t>(n);
    } catch (...) {
        c->error = std::current_exception();
        archive_set_error(a, EIO, "input stream failed");
        return -1;
    }
}

[[noreturn]] void fail(struct archive* a, const std::exception_ptr& parked, const std::string& what) {
    if (parked) std::rethrow_exception(parked);
    const char* msg = archive_error_string(a);
    throw NexcliError(fmt::format("{}: {}", what, msg ? msg : "unknown archive error"));
}

void drain(ByteSource& src) {
    std::vector<char> buf(IO_CHUNK_SIZE);
    while (src.read(buf.data(), buf.size()) > 0) {}
}

} // namespace

// ── Writing ────────────────────────────────────────────────

std::vector<ArchiveEntry> ArchiveCodec::write(const fs::path& source_dir, ByteSink& dest,
                                              const GlobFilter& filter,
                                              ProgressAccounter* progress) const {
    std::vector<FileTransferUnit> files = filter.collect_files(source_dir);

    WriteHandle a(archive_write_new());
    if (!a) throw NexcliError("failed to create archive writer");

    switch (format_) {
        case ArchiveFormat::Gzip:
            archive_write_set_format_pax_restricted(a.get());
            archive_write_add_filter_gzip(a.get());
            break;
        case ArchiveFormat::Zstd:
            archive_write_set_format_pax_restricted(a.get());
            if (archive_write_add_filter_zstd(a.get()) != ARCHIVE_OK) {
                fail(a.get(), nullptr, "zstd compression unavailable");
            }
            break;
        case ArchiveFormat::Zip:
            archive_write_set_format_zip(a.get());
            // "xl" extra field: mode bits in the local header for streaming readers
            if (archive_write_set_format_option(a.get(), "zip", "experimental", "1") != ARCHIVE_OK) {
                nexcli_log("archive zip: experimental local-header attributes unavailable");
            }
            break;
    }
    archive_write_set_bytes_per_block(a.get(), static_cast<int>(ARCHIVE_BLOCK_SIZE));
    archive_write_set_bytes_in_last_block(a.get(), 1);

    SinkClient client{&dest, nullptr};
    if (archive_write_open(a.get(), &client, nullptr, sink_write_cb, nullptr) != ARCHIVE_OK) {
        fail(a.get(), client.error, "failed to open archive stream");
    }

    std::vector<ArchiveEntry> written;
    EntryHandle entry(archive_entry_new());
    std::vector<char> buf(IO_CHUNK_SIZE);

    for (const auto& unit : files) {
        struct stat st;
        if (::stat(unit.absolute_path.c_str(), &st) != 0) {
            throw FilesystemError(fmt::format("cannot stat {}", unit.absolute_path));
        }

        ArchiveEntry meta;
        meta.relative_path = unit.relative_path;
        meta.size = static_cast<int64_t>(st.st_size);
        meta.mode = static_cast<unsigned int>(st.st_mode & 07777);
        meta.mod_time = static_cast<int64_t>(st.st_mtime);

        archive_entry_clear(entry.get());
        archive_entry_set_pathname(entry.get(), meta.relative_path.c_str());
        archive_entry_set_size(entry.get(), meta.size);
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), meta.mode);
        archive_entry_set_mtime(entry.get(), meta.mod_time, 0);

        if (archive_write_header(a.get(), entry.get()) < ARCHIVE_WARN) {
            fail(a.get(), client.error, fmt::format("failed to write header for {}", meta.relative_path));
        }

        // Write file contents in chunks
        FileSource in(unit.absolute_path);
        for (;;) {
            size_t n = in.read(buf.data(), buf.size());
            if (n == 0) break;
            if (archive_write_data(a.get(), buf.data(), n) < 0) {
                fail(a.get(), client.error, fmt::format("failed to write {}", meta.relative_path));
            }
            if (progress) progress->add_bytes(static_cast<int64_t>(n));
        }
        archive_write_finish_entry(a.get());
        written.push_back(meta);
    }

    if (archive_write_close(a.get()) != ARCHIVE_OK) {
        fail(a.get(), client.error, "failed to finish archive");
    }
    nexcli_log(fmt::format("archive {}: wrote {} entries from {}", archive_format_name(format_),
                           written.size(), source_dir.string()));
    return written;
}

// ── Reading ────────────────────────────────────────────────

fs::path ArchiveCodec::safe_destination(const fs::path& dest_dir, const std::string& entry_name) {
    return contained_path(fs::absolute(dest_dir), entry_name, "archive entry");
}

std::vector<ArchiveEntry> ArchiveCodec::read(ByteSource& src, const fs::path& dest_dir,
                                             ProgressAccounter* progress) const {
    ReadHandle a(archive_read_new());
    if (!a) throw NexcliError("failed to create archive reader");

    switch (format_) {
        case ArchiveFormat::Gzip:
            archive_read_support_format_tar(a.get());
            archive_read_support_filter_gzip(a.get());
            break;
        case ArchiveFormat::Zstd:
            archive_read_support_format_tar(a.get());
            archive_read_support_filter_zstd(a.get());
            break;
        case ArchiveFormat::Zip:
            archive_read_support_format_zip_streamable(a.get());
            break;
    }

    SourceClient client{&src, std::vector<char>(ARCHIVE_BLOCK_SIZE), nullptr};
    if (archive_read_open(a.get(), &client, nullptr, source_read_cb, nullptr) != ARCHIVE_OK) {
        fail(a.get(), client.error, "failed to open archive");
    }

    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        throw FilesystemError(fmt::format("cannot create {}: {}", dest_dir.string(), ec.message()));
    }

    std::vector<ArchiveEntry> extracted;
    std::vector<char> buf(IO_CHUNK_SIZE);
    struct archive_entry* entry = nullptr;

    for (;;) {
        int r = archive_read_next_header(a.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) fail(a.get(), client.error, "corrupt archive");

        const char* raw_name = archive_entry_pathname(entry);
        std::string name = raw_name ? raw_name : "";
        fs::path target = safe_destination(dest_dir, name);

        ArchiveEntry meta;
        meta.relative_path = name;
        meta.size = archive_entry_size(entry);
        meta.mode = static_cast<unsigned int>(archive_entry_perm(entry));
        meta.mod_time = static_cast<int64_t>(archive_entry_mtime(entry));

        auto type = archive_entry_filetype(entry);
        if (type == AE_IFDIR) {
            meta.is_directory = true;
            fs::create_directories(target, ec);
            if (ec) {
                throw FilesystemError(fmt::format("cannot create {}: {}", target.string(), ec.message()));
            }
            extracted.push_back(meta);
            continue;
        }
        if (type != AE_IFREG) {
            nexcli_log(fmt::format("archive: skipping special entry {}", name));
            archive_read_data_skip(a.get());
            continue;
        }

        FileSink out(target);
        for (;;) {
            la_ssize_t n = archive_read_data(a.get(), buf.data(), buf.size());
            if (n == 0) break;
            if (n < 0) fail(a.get(), client.error, fmt::format("failed to read {}", name));
            out.write(buf.data(), static_cast<size_t>(n));
            if (progress) progress->add_bytes(static_cast<int64_t>(n));
        }
        out.close();

        if (meta.mode != 0) {
            fs::permissions(target, static_cast<fs::perms>(meta.mode & 07777),
                            fs::perm_options::replace, ec);
            if (ec) {
                throw FilesystemError(fmt::format("cannot set mode on {}: {}", target.string(),
                                                  ec.message()));
            }
        }
        extracted.push_back(meta);
    }

    // The producer side may still hold trailing padding or a zip central directory
    drain(src);

    nexcli_log(fmt::format("archive {}: extracted {} entries into {}", archive_format_name(format_),
                           extracted.size(), dest_dir.string()));
    return extracted;
}
