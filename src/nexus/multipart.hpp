#pragma once

#include <string>
#include <core/types.hpp>

class ByteSink;
class ByteSource;
class ProgressAccounter;

// Streams a multipart/form-data body into a ByteSink. File parts are copied
// chunk by chunk, never buffered whole.
class MultipartWriter {
public:
    explicit MultipartWriter(ByteSink& out);
    MultipartWriter(ByteSink& out, std::string boundary);

    const std::string& boundary() const { return boundary_; }
    std::string content_type() const;

    void write_field(const std::string& name, const std::string& value);
    void write_file(const std::string& name, const std::string& filename, ByteSource& content);

    // Open a file part and hand back the sink for its content; end_part()
    // finishes it. For producers that push bytes (archive encoders).
    ByteSink& begin_file(const std::string& name, const std::string& filename);
    void end_part();

    // Closing boundary. Required once all parts are written.
    void close();

    static std::string random_boundary();

private:
    void put(const std::string& s);

    ByteSink& out_;
    std::string boundary_;
    bool closed_ = false;
};

// Hosted package repositories that take a single package file per upload.
enum class PackageFormat { Apt, Yum };

// "apt" or "yum"
std::string package_format_name(PackageFormat format);

// Nexus raw upload form for one file: raw.directory, raw.asset1 and
// raw.asset1.filename. `directory` may be empty.
void write_raw_upload_form(MultipartWriter& form, const FileTransferUnit& file,
                           const std::string& directory, ProgressAccounter* progress);

// Package upload form: one apt.asset or yum.asset file part named after
// the file's basename. Nexus places the package itself.
void write_package_upload_form(MultipartWriter& form, PackageFormat format,
                               const FileTransferUnit& file, ProgressAccounter* progress);
