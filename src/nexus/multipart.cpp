#include "multipart.hpp"
#include <transfer/streams.hpp>
#include <core/errors.hpp>
#include <fmt/format.h>
#include <random>

MultipartWriter::MultipartWriter(ByteSink& out) : MultipartWriter(out, random_boundary()) {}

MultipartWriter::MultipartWriter(ByteSink& out, std::string boundary)
    : out_(out), boundary_(std::move(boundary)) {}

std::string MultipartWriter::random_boundary() {
    static const char* hex = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 rng(rd());
    std::uniform_int_distribution<int> dist(0, 15);
    std::string b;
    for (int i = 0; i < 60; ++i) b += hex[dist(rng)];
    return b;
}

std::string MultipartWriter::content_type() const {
    return "multipart/form-data; boundary=" + boundary_;
}

void MultipartWriter::put(const std::string& s) {
    out_.write(s.data(), s.size());
}

static std::string escape_quotes(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

void MultipartWriter::write_field(const std::string& name, const std::string& value) {
    if (closed_) throw NexcliError("multipart form already closed");
    put(fmt::format("--{}\r\nContent-Disposition: form-data; name=\"{}\"\r\n\r\n",
                    boundary_, escape_quotes(name)));
    put(value);
    put("\r\n");
}

void MultipartWriter::write_file(const std::string& name, const std::string& filename,
                                 ByteSource& content) {
    copy_stream(content, begin_file(name, filename));
    end_part();
}

ByteSink& MultipartWriter::begin_file(const std::string& name, const std::string& filename) {
    if (closed_) throw NexcliError("multipart form already closed");
    put(fmt::format("--{}\r\nContent-Disposition: form-data; name=\"{}\"; filename=\"{}\"\r\n"
                    "Content-Type: application/octet-stream\r\n\r\n",
                    boundary_, escape_quotes(name), escape_quotes(filename)));
    return out_;
}

void MultipartWriter::end_part() {
    put("\r\n");
}

void MultipartWriter::close() {
    if (closed_) return;
    closed_ = true;
    put(fmt::format("--{}--\r\n", boundary_));
}

void write_raw_upload_form(MultipartWriter& form, const FileTransferUnit& file,
                           const std::string& directory, ProgressAccounter* progress) {
    FileSource in(file.absolute_path);
    ProgressSource tapped(in, progress);

    std::string basename = file.relative_path;
    auto slash = basename.rfind('/');
    if (slash != std::string::npos) basename = basename.substr(slash + 1);

    form.write_file("raw.asset1", basename, tapped);
    form.write_field("raw.asset1.filename", file.relative_path);
    if (!directory.empty()) {
        form.write_field("raw.directory", directory);
    }
    form.close();
}

std::string package_format_name(PackageFormat format) {
    return format == PackageFormat::Apt ? "apt" : "yum";
}

void write_package_upload_form(MultipartWriter& form, PackageFormat format,
                               const FileTransferUnit& file, ProgressAccounter* progress) {
    FileSource in(file.absolute_path);
    ProgressSource tapped(in, progress);

    std::string basename = file.relative_path;
    auto slash = basename.rfind('/');
    if (slash != std::string::npos) basename = basename.substr(slash + 1);

    form.write_file(package_format_name(format) + ".asset", basename, tapped);
    form.close();
}
