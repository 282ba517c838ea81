#include <gtest/gtest.h>
#include <nexus/multipart.hpp>
#include <transfer/streams.hpp>
#include <core/errors.hpp>
#include "fake_repository.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Multipart, FieldsAndFileLayout) {
    StringSink out;
    MultipartWriter form(out, "BOUNDARY");
    form.write_field("raw.directory", "builds/1.0");
    StringSource content("file-bytes");
    form.write_file("raw.asset1", "app.bin", content);
    form.close();

    EXPECT_EQ(form.content_type(), "multipart/form-data; boundary=BOUNDARY");
    EXPECT_EQ(out.data(),
              "--BOUNDARY\r\n"
              "Content-Disposition: form-data; name=\"raw.directory\"\r\n\r\n"
              "builds/1.0\r\n"
              "--BOUNDARY\r\n"
              "Content-Disposition: form-data; name=\"raw.asset1\"; filename=\"app.bin\"\r\n"
              "Content-Type: application/octet-stream\r\n\r\n"
              "file-bytes\r\n"
              "--BOUNDARY--\r\n");
}

TEST(Multipart, ClosedFormRejectsParts) {
    StringSink out;
    MultipartWriter form(out, "B");
    form.close();
    form.close();
    EXPECT_THROW(form.write_field("x", "y"), NexcliError);
}

TEST(Multipart, RandomBoundaries) {
    std::string a = MultipartWriter::random_boundary();
    EXPECT_EQ(a.size(), 60u);
    EXPECT_NE(a, MultipartWriter::random_boundary());
}

TEST(Multipart, RawUploadFormForNestedFile) {
    fs::path file = fs::temp_directory_path() / "nexcli_multipart_test.txt";
    std::ofstream(file) << "payload";

    FileTransferUnit unit;
    unit.absolute_path = file.string();
    unit.relative_path = "sub/dir/nexcli_multipart_test.txt";
    unit.size_bytes = 7;

    StringSink out;
    MultipartWriter form(out);
    write_raw_upload_form(form, unit, "releases", nullptr);

    auto parts = FakeRepositoryClient::parse_form(out.data(), form.content_type());
    EXPECT_EQ(parts["raw.asset1"], "payload");
    EXPECT_EQ(parts["raw.asset1.filename"], "sub/dir/nexcli_multipart_test.txt");
    EXPECT_EQ(parts["raw.directory"], "releases");
    EXPECT_NE(out.data().find("filename=\"nexcli_multipart_test.txt\""), std::string::npos);

    fs::remove(file);
}

TEST(Multipart, PackageFormCarriesOnlyTheFilePart) {
    fs::path file = fs::temp_directory_path() / "nexcli_multipart_pkg.rpm";
    std::ofstream(file) << "rpm";

    FileTransferUnit unit;
    unit.absolute_path = file.string();
    unit.relative_path = "nexcli_multipart_pkg.rpm";
    unit.size_bytes = 3;

    StringSink out;
    MultipartWriter form(out);
    write_package_upload_form(form, PackageFormat::Yum, unit, nullptr);

    auto parts = FakeRepositoryClient::parse_form(out.data(), form.content_type());
    EXPECT_EQ(parts["yum.asset"], "rpm");
    EXPECT_EQ(parts["filename:yum.asset"], "nexcli_multipart_pkg.rpm");
    EXPECT_EQ(parts.size(), 2u);
    EXPECT_EQ(package_format_name(PackageFormat::Apt), "apt");

    fs::remove(file);
}
