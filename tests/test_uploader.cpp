#include <gtest/gtest.h>
#include <transfer/uploader.hpp>
#include <cli/console.hpp>
#include <core/errors.hpp>
#include "fake_repository.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class UploaderTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FakeRepositoryClient repo;
    std::ostringstream out;
    std::ostringstream err;
    Console console{Verbosity::Normal, out, err, false};
    TransferOptions options;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "nexcli_upload_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        options.parallelism = 4;
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& rel_path, const std::string& content) {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full, std::ios::binary) << content;
    }

    TransferReport upload(const std::string& dest) {
        Uploader uploader(repo, options, console);
        return uploader.upload(test_dir, dest);
    }
};

TEST_F(UploaderTest, UploadsTreeUnderSubdir) {
    write_file("a.txt", "alpha");
    write_file("sub/b.txt", "beta");

    TransferReport report = upload("builds/v1");
    EXPECT_EQ(report.status, TransferStatus::Success);
    EXPECT_EQ(report.summary.succeeded, 2);
    EXPECT_EQ(report.summary.failed, 0);

    EXPECT_EQ(repo.content("builds", "v1/a.txt"), "alpha");
    EXPECT_EQ(repo.content("builds", "v1/sub/b.txt"), "beta");
    EXPECT_NE(out.str().find("Files uploaded: 2"), std::string::npos);
}

TEST_F(UploaderTest, SecondRunSkipsUnchangedFiles) {
    write_file("a.txt", "alpha");
    write_file("sub/b.txt", "beta");
    upload("builds/v1");
    ASSERT_EQ(repo.upload_calls(), 2);

    TransferReport report = upload("builds/v1");
    EXPECT_EQ(report.summary.succeeded, 0);
    EXPECT_EQ(report.summary.skipped, 2);
    EXPECT_EQ(repo.upload_calls(), 2);
}

TEST_F(UploaderTest, ChangedFileIsUploadedAgain) {
    write_file("a.txt", "alpha");
    upload("builds");
    write_file("a.txt", "alpha-2");

    TransferReport report = upload("builds");
    EXPECT_EQ(report.summary.succeeded, 1);
    EXPECT_EQ(repo.content("builds", "a.txt"), "alpha-2");
}

TEST_F(UploaderTest, SkipChecksumOnlyChecksExistence) {
    write_file("a.txt", "alpha");
    upload("builds");
    write_file("a.txt", "different");

    options.skip_checksum = true;
    TransferReport report = upload("builds");
    EXPECT_EQ(report.summary.skipped, 1);
    EXPECT_EQ(repo.content("builds", "a.txt"), "alpha");
}

TEST_F(UploaderTest, ForceAlwaysUploads) {
    write_file("a.txt", "alpha");
    upload("builds");

    options.force = true;
    TransferReport report = upload("builds");
    EXPECT_EQ(report.summary.succeeded, 1);
    EXPECT_EQ(repo.upload_calls(), 2);
}

TEST_F(UploaderTest, GlobSelectsFiles) {
    write_file("a.go", "package a");
    write_file("b.txt", "b");
    write_file("vendor/c.go", "package c");

    options.glob = "**/*.go,!vendor/**";
    TransferReport report = upload("src");
    EXPECT_EQ(report.summary.succeeded, 1);
    EXPECT_TRUE(repo.has("src", "a.go"));
    EXPECT_FALSE(repo.has("src", "vendor/c.go"));
}

TEST_F(UploaderTest, DryRunUploadsNothing) {
    write_file("a.txt", "alpha");
    write_file("b.txt", "beta");

    options.dry_run = true;
    TransferReport report = upload("builds");
    EXPECT_EQ(report.summary.succeeded, 2);
    EXPECT_EQ(repo.upload_calls(), 0);
    EXPECT_NE(out.str().find("Dry-run mode: would upload 2 files"), std::string::npos);
}

TEST_F(UploaderTest, FailedFileDoesNotStopSiblings) {
    write_file("good1.txt", "1");
    write_file("bad.txt", "x");
    write_file("good2.txt", "2");
    repo.fail_uploads_for("bad.txt");

    TransferReport report = upload("builds");
    EXPECT_EQ(report.status, TransferStatus::Error);
    EXPECT_EQ(report.summary.succeeded, 2);
    EXPECT_EQ(report.summary.failed, 1);
    EXPECT_EQ(report.summary.attempted(), 3);
    EXPECT_NE(err.str().find("bad.txt"), std::string::npos);
}

TEST_F(UploaderTest, ListingFailureUploadsEverything) {
    write_file("a.txt", "alpha");
    repo.fail_listing(true);

    TransferReport report = upload("builds");
    EXPECT_EQ(report.summary.succeeded, 1);
}

TEST_F(UploaderTest, CompressedUploadSendsOneArchive) {
    write_file("a.txt", "alpha");
    write_file("sub/b.txt", "beta");

    options.compress = true;
    TransferReport report = upload("archives/v1/bundle.tar.gz");
    EXPECT_EQ(report.status, TransferStatus::Success);
    EXPECT_EQ(repo.upload_calls(), 1);
    ASSERT_TRUE(repo.has("archives", "v1/bundle.tar.gz"));

    std::string archive = repo.content("archives", "v1/bundle.tar.gz");
    ASSERT_GE(archive.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(archive[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(archive[1]), 0x8b);
}

TEST_F(UploaderTest, KeyTemplateNamesTheArchive) {
    write_file("a.txt", "alpha");
    fs::path key = fs::temp_directory_path() / "nexcli_upload_key.lock";
    std::ofstream(key) << "hello world";

    options.compress = true;
    options.key_from = key.string();
    upload("cache/{key}.tar.gz");
    EXPECT_TRUE(repo.has("cache",
                         "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9.tar.gz"));
    fs::remove(key);
}

TEST_F(UploaderTest, SingleFileOutsideGlobUploadsNothing) {
    write_file("a.txt", "alpha");

    options.glob = "*.go";
    Uploader uploader(repo, options, console);
    TransferReport report = uploader.upload(test_dir / "a.txt", "builds/v1");
    EXPECT_EQ(report.status, TransferStatus::Success);
    EXPECT_EQ(report.summary.attempted(), 0);
    EXPECT_EQ(repo.upload_calls(), 0);
}

TEST_F(UploaderTest, ProgressEndsAtFullCountAfterMixedRun) {
    write_file("same.txt", "same");
    write_file("bad.txt", "bad");
    write_file("good.txt", "good");
    repo.add("builds", "v1/same.txt", "same");
    repo.fail_uploads_for("bad.txt");

    std::ostringstream bar;
    Console tty_console{Verbosity::Normal, bar, err, true};
    Uploader uploader(repo, options, tty_console);
    TransferReport report = uploader.upload(test_dir, "builds/v1");

    EXPECT_EQ(report.status, TransferStatus::Error);
    EXPECT_EQ(report.summary.succeeded, 1);
    EXPECT_EQ(report.summary.skipped, 1);
    EXPECT_EQ(report.summary.failed, 1);

    std::string rendered = bar.str();
    auto last = rendered.rfind("\r\033[K");
    ASSERT_NE(last, std::string::npos);
    EXPECT_EQ(rendered.compare(last + 4, 15, "[3/3] Uploading"), 0) << rendered;
}

// ── Package uploads ─────────────────────────────────────────

TEST_F(UploaderTest, DebPackageGoesToAptRepository) {
    write_file("pool/tool_1.0_amd64.deb", "debian-binary");

    Uploader uploader(repo, options, console);
    TransferReport report = uploader.upload(test_dir / "pool" / "tool_1.0_amd64.deb", "apt-hosted/");
    EXPECT_EQ(report.status, TransferStatus::Success);
    EXPECT_EQ(report.summary.succeeded, 1);
    EXPECT_EQ(repo.upload_calls(), 1);

    auto form = repo.last_form();
    EXPECT_EQ(form["apt.asset"], "debian-binary");
    EXPECT_EQ(form["filename:apt.asset"], "tool_1.0_amd64.deb");
    EXPECT_EQ(form.count("raw.asset1"), 0u);
    EXPECT_EQ(form.count("raw.directory"), 0u);
    EXPECT_EQ(repo.content("apt-hosted", "tool_1.0_amd64.deb"), "debian-binary");
    EXPECT_NE(out.str().find("Uploaded apt package tool_1.0_amd64.deb"), std::string::npos);
}

TEST_F(UploaderTest, RpmSuffixIsCaseInsensitive) {
    write_file("tool-1.0.x86_64.RPM", "rpm-bytes");

    Uploader uploader(repo, options, console);
    TransferReport report = uploader.upload(test_dir / "tool-1.0.x86_64.RPM", "yum-hosted");
    EXPECT_EQ(report.status, TransferStatus::Success);
    EXPECT_EQ(repo.last_form()["yum.asset"], "rpm-bytes");
    EXPECT_TRUE(repo.has("yum-hosted", "tool-1.0.x86_64.RPM"));
}

TEST_F(UploaderTest, PackageUploadRejectsSubdirAndCompression) {
    write_file("tool.deb", "d");
    write_file("tool.rpm", "r");
    Uploader uploader(repo, options, console);

    EXPECT_THROW(uploader.upload(test_dir / "tool.deb", "apt-hosted/pool"), ConfigurationError);
    EXPECT_THROW(uploader.upload(test_dir / "tool.rpm", "yum-hosted/el9"), ConfigurationError);

    options.compress = true;
    Uploader compressing(repo, options, console);
    EXPECT_THROW(compressing.upload(test_dir / "tool.deb", "apt-hosted"), ConfigurationError);
    EXPECT_EQ(repo.upload_calls(), 0);
}

TEST_F(UploaderTest, PackageDryRunSendsNothing) {
    write_file("tool.deb", "d");

    options.dry_run = true;
    Uploader uploader(repo, options, console);
    TransferReport report = uploader.upload(test_dir / "tool.deb", "apt-hosted");
    EXPECT_EQ(report.status, TransferStatus::Success);
    EXPECT_EQ(report.summary.succeeded, 1);
    EXPECT_EQ(repo.upload_calls(), 0);
}

TEST(PackageDetection, OnlyRegularDebAndRpmFiles) {
    fs::path dir = fs::temp_directory_path() / "nexcli_package_detect";
    fs::remove_all(dir);
    fs::create_directories(dir / "looks.deb");
    std::ofstream(dir / "a.deb") << "x";
    std::ofstream(dir / "b.Rpm") << "x";
    std::ofstream(dir / "c.debx") << "x";

    EXPECT_TRUE(detect_package_format(dir / "a.deb") == PackageFormat::Apt);
    EXPECT_TRUE(detect_package_format(dir / "b.Rpm") == PackageFormat::Yum);
    EXPECT_FALSE(detect_package_format(dir / "c.debx").has_value());
    EXPECT_FALSE(detect_package_format(dir / "looks.deb").has_value());
    EXPECT_FALSE(detect_package_format(dir / "missing.deb").has_value());
    fs::remove_all(dir);
}

TEST(UploadDestination, Parsing) {
    UploadTarget t = parse_upload_destination("repo/a/b/", false);
    EXPECT_EQ(t.repository, "repo");
    EXPECT_EQ(t.subdir, "a/b");

    t = parse_upload_destination("repo/a/out.tar.zst", true);
    EXPECT_EQ(t.subdir, "a");
    EXPECT_EQ(t.archive_name, "out.tar.zst");

    EXPECT_THROW(parse_upload_destination("repo/a/b", true), ConfigurationError);
    EXPECT_THROW(parse_upload_destination("/x", false), ConfigurationError);
}
