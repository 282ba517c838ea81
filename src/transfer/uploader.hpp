#pragma once

#include <map>
#include <string>
#include <filesystem>
#include <optional>
#include <core/types.hpp>
#include <nexus/multipart.hpp>
#include "transfer_options.hpp"

namespace fs = std::filesystem;

class Console;
class RepositoryClient;
class ProgressAccounter;
class TransferTracker;
class ChecksumValidator;

// "repository[/subdir]". With compress the last component must be the
// archive filename (.tar.gz, .tar.zst or .zip).
struct UploadTarget {
    std::string repository;
    std::string subdir;
    std::string archive_name;
};

// Throws ConfigurationError for a missing repository or archive name.
UploadTarget parse_upload_destination(const std::string& destination, bool compress);

// Apt for a regular .deb file, Yum for a regular .rpm file (any case).
std::optional<PackageFormat> detect_package_format(const fs::path& source);

class Uploader {
public:
    Uploader(RepositoryClient& client, const TransferOptions& options, Console& console);

    // Upload a directory tree (or one regular file) to `destination`.
    // A single .deb or .rpm goes to an apt or yum repository instead, and
    // then `destination` must be a bare repository name.
    // Per-file failures are counted, not thrown.
    TransferReport upload(const fs::path& source, const std::string& destination);

private:
    TransferReport upload_files(const fs::path& source, const UploadTarget& target);
    TransferReport upload_compressed(const fs::path& source, const UploadTarget& target);
    TransferReport upload_package(const fs::path& source, const std::string& repository,
                                  PackageFormat format);

    std::map<std::string, RemoteAsset> remote_index(const UploadTarget& target);

    TransferOutcome upload_one(const FileTransferUnit& unit, const UploadTarget& target,
                               const std::map<std::string, RemoteAsset>& remote,
                               const ChecksumValidator& validator, ProgressAccounter& progress);

    RepositoryClient& client_;
    TransferOptions options_;
    Console& console_;
};
