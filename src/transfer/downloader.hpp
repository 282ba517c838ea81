#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "transfer_options.hpp"

namespace fs = std::filesystem;

class Console;
class RepositoryClient;
class ProgressAccounter;
class ChecksumValidator;

// "repository/folder[/archive.tar.gz]"
struct DownloadSource {
    std::string repository;
    std::string folder;
    std::string archive_name;   // set only with compress
};

// Throws ConfigurationError when there is no '/' or, with compress, no
// archive filename as the last component.
DownloadSource parse_download_source(const std::string& source, bool compress);

// One asset and the local path it lands on.
struct PlannedDownload {
    RemoteAsset asset;
    fs::path local_path;
    std::string display_path;
};

class Downloader {
public:
    Downloader(RepositoryClient& client, const TransferOptions& options, Console& console);

    // Download a remote folder (or one exact asset) into dest_dir.
    TransferReport download(const std::string& source, const fs::path& dest_dir);

    // Execute an explicit plan. Used by dependency sync.
    TransferReport download_planned(const std::vector<PlannedDownload>& plan, const std::string& label);

    // Local layout for `assets` listed under `folder`. With flatten the folder
    // prefix is stripped from every path.
    std::vector<PlannedDownload> plan(const std::vector<RemoteAsset>& assets,
                                      const std::string& folder, const fs::path& dest_dir) const;

private:
    TransferReport download_compressed(const DownloadSource& src, const fs::path& dest_dir);
    TransferReport execute(const std::vector<PlannedDownload>& plan, const std::string& label,
                           const fs::path* prune_root);

    TransferOutcome download_one(const PlannedDownload& item, const ChecksumValidator& validator,
                                 ProgressAccounter& progress);

    RepositoryClient& client_;
    TransferOptions options_;
    Console& console_;
};
