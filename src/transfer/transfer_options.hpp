#pragma once

#include <string>
#include <optional>
#include <core/constants.hpp>
#include <core/types.hpp>
#include "archive_codec.hpp"

// Per-invocation settings for upload and download. Built from flags and
// Config by the CLI; never read from global state.
struct TransferOptions {
    ChecksumAlgorithm checksum = ChecksumAlgorithm::SHA1;
    bool skip_checksum = false;     // existence-only skip
    bool force = false;             // never skip
    bool dry_run = false;
    bool compress = false;
    std::optional<ArchiveFormat> compress_format;   // detected from the archive name when unset
    std::string glob;
    std::string key_from;
    bool flatten = false;           // download only
    bool delete_extra = false;      // download only
    int parallelism = DEFAULT_PARALLELISM;
};

struct TransferReport {
    TransferStatus status = TransferStatus::Success;
    TransferSummary summary;
};
