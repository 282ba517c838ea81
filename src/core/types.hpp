#pragma once

#include <string>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Checksums ───────────────────────────────────────────────

enum class ChecksumAlgorithm { SHA1, SHA256, SHA512, MD5 };

// Digests published by the repository for one asset. Empty = not published.
struct Checksums {
    std::string sha1;
    std::string sha256;
    std::string sha512;
    std::string md5;

    const std::string& get(ChecksumAlgorithm alg) const {
        switch (alg) {
            case ChecksumAlgorithm::SHA1:   return sha1;
            case ChecksumAlgorithm::SHA256: return sha256;
            case ChecksumAlgorithm::SHA512: return sha512;
            case ChecksumAlgorithm::MD5:    return md5;
        }
        return sha1;
    }
};

// ── Transfer units ──────────────────────────────────────────

struct RemoteAsset {
    std::string path;               // repository-relative, no leading slash
    std::string repository;
    std::string download_url;
    int64_t size_bytes = 0;
    Checksums checksums;
};

struct FileTransferUnit {
    std::string absolute_path;
    std::string relative_path;      // slash-separated
    int64_t size_bytes = 0;
};

struct TransferOutcome {
    enum class Kind { Uploaded, Downloaded, Skipped, Failed };

    Kind kind;
    std::string path;
    int64_t size_bytes = 0;
    std::string detail;             // skip reason or error message

    bool succeeded() const { return kind == Kind::Uploaded || kind == Kind::Downloaded; }
};

struct TransferSummary {
    int succeeded = 0;
    int skipped = 0;
    int deleted = 0;
    int failed = 0;

    int attempted() const { return succeeded + skipped + failed; }
    bool ok() const { return failed == 0; }
};

// Process exit status for transfer commands
enum class TransferStatus {
    Success = 0,
    Error = 1,
    NoAssetsFound = 66,
};
