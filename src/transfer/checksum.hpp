#pragma once

#include <string>
#include <filesystem>
#include <memory>
#include <core/types.hpp>

namespace fs = std::filesystem;

class ByteSource;
class ProgressAccounter;

// "sha1", "SHA256", ... Throws ConfigurationError for anything else.
ChecksumAlgorithm parse_checksum_algorithm(const std::string& name);
std::string algorithm_name(ChecksumAlgorithm alg);

// Incremental digest over OpenSSL EVP. Lower-case hex output.
class Digester {
public:
    explicit Digester(ChecksumAlgorithm alg);
    ~Digester();

    Digester(const Digester&) = delete;
    Digester& operator=(const Digester&) = delete;

    void update(const char* data, size_t len);
    std::string hex_final();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string digest_stream(ByteSource& src, ChecksumAlgorithm alg,
                          ProgressAccounter* progress = nullptr);
std::string digest_file(const fs::path& path, ChecksumAlgorithm alg,
                        ProgressAccounter* progress = nullptr);
std::string digest_string(const std::string& data, ChecksumAlgorithm alg);

// Compares a local file against the digests the repository publishes for an
// asset, using one configured algorithm.
class ChecksumValidator {
public:
    explicit ChecksumValidator(ChecksumAlgorithm alg) : alg_(alg) {}

    ChecksumAlgorithm algorithm() const { return alg_; }

    std::string digest(const fs::path& path, ProgressAccounter* progress = nullptr) const;

    // True when `expected` carries a digest for the configured algorithm.
    bool can_validate(const Checksums& expected) const;

    // Case-insensitive compare. Throws IntegrityError when `expected` has no
    // digest for the configured algorithm.
    bool validate(const fs::path& path, const Checksums& expected,
                  ProgressAccounter* progress = nullptr) const;

private:
    ChecksumAlgorithm alg_;
};
