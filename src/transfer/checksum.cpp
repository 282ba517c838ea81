#include "checksum.hpp"
#include "streams.hpp"
#include "progress.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <openssl/evp.h>
#include <fmt/format.h>
#include <vector>

ChecksumAlgorithm parse_checksum_algorithm(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "sha1") return ChecksumAlgorithm::SHA1;
    if (n == "sha256") return ChecksumAlgorithm::SHA256;
    if (n == "sha512") return ChecksumAlgorithm::SHA512;
    if (n == "md5") return ChecksumAlgorithm::MD5;
    throw ConfigurationError(fmt::format(
        "unsupported checksum algorithm '{}' (expected sha1, sha256, sha512 or md5)", name));
}

std::string algorithm_name(ChecksumAlgorithm alg) {
    switch (alg) {
        case ChecksumAlgorithm::SHA1:   return "sha1";
        case ChecksumAlgorithm::SHA256: return "sha256";
        case ChecksumAlgorithm::SHA512: return "sha512";
        case ChecksumAlgorithm::MD5:    return "md5";
    }
    return "sha1";
}

static const EVP_MD* evp_for(ChecksumAlgorithm alg) {
    switch (alg) {
        case ChecksumAlgorithm::SHA1:   return EVP_sha1();
        case ChecksumAlgorithm::SHA256: return EVP_sha256();
        case ChecksumAlgorithm::SHA512: return EVP_sha512();
        case ChecksumAlgorithm::MD5:    return EVP_md5();
    }
    return EVP_sha1();
}

// ── Digester ───────────────────────────────────────────────

struct Digester::Impl {
    EVP_MD_CTX* ctx = nullptr;
    ~Impl() { if (ctx) EVP_MD_CTX_free(ctx); }
};

Digester::Digester(ChecksumAlgorithm alg) : impl_(std::make_unique<Impl>()) {
    impl_->ctx = EVP_MD_CTX_new();
    if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx, evp_for(alg), nullptr) != 1) {
        throw NexcliError(fmt::format("cannot initialise {} digest", algorithm_name(alg)));
    }
}

Digester::~Digester() = default;

void Digester::update(const char* data, size_t len) {
    if (EVP_DigestUpdate(impl_->ctx, data, len) != 1) {
        throw NexcliError("digest update failed");
    }
}

std::string Digester::hex_final() {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, md, &len) != 1) {
        throw NexcliError("digest finalisation failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        result += hex[(md[i] >> 4) & 0xF];
        result += hex[md[i] & 0xF];
    }
    return result;
}

// ── Helpers ────────────────────────────────────────────────

std::string digest_stream(ByteSource& src, ChecksumAlgorithm alg, ProgressAccounter* progress) {
    Digester d(alg);
    std::vector<char> buf(IO_CHUNK_SIZE);
    for (;;) {
        size_t n = src.read(buf.data(), buf.size());
        if (n == 0) break;
        d.update(buf.data(), n);
        if (progress) progress->add_bytes(static_cast<int64_t>(n));
    }
    return d.hex_final();
}

std::string digest_file(const fs::path& path, ChecksumAlgorithm alg, ProgressAccounter* progress) {
    FileSource src(path);
    return digest_stream(src, alg, progress);
}

std::string digest_string(const std::string& data, ChecksumAlgorithm alg) {
    Digester d(alg);
    d.update(data.data(), data.size());
    return d.hex_final();
}

// ── ChecksumValidator ──────────────────────────────────────

std::string ChecksumValidator::digest(const fs::path& path, ProgressAccounter* progress) const {
    return digest_file(path, alg_, progress);
}

bool ChecksumValidator::can_validate(const Checksums& expected) const {
    return !expected.get(alg_).empty();
}

bool ChecksumValidator::validate(const fs::path& path, const Checksums& expected,
                                 ProgressAccounter* progress) const {
    const std::string& want = expected.get(alg_);
    if (want.empty()) {
        throw IntegrityError(fmt::format("no {} checksum published for {}",
                                         algorithm_name(alg_), path.filename().string()));
    }
    return to_lower(digest(path, progress)) == to_lower(want);
}
