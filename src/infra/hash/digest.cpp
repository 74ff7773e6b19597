#include "digest.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <vector>
#include <fmt/core.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <xxhash.h>

namespace dbxfer::infra {

namespace {

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

struct Xxh64StateDeleter {
    void operator()(XXH64_state_t* state) const { XXH64_freeState(state); }
};
using Xxh64StatePtr = std::unique_ptr<XXH64_state_t, Xxh64StateDeleter>;

auto evp_for(DigestAlgorithm algorithm) -> const EVP_MD* {
    switch (algorithm) {
        case DigestAlgorithm::Sha256: return EVP_sha256();
        case DigestAlgorithm::Sha1:   return EVP_sha1();
        case DigestAlgorithm::Md5:    return EVP_md5();
        case DigestAlgorithm::Xxh64:  break;
    }
    return nullptr;
}

auto to_hex(const unsigned char* data, std::size_t size) -> std::string {
    static constexpr char hex[] = "0123456789abcdef";
    std::string out(size * 2, '0');
    for (std::size_t i = 0; i < size; ++i) {
        out[2 * i]     = hex[(data[i] >> 4) & 0xF];
        out[2 * i + 1] = hex[data[i] & 0xF];
    }
    return out;
}

// Общий цикл для EVP и XXH64: update вызывается на каждый прочитанный кусок
class Accumulator {
public:
    explicit Accumulator(DigestAlgorithm algorithm) : algorithm_(algorithm) {}

    auto init() -> VoidResult {
        if (algorithm_ == DigestAlgorithm::Xxh64) {
            xxh_.reset(XXH64_createState());
            if (!xxh_) {
                return std::unexpected(make_error(ErrorCode::DigestFailed, "Failed to create XXH64 state"));
            }
            XXH64_reset(xxh_.get(), 0); // seed = 0
            return {};
        }

        evp_.reset(EVP_MD_CTX_new());
        if (!evp_ || EVP_DigestInit_ex(evp_.get(), evp_for(algorithm_), nullptr) != 1) {
            return std::unexpected(make_error(ErrorCode::DigestFailed,
                                              fmt::format("Failed to initialise {} context", to_string(algorithm_))));
        }
        return {};
    }

    auto update(const char* data, std::size_t size) -> VoidResult {
        if (xxh_) {
            XXH64_update(xxh_.get(), data, size);
            return {};
        }
        if (EVP_DigestUpdate(evp_.get(), data, size) != 1) {
            return std::unexpected(make_error(ErrorCode::DigestFailed, "EVP_DigestUpdate failed"));
        }
        return {};
    }

    auto finish() -> Result<std::string> {
        if (xxh_) {
            return fmt::format("{:016x}", XXH64_digest(xxh_.get()));
        }
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int md_len = 0;
        if (EVP_DigestFinal_ex(evp_.get(), md, &md_len) != 1) {
            return std::unexpected(make_error(ErrorCode::DigestFailed, "EVP_DigestFinal_ex failed"));
        }
        return to_hex(md, md_len);
    }

private:
    DigestAlgorithm algorithm_;
    EvpCtxPtr evp_;
    Xxh64StatePtr xxh_;
};

} // namespace

auto parse_algorithm(std::string_view name) -> Result<DigestAlgorithm> {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "sha256") return DigestAlgorithm::Sha256;
    if (lowered == "sha1")   return DigestAlgorithm::Sha1;
    if (lowered == "md5")    return DigestAlgorithm::Md5;
    if (lowered == "xxh64")  return DigestAlgorithm::Xxh64;

    return std::unexpected(make_error(ErrorCode::UnsupportedAlgorithm,
                                      fmt::format("Unsupported hash algorithm: {}", name)));
}

auto to_string(DigestAlgorithm algorithm) -> std::string_view {
    switch (algorithm) {
        case DigestAlgorithm::Sha256: return "sha256";
        case DigestAlgorithm::Sha1:   return "sha1";
        case DigestAlgorithm::Md5:    return "md5";
        case DigestAlgorithm::Xxh64:  return "xxh64";
    }
    return "unknown";
}

auto remote_digest_program(DigestAlgorithm algorithm) -> std::optional<std::string_view> {
    switch (algorithm) {
        case DigestAlgorithm::Sha256: return "sha256sum";
        case DigestAlgorithm::Sha1:   return "sha1sum";
        case DigestAlgorithm::Md5:    return "md5sum";
        case DigestAlgorithm::Xxh64:  break;
    }
    return std::nullopt;
}

auto digest_hex_length(DigestAlgorithm algorithm) -> std::size_t {
    switch (algorithm) {
        case DigestAlgorithm::Sha256: return 64;
        case DigestAlgorithm::Sha1:   return 40;
        case DigestAlgorithm::Md5:    return 32;
        case DigestAlgorithm::Xxh64:  return 16;
    }
    return 0;
}

auto normalize_hex_digest(std::string_view token, DigestAlgorithm algorithm)
    -> std::optional<std::string>
{
    if (token.size() != digest_hex_length(algorithm)) {
        return std::nullopt;
    }
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

auto DigestHasher::hash_file(const std::filesystem::path& path,
                             DigestAlgorithm algorithm,
                             std::size_t chunk_size)
    -> Result<std::string>
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::unexpected(make_error(ErrorCode::FileNotFound,
                                          fmt::format("Not a regular file: {}", path.string())));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::DigestFailed,
                                          fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    Accumulator acc(algorithm);
    if (auto res = acc.init(); !res) {
        return std::unexpected(std::move(res.error()));
    }

    std::vector<char> buffer(chunk_size == 0 ? DEFAULT_CHUNK_SIZE : chunk_size);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        if (auto res = acc.update(buffer.data(), static_cast<std::size_t>(file.gcount())); !res) {
            return std::unexpected(std::move(res.error()));
        }
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::DigestFailed,
                                          fmt::format("Error reading file: {}", path.string())));
    }

    auto digest = acc.finish();
    if (digest) {
        spdlog::debug("{} {} = {}", to_string(algorithm), path.string(), *digest);
    }
    return digest;
}

auto DigestHasher::hash_bytes(std::string_view data, DigestAlgorithm algorithm)
    -> Result<std::string>
{
    Accumulator acc(algorithm);
    if (auto res = acc.init(); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = acc.update(data.data(), data.size()); !res) {
        return std::unexpected(std::move(res.error()));
    }
    return acc.finish();
}

} // namespace dbxfer::infra
