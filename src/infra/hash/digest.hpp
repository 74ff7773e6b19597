#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "../error_handler/error.hpp"

namespace dbxfer::infra {

enum class DigestAlgorithm {
    Sha256,   // 256 бит, совпадает с sha256sum на устройстве
    Sha1,     // 160 бит
    Md5,      // 128 бит
    Xxh64,    // только локально: на устройстве нет xxhsum
};

[[nodiscard]] auto parse_algorithm(std::string_view name) -> Result<DigestAlgorithm>;
[[nodiscard]] auto to_string(DigestAlgorithm algorithm) -> std::string_view;

/// Программа на устройстве, печатающая "<hex>  <file>", либо nullopt.
[[nodiscard]] auto remote_digest_program(DigestAlgorithm algorithm) -> std::optional<std::string_view>;

/// Длина hex-представления дайджеста.
[[nodiscard]] auto digest_hex_length(DigestAlgorithm algorithm) -> std::size_t;

/// Проверяет токен из вывода md5sum/sha1sum/sha256sum и приводит к нижнему регистру.
[[nodiscard]] auto normalize_hex_digest(std::string_view token, DigestAlgorithm algorithm)
    -> std::optional<std::string>;

class DigestHasher {
public:
    static constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

    // Читает файл кусками chunk_size и возвращает hex-дайджест
    static auto hash_file(const std::filesystem::path& path,
                          DigestAlgorithm algorithm,
                          std::size_t chunk_size = DEFAULT_CHUNK_SIZE)
        -> Result<std::string>;

    static auto hash_bytes(std::string_view data, DigestAlgorithm algorithm)
        -> Result<std::string>;
};

} // namespace dbxfer::infra
