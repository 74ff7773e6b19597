#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "adapters/command_runner.hpp"
#include "infra/hash/digest.hpp"

namespace dbxfer::core {

enum class Side {
    Local,
    Remote,   // на устройстве, через CommandRunner
};

[[nodiscard]] constexpr auto to_string(Side side) -> std::string_view {
    return side == Side::Local ? "local" : "remote";
}

/// Дайджест и размер файла с любой стороны.
/// Состояния нет, поэтому можно вызывать из нескольких потоков одновременно
/// (если CommandRunner это допускает).
class HashEngine {
public:
    HashEngine(adapters::CommandRunner& runner,
               infra::DigestAlgorithm algorithm,
               std::size_t chunk_size = infra::DigestHasher::DEFAULT_CHUNK_SIZE);

    // nullopt: не обычный файл, не читается, ненулевой код или мусор в выводе
    [[nodiscard]] auto compute_digest(const std::string& path, Side side) const -> std::optional<std::string>;

    // shell stat -c %s <path> для устройства
    [[nodiscard]] auto file_size(const std::string& path, Side side) const -> std::optional<std::uint64_t>;

    // shell test -f <path>
    [[nodiscard]] auto is_remote_file(const std::string& path) const -> bool;

    [[nodiscard]] auto algorithm() const -> infra::DigestAlgorithm { return algorithm_; }

private:
    auto local_digest_(const std::string& path) const -> std::optional<std::string>;
    auto remote_digest_(const std::string& path) const -> std::optional<std::string>;

    adapters::CommandRunner& runner_;
    infra::DigestAlgorithm algorithm_;
    std::size_t chunk_size_;
};

} // namespace dbxfer::core
