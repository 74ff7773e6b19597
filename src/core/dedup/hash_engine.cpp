#include "hash_engine.hpp"

#include <charconv>
#include <filesystem>
#include <system_error>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace dbxfer::core {

namespace {

auto first_token(std::string_view text) -> std::string_view {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return {};
    const auto end = text.find_first_of(" \t\r\n", begin);
    return text.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin);
}

} // namespace

HashEngine::HashEngine(adapters::CommandRunner& runner,
                       infra::DigestAlgorithm algorithm,
                       std::size_t chunk_size)
    : runner_(runner)
    , algorithm_(algorithm)
    , chunk_size_(chunk_size == 0 ? infra::DigestHasher::DEFAULT_CHUNK_SIZE : chunk_size)
{}

auto HashEngine::compute_digest(const std::string& path, Side side) const -> std::optional<std::string> {
    auto digest = side == Side::Local ? local_digest_(path) : remote_digest_(path);
    if (digest) {
        spdlog::debug("{} {} {}: {}", to_string(side), infra::to_string(algorithm_), path, *digest);
    }
    return digest;
}

auto HashEngine::local_digest_(const std::string& path) const -> std::optional<std::string> {
    auto result = infra::DigestHasher::hash_file(path, algorithm_, chunk_size_);
    if (!result) {
        spdlog::warn("Error computing hash for {}: {}", path, result.error().message);
        return std::nullopt;
    }
    return std::move(*result);
}

auto HashEngine::remote_digest_(const std::string& path) const -> std::optional<std::string> {
    const auto program = infra::remote_digest_program(algorithm_);
    if (!program) {
        spdlog::warn("Unsupported hash algorithm on device: {}", infra::to_string(algorithm_));
        return std::nullopt;
    }

    auto output = runner_.run({"shell", std::string(*program), path});
    if (!output) {
        spdlog::warn("Error computing remote hash for {}: {}", path, output.error().message);
        return std::nullopt;
    }
    if (output->exit_code != 0) {
        spdlog::warn("Failed to compute remote hash for {} (code {}): {}",
                     path, output->exit_code, output->err);
        return std::nullopt;
    }

    auto digest = infra::normalize_hex_digest(first_token(output->out), algorithm_);
    if (!digest) {
        spdlog::warn("Unparsable {} output for {}", *program, path);
    }
    return digest;
}

auto HashEngine::file_size(const std::string& path, Side side) const -> std::optional<std::uint64_t> {
    if (side == Side::Local) {
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            return std::nullopt;
        }
        const auto size = fs::file_size(path, ec);
        if (ec) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(size);
    }

    auto output = runner_.run({"shell", "stat", "-c", "%s", path});
    if (!output || output->exit_code != 0) {
        return std::nullopt;
    }

    const auto token = first_token(output->out);
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (token.empty() || ec != std::errc{} || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return value;
}

auto HashEngine::is_remote_file(const std::string& path) const -> bool {
    auto output = runner_.run({"shell", "test", "-f", path});
    return output && output->exit_code == 0;
}

} // namespace dbxfer::core
