#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>

namespace dbxfer::args_parser{
    struct CLIArgs;
}

namespace dbxfer::infra {

inline constexpr std::string_view kDefaultBridge = "adb";
inline constexpr std::string_view kDefaultAlgorithm = "sha256";
inline constexpr std::size_t kDefaultChunkSize = 64 * 1024;
inline constexpr std::uint32_t kDefaultGracePeriodMs = 2000;

struct Config {
    // Внешний инструмент
    std::optional<std::string> bridge;          // путь или имя бинарника (adb)
    std::optional<std::string> device;          // serial -> "-s <serial>"

    // Дедупликация
    bool dedup = false;
    std::optional<std::string> algorithm;       // sha256 | sha1 | md5 | xxh64
    std::optional<std::size_t> chunk_size;      // bytes
    std::optional<std::uint32_t> hash_threads;

    // Отмена
    std::optional<std::uint32_t> grace_period_ms;

    // Локальные пути назначения ограничены этим каталогом (если задан)
    std::optional<std::string> base_dir;

    // Вывод
    bool progress = true;
    bool quiet = false;
    bool verbose = false;
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.dbxfer.yaml
///   2. $XDG_CONFIG_HOME/dbxfer/config.yaml
///   3. ~/.config/dbxfer/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Разбирает конкретный файл (используется load_config_from_file и тестами).
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const dbxfer::args_parser::CLIArgs& args) -> Config;

/// Уровень логирования с учётом quiet/verbose.
[[nodiscard]] auto effective_log_level(const Config& config) -> std::string;

} // namespace dbxfer::infra
