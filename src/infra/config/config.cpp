#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace dbxfer::infra {
    void Config::merge_with(const Config& other) {
        if (other.bridge) bridge = other.bridge;
        if (other.device) device = other.device;
        if (other.dedup) dedup = true;
        if (other.algorithm) algorithm = other.algorithm;
        if (other.chunk_size) chunk_size = other.chunk_size;
        if (other.hash_threads) hash_threads = other.hash_threads;
        if (other.grace_period_ms) grace_period_ms = other.grace_period_ms;
        if (other.base_dir) base_dir = other.base_dir;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
        if (other.verbose) verbose = true;
        if (other.log_level) log_level = other.log_level;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".dbxfer.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "dbxfer" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "dbxfer" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["bridge"]) cfg.bridge = config["bridge"].as<std::string>();
            if (config["device"]) cfg.device = config["device"].as<std::string>();

            if (config["dedup"]) cfg.dedup = config["dedup"].as<bool>();
            if (config["algorithm"]) cfg.algorithm = config["algorithm"].as<std::string>();
            if (config["chunk_size"]) cfg.chunk_size = config["chunk_size"].as<std::size_t>();
            if (config["hash_threads"]) cfg.hash_threads = config["hash_threads"].as<std::uint32_t>();
            if (config["grace_period_ms"]) cfg.grace_period_ms = config["grace_period_ms"].as<std::uint32_t>();
            if (config["base_dir"]) cfg.base_dir = config["base_dir"].as<std::string>();

            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            if (cfg.chunk_size && *cfg.chunk_size == 0) {
                return std::unexpected(fmt::format("Invalid chunk_size in {}: must be positive", path.string()));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config(path);
        }

        // Файл не найден: возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const __CLI& args) -> Config {
        Config cfg{};
        cfg.bridge = args.bridge;
        cfg.device = args.device;
        cfg.dedup = args.dedup;
        cfg.algorithm = args.algorithm;
        cfg.hash_threads = args.threads;
        cfg.grace_period_ms = args.grace_ms;
        cfg.base_dir = args.base_dir;
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        cfg.verbose = args.verbose;
        return cfg;
    }

    auto effective_log_level(const Config& config) -> std::string {
        if (config.verbose) return "debug";
        if (config.quiet) return "warn";
        return config.log_level.value_or("info");
    }

} // namespace dbxfer::infra
