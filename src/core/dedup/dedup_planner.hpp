#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>
#include "adapters/command_runner.hpp"
#include "hash_engine.hpp"
#include "infra/hash/digest.hpp"

namespace dbxfer::core {

// path -> hex digest; строится заново на каждый вызов планировщика
using HashIndex = std::unordered_map<std::string, std::string>;

struct DuplicateReport {
    std::vector<std::string> files_to_transfer;   // в порядке source
    std::vector<std::string> duplicates;          // в порядке source
    std::uint64_t bytes_saved = 0;
    std::uint64_t files_saved = 0;                // только дубликаты с известным размером
};

struct PlannerOptions {
    infra::DigestAlgorithm algorithm = infra::DigestAlgorithm::Sha256;
    std::size_t chunk_size = infra::DigestHasher::DEFAULT_CHUNK_SIZE;
    std::size_t hash_threads = 0;   // 0 = по числу ядер
};

/// Делит набор файлов на "передать" и "пропустить" по совпадению содержимого.
/// Имя файла не важно: дубликат - любой source, чей дайджест есть среди target.
class DedupPlanner {
public:
    using StatusCallback = std::function<void(const std::string&)>;
    using ProgressCallback = std::function<void(int)>;

    DedupPlanner(adapters::CommandRunner& runner, PlannerOptions options = {});

    void set_status_callback(StatusCallback cb) { status_cb_ = std::move(cb); }
    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    // stop проверяется между файлами; при остановке индекс неполный
    [[nodiscard]] auto build_hash_index(const std::vector<std::string>& paths, Side side,
                                        std::stop_token stop = {}) const -> HashIndex;

    // После остановки отчёт неполный, вызывающий сам проверяет stop
    [[nodiscard]] auto find_duplicate_files(const std::vector<std::string>& source_paths,
                                            const std::vector<std::string>& target_paths,
                                            Side source_side,
                                            Side target_side,
                                            std::stop_token stop = {}) const -> DuplicateReport;

    // false, если хотя бы один дайджест не посчитан
    [[nodiscard]] auto check_files_identical(const std::string& local_path,
                                             const std::string& remote_path) const -> bool;

    // Все обычные файлы под root. Локально - рекурсивный обход, на устройстве - find -type f.
    [[nodiscard]] auto list_files(const std::string& root, Side side,
                                  std::stop_token stop = {}) const -> std::vector<std::string>;

    [[nodiscard]] auto engine() const -> const HashEngine& { return engine_; }

private:
    auto build_local_index_(const std::vector<std::string>& paths, std::stop_token stop) const -> HashIndex;
    auto build_remote_index_(const std::vector<std::string>& paths, std::stop_token stop) const -> HashIndex;
    void report_(std::size_t done, std::size_t total, Side side) const;
    void status_(const std::string& message) const;

    adapters::CommandRunner& runner_;
    HashEngine engine_;
    PlannerOptions options_;
    StatusCallback status_cb_;
    ProgressCallback progress_cb_;
};

// "512 B", "1.5 KB", "3.0 MB", "1.2 GB"
[[nodiscard]] auto format_bytes(std::uint64_t bytes) -> std::string;

} // namespace dbxfer::core
