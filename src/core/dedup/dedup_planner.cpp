#include "dedup_planner.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <unordered_set>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "infra/thread_pool/thread_pool.hpp"

namespace fs = std::filesystem;

namespace dbxfer::core {

DedupPlanner::DedupPlanner(adapters::CommandRunner& runner, PlannerOptions options)
    : runner_(runner)
    , engine_(runner, options.algorithm, options.chunk_size)
    , options_(options)
{}

void DedupPlanner::status_(const std::string& message) const {
    if (status_cb_) status_cb_(message);
}

void DedupPlanner::report_(std::size_t done, std::size_t total, Side side) const {
    if (total == 0) return;
    if (progress_cb_) {
        progress_cb_(static_cast<int>(done * 100 / total));
    }
    status_(fmt::format("Computing {} hashes... {}/{}", to_string(side), done, total));
}

auto DedupPlanner::build_hash_index(const std::vector<std::string>& paths, Side side,
                                    std::stop_token stop) const -> HashIndex {
    return side == Side::Local ? build_local_index_(paths, stop) : build_remote_index_(paths, stop);
}

auto DedupPlanner::build_local_index_(const std::vector<std::string>& paths,
                                      std::stop_token stop) const -> HashIndex {
    HashIndex index;
    if (paths.empty()) return index;

    const std::size_t threads = std::min(
        options_.hash_threads == 0 ? infra::ThreadPool::default_thread_count() : options_.hash_threads,
        paths.size());

    infra::ThreadPool pool(threads);
    std::vector<std::future<std::optional<std::string>>> pending;
    pending.reserve(paths.size());
    for (const auto& path : paths) {
        pending.push_back(pool.submit([this, &path, stop]() -> std::optional<std::string> {
            if (stop.stop_requested()) return std::nullopt;
            return engine_.compute_digest(path, Side::Local);
        }));
    }

    // результаты забираются в порядке paths, чтобы статус шёл по порядку
    // очередь пула дорабатывает сама: после остановки задачи сразу возвращают nullopt
    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (auto digest = pending[i].get()) {
            index.emplace(paths[i], std::move(*digest));
        }
        if (stop.stop_requested()) break;
        report_(i + 1, paths.size(), Side::Local);
    }
    return index;
}

auto DedupPlanner::build_remote_index_(const std::vector<std::string>& paths,
                                       std::stop_token stop) const -> HashIndex {
    HashIndex index;
    // adb shell по одному: параллельные сессии на устройстве только мешают друг другу
    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (stop.stop_requested()) {
            spdlog::debug("Remote hashing stopped at {}/{}", i, paths.size());
            break;
        }
        if (auto digest = engine_.compute_digest(paths[i], Side::Remote)) {
            index.emplace(paths[i], std::move(*digest));
        }
        report_(i + 1, paths.size(), Side::Remote);
    }
    return index;
}

auto DedupPlanner::find_duplicate_files(const std::vector<std::string>& source_paths,
                                        const std::vector<std::string>& target_paths,
                                        Side source_side,
                                        Side target_side,
                                        std::stop_token stop) const -> DuplicateReport
{
    status_("Building hash maps for duplicate detection...");

    DuplicateReport report;
    const auto source_index = build_hash_index(source_paths, source_side, stop);
    if (stop.stop_requested()) {
        report.files_to_transfer = source_paths;
        return report;
    }
    const auto target_index = build_hash_index(target_paths, target_side, stop);
    if (stop.stop_requested()) {
        report.files_to_transfer = source_paths;
        return report;
    }

    std::unordered_set<std::string> target_digests;
    target_digests.reserve(target_index.size());
    for (const auto& [path, digest] : target_index) {
        target_digests.insert(digest);
    }

    for (const auto& path : source_paths) {
        auto it = source_index.find(path);
        if (it != source_index.end() && target_digests.contains(it->second)) {
            report.duplicates.push_back(path);
        } else {
            report.files_to_transfer.push_back(path);
        }
    }

    for (const auto& path : report.duplicates) {
        if (auto size = engine_.file_size(path, source_side)) {
            report.bytes_saved += *size;
            ++report.files_saved;
        }
    }

    spdlog::info("Dedup: {} duplicates, {} to transfer, {} saved",
                 report.duplicates.size(), report.files_to_transfer.size(), format_bytes(report.bytes_saved));
    status_(fmt::format("Found {} duplicates, {} files to transfer",
                        report.duplicates.size(), report.files_to_transfer.size()));
    return report;
}

auto DedupPlanner::check_files_identical(const std::string& local_path,
                                         const std::string& remote_path) const -> bool
{
    const auto local = engine_.compute_digest(local_path, Side::Local);
    if (!local) return false;
    const auto remote = engine_.compute_digest(remote_path, Side::Remote);
    if (!remote) return false;
    return *local == *remote;
}

auto DedupPlanner::list_files(const std::string& root, Side side,
                              std::stop_token stop) const -> std::vector<std::string> {
    std::vector<std::string> files;
    if (stop.stop_requested()) return files;

    if (side == Side::Local) {
        std::error_code ec;
        if (fs::is_regular_file(root, ec)) {
            files.push_back(root);
            return files;
        }
        if (!fs::is_directory(root, ec)) {
            return files;
        }
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            spdlog::warn("Cannot list {}: {}", root, ec.message());
            return files;
        }
        for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (stop.stop_requested()) {
                files.clear();
                return files;
            }
            if (ec) {
                spdlog::warn("Error while listing {}: {}", root, ec.message());
                break;
            }
            std::error_code entry_ec;
            if (it->is_regular_file(entry_ec)) {
                files.push_back(it->path().string());
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    auto output = runner_.run({"shell", "find", root, "-type", "f"});
    if (!output) {
        spdlog::warn("Cannot list remote {}: {}", root, output.error().message);
        return files;
    }
    if (output->exit_code != 0) {
        spdlog::debug("find {} exited with {}", root, output->exit_code);
        return files;
    }

    std::string_view rest = output->out;
    while (!rest.empty()) {
        const auto nl = rest.find('\n');
        auto line = rest.substr(0, nl);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        if (!line.empty()) files.emplace_back(line);
        if (nl == std::string_view::npos) break;
        rest.remove_prefix(nl + 1);
    }
    std::sort(files.begin(), files.end());
    return files;
}

auto format_bytes(std::uint64_t bytes) -> std::string {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    if (bytes < 1024) {
        return fmt::format("{} B", bytes);
    }
    const auto value = static_cast<double>(bytes);
    if (value < MB) {
        return fmt::format("{:.1f} KB", value / KB);
    }
    if (value < GB) {
        return fmt::format("{:.1f} MB", value / MB);
    }
    return fmt::format("{:.1f} GB", value / GB);
}

} // namespace dbxfer::core
