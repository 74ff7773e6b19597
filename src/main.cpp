#include <iostream>
#include <fmt/core.h>
#include <fmt/ranges.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/hash/digest.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "adapters/command_runner.hpp"
#include "core/dedup/dedup_planner.hpp"
#include "core/dedup/hash_engine.hpp"
#include "core/transfer/transfer_manager.hpp"
#include "extensions/validation.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <thread>

using GIT = dbxfer::build_info::GitInfo;
using ARGS = dbxfer::args_parser::CLIArgs;

constexpr auto load_from_cli = dbxfer::infra::config_from_cli;
constexpr auto load_config_file = dbxfer::infra::load_config_from_file;
constexpr auto args_parser = dbxfer::args_parser::parse_args;
constexpr auto git = dbxfer::build_info::get_git_info();

namespace core = dbxfer::core;
namespace infra = dbxfer::infra;
namespace ext = dbxfer::extensions;

static auto
__out_git_verse(const GIT& git)
-> void {
    spdlog::debug("Git branch: {}", git.branch);
    spdlog::debug("Git commit: {}{}", git.commit, git.dirty ? " (dirty)" : "");
    spdlog::debug("Build timestamp (UTC): {}", git.timestamp);
}

static auto
__out_args_verse(const ARGS& args)
-> void {
    spdlog::debug("Command: {}", args.command);
    if (args.command == "plan") {
        spdlog::debug("Sources: {} ({})", args.sources, args.source_remote ? "remote" : "local");
        spdlog::debug("Targets: {} ({})", args.targets, args.target_remote ? "remote" : "local");
    } else {
        spdlog::debug("Source: {}", args.source);
        spdlog::debug("Destination: {}", args.destination);
    }
    spdlog::debug("Dedup: {}", args.dedup ? "yes" : "no");
    spdlog::debug("Threads: {}", args.threads ? fmt::to_string(*args.threads) : "auto");
}

// Пути для одной стороны: устройство или локальная ФС
static auto
__validate_paths(const std::vector<std::string>& paths, core::Side side)
-> infra::Result<std::vector<std::string>> {
    std::vector<std::string> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        auto checked = side == core::Side::Remote
            ? ext::validate_remote_path(p)
            : ext::validate_local_path(p);
        if (!checked) {
            return std::unexpected(std::move(checked.error()));
        }
        out.push_back(std::move(*checked));
    }
    return out;
}

// Файлы для плана: папка раскрывается в список, файл берётся как есть
static auto
__expand(const core::DedupPlanner& planner, const std::vector<std::string>& paths, core::Side side)
-> std::vector<std::string> {
    std::vector<std::string> files;
    for (const auto& p : paths) {
        auto listed = planner.list_files(p, side);
        if (listed.empty()) {
            files.push_back(p);
        } else {
            files.insert(files.end(), listed.begin(), listed.end());
        }
    }
    return files;
}

static auto
__run_plan(const ARGS& args, dbxfer::adapters::CommandRunner& runner, const core::TransferOptions& options)
-> int {
    const auto source_side = args.source_remote ? core::Side::Remote : core::Side::Local;
    const auto target_side = args.target_remote ? core::Side::Remote : core::Side::Local;

    auto sources = __validate_paths(args.sources, source_side);
    if (!sources) {
        return infra::log_and_return(std::move(sources.error())).to_exit_code();
    }
    auto targets = __validate_paths(args.targets, target_side);
    if (!targets) {
        return infra::log_and_return(std::move(targets.error())).to_exit_code();
    }

    core::DedupPlanner planner(runner, core::PlannerOptions{
        .algorithm = options.algorithm,
        .chunk_size = options.chunk_size,
        .hash_threads = options.hash_threads,
    });
    planner.set_status_callback([](const std::string& message) { spdlog::debug("{}", message); });

    const auto source_files = __expand(planner, *sources, source_side);
    const auto target_files = __expand(planner, *targets, target_side);
    const auto report = planner.find_duplicate_files(source_files, target_files, source_side, target_side);

    fmt::print("Files to transfer: {}\n", report.files_to_transfer.size());
    for (const auto& f : report.files_to_transfer) {
        fmt::print("  + {}\n", f);
    }
    fmt::print("Duplicates: {}\n", report.duplicates.size());
    for (const auto& f : report.duplicates) {
        fmt::print("  = {}\n", f);
    }
    fmt::print("Saved: {} in {} files\n", core::format_bytes(report.bytes_saved), report.files_saved);
    return 0;
}

static auto
__run_transfer(const ARGS& args, const infra::Config& config,
               dbxfer::adapters::CommandRunner& runner, const core::TransferOptions& options)
-> int {
    const auto direction = args.command == "pull" ? core::Direction::Pull : core::Direction::Push;

    // pull: устройство -> локально, push: наоборот; base_dir ограничивает только локальное назначение
    auto source = direction == core::Direction::Pull
        ? ext::validate_remote_path(args.source)
        : ext::validate_local_path(args.source);
    if (!source) {
        return infra::log_and_return(std::move(source.error())).to_exit_code();
    }
    auto destination = direction == core::Direction::Pull
        ? ext::validate_local_path(args.destination, config.base_dir)
        : ext::validate_remote_path(args.destination);
    if (!destination) {
        return infra::log_and_return(std::move(destination.error())).to_exit_code();
    }

    bool is_single_file = false;
    if (direction == core::Direction::Push) {
        std::error_code ec;
        if (!std::filesystem::exists(*source, ec)) {
            spdlog::error("Source does not exist: {}", *source);
            return 1;
        }
        is_single_file = std::filesystem::is_regular_file(*source, ec);
    } else {
        is_single_file = core::HashEngine(runner, options.algorithm).is_remote_file(*source);
    }

    const core::TransferRequest request{
        .direction = direction,
        .source_path = *source,
        .destination_path = *destination,
        .is_single_file = is_single_file,
    };

    const auto grace = std::chrono::milliseconds(config.grace_period_ms.value_or(infra::kDefaultGracePeriodMs));
    core::TransferManager manager(runner, grace);

    infra::ProgressMonitor monitor(config.progress, config.quiet);
    const bool echo_status = !monitor.is_enabled() && !config.quiet;

    manager.set_progress_callback([&monitor](int pct) { monitor.set_percentage(pct); });
    manager.set_files_callback([&monitor](std::uint64_t done, std::uint64_t total) { monitor.set_files(done, total); });
    manager.set_status_callback([&monitor, echo_status](const std::string& message) {
        monitor.set_status(message);
        if (echo_status) {
            fmt::print("{}\n", message);
        }
    });

    auto generation = manager.start_transfer(request, options);
    if (!generation) {
        return infra::log_and_return(std::move(generation.error())).to_exit_code();
    }

    // Ctrl+C: флаг из обработчика сигнала, отмена - здесь
    bool cancel_sent = false;
    while (manager.is_active()) {
        if (!cancel_sent && infra::is_interrupted()) {
            cancel_sent = true;
            spdlog::debug("Interrupted by signal {}", infra::interrupt_signal());
            manager.cancel();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    const auto result = manager.wait();
    monitor.finish();

    if (!result) {
        spdlog::error("Transfer finished without a result");
        return 1;
    }

    if (result->stats && options.dedup && !config.quiet) {
        const auto& stats = *result->stats;
        spdlog::info("Duplicates skipped: {} ({} saved in {} files)",
                     stats.duplicates, core::format_bytes(stats.bytes_saved), stats.files_saved);
    }

    if (result->cancelled) {
        spdlog::warn("{}", result->message);
        return infra::make_error(infra::ErrorCode::Cancelled, result->message).to_exit_code();
    }
    if (!result->success) {
        spdlog::error("{}", result->message);
        return 1;
    }
    if (!config.quiet) {
        spdlog::info("{}", result->message);
    }
    return 0;
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return 1; // --help или ошибка
        }
        const auto& args = *args_opt;

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        spdlog::set_level(spdlog::level::from_str(infra::effective_log_level(config)));
        __out_git_verse(git);
        __out_args_verse(args);

        auto algorithm = infra::parse_algorithm(config.algorithm.value_or(std::string(infra::kDefaultAlgorithm)));
        if (!algorithm) {
            return infra::log_and_return(std::move(algorithm.error())).to_exit_code();
        }

        std::optional<std::string> device;
        if (config.device) {
            auto checked = ext::validate_device_id(*config.device);
            if (!checked) {
                return infra::log_and_return(std::move(checked.error())).to_exit_code();
            }
            device = std::move(*checked);
        }

        dbxfer::adapters::BridgeCommandRunner runner(
            config.bridge.value_or(std::string(infra::kDefaultBridge)), device);

        const core::TransferOptions options{
            .dedup = config.dedup,
            .algorithm = *algorithm,
            .chunk_size = config.chunk_size.value_or(infra::kDefaultChunkSize),
            .hash_threads = config.hash_threads.value_or(0),
        };

        if (args.command == "plan") {
            return __run_plan(args, runner, options);
        }
        return __run_transfer(args, config, runner, options);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
