#include "transfer_executor.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "core/progress/output_parser.hpp"

namespace dbxfer::core {

namespace {

auto trim(std::string_view text) -> std::string_view {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

TransferExecutor::TransferExecutor(adapters::CommandRunner& runner, ProcessController& controller)
    : runner_(runner), controller_(controller) {}

auto TransferExecutor::build_args(const TransferRequest& request) -> std::vector<std::string> {
    return {std::string(to_verb(request.direction)), request.source_path, request.destination_path};
}

auto TransferExecutor::run(const TransferRequest& request,
                           TransferGeneration generation,
                           TransferObserver& observer,
                           std::uint64_t expected_files,
                           std::stop_token stop) -> TransferResult
{
    const auto title = to_title(request.direction);

    ProgressState state;
    state.reset(Clock::now());

    observer.on_progress(generation, 0);
    observer.on_status(generation, fmt::format("Starting {}...", to_verb(request.direction)));
    spdlog::info("[gen {}] {} {} -> {}", generation, title, request.source_path, request.destination_path);

    auto child = controller_.start(runner_, build_args(request), stop);
    if (!child) {
        if (child.error().is_cancellation()) {
            return TransferResult{.success = false, .cancelled = true, .message = "Transfer cancelled by user."};
        }
        auto err = infra::log_and_return(std::move(child.error()));
        auto message = fmt::format("{} error: {}", title, err.message);
        observer.on_status(generation, message);
        return TransferResult{.success = false, .cancelled = false, .message = std::move(message)};
    }

    std::uint64_t files_done = 0;
    std::string last_output;
    std::optional<infra::Error> stream_error;

    for (;;) {
        auto line = (*child)->read_line();
        if (!line) {
            stream_error = std::move(line.error());
            break;
        }
        if (!*line) {
            break; // EOF
        }

        const auto& text = **line;

        if (auto files = parse_file_count(text)) {
            files_done = files->absolute ? files->count : files_done + files->count;
            if (expected_files > 0) {
                observer.on_files(generation, files_done, expected_files);
            }
        }

        const auto signal = parse_progress(text);
        if (signal) {
            spdlog::debug("[gen {}] explicit progress {}% from '{}'", generation, *signal, text);
        }
        if (auto pct = ProgressEstimator::on_line(state, signal, Clock::now())) {
            observer.on_progress(generation, *pct);
        }

        const auto stripped = trim(text);
        if (!stripped.empty()) {
            last_output.assign(stripped);
            observer.on_status(generation, last_output);
        }
    }

    if (stream_error) {
        // процесс дальше не читается: останавливаем его
        controller_.cancel();
        auto err = infra::log_and_return(std::move(*stream_error));
        auto message = fmt::format("{} error: {}", title, err.message);
        observer.on_status(generation, message);
        return TransferResult{.success = false, .cancelled = false, .message = std::move(message)};
    }

    const int exit_code = controller_.finish(*child);
    const auto exit = controller_.last_exit();

    TransferStats stats;
    stats.files_transferred = files_done;

    if (exit && exit->cancelled) {
        spdlog::info("[gen {}] {} cancelled (exit {})", generation, title, exit_code);
        return TransferResult{.success = false, .cancelled = true,
                              .message = "Transfer cancelled by user.", .stats = stats};
    }

    if (auto pct = ProgressEstimator::on_exit(state, exit_code)) {
        observer.on_progress(generation, *pct);
        if (request.is_single_file && files_done == 0) {
            stats.files_transferred = 1;
            observer.on_files(generation, 1, 1);
        }
        auto message = fmt::format("{} completed successfully.", title);
        observer.on_status(generation, message);
        spdlog::info("[gen {}] {} finished after {} lines", generation, title, state.line_count);
        return TransferResult{.success = true, .cancelled = false, .message = std::move(message), .stats = stats};
    }

    auto message = fmt::format("{} failed with code {}", title, exit_code);
    if (!last_output.empty()) {
        message += fmt::format(". Error: {}", last_output);
    }
    spdlog::error("[gen {}] {}", generation, message);
    observer.on_status(generation, message);
    return TransferResult{.success = false, .cancelled = false, .message = std::move(message), .stats = stats};
}

} // namespace dbxfer::core
