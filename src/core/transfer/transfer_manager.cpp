#include "transfer_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace dbxfer::core {

namespace {
thread_local bool t_in_completion = false;
} // namespace

// Пропускает наружу только события текущего поколения
class TransferManager::Dispatcher final : public TransferObserver {
public:
    explicit Dispatcher(TransferManager& owner) : owner_(owner) {}

    void on_progress(TransferGeneration generation, int percentage) override {
        if (!owner_.is_current_(generation)) {
            spdlog::debug("[gen {}] stale progress {}% dropped", generation, percentage);
            return;
        }
        owner_.emit_progress_(percentage);
    }

    void on_status(TransferGeneration generation, const std::string& message) override {
        if (!owner_.is_current_(generation)) return;
        owner_.emit_status_(message);
    }

    void on_files(TransferGeneration generation, std::uint64_t done, std::uint64_t total) override {
        if (!owner_.is_current_(generation)) return;
        owner_.emit_files_(done, total);
    }

private:
    TransferManager& owner_;
};

// Файл index из count: 0..100 одного запуска -> общая шкала, без откатов назад
class TransferManager::ScaledObserver final : public TransferObserver {
public:
    ScaledObserver(TransferObserver& inner, std::size_t count)
        : inner_(inner), count_(count == 0 ? 1 : count) {}

    void select(std::size_t index) { index_ = index; }

    void on_progress(TransferGeneration generation, int percentage) override {
        const auto overall = static_cast<int>((index_ * 100 + static_cast<std::size_t>(percentage)) / count_);
        if (overall > last_) {
            last_ = std::min(overall, 100);
            inner_.on_progress(generation, last_);
        }
    }

    void on_status(TransferGeneration generation, const std::string& message) override {
        inner_.on_status(generation, message);
    }

    // счёт файлов ведёт сам менеджер
    void on_files(TransferGeneration, std::uint64_t, std::uint64_t) override {}

private:
    TransferObserver& inner_;
    std::size_t count_;
    std::size_t index_ = 0;
    int last_ = 0;
};

TransferManager::TransferManager(adapters::CommandRunner& runner, std::chrono::milliseconds grace)
    : runner_(runner)
    , controller_(grace)
    , executor_(runner_, controller_)
{}

TransferManager::~TransferManager() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (retired_.joinable()) {
        retired_.join();
    }
}

void TransferManager::set_progress_callback(ProgressCallback cb) {
    std::lock_guard lock(callbacks_mutex_);
    progress_cb_ = std::move(cb);
}

void TransferManager::set_status_callback(StatusCallback cb) {
    std::lock_guard lock(callbacks_mutex_);
    status_cb_ = std::move(cb);
}

void TransferManager::set_files_callback(FilesCallback cb) {
    std::lock_guard lock(callbacks_mutex_);
    files_cb_ = std::move(cb);
}

void TransferManager::set_completion_callback(CompletionCallback cb) {
    std::lock_guard lock(callbacks_mutex_);
    completion_cb_ = std::move(cb);
}

// Колбэк копируется под мьютексом и вызывается без него:
// получатель может сам вызвать cancel()
void TransferManager::emit_progress_(int percentage) {
    ProgressCallback cb;
    {
        std::lock_guard lock(callbacks_mutex_);
        cb = progress_cb_;
    }
    if (cb) cb(percentage);
}

void TransferManager::emit_status_(const std::string& message) {
    StatusCallback cb;
    {
        std::lock_guard lock(callbacks_mutex_);
        cb = status_cb_;
    }
    if (cb) cb(message);
}

void TransferManager::emit_files_(std::uint64_t done, std::uint64_t total) {
    FilesCallback cb;
    {
        std::lock_guard lock(callbacks_mutex_);
        cb = files_cb_;
    }
    if (cb) cb(done, total);
}

auto TransferManager::start_transfer(const TransferRequest& request, const TransferOptions& options)
    -> infra::Result<TransferGeneration>
{
    // Предыдущий поток уже отдал результат, но может ещё выполнять колбэк
    // завершения. join - только вне state_mutex_, иначе он не доберётся до конца.
    std::jthread previous;
    std::jthread older;
    TransferGeneration generation = 0;
    {
        std::lock_guard lock(state_mutex_);
        if (active_) {
            return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyRunning,
                                                     "A transfer is already in progress"));
        }

        older = std::move(retired_);
        previous = std::move(worker_);
        // вызов из колбэка завершения: себя не join-им
        if (previous.get_id() == std::this_thread::get_id()) {
            retired_ = std::move(previous);
        }

        active_ = true;
        last_result_.reset();
        phase_ = Phase::Planning;
        generation = generation_.fetch_add(1) + 1;
        active_generation_ = generation;

        worker_ = std::jthread([this, request, options, generation](std::stop_token stop) {
            run_(request, options, generation, stop);
        });
        stop_source_ = worker_.get_stop_source();
    }

    if (previous.joinable()) previous.join();
    if (older.joinable()) older.join();

    spdlog::debug("Started transfer generation {}", generation);
    return generation;
}

auto TransferManager::cancel() -> bool {
    std::stop_source source{std::nostopstate};
    TransferGeneration target = 0;
    bool on_worker = false;
    {
        std::lock_guard lock(state_mutex_);
        if (!active_) {
            return false;
        }
        source = stop_source_;
        target = active_generation_;
        on_worker = worker_.get_id() == std::this_thread::get_id();
        // всё, что старый запуск ещё успеет прислать, уже устарело
        generation_.fetch_add(1);
    }

    const bool planning = phase_.load() == Phase::Planning;
    source.request_stop();
    const bool killed = controller_.cancel();
    spdlog::debug("[gen {}] cancel during {}, process {}", target,
                  planning ? "planning" : "transfer", killed ? "killed" : "not running");

    // Процесса может не быть (между файлами, до spawn), итог берётся у самого запуска.
    // Из колбэка рабочего потока ждать нельзя: запрос уже дошёл до живого запуска.
    bool cancelled = true;
    if (!on_worker) {
        std::unique_lock lock(state_mutex_);
        state_cv_.wait(lock, [this, target] { return !active_ || active_generation_ != target; });
        if (active_generation_ == target && last_result_) {
            cancelled = last_result_->cancelled;
        }
    }

    emit_status_(cancelled ? "Transfer cancelled by user." : "Transfer cancellation failed.");
    spdlog::info("Cancel requested: {}", cancelled ? "cancelled" : "nothing to cancel");
    return cancelled;
}

auto TransferManager::is_active() const -> bool {
    std::lock_guard lock(state_mutex_);
    return active_;
}

auto TransferManager::wait() -> std::optional<TransferResult> {
    std::unique_lock lock(state_mutex_);
    // внутри колбэка завершения ждать его же окончания нельзя
    if (t_in_completion) {
        state_cv_.wait(lock, [this] { return !active_; });
    } else {
        state_cv_.wait(lock, [this] { return !active_ && delivering_ == 0; });
    }
    return last_result_;
}

auto TransferManager::get_duplicate_report(const std::vector<std::string>& source_paths,
                                           const std::vector<std::string>& target_paths,
                                           Side source_side,
                                           Side target_side,
                                           const TransferOptions& options) -> DuplicateReport
{
    DedupPlanner planner(runner_, PlannerOptions{
        .algorithm = options.algorithm,
        .chunk_size = options.chunk_size,
        .hash_threads = options.hash_threads,
    });
    planner.set_status_callback([this](const std::string& message) { emit_status_(message); });
    planner.set_progress_callback([this](int percentage) { emit_progress_(percentage); });
    return planner.find_duplicate_files(source_paths, target_paths, source_side, target_side);
}

void TransferManager::run_(TransferRequest request, TransferOptions options,
                           TransferGeneration generation, std::stop_token stop)
{
    TransferResult result;
    if (options.dedup && !request.is_single_file) {
        result = run_deduplicated_(request, options, generation, stop);
    } else {
        Dispatcher dispatcher(*this);
        phase_ = Phase::Transferring;
        result = executor_.run(request, generation, dispatcher, request.is_single_file ? 1 : 0, stop);
    }

    if (result.cancelled) {
        spdlog::info("[gen {}] {}", generation, result.message);
    }

    CompletionCallback completion;
    {
        std::lock_guard lock(callbacks_mutex_);
        completion = completion_cb_;
    }

    // active_ снимается до колбэка: из него можно запустить следующую передачу
    {
        std::lock_guard lock(state_mutex_);
        phase_ = Phase::Idle;
        last_result_ = result;
        active_ = false;
        ++delivering_;
    }
    state_cv_.notify_all();

    if (completion && is_current_(generation)) {
        t_in_completion = true;
        completion(generation, result);
        t_in_completion = false;
    }

    {
        std::lock_guard lock(state_mutex_);
        --delivering_;
    }
    state_cv_.notify_all();
}

namespace {

// Имя папки-источника: "/sdcard/DCIM/" -> "DCIM"
auto folder_name(const std::string& path) -> fs::path {
    auto normal = fs::path(path).lexically_normal();
    if (normal.filename().empty()) {
        normal = normal.parent_path();
    }
    return normal.filename();
}

} // namespace

auto TransferManager::run_deduplicated_(const TransferRequest& request, const TransferOptions& options,
                                        TransferGeneration generation, std::stop_token stop) -> TransferResult
{
    Dispatcher dispatcher(*this);
    const auto title = to_title(request.direction);
    const Side source_side = request.direction == Direction::Pull ? Side::Remote : Side::Local;
    const Side target_side = request.direction == Direction::Pull ? Side::Local : Side::Remote;

    DedupPlanner planner(runner_, PlannerOptions{
        .algorithm = options.algorithm,
        .chunk_size = options.chunk_size,
        .hash_threads = options.hash_threads,
    });
    // прогресс хеширования не смешивается со шкалой передачи
    planner.set_status_callback([&dispatcher, generation](const std::string& message) {
        dispatcher.on_status(generation, message);
    });

    const auto cancelled_result = [](std::optional<TransferStats> stats) {
        return TransferResult{.success = false, .cancelled = true,
                              .message = "Transfer cancelled by user.", .stats = stats};
    };

    dispatcher.on_progress(generation, 0);
    const auto source_files = planner.list_files(request.source_path, source_side, stop);
    if (stop.stop_requested()) {
        return cancelled_result(std::nullopt);
    }
    if (source_files.empty()) {
        spdlog::warn("[gen {}] nothing listed under {}, transferring the folder as is",
                     generation, request.source_path);
        phase_ = Phase::Transferring;
        return executor_.run(request, generation, dispatcher, 0, stop);
    }
    const auto target_files = planner.list_files(request.destination_path, target_side, stop);
    if (stop.stop_requested()) {
        return cancelled_result(std::nullopt);
    }

    auto report = planner.find_duplicate_files(source_files, target_files, source_side, target_side, stop);
    if (stop.stop_requested()) {
        return cancelled_result(std::nullopt);
    }

    TransferStats stats{
        .files_to_transfer = report.files_to_transfer.size(),
        .duplicates = report.duplicates.size(),
        .files_saved = report.files_saved,
        .bytes_saved = report.bytes_saved,
        .files_transferred = 0,
    };

    if (!report.duplicates.empty()) {
        dispatcher.on_status(generation, fmt::format("Skipping {} duplicates ({} saved)",
                                                     report.duplicates.size(), format_bytes(report.bytes_saved)));
    }

    if (report.files_to_transfer.empty()) {
        dispatcher.on_progress(generation, 100);
        std::string message = "All files already exist on the destination.";
        dispatcher.on_status(generation, message);
        return TransferResult{.success = true, .cancelled = false, .message = std::move(message), .stats = stats};
    }

    phase_ = Phase::Transferring;
    const auto count = report.files_to_transfer.size();

    if (report.duplicates.empty()) {
        auto result = executor_.run(request, generation, dispatcher, count, stop);
        stats.files_transferred = result.stats ? result.stats->files_transferred : 0;
        result.stats = stats;
        return result;
    }

    const fs::path source_root = fs::path(request.source_path).lexically_normal();
    const fs::path target_root = fs::path(request.destination_path) / folder_name(request.source_path);

    ScaledObserver scaled(dispatcher, count);
    for (std::size_t index = 0; index < count; ++index) {
        const auto& file = report.files_to_transfer[index];
        auto relative = fs::path(file).lexically_relative(source_root);
        if (relative.empty()) {
            relative = fs::path(file).filename();
        }
        const auto destination = (target_root / relative).lexically_normal();

        if (target_side == Side::Local) {
            std::error_code ec;
            fs::create_directories(destination.parent_path(), ec);
            if (ec) {
                auto message = fmt::format("{} failed: cannot create {}: {}",
                                           title, destination.parent_path().string(), ec.message());
                spdlog::error("[gen {}] {}", generation, message);
                dispatcher.on_status(generation, message);
                return TransferResult{.success = false, .cancelled = false,
                                      .message = std::move(message), .stats = stats};
            }
        }

        scaled.select(index);
        const TransferRequest single{
            .direction = request.direction,
            .source_path = file,
            .destination_path = destination.string(),
            .is_single_file = true,
        };
        auto result = executor_.run(single, generation, scaled, 0, stop);
        if (!result.success) {
            // отмена или ошибка: остальные файлы не трогаем
            result.stats = stats;
            return result;
        }

        ++stats.files_transferred;
        dispatcher.on_files(generation, stats.files_transferred, count);
    }

    dispatcher.on_progress(generation, 100);
    auto message = fmt::format("{} completed successfully.", title);
    dispatcher.on_status(generation, message);
    return TransferResult{.success = true, .cancelled = false, .message = std::move(message), .stats = stats};
}

} // namespace dbxfer::core
