#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "adapters/command_runner.hpp"
#include "core/dedup/dedup_planner.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/hash/digest.hpp"
#include "process_controller.hpp"
#include "transfer_executor.hpp"
#include "transfer_types.hpp"

namespace dbxfer::core {

struct TransferOptions {
    bool dedup = false;     // только для папок
    infra::DigestAlgorithm algorithm = infra::DigestAlgorithm::Sha256;
    std::size_t chunk_size = infra::DigestHasher::DEFAULT_CHUNK_SIZE;
    std::size_t hash_threads = 0;
};

/// Точка входа для фронтенда: один фоновый поток на активную передачу,
/// номер поколения на каждый запуск, отмена с любого потока.
///
/// Колбэки вызываются из рабочего потока. События устаревшего поколения
/// (после cancel() или нового start_transfer()) отбрасываются здесь же.
class TransferManager {
public:
    using ProgressCallback = std::function<void(int)>;
    using StatusCallback = std::function<void(const std::string&)>;
    using FilesCallback = std::function<void(std::uint64_t done, std::uint64_t total)>;
    using CompletionCallback = std::function<void(TransferGeneration, const TransferResult&)>;

    explicit TransferManager(adapters::CommandRunner& runner,
                             std::chrono::milliseconds grace = ProcessController::DEFAULT_GRACE);
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    void set_progress_callback(ProgressCallback cb);
    void set_status_callback(StatusCallback cb);
    void set_files_callback(FilesCallback cb);
    // Вызывается после того, как запуск перестал быть активным: из колбэка
    // можно вызвать start_transfer() и wait()
    void set_completion_callback(CompletionCallback cb);

    // AlreadyRunning, если предыдущий запуск ещё не закончился
    [[nodiscard]] auto start_transfer(const TransferRequest& request, const TransferOptions& options = {})
        -> infra::Result<TransferGeneration>;

    // Останавливает активный запуск и ждёт его итога: true, если запуск
    // закончился отменой. Из колбэков прогресса/статуса не ждёт и сразу
    // возвращает true.
    auto cancel() -> bool;

    // Синхронно, в потоке вызывающего; статус и прогресс идут в те же колбэки без фильтра
    [[nodiscard]] auto get_duplicate_report(const std::vector<std::string>& source_paths,
                                            const std::vector<std::string>& target_paths,
                                            Side source_side,
                                            Side target_side,
                                            const TransferOptions& options = {}) -> DuplicateReport;

    // Ждёт окончания текущего запуска; результат последнего запуска или nullopt
    auto wait() -> std::optional<TransferResult>;

    [[nodiscard]] auto is_active() const -> bool;
    [[nodiscard]] auto current_generation() const -> TransferGeneration { return generation_.load(); }

private:
    enum class Phase { Idle, Planning, Transferring };

    class Dispatcher;
    class ScaledObserver;

    void run_(TransferRequest request, TransferOptions options, TransferGeneration generation, std::stop_token stop);
    auto run_deduplicated_(const TransferRequest& request, const TransferOptions& options,
                           TransferGeneration generation, std::stop_token stop) -> TransferResult;

    [[nodiscard]] auto is_current_(TransferGeneration generation) const -> bool {
        return generation == generation_.load();
    }
    void emit_progress_(int percentage);
    void emit_status_(const std::string& message);
    void emit_files_(std::uint64_t done, std::uint64_t total);

    adapters::CommandRunner& runner_;
    ProcessController controller_;
    TransferExecutor executor_;

    std::atomic<TransferGeneration> generation_{0};
    std::atomic<Phase> phase_{Phase::Idle};

    mutable std::mutex callbacks_mutex_;
    ProgressCallback progress_cb_;
    StatusCallback status_cb_;
    FilesCallback files_cb_;
    CompletionCallback completion_cb_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool active_ = false;
    TransferGeneration active_generation_ = 0;
    int delivering_ = 0;    // колбэки завершения, которые ещё выполняются
    std::optional<TransferResult> last_result_;
    std::stop_source stop_source_{std::nostopstate};

    // последними: потоки должны завершиться раньше остальных полей
    std::jthread retired_;  // поток, запустивший следующую передачу из колбэка завершения
    std::jthread worker_;
};

} // namespace dbxfer::core
