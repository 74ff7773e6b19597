#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <variant>
#include <vector>
#include "adapters/command_runner.hpp"
#include "adapters/process/child_process.hpp"
#include "infra/error_handler/error.hpp"

namespace dbxfer::core {

namespace process_state {

struct NotStarted {};

struct Running {
    std::shared_ptr<adapters::process::ChildProcess> child;
};

struct Exited {
    int exit_code = 0;
    bool cancelled = false;
};

} // namespace process_state

using ProcessState = std::variant<process_state::NotStarted,
                                  process_state::Running,
                                  process_state::Exited>;

/// Владеет не более чем одним живым дочерним процессом.
/// "Уже завершился" и "ещё работает" различаются явно, чтобы отмена
/// никогда не сигналила процессу, который уже собран.
class ProcessController {
public:
    static constexpr std::chrono::milliseconds DEFAULT_GRACE{2000};

    explicit ProcessController(std::chrono::milliseconds grace = DEFAULT_GRACE);
    ~ProcessController();

    ProcessController(const ProcessController&) = delete;
    ProcessController& operator=(const ProcessController&) = delete;

    // AlreadyRunning, если процесс уже есть; SpawnFailed с ошибкой ОС;
    // Cancelled, если stop уже запрошен (проверка и запуск под одним mutex_ с cancel())
    [[nodiscard]] auto start(adapters::CommandRunner& runner,
                             const std::vector<std::string>& args,
                             std::stop_token stop = {})
        -> infra::Result<std::shared_ptr<adapters::process::ChildProcess>>;

    // SIGTERM, ожидание grace, затем SIGKILL. false если процесса нет или он уже вышел.
    auto cancel() -> bool;

    // Дожидается выхода child и освобождает слот; возвращает код выхода
    auto finish(const std::shared_ptr<adapters::process::ChildProcess>& child) -> int;

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto last_exit() const -> std::optional<process_state::Exited>;
    [[nodiscard]] auto grace_period() const -> std::chrono::milliseconds { return grace_; }

private:
    mutable std::mutex mutex_;
    ProcessState state_{process_state::NotStarted{}};
    std::chrono::milliseconds grace_;
};

} // namespace dbxfer::core
