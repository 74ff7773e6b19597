#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>
#include "infra/error_handler/error.hpp"

namespace dbxfer::adapters::process {

enum class OutputMode {
    Merged,     // stderr -> stdout, построчное чтение
    Separate,   // отдельные pipe, для communicate()
};

struct CapturedOutput {
    std::string out;
    std::string err;
};

/// Дочерний процесс с pipe на stdout/stderr.
/// Единственный владелец pid: только этот объект делает waitpid, поэтому
/// сигнал никогда не уходит чужому процессу с переиспользованным pid.
class ChildProcess {
public:
    [[nodiscard]] static auto spawn(const std::vector<std::string>& argv,
                                    OutputMode mode = OutputMode::Merged)
        -> infra::Result<std::shared_ptr<ChildProcess>>;

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] auto pid() const -> pid_t { return pid_; }

    // Следующая строка объединённого вывода; std::nullopt на EOF.
    // Разделители: '\n', '\r' и "\r\n" (adb перерисовывает прогресс через '\r').
    [[nodiscard]] auto read_line() -> infra::Result<std::optional<std::string>>;

    // Читает stdout и stderr до EOF (только OutputMode::Separate)
    [[nodiscard]] auto communicate(std::chrono::milliseconds timeout) -> infra::Result<CapturedOutput>;

    // Неблокирующая проверка; код выхода или -N если убит сигналом N
    [[nodiscard]] auto poll() -> std::optional<int>;
    [[nodiscard]] auto wait_for(std::chrono::milliseconds timeout) -> std::optional<int>;
    auto wait() -> int;

    // false если процесс уже завершён
    auto terminate() -> bool;
    auto kill() -> bool;

private:
    ChildProcess(pid_t pid, int out_fd, int err_fd);

    auto send_signal_(int sig) -> bool;
    auto fill_buffer_() -> infra::Result<bool>;
    void close_fds_();

    pid_t pid_;
    int out_fd_;
    int err_fd_;

    std::string buffer_;
    bool eof_ = false;
    bool pending_cr_ = false;

    std::mutex status_mutex_;
    std::optional<int> exit_code_;
};

} // namespace dbxfer::adapters::process
