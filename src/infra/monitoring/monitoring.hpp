#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace dbxfer::infra {

/// Строка прогресса в терминале: полоса, процент, файлы, время, последний статус.
/// Все set_* потокобезопасны: вызываются из рабочего потока передачи.
class ProgressMonitor {
public:
    struct Stats {
        int percentage = 0;
        std::uint64_t files_done = 0;
        std::uint64_t files_total = 0;   // 0 = неизвестно
        std::string status;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void set_percentage(int percentage);
    void set_files(std::uint64_t done, std::uint64_t total);
    void set_status(const std::string& status);

    // Последняя отрисовка и перевод строки; повторный вызов ничего не делает
    void finish();

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    // Одна строка без ANSI-последовательностей (для тестов и логов)
    [[nodiscard]] static auto format_line(const Stats& stats, std::chrono::steady_clock::time_point now) -> std::string;

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<int> percentage_{0};
    std::atomic<std::uint64_t> files_done_{0};
    std::atomic<std::uint64_t> files_total_{0};
    mutable std::mutex status_mutex_;
    std::string status_;

    const bool enabled_;
    const std::chrono::steady_clock::time_point start_time_;
    std::atomic<bool> finished_{false};
    mutable std::mutex render_mutex_;
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace dbxfer::infra
