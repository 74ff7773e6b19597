#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

namespace dbxfer::core {

using Clock = std::chrono::steady_clock;

/// Состояние одного запуска передачи. Принадлежит ровно одному запуску,
/// передаётся по ссылке и сбрасывается в начале каждого запуска.
struct ProgressState {
    Clock::time_point start_time{};
    Clock::time_point last_update_time{};
    int last_progress = 0;          // [0, 100]
    std::uint64_t line_count = 0;

    void reset(Clock::time_point now);
};

/// Оценка прогресса, когда adb не печатает процентов.
/// Константы подобраны под реальный вывод adb; менять их нельзя без сверки с ним.
class ProgressEstimator {
public:
    static constexpr std::chrono::milliseconds TIME_STEP{2000};
    static constexpr int TIME_CAP = 95;
    static constexpr int ACTIVITY_CAP = 90;
    static constexpr std::uint64_t ACTIVITY_WINDOW = 50;
    static constexpr std::uint64_t LARGE_TRANSFER_LINES = 100;
    static constexpr int SMALL_TRANSFER_STEP = 10;
    static constexpr int MAX_ACTIVITY_STEP = 5;

    // Один шаг на строку вывода (line_count увеличивается здесь).
    // Возвращает значение для отправки наблюдателю, если оно есть.
    [[nodiscard]] static auto on_line(ProgressState& state,
                                      std::optional<int> signal,
                                      Clock::time_point now) -> std::optional<int>;

    // Завершение процесса: при коде 0 прогресс становится ровно 100.
    [[nodiscard]] static auto on_exit(ProgressState& state, int exit_code) -> std::optional<int>;

    // min(lines/1000, 50) + min(elapsed/60, 40), не больше 95
    [[nodiscard]] static auto large_transfer_candidate(std::uint64_t line_count,
                                                       double elapsed_seconds) -> double;

    // max(1, min(5, 90 / (lines/50 + 1)))
    [[nodiscard]] static auto activity_increment(std::uint64_t line_count) -> int;
};

} // namespace dbxfer::core
