#include "progress_estimator.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace dbxfer::core {

void ProgressState::reset(Clock::time_point now) {
    start_time = now;
    last_update_time = now;
    last_progress = 0;
    line_count = 0;
}

auto ProgressEstimator::large_transfer_candidate(std::uint64_t line_count,
                                                 double elapsed_seconds) -> double {
    const double activity = std::min(static_cast<double>(line_count) / 1000.0, 50.0);
    const double time_term = std::min(elapsed_seconds / 60.0, 40.0);
    return std::min(activity + time_term, static_cast<double>(TIME_CAP));
}

auto ProgressEstimator::activity_increment(std::uint64_t line_count) -> int {
    const auto windows = line_count / ACTIVITY_WINDOW + 1;
    const auto step = static_cast<std::uint64_t>(ACTIVITY_CAP) / windows;
    return static_cast<int>(std::max<std::uint64_t>(1, std::min<std::uint64_t>(MAX_ACTIVITY_STEP, step)));
}

auto ProgressEstimator::on_line(ProgressState& state,
                                std::optional<int> signal,
                                Clock::time_point now) -> std::optional<int> {
    ++state.line_count;

    // Явный процент всегда главнее и может откатить прогресс назад
    if (signal) {
        state.last_progress = std::clamp(*signal, 0, 100);
        state.last_update_time = now;
        return state.last_progress;
    }

    const auto since_update = now - state.last_update_time;
    if (since_update >= TIME_STEP && state.last_progress < TIME_CAP) {
        double candidate = 0.0;
        if (state.line_count > LARGE_TRANSFER_LINES) {
            const double elapsed = std::chrono::duration<double>(now - state.start_time).count();
            candidate = large_transfer_candidate(state.line_count, elapsed);
        } else {
            candidate = std::min(state.last_progress + SMALL_TRANSFER_STEP, TIME_CAP);
        }

        // целая часть, как у отображаемого процента
        const int rounded = static_cast<int>(candidate);
        if (rounded > state.last_progress) {
            state.last_progress = rounded;
            state.last_update_time = now;
            spdlog::trace("time-based estimate -> {}%", rounded);
            return rounded;
        }
        // ветка по времени сработала, но не продвинула: активность не проверяем
        return std::nullopt;
    }

    if (state.line_count % ACTIVITY_WINDOW == 0 && state.last_progress < ACTIVITY_CAP) {
        const int candidate = std::min(state.last_progress + activity_increment(state.line_count), ACTIVITY_CAP);
        if (candidate > state.last_progress) {
            state.last_progress = candidate;
            state.last_update_time = now;
            spdlog::trace("activity-based estimate -> {}%", candidate);
            return candidate;
        }
    }

    return std::nullopt;
}

auto ProgressEstimator::on_exit(ProgressState& state, int exit_code) -> std::optional<int> {
    if (exit_code != 0) {
        return std::nullopt;
    }
    state.last_progress = 100;
    return state.last_progress;
}

} // namespace dbxfer::core
