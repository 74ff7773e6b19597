#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <iostream>

namespace dbxfer::infra {

namespace {

constexpr int kBarWidth = 20;
constexpr std::size_t kStatusWidth = 40;

} // namespace

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::set_percentage(int percentage) {
    percentage_.store(std::clamp(percentage, 0, 100));
}

void ProgressMonitor::set_files(std::uint64_t done, std::uint64_t total) {
    files_done_.store(done);
    files_total_.store(total);
}

void ProgressMonitor::set_status(const std::string& status) {
    std::lock_guard lock(status_mutex_);
    status_ = status;
}

void ProgressMonitor::finish() {
    if (finished_.exchange(true)) return;
    stop_rendering_thread_();
    if (enabled_) {
        render_();
        std::cout << "\n" << std::flush; // финальный перенос
    }
}

auto ProgressMonitor::get_stats() const -> Stats {
    std::lock_guard lock(status_mutex_);
    return Stats{
        .percentage = percentage_.load(),
        .files_done = files_done_.load(),
        .files_total = files_total_.load(),
        .status = status_,
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_->join();
        render_thread_.reset();
    }
}

auto ProgressMonitor::format_line(const Stats& stats, std::chrono::steady_clock::time_point now) -> std::string {
    const int pct = std::clamp(stats.percentage, 0, 100);
    const int filled = pct * kBarWidth / 100;

    std::string bar;
    for (int i = 0; i < kBarWidth; ++i) {
        bar += i < filled ? "█" : "░";
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - stats.start_time).count();
    const auto minutes = elapsed / 60;
    const auto seconds = elapsed % 60;

    std::string files;
    if (stats.files_total > 0) {
        files = fmt::format(" | {}/{} files", stats.files_done, stats.files_total);
    } else if (stats.files_done > 0) {
        files = fmt::format(" | {} files", stats.files_done);
    }

    // длинный статус обрезается, чтобы строка не переносилась
    std::string status = stats.status;
    if (status.size() > kStatusWidth) {
        auto from = status.size() - (kStatusWidth - 3);
        // не начинать с середины UTF-8 символа (байты 10xxxxxx)
        while (from < status.size() && (static_cast<unsigned char>(status[from]) & 0xC0) == 0x80) {
            ++from;
        }
        status = "..." + status.substr(from);
    }

    return fmt::format("[{}] {:3d}%{} | {:02d}:{:02d} | {}", bar, pct, files, minutes, seconds, status);
}

void ProgressMonitor::render_() const {
    if (!enabled_) return;

    const auto line = format_line(get_stats(), std::chrono::steady_clock::now());

    std::lock_guard lock(render_mutex_);
    std::cout << "\r\033[K" << line << std::flush; // ANSI: очистить строку
}

} // namespace dbxfer::infra
