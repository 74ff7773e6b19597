#include "process_controller.hpp"

#include <spdlog/spdlog.h>

namespace dbxfer::core {

using adapters::process::ChildProcess;

ProcessController::ProcessController(std::chrono::milliseconds grace)
    : grace_(grace) {}

ProcessController::~ProcessController() {
    cancel();
}

auto ProcessController::start(adapters::CommandRunner& runner,
                              const std::vector<std::string>& args,
                              std::stop_token stop)
    -> infra::Result<std::shared_ptr<ChildProcess>>
{
    std::lock_guard lock(mutex_);
    if (stop.stop_requested()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Cancelled,
                                                 "Transfer cancelled before start"));
    }
    if (std::holds_alternative<process_state::Running>(state_)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::AlreadyRunning,
                                                 "A transfer process is already running"));
    }

    auto child = runner.spawn(args);
    if (!child) {
        state_ = process_state::NotStarted{};
        return std::unexpected(std::move(child.error()));
    }

    state_ = process_state::Running{*child};
    return *child;
}

auto ProcessController::cancel() -> bool {
    std::lock_guard lock(mutex_);
    auto* running = std::get_if<process_state::Running>(&state_);
    if (!running) {
        return false;
    }

    auto child = running->child;

    // Процесс уже закончился сам: это не отмена
    if (auto code = child->poll()) {
        state_ = process_state::Exited{.exit_code = *code, .cancelled = false};
        return false;
    }

    spdlog::info("Cancelling pid {} (grace {} ms)", child->pid(), grace_.count());
    child->terminate();
    auto code = child->wait_for(grace_);
    if (!code) {
        spdlog::warn("pid {} ignored SIGTERM, sending SIGKILL", child->pid());
        child->kill();
        code = child->wait();
    }

    state_ = process_state::Exited{.exit_code = *code, .cancelled = true};
    return true;
}

int ProcessController::finish(const std::shared_ptr<ChildProcess>& child) {
    // ждём без блокировки: cancel() может в это время держать mutex_
    const int code = child->wait();

    std::lock_guard lock(mutex_);
    if (auto* running = std::get_if<process_state::Running>(&state_);
        running && running->child == child) {
        state_ = process_state::Exited{.exit_code = code, .cancelled = false};
    }
    return code;
}

bool ProcessController::is_running() const {
    std::lock_guard lock(mutex_);
    return std::holds_alternative<process_state::Running>(state_);
}

auto ProcessController::last_exit() const -> std::optional<process_state::Exited> {
    std::lock_guard lock(mutex_);
    if (const auto* exited = std::get_if<process_state::Exited>(&state_)) {
        return *exited;
    }
    return std::nullopt;
}

} // namespace dbxfer::core
