#include "child_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace dbxfer::adapters::process {

namespace {

constexpr std::size_t READ_CHUNK = 4096;
constexpr auto POLL_INTERVAL = std::chrono::milliseconds(10);

auto decode_status(int status) -> int {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return -WTERMSIG(status);
    return -1;
}

void close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

auto ChildProcess::spawn(const std::vector<std::string>& argv, OutputMode mode)
    -> infra::Result<std::shared_ptr<ChildProcess>>
{
    if (argv.empty() || argv.front().empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SpawnFailed, "Empty command line"));
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) == -1) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::SpawnFailed, "pipe2 failed", errno));
    }
    if (mode == OutputMode::Separate && ::pipe2(err_pipe, O_CLOEXEC) == -1) {
        const int err = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return std::unexpected(infra::make_system_error(infra::ErrorCode::SpawnFailed, "pipe2 failed", err));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions,
                                     mode == OutputMode::Merged ? out_pipe[1] : err_pipe[1],
                                     STDERR_FILENO);

    // Родитель игнорирует SIGPIPE; ребёнку возвращаем поведение по умолчанию
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGPIPE);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGTERM);
    posix_spawnattr_setsigdefault(&attr, &defaults);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    pid_t pid = -1;
    const int rc = ::posix_spawnp(&pid, cargv[0], &actions, &attr, cargv.data(), environ);

    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    if (rc != 0) {
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        return std::unexpected(infra::make_system_error(
            infra::ErrorCode::SpawnFailed, fmt::format("Cannot start {}", argv.front()), rc));
    }

    spdlog::debug("Spawned pid {}: {}", pid, fmt::join(argv, " "));
    return std::shared_ptr<ChildProcess>(new ChildProcess(pid, out_pipe[0], err_pipe[0]));
}

ChildProcess::ChildProcess(pid_t pid, int out_fd, int err_fd)
    : pid_(pid), out_fd_(out_fd), err_fd_(err_fd) {}

ChildProcess::~ChildProcess() {
    close_fds_();
    // Не оставляем зомби: живой процесс добиваем
    if (!poll()) {
        kill();
        wait();
    }
}

void ChildProcess::close_fds_() {
    close_fd(out_fd_);
    close_fd(err_fd_);
}

auto ChildProcess::fill_buffer_() -> infra::Result<bool> {
    char chunk[READ_CHUNK];
    for (;;) {
        const ssize_t n = ::read(out_fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.append(chunk, static_cast<std::size_t>(n));
            return true;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return std::unexpected(infra::make_system_error(
            infra::ErrorCode::StreamFailed, fmt::format("read from pid {} failed", pid_), errno));
    }
}

auto ChildProcess::read_line() -> infra::Result<std::optional<std::string>> {
    if (out_fd_ == -1 && buffer_.empty()) {
        return std::optional<std::string>{};
    }

    for (;;) {
        if (pending_cr_ && !buffer_.empty()) {
            if (buffer_.front() == '\n') buffer_.erase(0, 1);
            pending_cr_ = false;
        }

        const auto pos = buffer_.find_first_of("\r\n");
        if (pos != std::string::npos) {
            std::string line = buffer_.substr(0, pos);
            pending_cr_ = buffer_[pos] == '\r';
            buffer_.erase(0, pos + 1);
            return std::optional<std::string>{std::move(line)};
        }

        if (eof_) {
            if (buffer_.empty()) {
                return std::optional<std::string>{};
            }
            std::string line = std::move(buffer_);
            buffer_.clear();
            return std::optional<std::string>{std::move(line)};
        }

        auto more = fill_buffer_();
        if (!more) {
            return std::unexpected(std::move(more.error()));
        }
        if (!*more) {
            eof_ = true;
        }
    }
}

auto ChildProcess::communicate(std::chrono::milliseconds timeout) -> infra::Result<CapturedOutput> {
    if (err_fd_ == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                                                 "communicate() requires OutputMode::Separate"));
    }

    CapturedOutput captured;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    char chunk[READ_CHUNK];

    while (out_fd_ != -1 || err_fd_ != -1) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::unexpected(infra::make_error(
                infra::ErrorCode::CommandFailed,
                fmt::format("Command timed out after {} ms", timeout.count())));
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_fd_ != -1) fds[count++] = pollfd{out_fd_, POLLIN, 0};
        if (err_fd_ != -1) fds[count++] = pollfd{err_fd_, POLLIN, 0};

        const int ready = ::poll(fds, count, static_cast<int>(remaining.count()));
        if (ready == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_system_error(infra::ErrorCode::StreamFailed, "poll failed", errno));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

            const ssize_t n = ::read(fds[i].fd, chunk, sizeof(chunk));
            if (n == -1 && errno == EINTR) continue;
            if (n == -1) {
                return std::unexpected(infra::make_system_error(
                    infra::ErrorCode::StreamFailed, fmt::format("read from pid {} failed", pid_), errno));
            }

            auto& target = fds[i].fd == out_fd_ ? captured.out : captured.err;
            if (n == 0) {
                close_fd(fds[i].fd == out_fd_ ? out_fd_ : err_fd_);
            } else {
                target.append(chunk, static_cast<std::size_t>(n));
            }
        }
    }

    return captured;
}

auto ChildProcess::poll() -> std::optional<int> {
    std::lock_guard lock(status_mutex_);
    if (exit_code_) {
        return exit_code_;
    }

    int status = 0;
    const pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exit_code_ = decode_status(status);
        spdlog::debug("pid {} exited with {}", pid_, *exit_code_);
    } else if (r == -1 && errno == ECHILD) {
        // уже собран кем-то ещё (SIGCHLD = SIG_IGN); код неизвестен
        exit_code_ = -1;
    }
    return exit_code_;
}

auto ChildProcess::wait_for(std::chrono::milliseconds timeout) -> std::optional<int> {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (auto code = poll()) {
            return code;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

int ChildProcess::wait() {
    for (;;) {
        if (auto code = poll()) {
            return *code;
        }
        std::this_thread::sleep_for(POLL_INTERVAL);
    }
}

auto ChildProcess::send_signal_(int sig) -> bool {
    std::lock_guard lock(status_mutex_);
    if (exit_code_) {
        return false;
    }
    if (::kill(pid_, sig) == -1) {
        spdlog::warn("kill({}, {}) failed: {}", pid_, sig, std::strerror(errno));
        return false;
    }
    return true;
}

auto ChildProcess::terminate() -> bool {
    return send_signal_(SIGTERM);
}

auto ChildProcess::kill() -> bool {
    return send_signal_(SIGKILL);
}

} // namespace dbxfer::adapters::process
