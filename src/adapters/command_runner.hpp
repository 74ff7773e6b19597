#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "infra/error_handler/error.hpp"
#include "process/child_process.hpp"

namespace dbxfer::adapters {

struct CommandOutput {
    std::string out;
    std::string err;
    int exit_code = -1;
};

/// Запуск команд внешнего инструмента (adb). Аргументы всегда передаются
/// массивом argv, без shell-строк; пути должны быть проверены вызывающим.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Захват вывода: args без имени инструмента, например {"shell", "stat", "-c", "%s", path}
    [[nodiscard]] virtual auto run(const std::vector<std::string>& args)
        -> infra::Result<CommandOutput> = 0;

    // Живой поток: stdout и stderr объединены
    [[nodiscard]] virtual auto spawn(const std::vector<std::string>& args)
        -> infra::Result<std::shared_ptr<process::ChildProcess>> = 0;
};

class BridgeCommandRunner final : public CommandRunner {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{15'000};

    explicit BridgeCommandRunner(std::string bridge,
                                 std::optional<std::string> device = std::nullopt,
                                 std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    [[nodiscard]] auto run(const std::vector<std::string>& args)
        -> infra::Result<CommandOutput> override;

    [[nodiscard]] auto spawn(const std::vector<std::string>& args)
        -> infra::Result<std::shared_ptr<process::ChildProcess>> override;

    // bridge [-s device] args...
    [[nodiscard]] auto build_argv(const std::vector<std::string>& args) const -> std::vector<std::string>;

    [[nodiscard]] auto bridge() const -> const std::string& { return bridge_; }

private:
    std::string bridge_;
    std::optional<std::string> device_;
    std::chrono::milliseconds timeout_;
};

} // namespace dbxfer::adapters
