#pragma once

#include <stop_token>
#include <string>
#include <vector>
#include "adapters/command_runner.hpp"
#include "core/progress/progress_estimator.hpp"
#include "process_controller.hpp"
#include "transfer_types.hpp"

namespace dbxfer::core {

/// Один запуск adb pull/push: запуск процесса, разбор каждой строки
/// (парсер + оценщик), события наблюдателю и итоговый TransferResult.
class TransferExecutor {
public:
    TransferExecutor(adapters::CommandRunner& runner, ProcessController& controller);

    // Блокирует вызывающий (рабочий) поток до выхода процесса.
    // expected_files: общее число файлов для on_files, 0 если неизвестно.
    [[nodiscard]] auto run(const TransferRequest& request,
                           TransferGeneration generation,
                           TransferObserver& observer,
                           std::uint64_t expected_files = 0,
                           std::stop_token stop = {}) -> TransferResult;

    // {"pull", src, dst} / {"push", src, dst}
    [[nodiscard]] static auto build_args(const TransferRequest& request) -> std::vector<std::string>;

private:
    adapters::CommandRunner& runner_;
    ProcessController& controller_;
};

} // namespace dbxfer::core
