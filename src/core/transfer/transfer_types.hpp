#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dbxfer::core {

enum class Direction {
    Pull,   // устройство -> локально
    Push,   // локально -> устройство
};

[[nodiscard]] constexpr auto to_verb(Direction d) -> std::string_view {
    return d == Direction::Pull ? "pull" : "push";
}

// "Pull" / "Push" для сообщений о статусе
[[nodiscard]] constexpr auto to_title(Direction d) -> std::string_view {
    return d == Direction::Pull ? "Pull" : "Push";
}

struct TransferRequest {
    Direction direction = Direction::Pull;
    std::string source_path;
    std::string destination_path;
    bool is_single_file = false;
};

/// Номер запуска. Каждый start_transfer выдаёт новый; обратные вызовы
/// со старым номером отбрасываются.
using TransferGeneration = std::uint64_t;

struct TransferStats {
    std::uint64_t files_to_transfer = 0;
    std::uint64_t duplicates = 0;
    std::uint64_t files_saved = 0;
    std::uint64_t bytes_saved = 0;
    std::uint64_t files_transferred = 0;
};

struct TransferResult {
    bool success = false;
    bool cancelled = false;     // отмена пользователем: не ошибка, отдельный итог
    std::string message;
    std::optional<TransferStats> stats;
};

/// Получатель событий одного запуска. Вызывается из рабочего потока,
/// в порядке чтения строк; маршалинг в UI-поток на стороне получателя.
class TransferObserver {
public:
    virtual ~TransferObserver() = default;

    virtual void on_progress(TransferGeneration generation, int percentage) = 0;
    virtual void on_status(TransferGeneration generation, const std::string& message) = 0;
    virtual void on_files(TransferGeneration /*generation*/, std::uint64_t /*done*/, std::uint64_t /*total*/) {}
};

} // namespace dbxfer::core
