#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace dbxfer::core {

/// Процент из одной строки вывода adb, либо std::nullopt ("нет сигнала", не 0).
/// Форматы, по приоритету:
///   "(NN%)", "NN% complete", "transferred NN%", "N files pulled ... (NN%)",
///   дробь "A/B", "Transferring ... NN%", "(N bytes in ...)" -> 100.
/// Не бросает исключений; результат всегда в [0, 100].
[[nodiscard]] auto parse_progress(std::string_view line) noexcept -> std::optional<int>;

struct FileCountSignal {
    std::uint64_t count = 0;
    bool absolute = false;  // "N files pulled" задаёт счётчик, "1 file pulled" прибавляет
};

/// "1 file pulled" / "12 files pushed" и т.п.
[[nodiscard]] auto parse_file_count(std::string_view line) noexcept -> std::optional<FileCountSignal>;

} // namespace dbxfer::core
