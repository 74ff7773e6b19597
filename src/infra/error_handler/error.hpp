#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace dbxfer::infra {

enum class ErrorCode {
    // Фатальные для запуска
    SpawnFailed,          // дочерний процесс не создан
    InvalidArgument,      // путь / device id не прошли проверку
    UnsupportedAlgorithm,
    FileNotFound,

    // Локальные для одного файла или одного запуска
    StreamFailed,         // ошибка чтения вывода процесса
    DigestFailed,
    CommandFailed,        // команда завершилась с ненулевым кодом
    AlreadyRunning,
    Cancelled,

    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_cancellation() const -> bool {
        return code == ErrorCode::Cancelled;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Ошибка из errno / std::error_code, сообщение дополняется текстом ОС
[[nodiscard]] auto make_system_error(
    ErrorCode code,
    std::string_view context,
    int err,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

} // namespace dbxfer::infra
