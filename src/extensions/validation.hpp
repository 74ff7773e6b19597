#pragma once

#include <optional>
#include <string>
#include <string_view>
#include "infra/error_handler/error.hpp"

namespace dbxfer::extensions {

/// Проверки аргументов до того, как они попадут в argv adb.
/// adb shell склеивает аргументы в строку для sh на устройстве,
/// поэтому метасимволы shell в путях устройства запрещены.

// serial устройства: только [A-Za-z0-9.:_-]
[[nodiscard]] auto validate_device_id(std::string_view device_id) -> infra::Result<std::string>;

// путь на устройстве; возвращает обрезанный по краям путь
[[nodiscard]] auto validate_remote_path(std::string_view path) -> infra::Result<std::string>;

// локальный путь -> абсолютный нормализованный; если base_dir задан, путь должен лежать внутри
[[nodiscard]] auto validate_local_path(std::string_view path,
                                       const std::optional<std::string>& base_dir = std::nullopt)
    -> infra::Result<std::string>;

} // namespace dbxfer::extensions
