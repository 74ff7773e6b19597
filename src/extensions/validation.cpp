#include "validation.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <regex>
#include <system_error>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace dbxfer::extensions {

namespace {

auto trim(std::string_view text) -> std::string_view {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

auto invalid(std::string message) -> infra::Error {
    return infra::make_error(infra::ErrorCode::InvalidArgument, message);
}

// "\n" и "\r" после trim остаются только внутри пути
constexpr std::array<std::string_view, 9> kRemoteForbidden = {
    ";", "|", "&", "$(", "${", "`", "\n", "\r", ">>",
};

auto printable(std::string_view pattern) -> std::string {
    if (pattern == "\n") return "\\n";
    if (pattern == "\r") return "\\r";
    return std::string(pattern);
}

} // namespace

auto validate_device_id(std::string_view device_id) -> infra::Result<std::string> {
    if (device_id.empty()) {
        return std::unexpected(invalid("Device ID cannot be empty"));
    }
    const bool ok = std::all_of(device_id.begin(), device_id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == ':' || c == '_' || c == '-';
    });
    if (!ok) {
        return std::unexpected(invalid(fmt::format("Device ID contains invalid characters: '{}'", device_id)));
    }
    return std::string(device_id);
}

auto validate_remote_path(std::string_view raw) -> infra::Result<std::string> {
    const auto path = trim(raw);
    if (path.empty()) {
        return std::unexpected(invalid("Path cannot be empty"));
    }
    if (path.find('\0') != std::string_view::npos) {
        return std::unexpected(invalid("Path contains null byte"));
    }
    for (const auto pattern : kRemoteForbidden) {
        if (path.find(pattern) != std::string_view::npos) {
            return std::unexpected(invalid(fmt::format("Path contains dangerous pattern: {}", printable(pattern))));
        }
    }

    // не абсолютный и не "./..." - только безопасный набор символов
    if (!path.starts_with('/') && !path.starts_with("./")) {
        static const std::regex plain(R"(^[A-Za-z0-9_./-]+$)");
        if (!std::regex_match(path.begin(), path.end(), plain)) {
            return std::unexpected(invalid(fmt::format("Path contains invalid characters: '{}'", path)));
        }
    }
    return std::string(path);
}

auto validate_local_path(std::string_view raw, const std::optional<std::string>& base_dir)
    -> infra::Result<std::string>
{
    const auto path = trim(raw);
    if (path.empty()) {
        return std::unexpected(invalid("Path cannot be empty"));
    }
    if (path.find('\0') != std::string_view::npos) {
        return std::unexpected(invalid("Path contains null byte"));
    }
    const bool has_control = std::any_of(path.begin(), path.end(), [](unsigned char c) {
        return c < 0x20 || c == 0x7f;
    });
    if (has_control) {
        return std::unexpected(invalid("Path contains control characters"));
    }

    std::error_code ec;
    auto normalized = fs::absolute(fs::path(path), ec).lexically_normal();
    if (ec) {
        return std::unexpected(infra::make_system_error(infra::ErrorCode::InvalidArgument,
                                                        fmt::format("Invalid path '{}'", path), ec.value()));
    }
    // "/tmp/out/" -> "/tmp/out"
    if (normalized.has_relative_path() && normalized.filename().empty()) {
        normalized = normalized.parent_path();
    }

    if (base_dir && !base_dir->empty()) {
        auto base = fs::absolute(fs::path(*base_dir), ec).lexically_normal();
        if (ec) {
            return std::unexpected(infra::make_system_error(infra::ErrorCode::InvalidArgument,
                                                            "Invalid base directory", ec.value()));
        }
        if (base.has_relative_path() && base.filename().empty()) {
            base = base.parent_path();
        }

        const auto relative = normalized.lexically_relative(base);
        const bool inside = !relative.empty()
            && relative.native() != ".."
            && !relative.native().starts_with("../");
        if (!inside) {
            return std::unexpected(invalid(fmt::format(
                "Path traversal detected: '{}' is outside '{}'", normalized.string(), base.string())));
        }
    }

    return normalized.string();
}

} // namespace dbxfer::extensions
