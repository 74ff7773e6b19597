#include "error.hpp"
#include <fmt/core.h>
#include <cstdlib>

namespace dbxfer::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::SpawnFailed:
        case ErrorCode::InvalidArgument:
        case ErrorCode::UnsupportedAlgorithm:
        case ErrorCode::FileNotFound:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    if (is_fatal()) return EXIT_FAILURE;
    switch (code) {
        case ErrorCode::StreamFailed:   return 20;
        case ErrorCode::CommandFailed:  return 21;
        case ErrorCode::DigestFailed:   return 22;
        case ErrorCode::Cancelled:      return 130; // SIGINT
        default:                        return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error make_system_error(ErrorCode code, std::string_view context, int err,
                        const std::source_location& loc) {
    return Error{code,
                 fmt::format("{}: {}", context, std::generic_category().message(err)),
                 loc};
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SpawnFailed:          return "SpawnFailed";
        case ErrorCode::InvalidArgument:      return "InvalidArgument";
        case ErrorCode::UnsupportedAlgorithm: return "UnsupportedAlgorithm";
        case ErrorCode::FileNotFound:         return "FileNotFound";
        case ErrorCode::StreamFailed:         return "StreamFailed";
        case ErrorCode::DigestFailed:         return "DigestFailed";
        case ErrorCode::CommandFailed:        return "CommandFailed";
        case ErrorCode::AlreadyRunning:       return "AlreadyRunning";
        case ErrorCode::Cancelled:            return "Cancelled";
        case ErrorCode::Unknown:              break;
    }
    return "Unknown";
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace dbxfer::infra
