#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>



namespace dbxfer::args_parser {
    struct CLIArgs
{
    std::string command;                    // pull | push | plan
    std::string source;                     // pull/push: первый позиционный аргумент
    std::string destination;                // pull/push: второй позиционный аргумент
    std::vector<std::string> sources;       // plan: позиционные аргументы
    std::vector<std::string> targets;       // plan: --target
    bool source_remote{false};              // plan: --source-remote
    bool target_remote{false};              // plan: --target-remote

    std::optional<std::string> bridge;      // --bridge=PATH
    std::optional<std::string> device;      // -s, --device
    std::optional<std::string> algorithm;   // --algorithm
    bool dedup{false};                      // --dedup
    std::optional<std::uint32_t> threads;   // --threads=N (локальное хеширование)
    std::optional<std::uint32_t> grace_ms;  // --grace-ms=N
    std::optional<std::string> base_dir;    // --base-dir
    bool progress{true};                    // --progress / --no-progress
    bool quiet{false};                      // -q, --quiet
    bool verbose{false};                    // -v, --verbose
};



/// Parses command-line arguments and returns a CLIArgs struct.
/// std::nullopt: --help, --version или ошибка разбора (сообщение уже выведено).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace dbxfer::args_parser

using __CLI = dbxfer::args_parser::CLIArgs;
