#include "command_runner.hpp"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace dbxfer::adapters {

BridgeCommandRunner::BridgeCommandRunner(std::string bridge,
                                         std::optional<std::string> device,
                                         std::chrono::milliseconds timeout)
    : bridge_(std::move(bridge)), device_(std::move(device)), timeout_(timeout) {}

auto BridgeCommandRunner::build_argv(const std::vector<std::string>& args) const
    -> std::vector<std::string>
{
    std::vector<std::string> argv;
    argv.reserve(args.size() + 3);
    argv.push_back(bridge_);
    if (device_) {
        argv.push_back("-s");
        argv.push_back(*device_);
    }
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

auto BridgeCommandRunner::run(const std::vector<std::string>& args)
    -> infra::Result<CommandOutput>
{
    auto child = process::ChildProcess::spawn(build_argv(args), process::OutputMode::Separate);
    if (!child) {
        return std::unexpected(std::move(child.error()));
    }

    auto captured = (*child)->communicate(timeout_);
    if (!captured) {
        // таймаут или ошибка чтения: процесс больше не нужен
        (*child)->kill();
        (*child)->wait();
        return std::unexpected(std::move(captured.error()));
    }

    CommandOutput output;
    output.out = std::move(captured->out);
    output.err = std::move(captured->err);
    output.exit_code = (*child)->wait();

    spdlog::debug("{} {} -> {}", bridge_, fmt::join(args, " "), output.exit_code);
    return output;
}

auto BridgeCommandRunner::spawn(const std::vector<std::string>& args)
    -> infra::Result<std::shared_ptr<process::ChildProcess>>
{
    return process::ChildProcess::spawn(build_argv(args), process::OutputMode::Merged);
}

} // namespace dbxfer::adapters
