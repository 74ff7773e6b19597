#include "args_parser.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <git_info.hpp>

namespace dbxfer::args_parser {

namespace {

void add_transfer_positionals(CLI::App* cmd, CLIArgs& args,
                              const char* source_help, const char* destination_help) {
    cmd->add_option("source", args.source, source_help)->required();
    cmd->add_option("destination", args.destination, destination_help)->required();
}

} // namespace

std::optional<CLIArgs> parse_args(int argc, char const* const* argv) {
    CLIArgs args;

    CLI::App app{"dbxfer: device-bridge file transfers with duplicate pruning"};
    app.fallthrough();
    app.require_subcommand(1);

    constexpr auto git = build_info::get_git_info();
    app.set_version_flag("--version",
                         fmt::format("dbxfer {} ({}{})", git.commit_short, git.branch,
                                     git.dirty ? ", dirty" : ""));

    app.add_option("--bridge", args.bridge, "Device bridge executable (default: adb)");
    app.add_option("-s,--device", args.device, "Device serial");
    app.add_option("--algorithm", args.algorithm, "Digest algorithm")
        ->check(CLI::IsMember(std::vector<std::string>{"sha256", "sha1", "md5", "xxh64"}));
    app.add_flag("--dedup", args.dedup, "Skip files whose content already exists on the destination");
    app.add_option("--threads", args.threads, "Local hashing threads")
        ->check(CLI::PositiveNumber);
    app.add_option("--grace-ms", args.grace_ms, "Grace period between terminate and kill");
    app.add_option("--base-dir", args.base_dir, "Local destinations must stay under this directory");
    app.add_flag("--progress,!--no-progress", args.progress, "Render a progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Only warnings and errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");

    auto* pull = app.add_subcommand("pull", "Copy a file or folder from the device");
    add_transfer_positionals(pull, args, "Remote path", "Local directory");

    auto* push = app.add_subcommand("push", "Copy a local file or folder to the device");
    add_transfer_positionals(push, args, "Local path", "Remote path");

    auto* plan = app.add_subcommand("plan", "Report which files would be skipped as duplicates");
    plan->add_option("sources", args.sources, "Source files")->required();
    plan->add_option("--target", args.targets, "Target files")->required();
    plan->add_flag("--source-remote", args.source_remote, "Source files live on the device");
    plan->add_flag("--target-remote", args.target_remote, "Target files live on the device");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        (void)app.exit(e);
        return std::nullopt;
    }

    for (const auto* sub : app.get_subcommands()) {
        args.command = sub->get_name();
    }
    return args;
}

} // namespace dbxfer::args_parser
